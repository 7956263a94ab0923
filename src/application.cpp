// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h> // For write(), read(), STDOUT_FILENO (async-signal-safe)

namespace nearlink {
namespace app {

namespace {
constexpr int INPUT_POLL_TIMEOUT_MS = 200;
} // namespace

std::optional<ChatCommand> ParseChatCommand(const std::string &line) {
  if (line.empty()) {
    return std::nullopt;
  }
  if (line[0] != '/') {
    return ChatCommand{ChatCommand::Kind::BROADCAST, "", line};
  }
  if (line == "/peers") {
    return ChatCommand{ChatCommand::Kind::LIST_PEERS, "", ""};
  }
  if (line == "/quit") {
    return ChatCommand{ChatCommand::Kind::QUIT, "", ""};
  }
  if (line.rfind("/to ", 0) == 0) {
    std::string rest = line.substr(4);
    size_t start = rest.find_first_not_of(' ');
    if (start == std::string::npos) {
      return std::nullopt;
    }
    size_t space = rest.find(' ', start);
    if (space == std::string::npos) {
      return std::nullopt;
    }
    std::string target = rest.substr(start, space - start);
    std::string text = rest.substr(space + 1);
    if (text.empty()) {
      return std::nullopt;
    }
    return ChatCommand{ChatCommand::Kind::SEND_TO, target, text};
  }
  return std::nullopt;
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.mesh.peer_name, config_.mesh.service_type)
            << std::flush;

  LOG_APP_INFO("Initializing NearLink...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize network");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting NearLink...");

  setup_signal_handlers();

  transport_->run();
  connection_manager_->resume();

  running_ = true;

  input_thread_ = std::make_unique<std::thread>(&Application::input_loop, this);

  LOG_APP_INFO("NearLink started as {}", connection_manager_->me().ToString());
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal or /quit
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down NearLink...");

  running_ = false;

  // input_loop polls running_
  if (input_thread_ && input_thread_->joinable()) {
    input_thread_->join();
  }
  input_thread_.reset();

  if (connection_manager_) {
    LOG_APP_INFO("Stopping discovery...");
    connection_manager_->stop();
    connection_manager_->disconnect();
    connection_manager_.reset();
  }

  if (transport_) {
    LOG_APP_INFO("Stopping transport...");
    transport_->stop();
    transport_.reset();
  }

  LOG_APP_INFO("Releasing data directory lock...");
  datadir_lock_.reset();

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent two daemons sharing an identity
  util::LockResult lock_result = util::LockResult::Success;
  datadir_lock_ = util::DirectoryLock::Acquire(config_.datadir, ".lock", &lock_result);

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_APP_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                  "NearLink is probably already running.",
                  config_.datadir.string());
    return false;
  }

  if (config_.mesh.identity_path.empty()) {
    config_.mesh.identity_path = config_.datadir / "identity.json";
  }
  return true;
}

bool Application::init_network() {
  LOG_APP_INFO("Initializing mesh on service '{}'...", config_.mesh.service_type);

  transport_ = std::make_unique<network::AsioMeshTransport>(config_.transport);

  try {
    connection_manager_ =
        std::make_unique<network::ConnectionManager>(*transport_, config_.mesh);
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Failed to create connection manager: {}", e.what());
    return false;
  }

  connection_manager_->set_data_received_callback(
      [this](const network::Payload &data, const std::string &sender) {
        print_line(sender + ": " + std::string(data.begin(), data.end()));
      });
  connection_manager_->set_peer_found_callback([this](const network::Peer &peer) {
    print_line("* found " + peer.name());
  });
  connection_manager_->set_peer_lost_callback([this](const network::Peer &peer) {
    print_line("* lost " + peer.name());
  });
  connection_manager_->set_peer_state_changed_callback(
      [this](const network::Peer &peer, network::PeerState state) {
        if (state == network::PeerState::CONNECTED ||
            state == network::PeerState::DISCONNECTED) {
          print_line("* " + peer.name() + " " + network::PeerStateName(state));
        }
      });

  return true;
}

void Application::handle_line(const std::string &line) {
  if (line.empty()) {
    return;
  }

  auto command = ParseChatCommand(line);
  if (!command) {
    print_line("* usage: /peers | /to <name> <text> | /quit | <text>");
    return;
  }

  switch (command->kind) {
  case ChatCommand::Kind::QUIT:
    request_shutdown();
    return;
  case ChatCommand::Kind::LIST_PEERS:
    list_peers();
    return;
  case ChatCommand::Kind::SEND_TO:
    send_to_name(command->target, command->text);
    return;
  case ChatCommand::Kind::BROADCAST: {
    network::Payload payload(command->text.begin(), command->text.end());
    auto result = connection_manager_->broadcast(payload);
    if (!result) {
      print_line("* send failed: " + result.ToString());
    }
    return;
  }
  }
}

void Application::list_peers() {
  auto peers = connection_manager_->available_peers();
  if (peers.empty()) {
    print_line("* no peers");
    return;
  }
  for (const auto &entry : peers) {
    print_line("* " + entry.peer.id().ToString() + " (" +
               network::PeerStateName(entry.state) + ")");
  }
}

void Application::send_to_name(const std::string &name, const std::string &text) {
  std::vector<network::Peer> targets;
  for (const auto &entry : connection_manager_->available_peers()) {
    if (entry.peer.name() == name) {
      targets.push_back(entry.peer);
    }
  }
  if (targets.empty()) {
    print_line("* unknown peer '" + name + "'");
    return;
  }

  network::Payload payload(text.begin(), text.end());
  auto result = connection_manager_->send_to(payload, targets);
  if (!result) {
    print_line("* send to " + name + " failed: " + result.ToString());
  }
}

void Application::print_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

void Application::input_loop() {
  std::string buffer;
  std::array<char, 1024> chunk{};

  while (running_ && !shutdown_requested_) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, INPUT_POLL_TIMEOUT_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_APP_ERROR("poll() on stdin failed: {}", std::strerror(errno));
      return;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = read(STDIN_FILENO, chunk.data(), chunk.size());
    if (n <= 0) {
      // EOF: keep running until a signal arrives
      LOG_APP_INFO("stdin closed, input disabled");
      return;
    }
    buffer.append(chunk.data(), static_cast<size_t>(n));

    size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      handle_line(line);
    }
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17); // Literal length, no strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace nearlink
