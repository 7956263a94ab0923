// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/asio_transport.hpp"
#include "network/configuration.hpp"
#include "network/connection_manager.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace nearlink {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (identity.json, debug.log, .lock)
  std::filesystem::path datadir;

  // Mesh configuration (identity_path defaults to <datadir>/identity.json)
  network::MeshConfiguration mesh;

  // LAN transport configuration
  network::AsioTransportConfig transport;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {
    mesh.peer_name = network::DefaultPeerName();
  }
};

// One line typed on stdin
struct ChatCommand {
  enum class Kind {
    BROADCAST,  // plain text
    SEND_TO,    // /to <name> <text>
    LIST_PEERS, // /peers
    QUIT        // /quit
  };

  Kind kind;
  std::string target; // SEND_TO only
  std::string text;   // BROADCAST and SEND_TO
};

/**
 * Parse a line of chat input
 * Returns std::nullopt for an empty line, an unknown /command or a /to
 * without both name and text
 */
std::optional<ChatCommand> ParseChatCommand(const std::string &line);

// Application - chat daemon coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  network::ConnectionManager &connection_manager() { return *connection_manager_; }

  // Status
  bool is_running() const { return running_; }

  // Shutdown request (for /quit)
  void request_shutdown() { shutdown_requested_ = true; }

  // Execute one line of chat input
  void handle_line(const std::string &line);

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::unique_ptr<network::AsioMeshTransport> transport_;
  std::unique_ptr<network::ConnectionManager> connection_manager_;

  // stdin reader
  std::unique_ptr<std::thread> input_thread_;

  // Serializes console output from the io and input threads
  std::mutex output_mutex_;

  // Initialization steps
  bool init_datadir();
  bool init_network();

  void input_loop();
  void print_line(const std::string &line);
  void list_peers();
  void send_to_name(const std::string &name, const std::string &text);

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace nearlink
