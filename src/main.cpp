// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --name=<name>        Display name shown to peers (default: host name)\n"
      << "  --service=<type>     Service type shared by all peers (default: nearlink)\n"
      << "  --mode=<mode>        receiver, transmitter or both (default: both)\n"
      << "  --datadir=<path>     Data directory (default: ~/.nearlink)\n"
      << "  --invite-timeout=<s> Invitation timeout in seconds (default: 10)\n"
      << "  --dedup-invites      Do not re-invite peers already inviting or connected\n"
      << "  --group=<ip:port>    Discovery multicast group (default: 239.255.42.99:45454)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, discovery, session, app, all\n"
      << "                       Can be comma-separated: --debug=discovery,session\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    nearlink::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << nearlink::GetFullVersionString() << std::endl;
        std::cout << nearlink::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--name=") == 0) {
        config.mesh.peer_name = arg.substr(7);
      } else if (arg.find("--service=") == 0) {
        config.mesh.service_type = arg.substr(10);
      } else if (arg.find("--mode=") == 0) {
        std::string mode = arg.substr(7);
        config.mesh.modes.clear();
        if (mode == "both") {
          config.mesh.modes = {nearlink::network::Mode::RECEIVER,
                               nearlink::network::Mode::TRANSMITTER};
        } else if (auto parsed = nearlink::network::ParseMode(mode)) {
          config.mesh.modes.insert(*parsed);
        } else {
          std::cerr << "Error: Invalid mode: " << mode << std::endl;
          std::cerr << "Mode must be receiver, transmitter or both" << std::endl;
          return 1;
        }
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--invite-timeout=") == 0) {
        auto timeout_opt = nearlink::util::SafeParseInt(arg.substr(17), 1, 3600);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid invitation timeout: " << arg.substr(17) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.mesh.invitation_timeout = std::chrono::seconds(*timeout_opt);
      } else if (arg == "--dedup-invites") {
        config.mesh.invite_deduplication = true;
      } else if (arg.find("--group=") == 0) {
        auto group_opt = nearlink::util::ParseHostPort(arg.substr(8));
        if (!group_opt) {
          std::cerr << "Error: Invalid multicast group: " << arg.substr(8) << std::endl;
          std::cerr << "Expected <ip>:<port>, e.g. 239.255.42.99:45454" << std::endl;
          return 1;
        }
        config.transport.multicast_address = group_opt->first;
        config.transport.multicast_port = group_opt->second;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=discovery,session
        auto components = nearlink::util::SplitList(arg.substr(8));
        debug_components.insert(debug_components.end(), components.begin(),
                                components.end());
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (auto problem = nearlink::network::ValidateConfiguration(config.mesh)) {
      std::cerr << "Error: " << *problem << std::endl;
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    if (!nearlink::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir << std::endl;
      return 1;
    }
    // Log to <datadir>/debug.log; the console is reserved for chat
    std::string log_file = (config.datadir / "debug.log").string();
    nearlink::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        nearlink::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        nearlink::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        nearlink::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Create and initialize application
    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    {
      nearlink::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        std::cerr << "Failed to initialize, see " << log_file << std::endl;
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until /quit or a signal
      app.wait_for_shutdown();
    }

    // Shutdown logging AFTER app is fully destroyed
    nearlink::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    nearlink::util::LogManager::Shutdown();
    return 1;
  }
}
