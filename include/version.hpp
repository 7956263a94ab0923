// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace nearlink {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The NearLink Developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "NearLink version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// One-line startup banner
inline std::string GetStartupBanner(const std::string &peer_name,
                                    const std::string &service_type) {
  return "NearLink " + GetVersionString() + " - " + peer_name + " on '" +
         service_type + "'\n" + "Type /peers, /to <name> <text>, /quit or a message to broadcast\n";
}

} // namespace nearlink
