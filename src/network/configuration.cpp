// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/configuration.hpp"
#include "util/files.hpp"
#include <unistd.h>
#include <array>

namespace nearlink {
namespace network {

const char *ModeName(Mode mode) {
  switch (mode) {
  case Mode::RECEIVER:
    return "receiver";
  case Mode::TRANSMITTER:
    return "transmitter";
  }
  return "unknown";
}

std::optional<Mode> ParseMode(const std::string &str) {
  if (str == "receiver") {
    return Mode::RECEIVER;
  }
  if (str == "transmitter") {
    return Mode::TRANSMITTER;
  }
  return std::nullopt;
}

void AcceptAllInvitations(const Peer &, const InvitationContext &,
                          InvitationCompletion complete) {
  complete(true);
}

MeshConfiguration MeshConfiguration::Default() {
  MeshConfiguration config;
  config.peer_name = DefaultPeerName();
  config.identity_path = util::get_default_datadir() / "identity.json";
  return config;
}

std::optional<std::string> ValidateServiceType(const std::string &service_type) {
  if (service_type.empty()) {
    return std::string("service type is empty");
  }
  if (service_type.size() > MAX_SERVICE_TYPE_LENGTH) {
    return "service type '" + service_type + "' is longer than " +
           std::to_string(MAX_SERVICE_TYPE_LENGTH) + " characters";
  }

  bool has_letter = false;
  char prev = '\0';
  for (char c : service_type) {
    bool lower = c >= 'a' && c <= 'z';
    bool digit = c >= '0' && c <= '9';
    if (!lower && !digit && c != '-') {
      return "service type '" + service_type + "' contains invalid character '" +
             std::string(1, c) + "'";
    }
    if (c == '-' && prev == '-') {
      return "service type '" + service_type + "' contains adjacent hyphens";
    }
    has_letter = has_letter || lower;
    prev = c;
  }

  if (service_type.front() == '-' || service_type.back() == '-') {
    return "service type '" + service_type + "' starts or ends with a hyphen";
  }
  if (!has_letter) {
    return "service type '" + service_type + "' must contain a letter";
  }
  return std::nullopt;
}

std::optional<std::string> ValidateConfiguration(const MeshConfiguration &config) {
  if (auto problem = ValidateServiceType(config.service_type)) {
    return problem;
  }
  if (config.peer_name.empty()) {
    return std::string("peer name is empty");
  }
  if (config.peer_name.size() > MAX_DISPLAY_NAME_BYTES) {
    return "peer name is " + std::to_string(config.peer_name.size()) +
           " bytes (max " + std::to_string(MAX_DISPLAY_NAME_BYTES) + ")";
  }
  if (config.discovery_info) {
    if (auto problem = ValidateDiscoveryInfo(*config.discovery_info)) {
      return "discovery info: " + *problem;
    }
  }
  if (config.invitation_timeout.count() <= 0) {
    return std::string("invitation timeout must be positive");
  }
  if (!config.security.invitation_handler) {
    return std::string("invitation handler is not set");
  }
  return std::nullopt;
}

std::string DefaultPeerName() {
  std::array<char, 256> buf{};
  if (gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
    return "nearlink-peer";
  }
  std::string name(buf.data());
  if (name.size() > MAX_DISPLAY_NAME_BYTES) {
    name.resize(MAX_DISPLAY_NAME_BYTES);
  }
  return name;
}

} // namespace network
} // namespace nearlink
