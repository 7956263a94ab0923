// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/peer.hpp"

namespace nearlink {
namespace network {

const char *PeerStateName(PeerState state) {
  switch (state) {
  case PeerState::DISCOVERED:
    return "discovered";
  case PeerState::INVITING:
    return "inviting";
  case PeerState::CONNECTED:
    return "connected";
  case PeerState::DISCONNECTED:
    return "disconnected";
  }
  return "unknown";
}

std::optional<std::string> ValidateDiscoveryInfo(const DiscoveryInfo &info) {
  size_t record_bytes = 0;

  for (const auto &[key, value] : info) {
    if (key.empty()) {
      return std::string("empty key");
    }

    for (char c : key) {
      auto uc = static_cast<unsigned char>(c);
      if (uc < 0x20 || uc > 0x7E || c == '=') {
        return "invalid character in key '" + key + "'";
      }
    }

    // "key=value"
    size_t pair_bytes = key.size() + 1 + value.size();
    if (pair_bytes > MAX_DISCOVERY_PAIR_BYTES) {
      return "entry '" + key + "' is " + std::to_string(pair_bytes) +
             " bytes (max " + std::to_string(MAX_DISCOVERY_PAIR_BYTES) + ")";
    }

    // One length byte per TXT string
    record_bytes += 1 + pair_bytes;
  }

  if (record_bytes > MAX_DISCOVERY_INFO_BYTES) {
    return "discovery info is " + std::to_string(record_bytes) + " bytes (max " +
           std::to_string(MAX_DISCOVERY_INFO_BYTES) + ")";
  }

  return std::nullopt;
}

Peer::Peer(PeerID id, std::optional<DiscoveryInfo> info)
    : id_(std::move(id)), discovery_info_(std::move(info)) {}

std::optional<Peer> Peer::FromDiscovery(const PeerID &id,
                                        const std::optional<DiscoveryInfo> &info,
                                        std::string *error) {
  if (!id.IsValid()) {
    if (error) {
      *error = "invalid peer identifier '" + id.ToString() + "'";
    }
    return std::nullopt;
  }

  if (info) {
    if (auto problem = ValidateDiscoveryInfo(*info)) {
      if (error) {
        *error = *problem;
      }
      return std::nullopt;
    }
  }

  return Peer(id, info);
}

} // namespace network
} // namespace nearlink
