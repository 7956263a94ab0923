// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_id.hpp"
#include <map>
#include <optional>
#include <string>

namespace nearlink {
namespace network {

// Key/value metadata attached to an advertisement (DNS-SD TXT record style)
using DiscoveryInfo = std::map<std::string, std::string>;

// TXT record limits: one "key=value" pair, and the whole record
constexpr size_t MAX_DISCOVERY_PAIR_BYTES = 255;
constexpr size_t MAX_DISCOVERY_INFO_BYTES = 400;

// Per-peer lifecycle as seen by the connection manager
enum class PeerState {
  DISCOVERED,   // Browse "found" event, not yet invited
  INVITING,     // Invitation sent or accepted, session not yet connected
  CONNECTED,    // Session reported the peer connected
  DISCONNECTED  // Session reported the peer gone (still discoverable)
};

const char *PeerStateName(PeerState state);

/**
 * Check discovery info against TXT record rules
 * Returns a description of the first violation, or std::nullopt if valid
 *
 * Rules:
 * - keys are non-empty printable ASCII without '='
 * - each "key=value" pair fits in MAX_DISCOVERY_PAIR_BYTES
 * - the length-prefixed record fits in MAX_DISCOVERY_INFO_BYTES
 */
std::optional<std::string> ValidateDiscoveryInfo(const DiscoveryInfo &info);

/**
 * Peer - one remote participant discovered on the mesh
 *
 * Immutable value type. Built only through FromDiscovery(), so every Peer in
 * the system carries a valid PeerID and well-formed discovery info.
 */
class Peer {
public:
  /**
   * Build a Peer from a browse "found" event
   * @param id Transport identifier of the remote process
   * @param info Advertised discovery info (absent if the peer advertises none)
   * @param error If non-null, receives the reason on failure
   * @return std::nullopt for a malformed advertisement
   */
  static std::optional<Peer> FromDiscovery(const PeerID &id,
                                           const std::optional<DiscoveryInfo> &info,
                                           std::string *error = nullptr);

  const PeerID &id() const { return id_; }
  const std::string &name() const { return id_.display_name(); }
  const std::optional<DiscoveryInfo> &discovery_info() const { return discovery_info_; }

  bool operator==(const Peer &other) const { return id_ == other.id_; }
  bool operator!=(const Peer &other) const { return !(*this == other); }

private:
  Peer(PeerID id, std::optional<DiscoveryInfo> info);

  PeerID id_;
  std::optional<DiscoveryInfo> discovery_info_;
};

} // namespace network
} // namespace nearlink
