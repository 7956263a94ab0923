// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nearlink {
namespace network {

// Roles a ConnectionManager can run in; both may be active at once
enum class Mode {
  RECEIVER,    // Advertise and accept invitations
  TRANSMITTER  // Browse and invite discovered peers
};

const char *ModeName(Mode mode);
std::optional<Mode> ParseMode(const std::string &str);

// Must be called exactly once with the decision
using InvitationCompletion = std::function<void(bool accept)>;

// Application policy for inbound invitations. May complete synchronously
// or later from any thread.
using InvitationHandler =
    std::function<void(const Peer &from, const InvitationContext &context,
                       InvitationCompletion complete)>;

// Default policy: accept every invitation from a known peer
void AcceptAllInvitations(const Peer &from, const InvitationContext &context,
                          InvitationCompletion complete);

struct SecurityPolicy {
  // Opaque identity material handed to the session (empty = anonymous)
  std::vector<uint8_t> identity;
  EncryptionPreference encryption_preference{EncryptionPreference::REQUIRED};
  InvitationHandler invitation_handler{AcceptAllInvitations};
};

constexpr size_t MAX_SERVICE_TYPE_LENGTH = 15;
constexpr const char *DEFAULT_SERVICE_TYPE = "nearlink";
constexpr std::chrono::seconds DEFAULT_INVITATION_TIMEOUT{10};

/**
 * MeshConfiguration - immutable input to a ConnectionManager
 *
 * modes                 RECEIVER and/or TRANSMITTER (empty = idle manager)
 * service_type          DNS-SD style service name shared by all peers
 * peer_name             local display name
 * identity_path         where the local PeerID is persisted
 * discovery_info        key/value metadata advertised in receiver mode
 * security              session identity, encryption, invitation policy
 * invitation_timeout    bound on outbound invitations
 * invite_deduplication  skip re-inviting peers already inviting/connected
 */
struct MeshConfiguration {
  std::set<Mode> modes{Mode::RECEIVER, Mode::TRANSMITTER};
  std::string service_type{DEFAULT_SERVICE_TYPE};
  std::string peer_name;
  std::filesystem::path identity_path;
  std::optional<DiscoveryInfo> discovery_info;
  SecurityPolicy security;
  std::chrono::seconds invitation_timeout{DEFAULT_INVITATION_TIMEOUT};
  bool invite_deduplication{false};

  bool has_mode(Mode mode) const { return modes.count(mode) > 0; }

  // Defaults with peer_name set to DefaultPeerName()
  static MeshConfiguration Default();
};

/**
 * Check a service type against DNS-SD naming rules
 * 1-15 characters of [a-z0-9-], at least one letter, no leading/trailing
 * hyphen and no adjacent hyphens.
 * Returns a description of the problem, or std::nullopt if valid
 */
std::optional<std::string> ValidateServiceType(const std::string &service_type);

// Returns a description of the first invalid field, or std::nullopt
std::optional<std::string> ValidateConfiguration(const MeshConfiguration &config);

// Host name truncated to MAX_DISPLAY_NAME_BYTES ("nearlink-peer" if unknown)
std::string DefaultPeerName();

} // namespace network
} // namespace nearlink
