// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/peer_id.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nearlink {
namespace wire {

/*
 Session frames (TCP)

   +----------------+---------+------------------+
   | length (u32 BE)| type u8 | body (length B)  |
   +----------------+---------+------------------+

 INVITE  body: JSON {"token","name","context","has_context"}
         context is hex; has_context tells an absent context from an empty one
         and the context field is ignored when it is false or missing
 ACCEPT  body: empty
 DECLINE body: empty
 DATA    body: application payload
*/

enum class FrameType : uint8_t {
  INVITE = 1,
  ACCEPT = 2,
  DECLINE = 3,
  DATA = 4
};

const char *FrameTypeName(FrameType type);

constexpr size_t FRAME_HEADER_SIZE = 5;
constexpr uint32_t MAX_FRAME_BODY = 16 * 1024 * 1024;

struct FrameHeader {
  FrameType type;
  uint32_t body_size;
};

std::vector<uint8_t> EncodeFrame(FrameType type, const std::vector<uint8_t> &body);

// Returns std::nullopt for an unknown type or a body above MAX_FRAME_BODY
std::optional<FrameHeader> DecodeFrameHeader(const uint8_t *header);

struct InviteRequest {
  network::PeerID from;
  network::InvitationContext context;
};

std::vector<uint8_t> EncodeInvite(const InviteRequest &invite);
std::optional<InviteRequest> DecodeInvite(const std::vector<uint8_t> &body);

/*
 Discovery beacons (UDP multicast, one JSON object per datagram)

   {"v":1,"op":"announce"|"bye","service":"...",
    "peer":{"token":"...","name":"..."},"port":N,"info":{"k":"v",...}}

 "info" is omitted when the advertiser has no discovery info.
*/

constexpr int BEACON_VERSION = 1;
constexpr size_t MAX_BEACON_SIZE = 1400;

enum class BeaconOp {
  ANNOUNCE,
  BYE
};

struct Beacon {
  BeaconOp op{BeaconOp::ANNOUNCE};
  std::string service_type;
  network::PeerID peer;
  uint16_t port{0};
  std::optional<network::DiscoveryInfo> info;
};

std::string EncodeBeacon(const Beacon &beacon);

// Returns std::nullopt for malformed JSON, a wrong version or missing fields
std::optional<Beacon> DecodeBeacon(const std::string &datagram);

} // namespace wire
} // namespace nearlink
