// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/wire.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace nearlink {
namespace wire {

using json = nlohmann::json;

const char *FrameTypeName(FrameType type) {
  switch (type) {
  case FrameType::INVITE:
    return "invite";
  case FrameType::ACCEPT:
    return "accept";
  case FrameType::DECLINE:
    return "decline";
  case FrameType::DATA:
    return "data";
  }
  return "unknown";
}

std::vector<uint8_t> EncodeFrame(FrameType type, const std::vector<uint8_t> &body) {
  const auto size = static_cast<uint32_t>(body.size());
  std::vector<uint8_t> frame;
  frame.reserve(FRAME_HEADER_SIZE + body.size());
  frame.push_back(static_cast<uint8_t>(size >> 24));
  frame.push_back(static_cast<uint8_t>(size >> 16));
  frame.push_back(static_cast<uint8_t>(size >> 8));
  frame.push_back(static_cast<uint8_t>(size));
  frame.push_back(static_cast<uint8_t>(type));
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

std::optional<FrameHeader> DecodeFrameHeader(const uint8_t *header) {
  uint32_t size = (static_cast<uint32_t>(header[0]) << 24) |
                  (static_cast<uint32_t>(header[1]) << 16) |
                  (static_cast<uint32_t>(header[2]) << 8) |
                  static_cast<uint32_t>(header[3]);
  uint8_t type = header[4];

  if (type < static_cast<uint8_t>(FrameType::INVITE) ||
      type > static_cast<uint8_t>(FrameType::DATA)) {
    return std::nullopt;
  }
  if (size > MAX_FRAME_BODY) {
    return std::nullopt;
  }
  return FrameHeader{static_cast<FrameType>(type), size};
}

std::vector<uint8_t> EncodeInvite(const InviteRequest &invite) {
  json root;
  root["token"] = invite.from.token();
  root["name"] = invite.from.display_name();
  root["context"] = invite.context ? util::HexEncode(*invite.context) : "";
  root["has_context"] = invite.context.has_value();
  std::string text = root.dump(-1, ' ', false, json::error_handler_t::replace);
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<InviteRequest> DecodeInvite(const std::vector<uint8_t> &body) {
  try {
    json root = json::parse(body.begin(), body.end());
    if (!root.is_object() || !root.contains("token") || !root["token"].is_string() ||
        !root.contains("name") || !root["name"].is_string()) {
      return std::nullopt;
    }

    InviteRequest invite;
    invite.from = network::PeerID(root["token"].get<std::string>(),
                                  root["name"].get<std::string>());
    if (!invite.from.IsValid()) {
      return std::nullopt;
    }

    bool has_context = root.value("has_context", false);
    if (has_context) {
      if (!root.contains("context") || !root["context"].is_string()) {
        return std::nullopt;
      }
      auto bytes = util::HexDecode(root["context"].get<std::string>());
      if (!bytes) {
        return std::nullopt;
      }
      invite.context = std::move(*bytes);
    }
    return invite;

  } catch (const json::exception &e) {
    LOG_SESSION_DEBUG("Malformed invite body: {}", e.what());
    return std::nullopt;
  }
}

std::string EncodeBeacon(const Beacon &beacon) {
  json root;
  root["v"] = BEACON_VERSION;
  root["op"] = beacon.op == BeaconOp::ANNOUNCE ? "announce" : "bye";
  root["service"] = beacon.service_type;
  root["peer"] = {{"token", beacon.peer.token()}, {"name", beacon.peer.display_name()}};
  root["port"] = beacon.port;
  if (beacon.info) {
    json info = json::object();
    for (const auto &[key, value] : *beacon.info) {
      info[key] = value;
    }
    root["info"] = info;
  }
  // Invalid UTF-8 in a local name must not throw on the io thread
  return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Beacon> DecodeBeacon(const std::string &datagram) {
  if (datagram.size() > MAX_BEACON_SIZE) {
    return std::nullopt;
  }

  try {
    json root = json::parse(datagram);
    if (!root.is_object() || root.value("v", 0) != BEACON_VERSION) {
      return std::nullopt;
    }

    Beacon beacon;
    std::string op = root.value("op", "");
    if (op == "announce") {
      beacon.op = BeaconOp::ANNOUNCE;
    } else if (op == "bye") {
      beacon.op = BeaconOp::BYE;
    } else {
      return std::nullopt;
    }

    if (!root.contains("service") || !root["service"].is_string()) {
      return std::nullopt;
    }
    beacon.service_type = root["service"].get<std::string>();

    if (!root.contains("peer") || !root["peer"].is_object()) {
      return std::nullopt;
    }
    const auto &peer = root["peer"];
    if (!peer.contains("token") || !peer["token"].is_string() ||
        !peer.contains("name") || !peer["name"].is_string()) {
      return std::nullopt;
    }
    // Display name is checked later by Peer::FromDiscovery
    beacon.peer = network::PeerID(peer["token"].get<std::string>(),
                                  peer["name"].get<std::string>());
    if (beacon.peer.token().empty()) {
      return std::nullopt;
    }

    if (!root.contains("port") || !root["port"].is_number_unsigned()) {
      return std::nullopt;
    }
    auto port = root["port"].get<uint64_t>();
    if (port > 65535) {
      return std::nullopt;
    }
    beacon.port = static_cast<uint16_t>(port);

    if (root.contains("info")) {
      if (!root["info"].is_object()) {
        return std::nullopt;
      }
      network::DiscoveryInfo info;
      for (const auto &[key, value] : root["info"].items()) {
        if (!value.is_string()) {
          return std::nullopt;
        }
        info[key] = value.get<std::string>();
      }
      beacon.info = std::move(info);
    }
    return beacon;

  } catch (const json::exception &e) {
    LOG_DISC_TRACE("Malformed beacon: {}", e.what());
    return std::nullopt;
  }
}

} // namespace wire
} // namespace nearlink
