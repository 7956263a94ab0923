// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/message_router.hpp"
#include "util/logging.hpp"
#include <unordered_set>

namespace nearlink {
namespace network {

MessageRouter::MessageRouter(Session &session) : session_(session) {}

SendResult MessageRouter::Broadcast(const Payload &data) {
  auto targets = session_.connected_peers();
  if (targets.empty()) {
    LOG_NET_INFO("Broadcast of {} bytes skipped: no connected peers", data.size());
    return SendResult::Success();
  }
  return Deliver(data, targets);
}

SendResult MessageRouter::SendTo(const Payload &data, const std::vector<Peer> &peers) {
  if (peers.empty()) {
    LOG_NET_DEBUG("send_to called with an empty peer set");
    return SendResult::Failure(TransportError::NO_PEERS, "no destination peers");
  }

  std::vector<PeerID> targets;
  targets.reserve(peers.size());
  std::unordered_set<PeerID, PeerID::Hasher> seen;
  for (const auto &peer : peers) {
    if (seen.insert(peer.id()).second) {
      targets.push_back(peer.id());
    }
  }
  return Deliver(data, targets);
}

SendResult MessageRouter::Deliver(const Payload &data,
                                  const std::vector<PeerID> &targets) {
  SendResult result = session_.send(data, targets, SendMode::RELIABLE);
  if (!result) {
    send_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_WARN("Failed to send {} bytes to {} peer(s): {}", data.size(),
                 targets.size(), result.ToString());
    return result;
  }

  messages_sent_.fetch_add(1, std::memory_order_relaxed);
  bytes_sent_.fetch_add(data.size() * targets.size(), std::memory_order_relaxed);
  LOG_NET_TRACE("Sent {} bytes to {} peer(s)", data.size(), targets.size());
  return result;
}

} // namespace network
} // namespace nearlink
