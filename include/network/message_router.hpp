// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace nearlink {
namespace network {

/**
 * MessageRouter - outbound delivery over one session
 *
 * Destinations come from the session's live connected list (broadcast) or
 * from the caller (send_to); the peer registry is never consulted, so a peer
 * is only reachable while the transport reports it connected.
 *
 * Every send is RELIABLE. Failures are returned, never retried.
 */
class MessageRouter {
public:
  explicit MessageRouter(Session &session);

  MessageRouter(const MessageRouter &) = delete;
  MessageRouter &operator=(const MessageRouter &) = delete;

  // Send to every connected peer. No connected peers is a logged no-op success.
  SendResult Broadcast(const Payload &data);

  /**
   * Send to an explicit set of peers in one transport call
   * Duplicate peers are sent once (first occurrence keeps its position).
   * Returns NO_PEERS for an empty set without touching the transport.
   */
  SendResult SendTo(const Payload &data, const std::vector<Peer> &peers);

  uint64_t messages_sent() const { return messages_sent_.load(std::memory_order_relaxed); }
  uint64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }
  uint64_t send_failures() const { return send_failures_.load(std::memory_order_relaxed); }

private:
  SendResult Deliver(const Payload &data, const std::vector<PeerID> &targets);

  Session &session_;

  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> send_failures_{0};
};

} // namespace network
} // namespace nearlink
