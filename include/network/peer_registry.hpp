// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/peer_id.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace nearlink {
namespace network {

struct PeerEntry {
  Peer peer;
  PeerState state;
  std::chrono::steady_clock::time_point discovered_at;
};

/**
 * PeerRegistry - thread-safe map of currently discoverable peers
 *
 * Every operation takes a single lock and is atomic, so browse, advertise
 * and session callbacks arriving concurrently never observe a torn entry.
 * Results are returned by value; no reference into the map escapes the lock.
 *
 * Lifecycle:
 *   found  -> Upsert()      (DISCOVERED, or keeps state on rediscovery)
 *   invite -> BeginInvitation()
 *   session state change -> SetState()
 *   lost   -> Remove()
 */
class PeerRegistry {
public:
  PeerRegistry() = default;

  PeerRegistry(const PeerRegistry &) = delete;
  PeerRegistry &operator=(const PeerRegistry &) = delete;

  /**
   * Insert a newly found peer or replace the metadata of a known one
   * Rediscovery keeps the existing state and discovery time.
   * Returns true if inserted, false if updated
   */
  bool Upsert(const Peer &peer);

  std::optional<Peer> Find(const PeerID &id) const;
  std::optional<PeerEntry> FindEntry(const PeerID &id) const;
  bool Contains(const PeerID &id) const;

  // Atomic lookup + erase. Returns the removed peer, std::nullopt if unknown
  std::optional<Peer> Remove(const PeerID &id);

  // Returns the updated peer, std::nullopt if unknown
  std::optional<Peer> SetState(const PeerID &id, PeerState state);

  /**
   * Mark a peer INVITING (a CONNECTED peer keeps its state)
   * @param skip_if_active If true, refuse when the peer is already INVITING
   *        or CONNECTED
   * Returns false if the peer is unknown or was skipped
   */
  bool BeginInvitation(const PeerID &id, bool skip_if_active);

  /**
   * Record an accepted inbound invitation
   * A CONNECTED peer stays CONNECTED: the transport reports no new connect
   * for an extra link to an existing member.
   * Returns the resulting state, std::nullopt if unknown
   */
  std::optional<PeerState> AcceptInvitation(const PeerID &id);

  size_t Size() const;

  // Oldest discovery first
  std::vector<PeerEntry> Snapshot() const;
  void Clear();

private:
  mutable std::mutex mutex_;
  std::unordered_map<PeerID, PeerEntry, PeerID::Hasher> peers_;
};

} // namespace network
} // namespace nearlink
