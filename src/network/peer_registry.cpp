// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/peer_registry.hpp"
#include <algorithm>

namespace nearlink {
namespace network {

bool PeerRegistry::Upsert(const Peer &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer.id());
  if (it != peers_.end()) {
    it->second.peer = peer;
    return false;
  }
  peers_.emplace(peer.id(), PeerEntry{peer, PeerState::DISCOVERED,
                                      std::chrono::steady_clock::now()});
  return true;
}

std::optional<Peer> PeerRegistry::Find(const PeerID &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second.peer;
}

std::optional<PeerEntry> PeerRegistry::FindEntry(const PeerID &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PeerRegistry::Contains(const PeerID &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.find(id) != peers_.end();
}

std::optional<Peer> PeerRegistry::Remove(const PeerID &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  Peer removed = std::move(it->second.peer);
  peers_.erase(it);
  return removed;
}

std::optional<Peer> PeerRegistry::SetState(const PeerID &id, PeerState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  it->second.state = state;
  return it->second.peer;
}

bool PeerRegistry::BeginInvitation(const PeerID &id, bool skip_if_active) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return false;
  }
  const PeerState state = it->second.state;
  if (skip_if_active && (state == PeerState::INVITING || state == PeerState::CONNECTED)) {
    return false;
  }
  // A re-invite of a member is allowed but does not demote it
  if (state != PeerState::CONNECTED) {
    it->second.state = PeerState::INVITING;
  }
  return true;
}

std::optional<PeerState> PeerRegistry::AcceptInvitation(const PeerID &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  if (it->second.state != PeerState::CONNECTED) {
    it->second.state = PeerState::INVITING;
  }
  return it->second.state;
}

size_t PeerRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::vector<PeerEntry> PeerRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerEntry> result;
  result.reserve(peers_.size());
  for (const auto &[id, entry] : peers_) {
    result.push_back(entry);
  }
  std::sort(result.begin(), result.end(), [](const PeerEntry &a, const PeerEntry &b) {
    if (a.discovered_at != b.discovered_at) {
      return a.discovered_at < b.discovered_at;
    }
    return a.peer.id().token() < b.peer.id().token();
  });
  return result;
}

void PeerRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.clear();
}

} // namespace network
} // namespace nearlink
