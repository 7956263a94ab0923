// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/connection_manager.hpp"
#include "network/identity_store.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace nearlink {
namespace network {

namespace {

// Application code must not unwind into the transport's threads
template <typename Callback, typename... Args>
void InvokeCallback(const char *name, const Callback &callback, Args &&...args) {
  if (!callback) {
    return;
  }
  try {
    callback(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("{} callback threw: {}", name, e.what());
  }
}

PeerState ToPeerState(SessionState state) {
  switch (state) {
  case SessionState::CONNECTING:
    return PeerState::INVITING;
  case SessionState::CONNECTED:
    return PeerState::CONNECTED;
  case SessionState::NOT_CONNECTED:
    return PeerState::DISCONNECTED;
  }
  return PeerState::DISCONNECTED;
}

PeerID RequireIdentity(PeerID me) {
  if (!me.IsValid()) {
    throw std::invalid_argument("invalid local identity '" + me.ToString() + "'");
  }
  return me;
}

std::unique_ptr<Session> RequireSession(std::unique_ptr<Session> session) {
  if (!session) {
    throw std::runtime_error("transport failed to create a session");
  }
  return session;
}

} // namespace

const MeshConfiguration &
ConnectionManager::RequireValid(const MeshConfiguration &config) {
  if (auto problem = ValidateConfiguration(config)) {
    throw std::invalid_argument("invalid mesh configuration: " + *problem);
  }
  return config;
}

ConnectionManager::ConnectionManager(Transport &transport, MeshConfiguration config)
    : ConnectionManager(transport, config,
                        FetchOrCreateIdentity(RequireValid(config).peer_name,
                                              config.identity_path)) {}

ConnectionManager::ConnectionManager(Transport &transport, MeshConfiguration config,
                                     PeerID me)
    : config_(RequireValid(config)),
      me_(RequireIdentity(std::move(me))),
      session_(RequireSession(transport.create_session(
          me_, config_.security.identity, config_.security.encryption_preference))),
      browser_(config_.has_mode(Mode::TRANSMITTER)
                   ? transport.create_browser(me_, config_.service_type)
                   : nullptr),
      advertiser_(config_.has_mode(Mode::RECEIVER)
                      ? transport.create_advertiser(me_, config_.discovery_info,
                                                    config_.service_type)
                      : nullptr),
      router_(*session_),
      completion_guard_(std::make_shared<CompletionGuard>()) {
  if (config_.modes.empty()) {
    LOG_NET_WARN("No mode configured, {} will neither advertise nor browse",
                 me_.ToString());
  }

  AttachTransportCallbacks();

  LOG_NET_INFO("Connection manager for {} on service '{}' (receiver={}, transmitter={})",
               me_.ToString(), config_.service_type, advertiser_ != nullptr,
               browser_ != nullptr);
}

ConnectionManager::~ConnectionManager() {
  {
    // Waits out a completion already running on another thread. Released
    // before detaching, which takes the transport's callback locks.
    std::lock_guard<std::mutex> lock(completion_guard_->mutex);
    completion_guard_->alive = false;
  }
  stop();
  DetachTransportCallbacks();
}

void ConnectionManager::AttachTransportCallbacks() {
  session_->set_data_callback(
      [this](const Payload &data, const PeerID &from) { HandleData(data, from); });
  session_->set_state_callback([this](const PeerID &peer, SessionState state) {
    HandleSessionStateChange(peer, state);
  });
  session_->set_stream_callback([](const PeerID &peer, const std::string &name) {
    LOG_SESSION_TRACE("Stream '{}' from {}", name, peer.ToString());
  });
  session_->set_resource_start_callback(
      [](const PeerID &peer, const std::string &name) {
        LOG_SESSION_TRACE("Resource '{}' started from {}", name, peer.ToString());
      });
  session_->set_resource_finish_callback(
      [](const PeerID &peer, const std::string &name,
         const std::optional<std::string> &, const std::optional<std::string> &error) {
        LOG_SESSION_TRACE("Resource '{}' from {} finished{}", name, peer.ToString(),
                          error ? " with error: " + *error : std::string());
      });

  if (browser_) {
    browser_->set_found_callback(
        [this](const PeerID &id, const std::optional<DiscoveryInfo> &info) {
          HandlePeerFound(id, info);
        });
    browser_->set_lost_callback([this](const PeerID &id) { HandlePeerLost(id); });
    browser_->set_error_callback([](const std::string &reason) {
      LOG_DISC_ERROR("Browsing did not start: {}", reason);
    });
  }

  if (advertiser_) {
    advertiser_->set_invitation_callback(
        [this](const PeerID &from, const InvitationContext &context,
               InvitationResponder respond) {
          HandleInvitation(from, context, std::move(respond));
        });
    advertiser_->set_error_callback([](const std::string &reason) {
      LOG_DISC_ERROR("Advertising did not start: {}", reason);
    });
  }
}

void ConnectionManager::DetachTransportCallbacks() {
  session_->set_data_callback(nullptr);
  session_->set_state_callback(nullptr);
  session_->set_stream_callback(nullptr);
  session_->set_resource_start_callback(nullptr);
  session_->set_resource_finish_callback(nullptr);

  if (browser_) {
    browser_->set_found_callback(nullptr);
    browser_->set_lost_callback(nullptr);
    browser_->set_error_callback(nullptr);
  }
  if (advertiser_) {
    advertiser_->set_invitation_callback(nullptr);
    advertiser_->set_error_callback(nullptr);
  }
}

void ConnectionManager::resume() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (advertiser_ && !advertising_) {
    advertiser_->start_advertising();
    advertising_ = true;
    LOG_DISC_INFO("Advertising '{}' as {}", config_.service_type, me_.ToString());
  }
  if (browser_ && !browsing_) {
    browser_->start_browsing();
    browsing_ = true;
    LOG_DISC_INFO("Browsing for '{}'", config_.service_type);
  }
}

void ConnectionManager::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (advertiser_) {
    advertiser_->stop_advertising();
    if (advertising_) {
      LOG_DISC_INFO("Stopped advertising");
    }
    advertising_ = false;
  }
  if (browser_) {
    browser_->stop_browsing();
    if (browsing_) {
      LOG_DISC_INFO("Stopped browsing");
    }
    browsing_ = false;
  }
}

bool ConnectionManager::is_running() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return advertising_ || browsing_;
}

SendResult ConnectionManager::broadcast(const Payload &data) {
  return router_.Broadcast(data);
}

SendResult ConnectionManager::send_to(const Payload &data,
                                      const std::vector<Peer> &peers) {
  return router_.SendTo(data, peers);
}

bool ConnectionManager::invite(const Peer &peer, const InvitationContext &context,
                               std::optional<std::chrono::seconds> timeout) {
  if (!browser_) {
    LOG_NET_WARN("Cannot invite {}: transmitter mode is not configured",
                 peer.id().ToString());
    return false;
  }
  if (!registry_.BeginInvitation(peer.id(), false)) {
    LOG_NET_DEBUG("Cannot invite {}: peer is not registered", peer.id().ToString());
    return false;
  }

  auto effective = timeout.value_or(config_.invitation_timeout);
  LOG_SESSION_DEBUG("Inviting {} (context {} bytes, timeout {}s)", peer.id().ToString(),
                    context ? context->size() : 0, effective.count());
  browser_->invite_peer(peer.id(), *session_, context, effective);
  return true;
}

std::vector<PeerEntry> ConnectionManager::available_peers() const {
  return registry_.Snapshot();
}

bool ConnectionManager::is_connected(const Peer &peer) const {
  auto connected = session_->connected_peers();
  return std::find(connected.begin(), connected.end(), peer.id()) != connected.end();
}

void ConnectionManager::disconnect() {
  LOG_SESSION_INFO("Leaving session");
  session_->disconnect();
}

void ConnectionManager::set_data_received_callback(DataReceivedCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_data_received_ = std::move(callback);
}

void ConnectionManager::set_peer_found_callback(PeerCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_peer_found_ = std::move(callback);
}

void ConnectionManager::set_peer_lost_callback(PeerCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_peer_lost_ = std::move(callback);
}

void ConnectionManager::set_peer_state_changed_callback(PeerStateCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_peer_state_changed_ = std::move(callback);
}

void ConnectionManager::HandlePeerFound(const PeerID &id,
                                        const std::optional<DiscoveryInfo> &info) {
  std::string error;
  auto peer = Peer::FromDiscovery(id, info, &error);
  if (!peer) {
    LOG_DISC_WARN("Ignoring malformed advertisement from {}: {}", id.ToString(), error);
    return;
  }

  bool inserted = registry_.Upsert(*peer);
  LOG_DISC_INFO("{} peer {}", inserted ? "Found" : "Rediscovered", id.ToString());

  PeerCallback found_cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    found_cb = on_peer_found_;
  }
  InvokeCallback("peer found", found_cb, *peer);

  const bool dedup = config_.invite_deduplication;
  if (dedup) {
    auto connected = session_->connected_peers();
    if (std::find(connected.begin(), connected.end(), id) != connected.end()) {
      LOG_SESSION_DEBUG("Not inviting {}: already connected", id.ToString());
      return;
    }
  }
  if (!registry_.BeginInvitation(id, dedup)) {
    LOG_SESSION_DEBUG("Not inviting {}: invitation in progress or peer gone",
                      id.ToString());
    return;
  }

  LOG_SESSION_DEBUG("Inviting {} (timeout {}s)", id.ToString(),
                    config_.invitation_timeout.count());
  browser_->invite_peer(id, *session_, std::nullopt, config_.invitation_timeout);
}

void ConnectionManager::HandlePeerLost(const PeerID &id) {
  auto removed = registry_.Remove(id);
  if (!removed) {
    LOG_DISC_TRACE("Lost event for unknown peer {}", id.ToString());
    return;
  }

  LOG_DISC_INFO("Lost peer {}", id.ToString());

  PeerCallback lost_cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    lost_cb = on_peer_lost_;
  }
  InvokeCallback("peer lost", lost_cb, *removed);
}

void ConnectionManager::HandleInvitation(const PeerID &from,
                                         const InvitationContext &context,
                                         InvitationResponder respond) {
  auto peer = registry_.Find(from);
  if (!peer) {
    LOG_SESSION_TRACE("Ignoring invitation from unknown peer {}", from.ToString());
    return;
  }

  LOG_SESSION_DEBUG("Invitation from {} (context {} bytes)", from.ToString(),
                    context ? context->size() : 0);

  auto answered = std::make_shared<std::atomic<bool>>(false);
  std::shared_ptr<CompletionGuard> guard = completion_guard_;
  Session *session = session_.get();

  InvitationCompletion complete = [this, answered, guard, session, from,
                                   respond](bool accept) {
    if (answered->exchange(true)) {
      LOG_SESSION_WARN("Invitation from {} already answered, ignoring second decision",
                       from.ToString());
      return;
    }

    std::lock_guard<std::mutex> lock(guard->mutex);
    if (!guard->alive) {
      LOG_SESSION_DEBUG("Rejecting invitation from {}: manager shut down",
                        from.ToString());
      respond(false, nullptr);
      return;
    }

    if (accept) {
      auto state = registry_.AcceptInvitation(from);
      LOG_SESSION_INFO("Accepted invitation from {}{}", from.ToString(),
                       state == PeerState::CONNECTED ? " (already connected)" : "");
    } else {
      LOG_SESSION_INFO("Declined invitation from {}", from.ToString());
    }
    respond(accept, accept ? session : nullptr);
  };

  try {
    config_.security.invitation_handler(*peer, context, complete);
  } catch (const std::exception &e) {
    LOG_SESSION_ERROR("Invitation handler threw for {}: {}", from.ToString(), e.what());
    // No-op if the handler answered before throwing
    complete(false);
  }
}

void ConnectionManager::HandleSessionStateChange(const PeerID &id, SessionState state) {
  PeerState peer_state = ToPeerState(state);
  auto peer = registry_.SetState(id, peer_state);
  if (!peer) {
    LOG_SESSION_DEBUG("Unregistered peer {} is now {}", id.ToString(),
                      SessionStateName(state));
    return;
  }

  LOG_SESSION_INFO("Peer {} is now {}", id.ToString(), SessionStateName(state));

  PeerStateCallback state_cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_cb = on_peer_state_changed_;
  }
  InvokeCallback("peer state", state_cb, *peer, peer_state);
}

void ConnectionManager::HandleData(const Payload &data, const PeerID &from) {
  LOG_SESSION_TRACE("Received {} bytes from {}", data.size(), from.ToString());

  DataReceivedCallback data_cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    data_cb = on_data_received_;
  }
  InvokeCallback("data received", data_cb, data, from.display_name());
}

} // namespace network
} // namespace nearlink
