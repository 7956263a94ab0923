// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/configuration.hpp"
#include "network/message_router.hpp"
#include "network/peer.hpp"
#include "network/peer_id.hpp"
#include "network/peer_registry.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nearlink {
namespace network {

/**
 * ConnectionManager - peer-session lifecycle coordinator
 *
 * Owns one Session and, depending on the configured modes, one
 * ServiceBrowser (TRANSMITTER) and one ServiceAdvertiser (RECEIVER). Their
 * event streams are routed into this single object:
 *
 *   browser found       -> register peer, notify, invite
 *   browser lost        -> unregister peer, notify
 *   advertiser invite   -> known peers only, ask the security policy
 *   session state       -> update registry state, notify
 *   session data        -> forward with the sender's display name
 *
 * Threading: the transport may deliver events from any thread. The registry
 * is the only shared mutable state and has its own lock; application
 * callbacks run on the delivering thread, never under an internal lock.
 *
 * Lifetime: callbacks registered on the transport objects are detached in the
 * destructor. An invitation completion invoked after destruction rejects.
 */
class ConnectionManager {
public:
  using DataReceivedCallback =
      std::function<void(const Payload &data, const std::string &sender_name)>;
  using PeerCallback = std::function<void(const Peer &peer)>;
  using PeerStateCallback = std::function<void(const Peer &peer, PeerState state)>;

  /**
   * Construct with the identity loaded from (or created at)
   * config.identity_path for config.peer_name
   * @throws std::invalid_argument if the configuration is invalid
   */
  ConnectionManager(Transport &transport, MeshConfiguration config);

  /**
   * Construct with an explicit local identity
   * @throws std::invalid_argument if the configuration or identity is invalid
   */
  ConnectionManager(Transport &transport, MeshConfiguration config, PeerID me);

  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  // Start advertising/browsing for the configured modes (idempotent)
  void resume();

  // Stop advertising/browsing (idempotent). The session stays up.
  void stop();

  bool is_running() const;

  SendResult broadcast(const Payload &data);
  SendResult send_to(const Payload &data, const std::vector<Peer> &peers);

  /**
   * Invite a registered peer with an application-supplied context
   * @param timeout Defaults to the configured invitation timeout
   * Returns false if the peer is not registered or TRANSMITTER mode is off
   */
  bool invite(const Peer &peer, const InvitationContext &context,
              std::optional<std::chrono::seconds> timeout = std::nullopt);

  // Registered peers with their lifecycle state
  std::vector<PeerEntry> available_peers() const;

  // True if the session currently reports the peer connected
  bool is_connected(const Peer &peer) const;

  // Leave the session (closes every link)
  void disconnect();

  const PeerID &me() const { return me_; }
  const MeshConfiguration &configuration() const { return config_; }
  const PeerRegistry &registry() const { return registry_; }
  const MessageRouter &router() const { return router_; }

  void set_data_received_callback(DataReceivedCallback callback);
  void set_peer_found_callback(PeerCallback callback);
  void set_peer_lost_callback(PeerCallback callback);
  void set_peer_state_changed_callback(PeerStateCallback callback);

private:
  static const MeshConfiguration &RequireValid(const MeshConfiguration &config);

  void AttachTransportCallbacks();
  void DetachTransportCallbacks();

  // Transport event handlers
  void HandlePeerFound(const PeerID &id, const std::optional<DiscoveryInfo> &info);
  void HandlePeerLost(const PeerID &id);
  void HandleInvitation(const PeerID &from, const InvitationContext &context,
                        InvitationResponder respond);
  void HandleSessionStateChange(const PeerID &id, SessionState state);
  void HandleData(const Payload &data, const PeerID &from);

  const MeshConfiguration config_;
  const PeerID me_;

  PeerRegistry registry_;

  // Session first: invitation responses and the router reference it
  std::unique_ptr<Session> session_;
  std::unique_ptr<ServiceBrowser> browser_;       // TRANSMITTER only
  std::unique_ptr<ServiceAdvertiser> advertiser_; // RECEIVER only
  MessageRouter router_;

  // Shared with invitation completions. A completion holds the mutex while
  // it touches the manager; the destructor clears alive under the same mutex.
  struct CompletionGuard {
    std::mutex mutex;
    bool alive{true};
  };
  std::shared_ptr<CompletionGuard> completion_guard_;

  mutable std::mutex lifecycle_mutex_;
  bool advertising_{false};
  bool browsing_{false};

  mutable std::mutex callback_mutex_;
  DataReceivedCallback on_data_received_;
  PeerCallback on_peer_found_;
  PeerCallback on_peer_lost_;
  PeerStateCallback on_peer_state_changed_;
};

} // namespace network
} // namespace nearlink
