// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp in C++20
#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace nearlink {
namespace network {

namespace detail {
class SessionImpl;
} // namespace detail

struct AsioTransportConfig {
  // Discovery beacons (UDP multicast)
  std::string multicast_address{"239.255.42.99"};
  uint16_t multicast_port{45454};
  std::chrono::milliseconds beacon_interval{1000};
  // Browsers report a peer lost after this long without an announce
  std::chrono::milliseconds peer_expiry{3000};

  // Session listener (TCP, ephemeral port)
  std::string listen_address{"0.0.0.0"};
  // Inbound links must send INVITE within this window
  std::chrono::seconds handshake_timeout{10};
};

/**
 * AsioMeshTransport - boost::asio implementation of Transport for a LAN
 *
 * Discovery: advertisers multicast JSON beacons every beacon_interval and a
 * "bye" beacon on stop; browsers track announcers of their service type and
 * expire silent ones after peer_expiry.
 *
 * Sessions: each Session listens on an ephemeral TCP port (carried in the
 * beacon). An inviter connects, sends INVITE and waits for ACCEPT/DECLINE.
 * Accepted links carry length-prefixed DATA frames in both directions.
 *
 * Threading: one io thread started by run(). Every socket operation runs on
 * it; public methods post onto it and may be called from any thread. Callbacks
 * are delivered on the io thread.
 *
 * Objects created by this transport must be destroyed before it.
 */
class AsioMeshTransport : public Transport {
public:
  explicit AsioMeshTransport(AsioTransportConfig config);
  ~AsioMeshTransport() override;

  AsioMeshTransport(const AsioMeshTransport &) = delete;
  AsioMeshTransport &operator=(const AsioMeshTransport &) = delete;

  // Start the io thread (idempotent)
  void run();

  // Drain already-posted work briefly, then stop and join the io thread
  void stop();

  bool is_running() const { return running_; }

  std::unique_ptr<Session>
  create_session(const PeerID &local, const std::vector<uint8_t> &security_identity,
                 EncryptionPreference encryption) override;

  std::unique_ptr<ServiceBrowser>
  create_browser(const PeerID &local, const std::string &service_type) override;

  std::unique_ptr<ServiceAdvertiser>
  create_advertiser(const PeerID &local, const std::optional<DiscoveryInfo> &info,
                    const std::string &service_type) override;

  const AsioTransportConfig &config() const { return config_; }

  // Listening port of a session created by this transport, 0 for any other
  static uint16_t session_port(const Session &session);

  /**
   * Invite a peer whose session address is already known, without waiting
   * for its beacon. The outcome is reported through the session's state
   * callback exactly as for a discovered peer.
   * Returns false if the session was not created by this transport or the
   * address does not parse.
   */
  bool invite_at(Session &session, const PeerID &peer, const std::string &address,
                 uint16_t port, const InvitationContext &context,
                 std::chrono::seconds timeout);

private:
  const AsioTransportConfig config_;

  // NOTE: io_context_ outlives every handler it queued; it is destroyed only
  // in the destructor after the io thread has been joined.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};

  // Sessions by local token, so an advertiser can publish its session port
  std::mutex sessions_mutex_;
  std::map<std::string, std::weak_ptr<detail::SessionImpl>> sessions_;
};

} // namespace network
} // namespace nearlink
