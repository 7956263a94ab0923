// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/peer_id.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nearlink {
namespace network {

// Abstract transport boundary for the mesh
// Allows dependency injection of different implementations:
// - AsioMeshTransport: UDP multicast discovery + TCP sessions via boost::asio
// - MockTransport: call-recording fake for unit tests (in test/infra)
//
// Three independent event producers sit behind it:
//   Session           - data, membership changes, stream/resource events
//   ServiceBrowser    - found / lost peers (transmitter mode)
//   ServiceAdvertiser - inbound invitations (receiver mode)
// Their callbacks may fire from any thread, concurrently, in any order.

using Payload = std::vector<uint8_t>;

// Opaque blob carried with an invitation (absent when the inviter sends none)
using InvitationContext = std::optional<std::vector<uint8_t>>;

enum class SessionState {
  NOT_CONNECTED,
  CONNECTING,
  CONNECTED
};

enum class SendMode {
  RELIABLE,   // In-order, retransmitted delivery per destination
  UNRELIABLE  // Best-effort
};

enum class EncryptionPreference {
  OPTIONAL,
  REQUIRED,
  NONE
};

enum class TransportError {
  NO_PEERS,          // Empty destination set
  NOT_CONNECTED,     // A destination has no active session route
  PAYLOAD_TOO_LARGE, // Payload exceeds the transport frame limit
  SESSION_CLOSED,    // Session torn down
  IO_FAILURE         // Socket-level failure
};

const char *SessionStateName(SessionState state);
const char *TransportErrorName(TransportError error);

/**
 * SendResult - outcome of a send operation
 *
 * Default-constructed result is success. Failure carries a TransportError
 * code plus a human-readable message; there is no partial-success state.
 */
class SendResult {
public:
  SendResult() = default;

  static SendResult Success() { return SendResult(); }
  static SendResult Failure(TransportError error, std::string message) {
    SendResult result;
    result.error_ = error;
    result.message_ = std::move(message);
    return result;
  }

  bool IsSuccess() const { return !error_.has_value(); }
  explicit operator bool() const { return IsSuccess(); }

  std::optional<TransportError> error() const { return error_; }
  const std::string &message() const { return message_; }

  // "ok" or "<error name>: <message>"
  std::string ToString() const;

private:
  std::optional<TransportError> error_;
  std::string message_;
};

// Multi-party session joined through accepted invitations
class Session {
public:
  using DataCallback =
      std::function<void(const Payload &data, const PeerID &from)>;
  using StateCallback =
      std::function<void(const PeerID &peer, SessionState state)>;
  using StreamCallback =
      std::function<void(const PeerID &peer, const std::string &stream_name)>;
  using ResourceStartCallback =
      std::function<void(const PeerID &peer, const std::string &resource_name)>;
  using ResourceFinishCallback =
      std::function<void(const PeerID &peer, const std::string &resource_name,
                         const std::optional<std::string> &local_path,
                         const std::optional<std::string> &error)>;

  virtual ~Session() = default;

  virtual const PeerID &local_peer() const = 0;

  // Live list of peers currently connected to this session
  virtual std::vector<PeerID> connected_peers() const = 0;

  // Send to the given peers. The transport decides whether a multi-peer
  // send can partially succeed; callers only see success or one error.
  virtual SendResult send(const Payload &data, const std::vector<PeerID> &peers,
                          SendMode mode) = 0;

  // Leave the session (every link is closed)
  virtual void disconnect() = 0;

  virtual void set_data_callback(DataCallback callback) = 0;
  virtual void set_state_callback(StateCallback callback) = 0;
  virtual void set_stream_callback(StreamCallback callback) = 0;
  virtual void set_resource_start_callback(ResourceStartCallback callback) = 0;
  virtual void set_resource_finish_callback(ResourceFinishCallback callback) = 0;
};

// Discovers advertisers of one service type and invites them into a session
class ServiceBrowser {
public:
  using FoundCallback = std::function<void(
      const PeerID &peer, const std::optional<DiscoveryInfo> &info)>;
  using LostCallback = std::function<void(const PeerID &peer)>;
  using ErrorCallback = std::function<void(const std::string &reason)>;

  virtual ~ServiceBrowser() = default;

  virtual void start_browsing() = 0;
  virtual void stop_browsing() = 0;

  // The transport bounds the invitation lifetime with `timeout`; an
  // unanswered invitation surfaces as a NOT_CONNECTED session state change
  virtual void invite_peer(const PeerID &peer, Session &session,
                           const InvitationContext &context,
                           std::chrono::seconds timeout) = 0;

  virtual void set_found_callback(FoundCallback callback) = 0;
  virtual void set_lost_callback(LostCallback callback) = 0;
  virtual void set_error_callback(ErrorCallback callback) = 0;
};

// Answer to an inbound invitation: accept attaches the inviter to `session`,
// reject passes nullptr
using InvitationResponder = std::function<void(bool accept, Session *session)>;

// Makes the local peer discoverable and receives invitations
class ServiceAdvertiser {
public:
  using InvitationCallback =
      std::function<void(const PeerID &from, const InvitationContext &context,
                         InvitationResponder respond)>;
  using ErrorCallback = std::function<void(const std::string &reason)>;

  virtual ~ServiceAdvertiser() = default;

  virtual void start_advertising() = 0;
  virtual void stop_advertising() = 0;

  virtual void set_invitation_callback(InvitationCallback callback) = 0;
  virtual void set_error_callback(ErrorCallback callback) = 0;
};

// Transport - factory for the three event producers of one local peer
// Objects it returns must not outlive the transport.
class Transport {
public:
  virtual ~Transport() = default;

  virtual std::unique_ptr<Session>
  create_session(const PeerID &local, const std::vector<uint8_t> &security_identity,
                 EncryptionPreference encryption) = 0;

  virtual std::unique_ptr<ServiceBrowser>
  create_browser(const PeerID &local, const std::string &service_type) = 0;

  virtual std::unique_ptr<ServiceAdvertiser>
  create_advertiser(const PeerID &local, const std::optional<DiscoveryInfo> &info,
                    const std::string &service_type) = 0;
};

} // namespace network
} // namespace nearlink
