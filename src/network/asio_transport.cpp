// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "network/asio_transport.hpp"
#include "network/wire.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <future>
#include <set>
#include <vector>

namespace nearlink {
namespace network {

using tcp = boost::asio::ip::tcp;
using udp = boost::asio::ip::udp;

namespace detail {

class AdvertiserImpl;

// ============================================================================
// Link - one framed TCP connection
// ============================================================================

class Link : public std::enable_shared_from_this<Link> {
public:
  using FrameCallback =
      std::function<void(wire::FrameType type, std::vector<uint8_t> body)>;
  using CloseCallback = std::function<void()>;

  explicit Link(boost::asio::io_context &io) : io_(io), socket_(io) {}
  Link(boost::asio::io_context &io, tcp::socket socket)
      : io_(io), socket_(std::move(socket)) {}

  Link(const Link &) = delete;
  Link &operator=(const Link &) = delete;

  tcp::socket &socket() { return socket_; }

  // io thread only. Starts the read loop.
  void Start(FrameCallback on_frame, CloseCallback on_close) {
    on_frame_ = std::move(on_frame);
    on_close_ = std::move(on_close);

    boost::system::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown")
                 : ep.address().to_string() + ":" + std::to_string(ep.port());

    boost::system::error_code opt_ec;
    socket_.set_option(tcp::no_delay(true), opt_ec);

    open_ = true;
    ReadHeader();
  }

  // Any thread. Frames queued before Start() or after close are dropped.
  void Send(std::shared_ptr<const std::vector<uint8_t>> frame, bool close_after = false) {
    boost::asio::post(io_, [self = shared_from_this(), frame, close_after]() {
      if (!self->open_) {
        return;
      }
      self->queue_.push_back(frame);
      self->close_when_drained_ = self->close_when_drained_ || close_after;
      if (!self->writing_) {
        self->DoWrite();
      }
    });
  }

  // Any thread
  void Close() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->CloseImpl(); });
  }

  // io thread only
  void CloseImpl() {
    bool was_open = open_.exchange(false);

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    queue_.clear();
    writing_ = false;

    // Break callback -> link cycles before notifying
    on_frame_ = nullptr;
    CloseCallback on_close = std::move(on_close_);
    on_close_ = nullptr;

    if (was_open && on_close) {
      on_close();
    }
  }

  bool IsOpen() const { return open_; }
  const std::string &remote() const { return remote_; }

  // Peer identified by the INVITE (inbound) or invited (outbound), io thread only
  const std::optional<PeerID> &peer() const { return peer_; }
  void set_peer(const PeerID &peer) { peer_ = peer; }

private:
  void ReadHeader() {
    boost::asio::async_read(
        socket_, boost::asio::buffer(header_),
        [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
          if (!self->open_) {
            return;
          }
          if (ec) {
            if (ec != boost::asio::error::eof &&
                ec != boost::asio::error::operation_aborted) {
              LOG_SESSION_TRACE("read error from {}: {}", self->remote_, ec.message());
            }
            self->CloseImpl();
            return;
          }

          auto header = wire::DecodeFrameHeader(self->header_.data());
          if (!header) {
            LOG_SESSION_WARN("Invalid frame header from {}, closing link", self->remote_);
            self->CloseImpl();
            return;
          }

          if (header->body_size == 0) {
            self->Deliver(header->type, {});
            if (self->open_) {
              self->ReadHeader();
            }
            return;
          }
          self->ReadBody(*header);
        });
  }

  void ReadBody(const wire::FrameHeader &header) {
    auto body = std::make_shared<std::vector<uint8_t>>(header.body_size);
    boost::asio::async_read(
        socket_, boost::asio::buffer(*body),
        [self = shared_from_this(), body, type = header.type](
            const boost::system::error_code &ec, size_t) {
          if (!self->open_) {
            return;
          }
          if (ec) {
            LOG_SESSION_TRACE("read error from {}: {}", self->remote_, ec.message());
            self->CloseImpl();
            return;
          }
          self->Deliver(type, std::move(*body));
          if (self->open_) {
            self->ReadHeader();
          }
        });
  }

  void Deliver(wire::FrameType type, std::vector<uint8_t> body) {
    FrameCallback on_frame = on_frame_;
    if (!on_frame) {
      return;
    }
    try {
      on_frame(type, std::move(body));
    } catch (const std::exception &e) {
      LOG_SESSION_ERROR("exception handling {} frame from {}: {}",
                        wire::FrameTypeName(type), remote_, e.what());
    }
  }

  void DoWrite() {
    writing_ = true;
    auto frame = queue_.front();
    boost::asio::async_write(
        socket_, boost::asio::buffer(*frame),
        [self = shared_from_this(), frame](const boost::system::error_code &ec, size_t) {
          if (!self->open_) {
            return;
          }
          if (ec) {
            LOG_SESSION_TRACE("write error to {}: {}", self->remote_, ec.message());
            self->CloseImpl();
            return;
          }
          self->queue_.pop_front();
          if (!self->queue_.empty()) {
            self->DoWrite();
            return;
          }
          self->writing_ = false;
          if (self->close_when_drained_) {
            self->CloseImpl();
          }
        });
  }

  boost::asio::io_context &io_;
  tcp::socket socket_;
  std::string remote_;
  std::optional<PeerID> peer_;

  std::array<uint8_t, wire::FRAME_HEADER_SIZE> header_{};
  std::deque<std::shared_ptr<const std::vector<uint8_t>>> queue_;
  bool writing_{false};
  bool close_when_drained_{false};

  FrameCallback on_frame_;
  CloseCallback on_close_;
  std::atomic<bool> open_{false};
};

using LinkPtr = std::shared_ptr<Link>;

std::shared_ptr<const std::vector<uint8_t>>
MakeFrame(wire::FrameType type, const std::vector<uint8_t> &body = {}) {
  return std::make_shared<const std::vector<uint8_t>>(wire::EncodeFrame(type, body));
}

// ============================================================================
// SessionImpl
// ============================================================================

class SessionImpl : public std::enable_shared_from_this<SessionImpl> {
public:
  SessionImpl(boost::asio::io_context &io, PeerID local, const AsioTransportConfig &config)
      : io_(io), local_(std::move(local)), config_(config) {}

  // Bind the listener (caller thread, before any handler runs)
  bool Listen(std::string &error) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.listen_address, ec);
    if (ec) {
      error = "invalid listen address '" + config_.listen_address + "'";
      return false;
    }

    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(address, 0);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_->bind(endpoint, ec);
    if (!ec) acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      error = "failed to listen on " + config_.listen_address + ": " + ec.message();
      acceptor_.reset();
      return false;
    }

    port_ = acceptor_->local_endpoint(ec).port();
    LOG_SESSION_INFO("Session for {} listening on port {}", local_.ToString(), port_);

    boost::asio::post(io_, [self = shared_from_this()]() { self->StartAccept(); });
    return true;
  }

  const PeerID &local() const { return local_; }
  uint16_t port() const { return port_; }

  std::vector<PeerID> ConnectedPeers() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<PeerID> result;
    result.reserve(members_.size());
    for (const auto &[token, member] : members_) {
      result.push_back(member.id);
    }
    return result;
  }

  SendResult Send(const Payload &data, const std::vector<PeerID> &peers) {
    if (peers.empty()) {
      return SendResult::Failure(TransportError::NO_PEERS, "no destination peers");
    }
    if (data.size() > wire::MAX_FRAME_BODY) {
      return SendResult::Failure(TransportError::PAYLOAD_TOO_LARGE,
                                 std::to_string(data.size()) + " bytes exceeds " +
                                     std::to_string(wire::MAX_FRAME_BODY));
    }

    std::vector<LinkPtr> targets;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (shutdown_) {
        return SendResult::Failure(TransportError::SESSION_CLOSED, "session shut down");
      }
      for (const auto &peer : peers) {
        auto it = members_.find(peer.token());
        LinkPtr link;
        if (it != members_.end()) {
          for (const auto &candidate : it->second.links) {
            if (candidate->IsOpen()) {
              link = candidate;
              break;
            }
          }
        }
        if (!link) {
          return SendResult::Failure(TransportError::NOT_CONNECTED,
                                     peer.ToString() + " is not connected");
        }
        targets.push_back(std::move(link));
      }
    }

    auto frame = MakeFrame(wire::FrameType::DATA, data);
    for (const auto &link : targets) {
      link->Send(frame);
    }
    return SendResult::Success();
  }

  void Invite(const PeerID &peer, const tcp::endpoint &endpoint,
              const InvitationContext &context, std::chrono::seconds timeout) {
    boost::asio::post(io_, [self = shared_from_this(), peer, endpoint, context, timeout]() {
      self->InviteImpl(peer, endpoint, context, timeout);
    });
  }

  // Invitation that could not even be attempted (unknown endpoint)
  void ReportInviteFailure(const PeerID &peer) {
    boost::asio::post(io_, [self = shared_from_this(), peer]() {
      self->NotifyState(peer, SessionState::NOT_CONNECTED);
    });
  }

  void SetInvitationSink(std::weak_ptr<AdvertiserImpl> sink) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    sink_ = std::move(sink);
  }

  void Disconnect() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->CloseAllLinks(); });
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      data_cb_ = nullptr;
      state_cb_ = nullptr;
      stream_cb_ = nullptr;
      resource_start_cb_ = nullptr;
      resource_finish_cb_ = nullptr;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      shutdown_ = true;
      sink_.reset();
    }
    boost::asio::post(io_, [self = shared_from_this()]() {
      if (self->acceptor_) {
        boost::system::error_code ec;
        self->acceptor_->close(ec);
      }
      self->CloseAllLinks();
    });
  }

  void set_data_callback(Session::DataCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    data_cb_ = std::move(cb);
  }
  void set_state_callback(Session::StateCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_cb_ = std::move(cb);
  }
  void set_stream_callback(Session::StreamCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    stream_cb_ = std::move(cb);
  }
  void set_resource_start_callback(Session::ResourceStartCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    resource_start_cb_ = std::move(cb);
  }
  void set_resource_finish_callback(Session::ResourceFinishCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    resource_finish_cb_ = std::move(cb);
  }

  // Called by the advertiser's responder on the io thread
  void CompleteInbound(const LinkPtr &link, const PeerID &from, bool accept);

private:
  struct Member {
    PeerID id;
    std::vector<LinkPtr> links;
  };

  struct PendingInvite {
    LinkPtr link;
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  void StartAccept() {
    if (!acceptor_ || !acceptor_->is_open()) {
      return;
    }
    acceptor_->async_accept(
        [self = shared_from_this()](const boost::system::error_code &ec, tcp::socket socket) {
          if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
              LOG_SESSION_TRACE("accept error: {}", ec.message());
              self->StartAccept();
            }
            return;
          }
          self->HandleInbound(std::make_shared<Link>(self->io_, std::move(socket)));
          self->StartAccept();
        });
  }

  void HandleInbound(const LinkPtr &link) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (shutdown_) {
        link->CloseImpl();
        return;
      }
      handshaking_.insert(link);
    }
    AttachLinkCallbacks(link);
    LOG_SESSION_DEBUG("Inbound link from {}", link->remote());

    // Drop links that never send INVITE
    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(config_.handshake_timeout);
    std::weak_ptr<Link> weak_link = link;
    timer->async_wait([self = shared_from_this(), weak_link,
                       timer](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      auto link = weak_link.lock();
      if (!link || link->peer()) {
        return;
      }
      LOG_SESSION_DEBUG("No invitation from {} within {}s, closing", link->remote(),
                        self->config_.handshake_timeout.count());
      link->CloseImpl();
    });
  }

  void AttachLinkCallbacks(const LinkPtr &link) {
    std::weak_ptr<SessionImpl> weak_self = shared_from_this();
    std::weak_ptr<Link> weak_link = link;
    link->Start(
        [weak_self, weak_link](wire::FrameType type, std::vector<uint8_t> body) {
          auto self = weak_self.lock();
          auto link = weak_link.lock();
          if (self && link) {
            self->OnFrame(link, type, std::move(body));
          }
        },
        [weak_self, weak_link]() {
          auto self = weak_self.lock();
          auto link = weak_link.lock();
          if (self && link) {
            self->OnLinkClosed(link);
          }
        });
  }

  void InviteImpl(const PeerID &peer, const tcp::endpoint &endpoint,
                  const InvitationContext &context, std::chrono::seconds timeout) {
    auto link = std::make_shared<Link>(io_);
    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (shutdown_) {
        return;
      }
      if (members_.count(peer.token())) {
        LOG_SESSION_DEBUG("{} is already connected, invitation not sent", peer.ToString());
        return;
      }
      if (pending_.count(peer.token())) {
        LOG_SESSION_DEBUG("Invitation to {} already in flight", peer.ToString());
        return;
      }
      pending_[peer.token()] = PendingInvite{link, timer};
    }
    link->set_peer(peer);
    NotifyState(peer, SessionState::CONNECTING);

    timer->expires_after(timeout);
    timer->async_wait([self = shared_from_this(), peer, link](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      LOG_SESSION_INFO("Invitation to {} timed out", peer.ToString());
      self->FailPending(peer, link);
    });

    LOG_SESSION_DEBUG("Connecting to {} at {}:{}", peer.ToString(),
                      endpoint.address().to_string(), endpoint.port());

    link->socket().async_connect(
        endpoint, [self = shared_from_this(), peer, link,
                   context](const boost::system::error_code &ec) {
          if (!self->IsPending(peer, link)) {
            return;
          }
          if (ec) {
            LOG_SESSION_DEBUG("Failed to connect to {}: {}", peer.ToString(), ec.message());
            self->FailPending(peer, link);
            return;
          }
          self->AttachLinkCallbacks(link);
          link->Send(MakeFrame(wire::FrameType::INVITE,
                               wire::EncodeInvite({self->local_, context})));
        });
  }

  bool IsPending(const PeerID &peer, const LinkPtr &link) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = pending_.find(peer.token());
    return it != pending_.end() && it->second.link == link;
  }

  // Returns the pending entry if `link` is still the in-flight invitation
  std::optional<PendingInvite> TakePending(const PeerID &peer, const LinkPtr &link) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = pending_.find(peer.token());
    if (it == pending_.end() || it->second.link != link) {
      return std::nullopt;
    }
    PendingInvite pending = std::move(it->second);
    pending_.erase(it);
    return pending;
  }

  void FailPending(const PeerID &peer, const LinkPtr &link) {
    auto pending = TakePending(peer, link);
    if (!pending) {
      return;
    }
    pending->timer->cancel();
    link->CloseImpl();
    NotifyState(peer, SessionState::NOT_CONNECTED);
  }

  void OnFrame(const LinkPtr &link, wire::FrameType type, std::vector<uint8_t> body) {
    switch (type) {
    case wire::FrameType::INVITE:
      HandleInvite(link, body);
      return;
    case wire::FrameType::ACCEPT:
    case wire::FrameType::DECLINE:
      HandleAnswer(link, type);
      return;
    case wire::FrameType::DATA:
      HandleData(link, std::move(body));
      return;
    }
  }

  void HandleInvite(const LinkPtr &link, const std::vector<uint8_t> &body);

  void HandleAnswer(const LinkPtr &link, wire::FrameType type) {
    if (!link->peer()) {
      LOG_SESSION_DEBUG("Unexpected {} from {}", wire::FrameTypeName(type), link->remote());
      return;
    }
    PeerID peer = *link->peer();
    auto pending = TakePending(peer, link);
    if (!pending) {
      LOG_SESSION_TRACE("Stale {} from {}", wire::FrameTypeName(type), peer.ToString());
      return;
    }
    pending->timer->cancel();

    if (type == wire::FrameType::DECLINE) {
      LOG_SESSION_INFO("{} declined the invitation", peer.ToString());
      link->CloseImpl();
      NotifyState(peer, SessionState::NOT_CONNECTED);
      return;
    }
    AttachMember(peer, link);
  }

  void HandleData(const LinkPtr &link, std::vector<uint8_t> body) {
    std::optional<PeerID> from;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (link->peer()) {
        auto it = members_.find(link->peer()->token());
        if (it != members_.end()) {
          from = it->second.id;
        }
      }
    }
    if (!from) {
      LOG_SESSION_TRACE("Dropping data from non-member link {}", link->remote());
      return;
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (data_cb_) {
      data_cb_(body, *from);
    }
  }

  void AttachMember(const PeerID &peer, const LinkPtr &link) {
    bool first = false;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto &member = members_[peer.token()];
      first = member.links.empty();
      member.id = peer;
      member.links.push_back(link);
    }
    if (first) {
      LOG_SESSION_INFO("{} joined the session via {}", peer.ToString(), link->remote());
      NotifyState(peer, SessionState::CONNECTED);
    } else {
      LOG_SESSION_DEBUG("Additional link to {} via {}", peer.ToString(), link->remote());
    }
  }

  void OnLinkClosed(const LinkPtr &link) {
    std::optional<PeerID> left;
    bool was_pending = false;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      handshaking_.erase(link);
      if (link->peer()) {
        auto pending = pending_.find(link->peer()->token());
        was_pending = pending != pending_.end() && pending->second.link == link;

        auto it = members_.find(link->peer()->token());
        if (it != members_.end()) {
          auto &links = it->second.links;
          links.erase(std::remove(links.begin(), links.end(), link), links.end());
          if (links.empty()) {
            left = it->second.id;
            members_.erase(it);
          }
        }
      }
    }

    if (was_pending) {
      FailPending(*link->peer(), link);
    }
    if (left) {
      LOG_SESSION_INFO("{} left the session", left->ToString());
      NotifyState(*left, SessionState::NOT_CONNECTED);
    }
  }

  void CloseAllLinks() {
    std::vector<LinkPtr> links;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      for (const auto &[token, member] : members_) {
        links.insert(links.end(), member.links.begin(), member.links.end());
      }
      for (const auto &[token, pending] : pending_) {
        links.push_back(pending.link);
      }
      links.insert(links.end(), handshaking_.begin(), handshaking_.end());
    }
    // Close callbacks update members_/pending_ and report NOT_CONNECTED
    for (const auto &link : links) {
      link->CloseImpl();
    }
  }

  void NotifyState(const PeerID &peer, SessionState state) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (!state_cb_) {
      return;
    }
    try {
      state_cb_(peer, state);
    } catch (const std::exception &e) {
      LOG_SESSION_ERROR("session state callback threw: {}", e.what());
    }
  }

  boost::asio::io_context &io_;
  const PeerID local_;
  const AsioTransportConfig &config_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  uint16_t port_{0};

  mutable std::mutex state_mutex_;
  std::map<std::string, Member> members_;
  std::map<std::string, PendingInvite> pending_;
  std::set<LinkPtr> handshaking_;
  std::weak_ptr<AdvertiserImpl> sink_;
  bool shutdown_{false};

  // Held while a callback runs, so clearing waits for in-flight deliveries
  std::mutex callback_mutex_;
  Session::DataCallback data_cb_;
  Session::StateCallback state_cb_;
  Session::StreamCallback stream_cb_;
  Session::ResourceStartCallback resource_start_cb_;
  Session::ResourceFinishCallback resource_finish_cb_;
};

// ============================================================================
// AdvertiserImpl
// ============================================================================

class AdvertiserImpl : public std::enable_shared_from_this<AdvertiserImpl> {
public:
  AdvertiserImpl(boost::asio::io_context &io, PeerID local,
                 std::optional<DiscoveryInfo> info, std::string service_type,
                 const AsioTransportConfig &config, std::weak_ptr<SessionImpl> session)
      : io_(io), local_(std::move(local)), info_(std::move(info)),
        service_type_(std::move(service_type)), config_(config),
        session_(std::move(session)), socket_(io), timer_(io) {}

  void Start() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->StartImpl(); });
  }

  void Stop() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->StopImpl(); });
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      invitation_cb_ = nullptr;
      error_cb_ = nullptr;
    }
    Stop();
  }

  // io thread. Answers with a rejection when nobody is listening.
  void DeliverInvitation(const PeerID &from, const InvitationContext &context,
                         const InvitationResponder &respond) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (!running_ || !invitation_cb_) {
      LOG_SESSION_DEBUG("Declining invitation from {}: not advertising", from.ToString());
      respond(false, nullptr);
      return;
    }
    try {
      invitation_cb_(from, context, respond);
    } catch (const std::exception &e) {
      LOG_SESSION_ERROR("invitation callback threw: {}", e.what());
      respond(false, nullptr);
    }
  }

  void set_invitation_callback(ServiceAdvertiser::InvitationCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    invitation_cb_ = std::move(cb);
  }
  void set_error_callback(ServiceAdvertiser::ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_cb_ = std::move(cb);
  }

private:
  void StartImpl() {
    if (running_) {
      return;
    }

    auto session = session_.lock();
    if (!session) {
      ReportError("no session for " + local_.ToString());
      return;
    }

    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address(config_.multicast_address, ec);
    if (ec || !group.is_multicast()) {
      ReportError("invalid multicast group '" + config_.multicast_address + "'");
      return;
    }
    destination_ = udp::endpoint(group, config_.multicast_port);

    socket_.open(destination_.protocol(), ec);
    if (!ec) socket_.set_option(boost::asio::ip::multicast::enable_loopback(true), ec);
    if (!ec) socket_.set_option(boost::asio::ip::multicast::hops(1), ec);
    if (ec) {
      ReportError("failed to open beacon socket: " + ec.message());
      boost::system::error_code ignored;
      socket_.close(ignored);
      return;
    }

    running_ = true;
    session->SetInvitationSink(weak_from_this());
    LOG_DISC_DEBUG("Announcing {} on {}:{} (session port {})", local_.ToString(),
                   config_.multicast_address, config_.multicast_port, session->port());
    Announce();
  }

  void StopImpl() {
    if (!running_) {
      return;
    }
    running_ = false;
    timer_.cancel();

    // Best effort so browsers drop us before expiry
    SendBeacon(wire::BeaconOp::BYE);

    boost::system::error_code ec;
    socket_.close(ec);

    if (auto session = session_.lock()) {
      session->SetInvitationSink({});
    }
  }

  void Announce() {
    if (!running_) {
      return;
    }
    SendBeacon(wire::BeaconOp::ANNOUNCE);

    timer_.expires_after(config_.beacon_interval);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      self->Announce();
    });
  }

  void SendBeacon(wire::BeaconOp op) {
    auto session = session_.lock();
    if (!session) {
      return;
    }

    wire::Beacon beacon;
    beacon.op = op;
    beacon.service_type = service_type_;
    beacon.peer = local_;
    beacon.port = session->port();
    beacon.info = info_;

    std::string datagram = wire::EncodeBeacon(beacon);
    if (datagram.size() > wire::MAX_BEACON_SIZE) {
      LOG_DISC_ERROR("Beacon is {} bytes (max {}), not sent", datagram.size(),
                     wire::MAX_BEACON_SIZE);
      return;
    }

    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(datagram), destination_, 0, ec);
    if (ec) {
      LOG_DISC_WARN("Failed to send beacon: {}", ec.message());
    }
  }

  void ReportError(const std::string &reason) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (error_cb_) {
      error_cb_(reason);
    } else {
      LOG_DISC_ERROR("Advertiser error: {}", reason);
    }
  }

  boost::asio::io_context &io_;
  const PeerID local_;
  const std::optional<DiscoveryInfo> info_;
  const std::string service_type_;
  const AsioTransportConfig &config_;
  std::weak_ptr<SessionImpl> session_;

  // io thread only
  udp::socket socket_;
  udp::endpoint destination_;
  boost::asio::steady_timer timer_;
  std::atomic<bool> running_{false};

  std::mutex callback_mutex_;
  ServiceAdvertiser::InvitationCallback invitation_cb_;
  ServiceAdvertiser::ErrorCallback error_cb_;
};

void SessionImpl::HandleInvite(const LinkPtr &link, const std::vector<uint8_t> &body) {
  if (link->peer()) {
    LOG_SESSION_DEBUG("Duplicate INVITE on link {}, ignoring", link->remote());
    return;
  }

  auto invite = wire::DecodeInvite(body);
  if (!invite) {
    LOG_SESSION_WARN("Malformed INVITE from {}, closing link", link->remote());
    link->CloseImpl();
    return;
  }
  link->set_peer(invite->from);

  std::shared_ptr<AdvertiserImpl> sink;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    sink = sink_.lock();
  }
  if (!sink) {
    LOG_SESSION_DEBUG("Declining invitation from {}: not advertising",
                      invite->from.ToString());
    link->Send(MakeFrame(wire::FrameType::DECLINE), true);
    return;
  }

  auto answered = std::make_shared<std::atomic<bool>>(false);
  std::weak_ptr<SessionImpl> weak_self = shared_from_this();
  PeerID from = invite->from;
  InvitationResponder respond = [weak_self, link, from, answered](bool accept,
                                                                  Session *session) {
    if (answered->exchange(true)) {
      return;
    }
    auto self = weak_self.lock();
    if (!self) {
      link->Close();
      return;
    }
    bool attach = accept && session != nullptr;
    boost::asio::post(self->io_, [self, link, from, attach]() {
      self->CompleteInbound(link, from, attach);
    });
  };

  sink->DeliverInvitation(from, invite->context, respond);
}

void SessionImpl::CompleteInbound(const LinkPtr &link, const PeerID &from, bool accept) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    handshaking_.erase(link);
  }
  if (!link->IsOpen()) {
    return;
  }
  if (!accept) {
    link->Send(MakeFrame(wire::FrameType::DECLINE), true);
    return;
  }
  link->Send(MakeFrame(wire::FrameType::ACCEPT));
  AttachMember(from, link);
}

// ============================================================================
// BrowserImpl
// ============================================================================

class BrowserImpl : public std::enable_shared_from_this<BrowserImpl> {
public:
  BrowserImpl(boost::asio::io_context &io, PeerID local, std::string service_type,
              const AsioTransportConfig &config)
      : io_(io), local_(std::move(local)), service_type_(std::move(service_type)),
        config_(config), socket_(io), expiry_timer_(io) {}

  void Start() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->StartImpl(); });
  }

  void Stop() {
    boost::asio::post(io_, [self = shared_from_this()]() { self->StopImpl(); });
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      found_cb_ = nullptr;
      lost_cb_ = nullptr;
      error_cb_ = nullptr;
    }
    Stop();
  }

  std::optional<tcp::endpoint> EndpointOf(const PeerID &peer) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = peers_.find(peer.token());
    if (it == peers_.end()) {
      return std::nullopt;
    }
    return it->second.endpoint;
  }

  void set_found_callback(ServiceBrowser::FoundCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    found_cb_ = std::move(cb);
  }
  void set_lost_callback(ServiceBrowser::LostCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    lost_cb_ = std::move(cb);
  }
  void set_error_callback(ServiceBrowser::ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_cb_ = std::move(cb);
  }

private:
  struct Advertised {
    PeerID id;
    tcp::endpoint endpoint;
    std::optional<DiscoveryInfo> info;
    std::chrono::steady_clock::time_point last_seen;
  };

  void StartImpl() {
    if (running_) {
      return;
    }

    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address(config_.multicast_address, ec);
    if (ec || !group.is_v4() || !group.is_multicast()) {
      ReportError("invalid multicast group '" + config_.multicast_address + "'");
      return;
    }

    udp::endpoint listen(boost::asio::ip::address_v4::any(), config_.multicast_port);
    socket_.open(listen.protocol(), ec);
    if (!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
    if (!ec) socket_.bind(listen, ec);
    if (!ec) socket_.set_option(boost::asio::ip::multicast::join_group(group.to_v4()), ec);
    if (ec) {
      ReportError("failed to join " + config_.multicast_address + ":" +
                  std::to_string(config_.multicast_port) + ": " + ec.message());
      boost::system::error_code ignored;
      socket_.close(ignored);
      return;
    }

    running_ = true;
    LOG_DISC_DEBUG("Listening for '{}' beacons on {}:{}", service_type_,
                   config_.multicast_address, config_.multicast_port);
    Receive();
    ScheduleExpiry();
  }

  void StopImpl() {
    if (!running_) {
      return;
    }
    running_ = false;
    expiry_timer_.cancel();

    boost::system::error_code ec;
    socket_.close(ec);

    // Not reported as lost: browsing stopped, the peers did not leave
    std::lock_guard<std::mutex> lock(state_mutex_);
    peers_.clear();
  }

  void Receive() {
    socket_.async_receive_from(
        boost::asio::buffer(recv_buffer_), sender_,
        [self = shared_from_this()](const boost::system::error_code &ec, size_t bytes) {
          if (!self->running_) {
            return;
          }
          if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
              return;
            }
            LOG_DISC_TRACE("beacon receive error: {}", ec.message());
          } else {
            self->HandleBeacon(std::string(self->recv_buffer_.data(), bytes),
                               self->sender_.address());
          }
          self->Receive();
        });
  }

  void HandleBeacon(const std::string &datagram, const boost::asio::ip::address &from) {
    auto beacon = wire::DecodeBeacon(datagram);
    if (!beacon) {
      LOG_DISC_TRACE("Ignoring malformed beacon from {}", from.to_string());
      return;
    }
    if (beacon->service_type != service_type_ || beacon->peer == local_) {
      return;
    }

    if (beacon->op == wire::BeaconOp::BYE) {
      bool removed = false;
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        removed = peers_.erase(beacon->peer.token()) > 0;
      }
      if (removed) {
        LOG_DISC_DEBUG("{} said goodbye", beacon->peer.ToString());
        NotifyLost(beacon->peer);
      }
      return;
    }

    if (beacon->port == 0) {
      return;
    }

    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto now = std::chrono::steady_clock::now();
      auto it = peers_.find(beacon->peer.token());
      if (it == peers_.end()) {
        peers_.emplace(beacon->peer.token(),
                       Advertised{beacon->peer, tcp::endpoint(from, beacon->port),
                                  beacon->info, now});
        changed = true;
      } else {
        auto &known = it->second;
        changed = known.info != beacon->info ||
                  known.id.display_name() != beacon->peer.display_name();
        known.id = beacon->peer;
        known.endpoint = tcp::endpoint(from, beacon->port);
        known.info = beacon->info;
        known.last_seen = now;
      }
    }

    if (changed) {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      if (found_cb_) {
        found_cb_(beacon->peer, beacon->info);
      }
    }
  }

  void ScheduleExpiry() {
    expiry_timer_.expires_after(config_.beacon_interval);
    expiry_timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec || !self->running_) {
        return;
      }
      self->ExpireSilentPeers();
      self->ScheduleExpiry();
    });
  }

  void ExpireSilentPeers() {
    std::vector<PeerID> expired;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto cutoff = std::chrono::steady_clock::now() - config_.peer_expiry;
      for (auto it = peers_.begin(); it != peers_.end();) {
        if (it->second.last_seen < cutoff) {
          expired.push_back(it->second.id);
          it = peers_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto &peer : expired) {
      LOG_DISC_DEBUG("{} expired", peer.ToString());
      NotifyLost(peer);
    }
  }

  void NotifyLost(const PeerID &peer) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (lost_cb_) {
      lost_cb_(peer);
    }
  }

  void ReportError(const std::string &reason) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (error_cb_) {
      error_cb_(reason);
    } else {
      LOG_DISC_ERROR("Browser error: {}", reason);
    }
  }

  boost::asio::io_context &io_;
  const PeerID local_;
  const std::string service_type_;
  const AsioTransportConfig &config_;

  // io thread only
  udp::socket socket_;
  udp::endpoint sender_;
  std::array<char, wire::MAX_BEACON_SIZE + 1> recv_buffer_{};
  boost::asio::steady_timer expiry_timer_;
  std::atomic<bool> running_{false};

  mutable std::mutex state_mutex_;
  std::map<std::string, Advertised> peers_;

  std::mutex callback_mutex_;
  ServiceBrowser::FoundCallback found_cb_;
  ServiceBrowser::LostCallback lost_cb_;
  ServiceBrowser::ErrorCallback error_cb_;
};

} // namespace detail

namespace {

// ============================================================================
// Public wrappers (shut the shared impl down on destruction)
// ============================================================================

class AsioSession : public Session {
public:
  explicit AsioSession(std::shared_ptr<detail::SessionImpl> impl) : impl_(std::move(impl)) {}
  ~AsioSession() override { impl_->Shutdown(); }

  const std::shared_ptr<detail::SessionImpl> &impl() const { return impl_; }

  const PeerID &local_peer() const override { return impl_->local(); }
  std::vector<PeerID> connected_peers() const override { return impl_->ConnectedPeers(); }

  SendResult send(const Payload &data, const std::vector<PeerID> &peers,
                  SendMode) override {
    // UNRELIABLE shares the TCP link
    return impl_->Send(data, peers);
  }

  void disconnect() override { impl_->Disconnect(); }

  void set_data_callback(DataCallback callback) override {
    impl_->set_data_callback(std::move(callback));
  }
  void set_state_callback(StateCallback callback) override {
    impl_->set_state_callback(std::move(callback));
  }
  void set_stream_callback(StreamCallback callback) override {
    impl_->set_stream_callback(std::move(callback));
  }
  void set_resource_start_callback(ResourceStartCallback callback) override {
    impl_->set_resource_start_callback(std::move(callback));
  }
  void set_resource_finish_callback(ResourceFinishCallback callback) override {
    impl_->set_resource_finish_callback(std::move(callback));
  }

private:
  std::shared_ptr<detail::SessionImpl> impl_;
};

class AsioBrowser : public ServiceBrowser {
public:
  explicit AsioBrowser(std::shared_ptr<detail::BrowserImpl> impl) : impl_(std::move(impl)) {}
  ~AsioBrowser() override { impl_->Shutdown(); }

  void start_browsing() override { impl_->Start(); }
  void stop_browsing() override { impl_->Stop(); }

  void invite_peer(const PeerID &peer, Session &session, const InvitationContext &context,
                   std::chrono::seconds timeout) override {
    auto *asio_session = dynamic_cast<AsioSession *>(&session);
    if (!asio_session) {
      LOG_SESSION_ERROR("Cannot invite {}: session was not created by this transport",
                        peer.ToString());
      return;
    }

    auto endpoint = impl_->EndpointOf(peer);
    if (!endpoint) {
      LOG_SESSION_WARN("Cannot invite {}: no advertised endpoint", peer.ToString());
      asio_session->impl()->ReportInviteFailure(peer);
      return;
    }
    asio_session->impl()->Invite(peer, *endpoint, context, timeout);
  }

  void set_found_callback(FoundCallback callback) override {
    impl_->set_found_callback(std::move(callback));
  }
  void set_lost_callback(LostCallback callback) override {
    impl_->set_lost_callback(std::move(callback));
  }
  void set_error_callback(ErrorCallback callback) override {
    impl_->set_error_callback(std::move(callback));
  }

private:
  std::shared_ptr<detail::BrowserImpl> impl_;
};

class AsioAdvertiser : public ServiceAdvertiser {
public:
  explicit AsioAdvertiser(std::shared_ptr<detail::AdvertiserImpl> impl)
      : impl_(std::move(impl)) {}
  ~AsioAdvertiser() override { impl_->Shutdown(); }

  void start_advertising() override { impl_->Start(); }
  void stop_advertising() override { impl_->Stop(); }

  void set_invitation_callback(InvitationCallback callback) override {
    impl_->set_invitation_callback(std::move(callback));
  }
  void set_error_callback(ErrorCallback callback) override {
    impl_->set_error_callback(std::move(callback));
  }

private:
  std::shared_ptr<detail::AdvertiserImpl> impl_;
};

} // namespace

// ============================================================================
// AsioMeshTransport
// ============================================================================

AsioMeshTransport::AsioMeshTransport(AsioTransportConfig config)
    : config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {}

AsioMeshTransport::~AsioMeshTransport() { stop(); }

void AsioMeshTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  io_thread_ = std::thread([this]() { io_context_->run(); });
}

void AsioMeshTransport::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Don't log here - this is called from destructor, logger may be shut down

  // Let shutdown work posted before this call (bye beacons, link closes) run
  auto drained = std::make_shared<std::promise<void>>();
  auto done = drained->get_future();
  boost::asio::post(*io_context_, [drained]() { drained->set_value(); });
  (void)done.wait_for(std::chrono::milliseconds(500));

  work_guard_.reset();
  io_context_->stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

std::unique_ptr<Session>
AsioMeshTransport::create_session(const PeerID &local,
                                  const std::vector<uint8_t> &security_identity,
                                  EncryptionPreference encryption) {
  if (encryption == EncryptionPreference::REQUIRED) {
    LOG_SESSION_WARN("Encryption requested but links are plaintext on this transport");
  }
  if (!security_identity.empty()) {
    LOG_SESSION_DEBUG("Session identity material ({} bytes) is not used by this transport",
                      security_identity.size());
  }

  auto impl = std::make_shared<detail::SessionImpl>(*io_context_, local, config_);
  std::string error;
  if (!impl->Listen(error)) {
    LOG_SESSION_ERROR("Failed to create session for {}: {}", local.ToString(), error);
    return nullptr;
  }

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[local.token()] = impl;
  }
  return std::make_unique<AsioSession>(impl);
}

std::unique_ptr<ServiceBrowser>
AsioMeshTransport::create_browser(const PeerID &local, const std::string &service_type) {
  return std::make_unique<AsioBrowser>(
      std::make_shared<detail::BrowserImpl>(*io_context_, local, service_type, config_));
}

std::unique_ptr<ServiceAdvertiser>
AsioMeshTransport::create_advertiser(const PeerID &local,
                                     const std::optional<DiscoveryInfo> &info,
                                     const std::string &service_type) {
  std::weak_ptr<detail::SessionImpl> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(local.token());
    if (it != sessions_.end()) {
      session = it->second;
    }
  }
  if (session.expired()) {
    LOG_DISC_WARN("Advertiser for {} has no session; invitations will be declined",
                  local.ToString());
  }
  return std::make_unique<AsioAdvertiser>(std::make_shared<detail::AdvertiserImpl>(
      *io_context_, local, info, service_type, config_, session));
}

uint16_t AsioMeshTransport::session_port(const Session &session) {
  auto *asio_session = dynamic_cast<const AsioSession *>(&session);
  return asio_session ? asio_session->impl()->port() : 0;
}

bool AsioMeshTransport::invite_at(Session &session, const PeerID &peer,
                                  const std::string &address, uint16_t port,
                                  const InvitationContext &context,
                                  std::chrono::seconds timeout) {
  auto *asio_session = dynamic_cast<AsioSession *>(&session);
  if (!asio_session) {
    LOG_SESSION_ERROR("Cannot invite {}: session was not created by this transport",
                      peer.ToString());
    return false;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec || port == 0) {
    LOG_SESSION_WARN("Cannot invite {}: invalid address {}:{}", peer.ToString(), address,
                     port);
    return false;
  }

  asio_session->impl()->Invite(peer, tcp::endpoint(ip, port), context, timeout);
  return true;
}

} // namespace network
} // namespace nearlink
