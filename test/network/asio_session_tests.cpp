// Loopback tests for the LAN transport's TCP sessions and beacon handling.
// Beacons are injected as unicast datagrams, so no multicast route is needed.

#include <catch2/catch_test_macros.hpp>
#include "network/asio_transport.hpp"
#include "network/wire.hpp"
#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace nearlink::network;
using namespace nearlink;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace {

AsioTransportConfig LoopbackConfig(uint16_t beacon_port) {
    AsioTransportConfig config;
    config.multicast_port = beacon_port;
    config.beacon_interval = std::chrono::milliseconds(10000);
    config.peer_expiry = std::chrono::milliseconds(60000);
    config.listen_address = "127.0.0.1";
    config.handshake_timeout = std::chrono::seconds(1);
    return config;
}

bool WaitFor(const std::function<bool()>& condition,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(4000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

Payload Bytes(const std::string& text) {
    return Payload(text.begin(), text.end());
}

// Session callbacks arrive on the io thread
struct SessionEvents {
    std::mutex mutex;
    std::vector<std::pair<PeerID, SessionState>> states;
    std::vector<std::pair<PeerID, std::string>> messages;

    void Attach(Session& session) {
        session.set_state_callback([this](const PeerID& peer, SessionState state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.emplace_back(peer, state);
        });
        session.set_data_callback([this](const Payload& data, const PeerID& from) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.emplace_back(from, std::string(data.begin(), data.end()));
        });
    }

    bool Saw(const PeerID& peer, SessionState state) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [id, s] : states) {
            if (id == peer && s == state) {
                return true;
            }
        }
        return false;
    }

    size_t MessageCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }
};

// Answers every inbound invitation with a fixed decision
struct InvitationDesk {
    std::mutex mutex;
    std::vector<std::pair<PeerID, InvitationContext>> received;
    std::atomic<bool> failed{false};

    void Attach(ServiceAdvertiser& advertiser, Session& session, bool accept) {
        advertiser.set_error_callback([this](const std::string&) { failed = true; });
        advertiser.set_invitation_callback(
            [this, &session, accept](const PeerID& from, const InvitationContext& context,
                                     InvitationResponder respond) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    received.emplace_back(from, context);
                }
                respond(accept, accept ? &session : nullptr);
            });
    }
};

struct BrowseLog {
    std::mutex mutex;
    std::vector<std::pair<PeerID, std::optional<DiscoveryInfo>>> found;
    std::vector<PeerID> lost;
    std::atomic<bool> failed{false};

    void Attach(ServiceBrowser& browser) {
        browser.set_found_callback(
            [this](const PeerID& peer, const std::optional<DiscoveryInfo>& info) {
                std::lock_guard<std::mutex> lock(mutex);
                found.emplace_back(peer, info);
            });
        browser.set_lost_callback([this](const PeerID& peer) {
            std::lock_guard<std::mutex> lock(mutex);
            lost.push_back(peer);
        });
        browser.set_error_callback([this](const std::string&) { failed = true; });
    }

    size_t FoundCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return found.size();
    }

    size_t LostCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return lost.size();
    }
};

// Sends beacons straight to the browser's port on loopback
class BeaconSender {
public:
    explicit BeaconSender(uint16_t port)
        : socket_(io_), target_(boost::asio::ip::make_address("127.0.0.1"), port) {
        socket_.open(udp::v4());
    }

    void Send(wire::BeaconOp op, const PeerID& peer, uint16_t session_port,
              std::optional<DiscoveryInfo> info = std::nullopt,
              const std::string& service = "nearlink-test") {
        wire::Beacon beacon;
        beacon.op = op;
        beacon.service_type = service;
        beacon.peer = peer;
        beacon.port = session_port;
        beacon.info = std::move(info);
        boost::system::error_code ec;
        socket_.send_to(boost::asio::buffer(wire::EncodeBeacon(beacon)), target_, 0, ec);
    }

private:
    boost::asio::io_context io_;
    udp::socket socket_;
    udp::endpoint target_;
};

// Accepts one TCP connection and never answers the INVITE
class SilentServer {
public:
    SilentServer()
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
          held_(io_) {
        acceptor_.async_accept(held_, [](const boost::system::error_code&) {});
        thread_ = std::thread([this]() { io_.run_for(std::chrono::seconds(5)); });
    }

    ~SilentServer() {
        io_.stop();
        thread_.join();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    tcp::socket held_;
    std::thread thread_;
};

} // namespace

TEST_CASE("AsioMeshTransport lifecycle is idempotent", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));

    CHECK_FALSE(transport.is_running());
    transport.stop();

    transport.run();
    CHECK(transport.is_running());
    transport.run();
    CHECK(transport.is_running());

    transport.stop();
    transport.stop();
    CHECK_FALSE(transport.is_running());

    transport.run();
    CHECK(transport.is_running());
    transport.stop();
}

TEST_CASE("Session send validates destinations before writing", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    {
        auto session = transport.create_session(PeerID::Generate("solo"), {},
                                                EncryptionPreference::NONE);
        REQUIRE(session);
        CHECK(AsioMeshTransport::session_port(*session) > 0);
        PeerID stranger("5742a9", "stranger");

        auto empty = session->send(Bytes("x"), {}, SendMode::RELIABLE);
        REQUIRE_FALSE(empty);
        CHECK(empty.error() == TransportError::NO_PEERS);

        auto unknown = session->send(Bytes("x"), {stranger}, SendMode::RELIABLE);
        REQUIRE_FALSE(unknown);
        CHECK(unknown.error() == TransportError::NOT_CONNECTED);

        Payload oversized(wire::MAX_FRAME_BODY + 1, 0x00);
        auto too_large = session->send(oversized, {stranger}, SendMode::RELIABLE);
        REQUIRE_FALSE(too_large);
        CHECK(too_large.error() == TransportError::PAYLOAD_TOO_LARGE);
    }

    transport.stop();
}

TEST_CASE("Accepted invitation joins both sessions", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    {
        SessionEvents host_events;
        SessionEvents guest_events;
        InvitationDesk desk;
        PeerID host_id = PeerID::Generate("host");
        PeerID guest_id = PeerID::Generate("guest");
        auto host = transport.create_session(host_id, {}, EncryptionPreference::NONE);
        auto guest = transport.create_session(guest_id, {}, EncryptionPreference::NONE);
        REQUIRE(host);
        REQUIRE(guest);

        host_events.Attach(*host);
        guest_events.Attach(*guest);

        auto advertiser = transport.create_advertiser(host_id, std::nullopt, "nearlink-test");
        desk.Attach(*advertiser, *host, true);
        advertiser->start_advertising();

        std::vector<uint8_t> context{0x01, 0x02, 0x03};
        REQUIRE(transport.invite_at(*guest, host_id, "127.0.0.1",
                                    AsioMeshTransport::session_port(*host), context,
                                    std::chrono::seconds(5)));

        REQUIRE(WaitFor([&] {
            return guest_events.Saw(host_id, SessionState::CONNECTED) ||
                   guest_events.Saw(host_id, SessionState::NOT_CONNECTED);
        }));
        if (desk.failed) {
            WARN("Skipping: advertiser could not open its beacon socket");
            return;
        }

        REQUIRE(guest_events.Saw(host_id, SessionState::CONNECTING));
        REQUIRE(guest_events.Saw(host_id, SessionState::CONNECTED));
        REQUIRE(WaitFor([&] { return host_events.Saw(guest_id, SessionState::CONNECTED); }));
        {
            std::lock_guard<std::mutex> lock(desk.mutex);
            REQUIRE(desk.received.size() == 1);
            CHECK(desk.received[0].first == guest_id);
            CHECK(desk.received[0].second == context);
        }
        CHECK(guest->connected_peers() == std::vector<PeerID>{host_id});
        CHECK(host->connected_peers() == std::vector<PeerID>{guest_id});

        SECTION("Send with one unconnected destination writes nothing") {
            PeerID stranger("5742a9", "stranger");
            auto partial = guest->send(Bytes("lost"), {host_id, stranger}, SendMode::RELIABLE);
            REQUIRE_FALSE(partial);
            CHECK(partial.error() == TransportError::NOT_CONNECTED);

            REQUIRE(guest->send(Bytes("ping"), {host_id}, SendMode::RELIABLE));
            REQUIRE(WaitFor([&] { return host_events.MessageCount() >= 1; }));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            std::lock_guard<std::mutex> lock(host_events.mutex);
            REQUIRE(host_events.messages.size() == 1);
            CHECK(host_events.messages[0].first == guest_id);
            CHECK(host_events.messages[0].second == "ping");
        }

        SECTION("Data flows back over the accepted link") {
            REQUIRE(host->send(Bytes("pong"), {guest_id}, SendMode::UNRELIABLE));
            REQUIRE(WaitFor([&] { return guest_events.MessageCount() >= 1; }));

            std::lock_guard<std::mutex> lock(guest_events.mutex);
            CHECK(guest_events.messages[0].first.display_name() == "host");
            CHECK(guest_events.messages[0].second == "pong");
        }

        SECTION("Disconnect is reported on both sides") {
            guest->disconnect();
            REQUIRE(WaitFor([&] { return guest_events.Saw(host_id, SessionState::NOT_CONNECTED); }));
            REQUIRE(WaitFor([&] { return host_events.Saw(guest_id, SessionState::NOT_CONNECTED); }));
            CHECK(WaitFor([&] { return host->connected_peers().empty(); }));

            auto after = guest->send(Bytes("late"), {host_id}, SendMode::RELIABLE);
            REQUIRE_FALSE(after);
            CHECK(after.error() == TransportError::NOT_CONNECTED);
        }
    }

    transport.stop();
}

TEST_CASE("Declined invitation leaves the inviter unconnected", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    {
        SessionEvents host_events;
        SessionEvents guest_events;
        InvitationDesk desk;
        PeerID host_id = PeerID::Generate("host");
        PeerID guest_id = PeerID::Generate("guest");
        auto host = transport.create_session(host_id, {}, EncryptionPreference::NONE);
        auto guest = transport.create_session(guest_id, {}, EncryptionPreference::NONE);
        REQUIRE(host);
        REQUIRE(guest);

        host_events.Attach(*host);
        guest_events.Attach(*guest);

        auto advertiser = transport.create_advertiser(host_id, std::nullopt, "nearlink-test");
        desk.Attach(*advertiser, *host, false);
        advertiser->start_advertising();

        REQUIRE(transport.invite_at(*guest, host_id, "127.0.0.1",
                                    AsioMeshTransport::session_port(*host), std::nullopt,
                                    std::chrono::seconds(5)));

        REQUIRE(WaitFor([&] { return guest_events.Saw(host_id, SessionState::NOT_CONNECTED); }));
        CHECK_FALSE(guest_events.Saw(host_id, SessionState::CONNECTED));
        CHECK_FALSE(host_events.Saw(guest_id, SessionState::CONNECTED));
        CHECK(guest->connected_peers().empty());
        CHECK(host->connected_peers().empty());
        if (!desk.failed) {
            std::lock_guard<std::mutex> lock(desk.mutex);
            REQUIRE(desk.received.size() == 1);
            CHECK_FALSE(desk.received[0].second.has_value());
        }
    }

    transport.stop();
}

TEST_CASE("Session without an advertiser declines invitations", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    {
        SessionEvents guest_events;
        PeerID host_id = PeerID::Generate("host");
        PeerID guest_id = PeerID::Generate("guest");
        auto host = transport.create_session(host_id, {}, EncryptionPreference::NONE);
        auto guest = transport.create_session(guest_id, {}, EncryptionPreference::NONE);
        REQUIRE(host);
        REQUIRE(guest);

        guest_events.Attach(*guest);

        REQUIRE(transport.invite_at(*guest, host_id, "127.0.0.1",
                                    AsioMeshTransport::session_port(*host), std::nullopt,
                                    std::chrono::seconds(5)));
        REQUIRE(WaitFor([&] { return guest_events.Saw(host_id, SessionState::NOT_CONNECTED); }));
        CHECK(host->connected_peers().empty());
    }

    transport.stop();
}

TEST_CASE("Unanswered invitation times out", "[network][transport][asio][timeout]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    SilentServer silent;

    {
        SessionEvents guest_events;
        PeerID guest_id = PeerID::Generate("guest");
        PeerID mute("3a7e", "mute");
        auto guest = transport.create_session(guest_id, {}, EncryptionPreference::NONE);
        REQUIRE(guest);
        guest_events.Attach(*guest);

        auto start = std::chrono::steady_clock::now();
        REQUIRE(transport.invite_at(*guest, mute, "127.0.0.1", silent.port(),
                                    std::nullopt, std::chrono::seconds(1)));

        REQUIRE(WaitFor([&] { return guest_events.Saw(mute, SessionState::NOT_CONNECTED); }));
        auto elapsed = std::chrono::steady_clock::now() - start;
        CHECK(elapsed >= std::chrono::milliseconds(900));
        CHECK(guest_events.Saw(mute, SessionState::CONNECTING));
        CHECK(guest->connected_peers().empty());
    }

    transport.stop();
}

TEST_CASE("Invitation to a closed port fails promptly", "[network][transport][asio]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    uint16_t closed_port = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor reserved(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        closed_port = reserved.local_endpoint().port();
    }

    {
        SessionEvents guest_events;
        PeerID guest_id = PeerID::Generate("guest");
        PeerID gone("90e3", "gone");
        auto guest = transport.create_session(guest_id, {}, EncryptionPreference::NONE);
        REQUIRE(guest);
        guest_events.Attach(*guest);

        REQUIRE(transport.invite_at(*guest, gone, "127.0.0.1", closed_port, std::nullopt,
                                    std::chrono::seconds(10)));
        REQUIRE(WaitFor([&] { return guest_events.Saw(gone, SessionState::NOT_CONNECTED); },
                        std::chrono::milliseconds(3000)));

        CHECK_FALSE(transport.invite_at(*guest, gone, "not-an-ip", 1234, std::nullopt,
                                        std::chrono::seconds(1)));
        CHECK_FALSE(transport.invite_at(*guest, gone, "127.0.0.1", 0, std::nullopt,
                                        std::chrono::seconds(1)));
    }

    transport.stop();
}

TEST_CASE("Inbound link without an invitation is closed", "[network][transport][asio][timeout]") {
    AsioMeshTransport transport(LoopbackConfig(46013));
    transport.run();

    {
        auto host = transport.create_session(PeerID::Generate("host"), {},
                                             EncryptionPreference::NONE);
        REQUIRE(host);
        uint16_t port = AsioMeshTransport::session_port(*host);

        boost::asio::io_context io;
        tcp::socket client(io);
        client.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

        std::array<char, 16> buffer{};
        bool closed = false;
        auto start = std::chrono::steady_clock::now();
        client.async_read_some(boost::asio::buffer(buffer),
                               [&](const boost::system::error_code& ec, size_t) {
                                   closed = static_cast<bool>(ec);
                               });
        io.run_for(std::chrono::seconds(4));

        REQUIRE(closed);
        CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(800));
        CHECK(host->connected_peers().empty());
    }

    transport.stop();
}

TEST_CASE("Browser tracks announce and bye beacons", "[network][transport][asio][discovery]") {
    constexpr uint16_t kBeaconPort = 46014;
    AsioMeshTransport transport(LoopbackConfig(kBeaconPort));
    transport.run();

    {
        SessionEvents guest_events;
        BrowseLog log;
        PeerID local = PeerID::Generate("local");
        PeerID alice = PeerID::Generate("alice");
        PeerID bob = PeerID::Generate("bob");

        auto guest = transport.create_session(local, {}, EncryptionPreference::NONE);
        auto alice_session = transport.create_session(alice, {}, EncryptionPreference::NONE);
        REQUIRE(guest);
        REQUIRE(alice_session);
        uint16_t alice_port = AsioMeshTransport::session_port(*alice_session);

        guest_events.Attach(*guest);

        auto browser = transport.create_browser(local, "nearlink-test");
        log.Attach(*browser);
        browser->start_browsing();

        BeaconSender sender(kBeaconPort);
        DiscoveryInfo lobby{{"room", "lobby"}};

        // Resend until the browser's socket is up
        REQUIRE(WaitFor([&] {
            if (log.failed) {
                return true;
            }
            sender.Send(wire::BeaconOp::ANNOUNCE, alice, alice_port, lobby);
            return log.FoundCount() >= 1;
        }));
        if (log.failed) {
            WARN("Skipping: unable to join the beacon group");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(log.mutex);
            REQUIRE(log.found.size() == 1);
            CHECK(log.found[0].first == alice);
            CHECK(log.found[0].first.display_name() == "alice");
            CHECK(log.found[0].second == lobby);
        }

        SECTION("Repeated announce is not reported again; changed info is") {
            sender.Send(wire::BeaconOp::ANNOUNCE, alice, alice_port, lobby);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            CHECK(log.FoundCount() == 1);

            DiscoveryInfo attic{{"room", "attic"}};
            sender.Send(wire::BeaconOp::ANNOUNCE, alice, alice_port, attic);
            REQUIRE(WaitFor([&] { return log.FoundCount() >= 2; }));
            std::lock_guard<std::mutex> lock(log.mutex);
            CHECK(log.found[1].second == attic);
        }

        SECTION("Own beacons and other services are ignored") {
            sender.Send(wire::BeaconOp::ANNOUNCE, local, 4000);
            sender.Send(wire::BeaconOp::ANNOUNCE, PeerID::Generate("other"), 4000, std::nullopt,
                        "other-service");
            sender.Send(wire::BeaconOp::ANNOUNCE, bob, 4000);
            REQUIRE(WaitFor([&] { return log.FoundCount() >= 2; }));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            std::lock_guard<std::mutex> lock(log.mutex);
            REQUIRE(log.found.size() == 2);
            CHECK(log.found[1].first == bob);
        }

        SECTION("Bye reports the peer lost once") {
            sender.Send(wire::BeaconOp::BYE, alice, 0);
            REQUIRE(WaitFor([&] { return log.LostCount() >= 1; }));
            sender.Send(wire::BeaconOp::BYE, alice, 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            std::lock_guard<std::mutex> lock(log.mutex);
            REQUIRE(log.lost.size() == 1);
            CHECK(log.lost[0] == alice);
        }

        SECTION("invite_peer connects to the advertised port") {
            // alice's session has no advertiser, so the invitation is declined
            browser->invite_peer(alice, *guest, std::nullopt, std::chrono::seconds(5));
            REQUIRE(WaitFor([&] { return guest_events.Saw(alice, SessionState::NOT_CONNECTED); }));
            CHECK(guest_events.Saw(alice, SessionState::CONNECTING));
        }

        SECTION("invite_peer for an unseen peer fails") {
            PeerID carol = PeerID::Generate("carol");
            browser->invite_peer(carol, *guest, std::nullopt, std::chrono::seconds(5));
            REQUIRE(WaitFor([&] { return guest_events.Saw(carol, SessionState::NOT_CONNECTED); }));
            CHECK_FALSE(guest_events.Saw(carol, SessionState::CONNECTING));
        }
    }

    transport.stop();
}

TEST_CASE("Browser expires silent peers", "[network][transport][asio][discovery]") {
    constexpr uint16_t kBeaconPort = 46015;
    auto config = LoopbackConfig(kBeaconPort);
    config.beacon_interval = std::chrono::milliseconds(100);
    config.peer_expiry = std::chrono::milliseconds(300);
    AsioMeshTransport transport(config);
    transport.run();

    {
        BrowseLog log;
        PeerID local = PeerID::Generate("local");
        PeerID quiet = PeerID::Generate("quiet");
        auto browser = transport.create_browser(local, "nearlink-test");
        log.Attach(*browser);
        browser->start_browsing();

        BeaconSender sender(kBeaconPort);
        REQUIRE(WaitFor([&] {
            if (log.failed) {
                return true;
            }
            sender.Send(wire::BeaconOp::ANNOUNCE, quiet, 4000);
            return log.FoundCount() >= 1;
        }));
        if (log.failed) {
            WARN("Skipping: unable to join the beacon group");
            return;
        }

        REQUIRE(WaitFor([&] { return log.LostCount() >= 1; }, std::chrono::milliseconds(2000)));
        std::lock_guard<std::mutex> lock(log.mutex);
        CHECK(log.lost[0] == quiet);
    }

    transport.stop();
}
