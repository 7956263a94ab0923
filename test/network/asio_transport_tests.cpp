// End-to-end tests over the real LAN transport (UDP multicast + TCP on
// loopback). Hidden by default: run with `nearlink_tests "[e2e]"` on a host
// with multicast loopback enabled.

#include <catch2/catch_test_macros.hpp>
#include "network/asio_transport.hpp"
#include "network/connection_manager.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace nearlink::network;

namespace {

AsioTransportConfig FastConfig(uint16_t port) {
    AsioTransportConfig config;
    config.multicast_port = port;
    config.beacon_interval = std::chrono::milliseconds(100);
    config.peer_expiry = std::chrono::milliseconds(600);
    config.handshake_timeout = std::chrono::seconds(2);
    return config;
}

MeshConfiguration MeshFor(const std::string& name) {
    MeshConfiguration config;
    config.service_type = "nearlink-e2e";
    config.peer_name = name;
    config.security.encryption_preference = EncryptionPreference::NONE;
    return config;
}

bool WaitFor(const std::function<bool()>& condition,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

struct Inbox {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> messages;

    void Attach(ConnectionManager& manager) {
        manager.set_data_received_callback([this](const Payload& data, const std::string& sender) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.emplace_back(sender, std::string(data.begin(), data.end()));
        });
    }

    size_t Size() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }
};

} // namespace

TEST_CASE("Two peers discover, connect and exchange messages", "[.][e2e][network]") {
    AsioMeshTransport transport_a(FastConfig(46011));
    AsioMeshTransport transport_b(FastConfig(46011));
    transport_a.run();
    transport_b.run();

    {
        ConnectionManager alice(transport_a, MeshFor("alice"), PeerID::Generate("alice"));
        ConnectionManager bob(transport_b, MeshFor("bob"), PeerID::Generate("bob"));
        Inbox alice_inbox;
        Inbox bob_inbox;
        alice_inbox.Attach(alice);
        bob_inbox.Attach(bob);

        alice.resume();
        bob.resume();

        REQUIRE(WaitFor([&] { return alice.registry().Contains(bob.me()); }));
        REQUIRE(WaitFor([&] { return bob.registry().Contains(alice.me()); }));

        Peer bob_peer = *alice.registry().Find(bob.me());
        REQUIRE(WaitFor([&] { return alice.is_connected(bob_peer); }));

        REQUIRE(alice.broadcast(Payload{'h', 'i'}));
        REQUIRE(WaitFor([&] { return bob_inbox.Size() >= 1; }));
        {
            std::lock_guard<std::mutex> lock(bob_inbox.mutex);
            REQUIRE(bob_inbox.messages[0].first == "alice");
            REQUIRE(bob_inbox.messages[0].second == "hi");
        }

        Peer alice_peer = *bob.registry().Find(alice.me());
        REQUIRE(WaitFor([&] { return bob.is_connected(alice_peer); }));
        REQUIRE(bob.send_to(Payload{'y', 'o'}, {alice_peer}));
        REQUIRE(WaitFor([&] { return alice_inbox.Size() >= 1; }));

        // Stopping bob's advertiser sends a bye; alice unregisters him
        bob.stop();
        REQUIRE(WaitFor([&] { return !alice.registry().Contains(bob.me()); }));

        alice.stop();
        alice.disconnect();
        bob.disconnect();
    }

    transport_a.stop();
    transport_b.stop();
}

TEST_CASE("Send to a peer that is not connected fails", "[.][e2e][network]") {
    AsioMeshTransport transport(FastConfig(46012));
    transport.run();

    {
        ConnectionManager alice(transport, MeshFor("alice"), PeerID::Generate("alice"));
        Peer ghost = *Peer::FromDiscovery(PeerID("0badc0de", "ghost"), std::nullopt);

        auto result = alice.send_to(Payload{'x'}, {ghost});
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == TransportError::NOT_CONNECTED);

        // Nobody connected: broadcast is a no-op success
        REQUIRE(alice.broadcast(Payload{'x'}));
    }

    transport.stop();
}
