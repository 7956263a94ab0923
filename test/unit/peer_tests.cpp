#include <catch2/catch_test_macros.hpp>
#include "network/peer.hpp"
#include "network/peer_id.hpp"
#include <unordered_set>

using namespace nearlink::network;

TEST_CASE("PeerID identity semantics", "[network][peer]") {
    SECTION("Equality uses the token only") {
        PeerID a("abc123", "alice");
        PeerID renamed("abc123", "alice-laptop");
        PeerID other("def456", "alice");

        REQUIRE(a == renamed);
        REQUIRE(a != other);
        REQUIRE(PeerID::Hasher{}(a) == PeerID::Hasher{}(renamed));
    }

    SECTION("Generate produces distinct 128-bit hex tokens") {
        PeerID first = PeerID::Generate("bob");
        PeerID second = PeerID::Generate("bob");

        REQUIRE(first.token().size() == 32);
        REQUIRE(first.display_name() == "bob");
        REQUIRE(first != second);
        REQUIRE(first.IsValid());
    }

    SECTION("Validity requires token and bounded display name") {
        REQUIRE_FALSE(PeerID("", "carol").IsValid());
        REQUIRE_FALSE(PeerID("00ff", "").IsValid());
        REQUIRE(PeerID("00ff", std::string(MAX_DISPLAY_NAME_BYTES, 'x')).IsValid());
        REQUIRE_FALSE(PeerID("00ff", std::string(MAX_DISPLAY_NAME_BYTES + 1, 'x')).IsValid());
    }

    SECTION("ToString shortens the token") {
        PeerID id("0123456789abcdef", "dave");
        REQUIRE(id.ToString() == "dave#01234567");
    }

    SECTION("Usable as an unordered key") {
        std::unordered_set<PeerID, PeerID::Hasher> ids;
        ids.insert(PeerID("t1", "a"));
        ids.insert(PeerID("t1", "b"));
        ids.insert(PeerID("t2", "a"));
        REQUIRE(ids.size() == 2);
    }
}

TEST_CASE("Peer::FromDiscovery", "[network][peer]") {
    PeerID id("feedbeef", "erin");

    SECTION("Peer without discovery info") {
        auto peer = Peer::FromDiscovery(id, std::nullopt);
        REQUIRE(peer.has_value());
        REQUIRE(peer->id() == id);
        REQUIRE(peer->name() == "erin");
        REQUIRE_FALSE(peer->discovery_info().has_value());
    }

    SECTION("Peer keeps discovery info") {
        DiscoveryInfo info{{"room", "lobby"}, {"role", "host"}};
        auto peer = Peer::FromDiscovery(id, info);
        REQUIRE(peer.has_value());
        REQUIRE(peer->discovery_info() == info);
    }

    SECTION("Invalid identifier is rejected with a reason") {
        std::string error;
        auto peer = Peer::FromDiscovery(PeerID("feedbeef", ""), std::nullopt, &error);
        REQUIRE_FALSE(peer.has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Malformed discovery info is rejected") {
        std::string error;
        DiscoveryInfo info{{"bad=key", "v"}};
        REQUIRE_FALSE(Peer::FromDiscovery(id, info, &error).has_value());
        REQUIRE(error.find("bad=key") != std::string::npos);
    }
}

TEST_CASE("ValidateDiscoveryInfo limits", "[network][peer]") {
    SECTION("Empty info is valid") {
        REQUIRE_FALSE(ValidateDiscoveryInfo({}).has_value());
    }

    SECTION("Empty key") {
        REQUIRE(ValidateDiscoveryInfo({{"", "value"}}).has_value());
    }

    SECTION("Non-printable key") {
        REQUIRE(ValidateDiscoveryInfo({{"a\tb", "value"}}).has_value());
    }

    SECTION("Pair at the limit is accepted, one byte more is not") {
        // "k=" + value
        std::string value(MAX_DISCOVERY_PAIR_BYTES - 2, 'v');
        REQUIRE_FALSE(ValidateDiscoveryInfo({{"k", value}}).has_value());
        REQUIRE(ValidateDiscoveryInfo({{"k", value + "v"}}).has_value());
    }

    SECTION("Total record size is bounded") {
        // Two pairs of 200 bytes plus length bytes exceed the record limit
        std::string value(198, 'v');
        DiscoveryInfo info{{"a", value}, {"b", value}};
        auto problem = ValidateDiscoveryInfo(info);
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("max") != std::string::npos);
    }
}

TEST_CASE("PeerStateName", "[network][peer]") {
    REQUIRE(std::string(PeerStateName(PeerState::DISCOVERED)) == "discovered");
    REQUIRE(std::string(PeerStateName(PeerState::INVITING)) == "inviting");
    REQUIRE(std::string(PeerStateName(PeerState::CONNECTED)) == "connected");
    REQUIRE(std::string(PeerStateName(PeerState::DISCONNECTED)) == "disconnected");
}
