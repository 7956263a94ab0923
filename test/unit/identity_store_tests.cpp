#include <catch2/catch_test_macros.hpp>
#include "network/identity_store.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <sys/stat.h>

using namespace nearlink::network;
using namespace nearlink::util;

namespace {

std::filesystem::path MakeTestDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("nearlink_identity_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("Identity persistence", "[network][identity]") {
    auto dir = MakeTestDir("persist");
    auto path = dir / "identity.json";

    SECTION("Save then load returns the same identity") {
        PeerID id = PeerID::Generate("alice");
        REQUIRE(SaveIdentity(id, path));

        auto loaded = LoadIdentity(path);
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == id);
        REQUIRE(loaded->display_name() == "alice");
    }

    SECTION("Identity file is owner-only") {
        REQUIRE(SaveIdentity(PeerID::Generate("alice"), path));

        struct stat st {};
        REQUIRE(stat(path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("Missing file loads nothing") {
        REQUIRE_FALSE(LoadIdentity(dir / "missing.json").has_value());
    }

    SECTION("Corrupt file loads nothing") {
        REQUIRE(atomic_write_file(path, "{not json"));
        REQUIRE_FALSE(LoadIdentity(path).has_value());
    }

    SECTION("Wrong version loads nothing") {
        REQUIRE(atomic_write_file(path, R"({"version":2,"display_name":"a","token":"ff"})"));
        REQUIRE_FALSE(LoadIdentity(path).has_value());
    }

    SECTION("Missing token loads nothing") {
        REQUIRE(atomic_write_file(path, R"({"version":1,"display_name":"a"})"));
        REQUIRE_FALSE(LoadIdentity(path).has_value());
    }

    SECTION("Save creates the parent directory") {
        auto nested = dir / "a" / "b" / "identity.json";
        REQUIRE(SaveIdentity(PeerID::Generate("alice"), nested));
        REQUIRE(std::filesystem::exists(nested));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("FetchOrCreateIdentity", "[network][identity]") {
    auto dir = MakeTestDir("fetch");
    auto path = dir / "identity.json";

    SECTION("Identity is reused across restarts") {
        PeerID first = FetchOrCreateIdentity("alice", path);
        PeerID second = FetchOrCreateIdentity("alice", path);
        REQUIRE(first == second);
        REQUIRE(first.token() == second.token());
    }

    SECTION("Changing the display name mints a new identity") {
        PeerID first = FetchOrCreateIdentity("alice", path);
        PeerID renamed = FetchOrCreateIdentity("alice2", path);
        REQUIRE(first != renamed);
        REQUIRE(renamed.display_name() == "alice2");

        // The new identity replaced the stored one
        auto stored = LoadIdentity(path);
        REQUIRE(stored.has_value());
        REQUIRE(*stored == renamed);
    }

    SECTION("Empty path disables persistence") {
        PeerID first = FetchOrCreateIdentity("alice", {});
        PeerID second = FetchOrCreateIdentity("alice", {});
        REQUIRE(first != second);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    std::filesystem::remove_all(dir);
}
