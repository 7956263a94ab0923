#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <filesystem>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace nearlink::util;

TEST_CASE("File utilities", "[util][files]") {
    auto test_dir = std::filesystem::temp_directory_path() / "nearlink_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file creates and overwrites") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "data.txt";

        REQUIRE(atomic_write_file(file_path, "first"));
        REQUIRE(atomic_write_file(file_path, "second"));
        REQUIRE(read_file_string(file_path) == std::string("second"));
    }

    SECTION("atomic_write_file honors the mode") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "secret.json";
        REQUIRE(atomic_write_file(file_path, "{}", 0600));

        struct stat st {};
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("No temp files are left behind") {
        REQUIRE(ensure_directory(test_dir));
        REQUIRE(atomic_write_file(test_dir / "a.txt", "a"));
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            ++count;
        }
        REQUIRE(count == 1);
    }

    SECTION("read_file_string of a missing file") {
        REQUIRE_FALSE(read_file_string(test_dir / "missing").has_value());
    }

    SECTION("atomic_write_file creates missing parent directories") {
        auto nested = test_dir / "no" / "such" / "file";
        REQUIRE(atomic_write_file(nested, "x"));
        REQUIRE(read_file_string(nested) == std::string("x"));
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Directory lock", "[util][files]") {
    auto test_dir = std::filesystem::temp_directory_path() / "nearlink_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    SECTION("Lock is acquired and creates the lock file") {
        LockResult result = LockResult::ErrorWrite;
        auto lock = DirectoryLock::Acquire(test_dir, ".lock", &result);
        REQUIRE(lock != nullptr);
        REQUIRE(result == LockResult::Success);
        REQUIRE(lock->path() == test_dir / ".lock");
        REQUIRE(std::filesystem::exists(test_dir / ".lock"));
    }

    SECTION("Another process cannot take a held lock") {
        auto lock = DirectoryLock::Acquire(test_dir);
        REQUIRE(lock != nullptr);

        pid_t pid = fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            LockResult child_result = LockResult::Success;
            auto child_lock = DirectoryLock::Acquire(test_dir, ".lock", &child_result);
            _exit(child_lock == nullptr && child_result == LockResult::ErrorLock ? 0 : 1);
        }

        int status = 0;
        REQUIRE(waitpid(pid, &status, 0) == pid);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == 0);
    }

    SECTION("Released lock can be taken by another process") {
        {
            auto lock = DirectoryLock::Acquire(test_dir);
            REQUIRE(lock != nullptr);
        }

        pid_t pid = fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            auto child_lock = DirectoryLock::Acquire(test_dir);
            _exit(child_lock != nullptr ? 0 : 1);
        }

        int status = 0;
        REQUIRE(waitpid(pid, &status, 0) == pid);
        REQUIRE(WEXITSTATUS(status) == 0);
    }

    SECTION("Missing directory is a write error") {
        LockResult result = LockResult::Success;
        auto lock = DirectoryLock::Acquire(test_dir / "missing", ".lock", &result);
        REQUIRE(lock == nullptr);
        REQUIRE(result == LockResult::ErrorWrite);
    }

    std::filesystem::remove_all(test_dir);
}
