// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "store/server_lists.hpp"
#include "util/fs_lock.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <sys/wait.h>
#include <unistd.h>

using namespace serverbook;
using namespace serverbook::store;

TEST_CASE("ServerLists: open and layout", "[server_lists]") {
    auto datadir = std::filesystem::temp_directory_path() / "serverbook_lists_test_open";
    std::filesystem::remove_all(datadir);
    util::MockTimeScope mock_time(1740000000);

    SECTION("Creates the data directory and lock file") {
        ServerLists lists(datadir / "nested");
        REQUIRE(lists.Open());
        REQUIRE(std::filesystem::is_directory(datadir / "nested"));
        REQUIRE(std::filesystem::exists(datadir / "nested" / ".lock"));
        REQUIRE(lists.Favorites().Size() == 0);
        REQUIRE(lists.History().Size() == 0);
        REQUIRE(lists.Recent().Size() == 0);
    }

    SECTION("Each list writes its own file") {
        ServerLists lists(datadir);
        REQUIRE(lists.Open());
        lists.Favorites().Upsert("10.0.0.1", 1000);
        lists.History().Upsert("10.0.0.2", 1000);
        lists.Recent().Upsert("10.0.0.3", 1000);

        REQUIRE(std::filesystem::exists(datadir / "server_favorites.json"));
        REQUIRE(std::filesystem::exists(datadir / "server_history.json"));
        REQUIRE(std::filesystem::exists(datadir / "RecentServers.json"));

        REQUIRE(lists.Favorites().Capacity() == 100);
        REQUIRE(lists.History().Capacity() == 10);
        REQUIRE(lists.Recent().Capacity() == 5);
        REQUIRE(&lists.Get(StoreKind::History) == &lists.History());
    }

    SECTION("Lists survive a reopen") {
        {
            ServerLists lists(datadir);
            REQUIRE(lists.Open());
            lists.Favorites().Upsert("play.example.com", 27015, std::string("Main"));
        }
        ServerLists lists(datadir);
        REQUIRE(lists.Open());
        auto favorite = lists.Favorites().Find("PLAY.example.com", 27015);
        REQUIRE(favorite.has_value());
        REQUIRE(favorite->DisplayText() == "Main");
    }

    SECTION("Corrupt file does not block the others") {
        std::filesystem::create_directories(datadir);
        {
            std::ofstream f(datadir / "server_history.json");
            f << "[[[";
        }
        {
            std::ofstream f(datadir / "RecentServers.json");
            f << R"([{"ip": "10.0.0.1", "port": 1000}])";
        }
        ServerLists lists(datadir);
        REQUIRE(lists.Open());
        REQUIRE(lists.History().Size() == 0);
        REQUIRE(lists.Recent().Size() == 1);
    }

    SECTION("Empty data directory path fails") {
        ServerLists lists{std::filesystem::path()};
        REQUIRE_FALSE(lists.Open());
    }

    std::filesystem::remove_all(datadir);
}

TEST_CASE("ServerLists: data directory held by another process", "[server_lists][multiprocess]") {
    auto datadir = std::filesystem::temp_directory_path() / "serverbook_lists_test_lock";
    std::filesystem::remove_all(datadir);
    std::filesystem::create_directories(datadir);

    int ready[2];
    int release[2];
    REQUIRE(pipe(ready) == 0);
    REQUIRE(pipe(release) == 0);

    pid_t pid = fork();
    if (pid == 0) {
        // Child: hold the lock until the parent is done
        char c = 0;
        auto result = util::LockDirectory(datadir, ".lock");
        c = result == util::LockResult::Success ? 1 : 0;
        if (write(ready[1], &c, 1) != 1) {
            _exit(2);
        }
        if (read(release[0], &c, 1) != 1) {
            _exit(3);
        }
        _exit(0);
    }

    char c = 0;
    REQUIRE(read(ready[0], &c, 1) == 1);
    REQUIRE(c == 1);

    {
        ServerLists lists(datadir);
        REQUIRE_FALSE(lists.Open());
    }

    REQUIRE(write(release[1], &c, 1) == 1);
    int status = 0;
    waitpid(pid, &status, 0);
    REQUIRE(WIFEXITED(status));

    close(ready[0]);
    close(ready[1]);
    close(release[0]);
    close(release[1]);

    // Free again once the other process exits
    {
        ServerLists lists(datadir);
        REQUIRE(lists.Open());
    }

    std::filesystem::remove_all(datadir);
}

TEST_CASE("ServerLists: two instances on one data directory", "[server_lists][multiprocess]") {
    auto datadir = std::filesystem::temp_directory_path() / "serverbook_lists_test_shared";
    std::filesystem::remove_all(datadir);

    // Reports whether another process could take the lock right now
    auto lock_free_elsewhere = [&datadir]() {
        pid_t pid = fork();
        if (pid == 0) {
            util::FileLock child_lock(datadir / ".lock");
            _exit(child_lock.TryLock() ? 0 : 1);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    };

    auto first = std::make_unique<ServerLists>(datadir);
    REQUIRE(first->Open());
    {
        ServerLists second(datadir);
        REQUIRE(second.Open());
        REQUIRE_FALSE(lock_free_elsewhere());

        // Closing the first instance must not drop the lock the second relies on
        first.reset();
        REQUIRE_FALSE(lock_free_elsewhere());
    }

    // Last holder gone
    REQUIRE(lock_free_elsewhere());

    std::filesystem::remove_all(datadir);
}
