// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the bounded server list engine (recency_store.cpp)

#include <catch2/catch.hpp>
#include "store/recency_store.hpp"
#include "util/time.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace serverbook;
using namespace serverbook::store;

namespace {

constexpr StoreConfig kSmallRecency{"test-recent", "recent.json", 5, OrderPolicy::Recency, false};
constexpr StoreConfig kSmallInsertion{"test-fifo", "fifo.json", 3, OrderPolicy::Insertion, false};

std::filesystem::path MakeTestDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("serverbook_store_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<std::string> Hosts(const BoundedRecencyStore& store) {
    std::vector<std::string> hosts;
    for (const auto& entry : store.Snapshot()) {
        hosts.push_back(entry.host);
    }
    return hosts;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
}

}  // namespace

TEST_CASE("BoundedRecencyStore: capacity is never exceeded", "[recency_store]") {
    auto dir = MakeTestDir("capacity");
    util::MockTimeScope mock_time(1740000000);

    BoundedRecencyStore recent(kSmallRecency, dir / "recent.json");
    BoundedRecencyStore fifo(kSmallInsertion, dir / "fifo.json");

    for (int i = 0; i < 50; ++i) {
        const std::string host = "10.0.0." + std::to_string(i % 17);
        recent.Upsert(host, static_cast<uint16_t>(1000 + i % 3));
        fifo.Upsert(host, static_cast<uint16_t>(1000 + i % 3));
        REQUIRE(recent.Size() <= recent.Capacity());
        REQUIRE(fifo.Size() <= fifo.Capacity());
    }
    REQUIRE(recent.Size() == 5);
    REQUIRE(fifo.Size() == 3);

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: upsert deduplicates", "[recency_store]") {
    auto dir = MakeTestDir("dedup");
    util::MockTimeScope mock_time(1740000000);
    BoundedRecencyStore store(kSmallRecency, dir / "recent.json");

    SECTION("Same host and port twice yields one entry") {
        REQUIRE(store.Upsert("10.0.0.1", 1000, std::string("first")));
        REQUIRE(store.Upsert("10.0.0.1", 1000, std::string("second")));
        REQUIRE(store.Size() == 1);
        REQUIRE(store.Snapshot()[0].display_name == std::optional<std::string>("second"));
    }

    SECTION("Host comparison is case-insensitive") {
        store.Upsert("A.B.C", 80);
        store.Upsert("a.b.c", 80);
        REQUIRE(store.Size() == 1);
        // First spelling is kept
        REQUIRE(store.Snapshot()[0].host == "A.B.C");
        REQUIRE(store.Contains("a.B.c", 80));
    }

    SECTION("Different ports are different servers") {
        store.Upsert("10.0.0.1", 1000);
        store.Upsert("10.0.0.1", 1001);
        REQUIRE(store.Size() == 2);
    }

    SECTION("Blank host or port 0 is rejected") {
        REQUIRE_FALSE(store.Upsert("", 1000));
        REQUIRE_FALSE(store.Upsert("   ", 1000));
        REQUIRE_FALSE(store.Upsert("10.0.0.1", 0));
        REQUIRE(store.Size() == 0);
        REQUIRE_FALSE(std::filesystem::exists(dir / "recent.json"));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: upsert payload", "[recency_store]") {
    auto dir = MakeTestDir("payload");
    util::MockTimeScope mock_time(1740000000);
    BoundedRecencyStore store(kSmallRecency, dir / "recent.json");

    store.Upsert("10.0.0.1", 1000, std::string("Friday Night"));
    REQUIRE(store.Find("10.0.0.1", 1000)->last_contact == 1740000000);

    util::SetMockTime(1740000500);

    SECTION("Empty or missing name keeps the stored name") {
        store.Upsert("10.0.0.1", 1000, std::string());
        store.Upsert("10.0.0.1", 1000);
        auto entry = store.Find("10.0.0.1", 1000);
        REQUIRE(entry.has_value());
        REQUIRE(entry->display_name == std::optional<std::string>("Friday Night"));
        REQUIRE(entry->last_contact == 1740000500);
    }

    SECTION("New entry with empty name has no name") {
        store.Upsert("10.0.0.2", 1000, std::string());
        REQUIRE_FALSE(store.Find("10.0.0.2", 1000)->display_name.has_value());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: recency ordering", "[recency_store]") {
    auto dir = MakeTestDir("recency");
    util::MockTimeScope mock_time(1740000000);
    BoundedRecencyStore store(kSmallRecency, dir / "recent.json");

    SECTION("Re-upsert moves to the head") {
        store.Upsert("x", 1);
        store.Upsert("y", 1);
        store.Upsert("x", 1);
        REQUIRE(Hosts(store) == std::vector<std::string>{"x", "y"});
    }

    SECTION("Capacity-5 store evicts the least recent") {
        for (int i = 1; i <= 6; ++i) {
            store.Upsert("10.0.0." + std::to_string(i), 1000);
        }
        auto snapshot = store.Snapshot();
        REQUIRE(snapshot.size() == 5);
        REQUIRE(snapshot.front().DisplayText() == "10.0.0.6:1000");
        REQUIRE_FALSE(store.Contains("10.0.0.1", 1000));
        REQUIRE(Hosts(store) == std::vector<std::string>{"10.0.0.6", "10.0.0.5", "10.0.0.4", "10.0.0.3", "10.0.0.2"});
    }

    SECTION("Touching an old entry saves it from eviction") {
        for (int i = 1; i <= 5; ++i) {
            store.Upsert("10.0.0." + std::to_string(i), 1000);
        }
        store.Upsert("10.0.0.1", 1000);
        store.Upsert("10.0.0.6", 1000);
        REQUIRE(store.Contains("10.0.0.1", 1000));
        REQUIRE_FALSE(store.Contains("10.0.0.2", 1000));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: insertion ordering", "[recency_store]") {
    auto dir = MakeTestDir("insertion");
    util::MockTimeScope mock_time(1740000000);

    SECTION("Updates keep position") {
        BoundedRecencyStore store(kSmallInsertion, dir / "fifo.json");
        store.Upsert("a", 1);
        store.Upsert("b", 1);
        store.Upsert("a", 1, std::string("renamed"));
        REQUIRE(Hosts(store) == std::vector<std::string>{"a", "b"});
    }

    SECTION("Overflow evicts the first inserted, not the least recently updated") {
        BoundedRecencyStore store(kSmallInsertion, dir / "fifo.json");
        store.Upsert("a", 1);
        store.Upsert("b", 1);
        store.Upsert("c", 1);
        store.Upsert("a", 1);  // most recently touched, still oldest inserted
        store.Upsert("d", 1);
        REQUIRE(Hosts(store) == std::vector<std::string>{"b", "c", "d"});
    }

    SECTION("Capacity-100 favorites keep e2..e101") {
        BoundedRecencyStore store(FAVORITES_CONFIG, dir / "server_favorites.json");
        for (int i = 1; i <= 101; ++i) {
            store.Upsert("e" + std::to_string(i), 1000);
        }
        auto hosts = Hosts(store);
        REQUIRE(hosts.size() == 100);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(hosts[static_cast<size_t>(i)] == "e" + std::to_string(i + 2));
        }
        REQUIRE_FALSE(store.Contains("e1", 1000));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: remove, clear and rename", "[recency_store]") {
    auto dir = MakeTestDir("mutations");
    util::MockTimeScope mock_time(1740000000);
    BoundedRecencyStore store(kSmallRecency, dir / "recent.json");
    store.Upsert("10.0.0.1", 1000, std::string("one"));
    store.Upsert("10.0.0.2", 1000);

    SECTION("Remove absent entry is a no-op") {
        auto before = store.Snapshot();
        REQUIRE_FALSE(store.Remove("10.0.0.9", 1000));
        REQUIRE_FALSE(store.Remove("10.0.0.1", 1001));
        REQUIRE(store.Snapshot() == before);
    }

    SECTION("Remove matches case-insensitively") {
        store.Upsert("Play.Example.com", 7777);
        REQUIRE(store.Remove("play.example.COM", 7777));
        REQUIRE(store.Size() == 2);
    }

    SECTION("Clear empties and persists") {
        store.Clear();
        REQUIRE(store.Size() == 0);
        BoundedRecencyStore reloaded(kSmallRecency, dir / "recent.json");
        REQUIRE(reloaded.Size() == 0);
        REQUIRE(std::filesystem::exists(dir / "recent.json"));
    }

    SECTION("UpdateDisplayName keeps position and timestamp") {
        util::SetMockTime(1740009999);
        REQUIRE(store.UpdateDisplayName("10.0.0.1", 1000, "Renamed"));
        auto snapshot = store.Snapshot();
        REQUIRE(snapshot[1].host == "10.0.0.1");
        REQUIRE(snapshot[1].display_name == std::optional<std::string>("Renamed"));
        REQUIRE(snapshot[1].last_contact == 1740000000);
    }

    SECTION("UpdateDisplayName with empty name clears it") {
        REQUIRE(store.UpdateDisplayName("10.0.0.1", 1000, ""));
        REQUIRE_FALSE(store.Find("10.0.0.1", 1000)->display_name.has_value());
    }

    SECTION("UpdateDisplayName on absent entry") {
        REQUIRE_FALSE(store.UpdateDisplayName("10.0.0.9", 1000, "x"));
        REQUIRE(store.Size() == 2);
    }

    SECTION("Snapshot is an independent copy") {
        auto snapshot = store.Snapshot();
        snapshot.clear();
        REQUIRE(store.Size() == 2);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: persistence", "[recency_store][persistence]") {
    auto dir = MakeTestDir("persistence");
    util::MockTimeScope mock_time(1740000000);
    auto path = dir / "recent.json";

    SECTION("Every mutation is visible to a fresh load") {
        {
            BoundedRecencyStore store(kSmallRecency, path);
            store.Upsert("10.0.0.1", 1000, std::string("one"));
            util::SetMockTime(1740000100);
            store.Upsert("2001:db8::1", 7777);
            REQUIRE(store.LastSaveResult() == SaveResult::Success);
        }
        BoundedRecencyStore reloaded(kSmallRecency, path);
        REQUIRE(reloaded.Load() == LoadStatus::Success);
        auto snapshot = reloaded.Snapshot();
        REQUIRE(snapshot.size() == 2);
        REQUIRE(snapshot[0] == ServerEntry("2001:db8::1", 7777, std::nullopt, 1740000100));
        REQUIRE(snapshot[1] == ServerEntry("10.0.0.1", 1000, std::string("one"), 1740000000));
    }

    SECTION("Missing file loads empty") {
        BoundedRecencyStore store(kSmallRecency, path);
        REQUIRE(store.Load() == LoadStatus::NotFound);
        REQUIRE(store.Size() == 0);
    }

    SECTION("Invalid JSON loads empty without throwing") {
        WriteText(path, "{ this is not json");
        BoundedRecencyStore store(kSmallRecency, path);
        REQUIRE(store.Load() == LoadStatus::ErrorParse);
        REQUIRE(store.Snapshot().empty());

        // Still usable; the next save overwrites the bad file
        REQUIRE(store.Upsert("10.0.0.1", 1000));
        BoundedRecencyStore reloaded(kSmallRecency, path);
        REQUIRE(reloaded.Size() == 1);
    }

    SECTION("Load is lazy") {
        WriteText(path, R"([{"ip": "10.0.0.1", "port": 1000, "lastConnected": "2025-01-01T00:00:00Z"}])");
        BoundedRecencyStore store(kSmallRecency, path);
        REQUIRE(store.Contains("10.0.0.1", 1000));
    }

    SECTION("Over-capacity and duplicate files are cleaned on load") {
        WriteText(path, R"([
            {"ip": "h1", "port": 1}, {"ip": "H1", "port": 1}, {"ip": "h2", "port": 1},
            {"ip": "h3", "port": 1}, {"ip": "h4", "port": 1}, {"ip": "h5", "port": 1},
            {"ip": "h6", "port": 1}, {"ip": "h7", "port": 1}
        ])");
        BoundedRecencyStore recent(kSmallRecency, path);
        // Recency keeps the head
        REQUIRE(Hosts(recent) == std::vector<std::string>{"h1", "h2", "h3", "h4", "h5"});

        BoundedRecencyStore fifo(kSmallInsertion, path);
        // Insertion keeps the tail
        REQUIRE(Hosts(fifo) == std::vector<std::string>{"h5", "h6", "h7"});
    }

    SECTION("sort_on_load orders by last contact, newest first") {
        WriteText(path, R"([
            {"ip": "old", "port": 1, "lastConnected": "2024-01-01T00:00:00Z"},
            {"ip": "new", "port": 1, "lastConnected": "2025-06-01T00:00:00Z"},
            {"ip": "mid", "port": 1, "lastConnected": "2025-01-01T00:00:00Z"},
            {"ip": "never", "port": 1}
        ])");
        BoundedRecencyStore history(HISTORY_CONFIG, path);
        REQUIRE(Hosts(history) == std::vector<std::string>{"new", "mid", "old", "never"});

        // Without the flag, file order is kept
        BoundedRecencyStore recent(kSmallRecency, path);
        REQUIRE(Hosts(recent) == std::vector<std::string>{"old", "new", "mid", "never"});
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: save failures keep memory state", "[recency_store][persistence]") {
    auto dir = MakeTestDir("save_failure");
    util::MockTimeScope mock_time(1740000000);

    // A directory where the file should be makes every save fail
    auto path = dir / "recent.json";
    std::filesystem::create_directories(path);

    BoundedRecencyStore store(kSmallRecency, path);
    REQUIRE(store.Load() == LoadStatus::ErrorRead);
    REQUIRE(store.Upsert("10.0.0.1", 1000));
    REQUIRE(store.LastSaveResult() == SaveResult::ErrorWrite);
    REQUIRE(store.Contains("10.0.0.1", 1000));

    // Repeated failures do not throw
    for (int i = 0; i < 20; ++i) {
        store.Upsert("10.0.0." + std::to_string(i), 1000);
    }
    REQUIRE(store.Size() == 5);

    std::filesystem::remove_all(dir);
}

TEST_CASE("BoundedRecencyStore: concurrent upserts and removes", "[recency_store][threading]") {
    auto dir = MakeTestDir("threads");
    util::MockTimeScope mock_time(1740000000);
    auto path = dir / "recent.json";
    BoundedRecencyStore store(kSmallRecency, path);

    const int num_threads = 8;
    const int ops_per_thread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&store, t, ops_per_thread]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                // Overlapping keys across threads, mixed case
                const std::string host = (i % 2 == 0 ? "host" : "HOST") + std::to_string((t + i) % 9);
                if (i % 3 == 2) {
                    store.Remove(host, 1000);
                } else {
                    store.Upsert(host, 1000, "thread " + std::to_string(t));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = store.Snapshot();
    REQUIRE(snapshot.size() <= store.Capacity());
    REQUIRE(store.Size() == snapshot.size());

    std::set<std::string> keys;
    for (const auto& entry : snapshot) {
        std::string key = entry.host;
        for (char& c : key) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        REQUIRE(keys.insert(key + ":" + std::to_string(entry.port)).second);
    }

    // The file holds the result of the last mutation
    REQUIRE(store.LastSaveResult() == SaveResult::Success);
    BoundedRecencyStore reloaded(kSmallRecency, path);
    REQUIRE(reloaded.Load() == LoadStatus::Success);
    REQUIRE(reloaded.Snapshot() == snapshot);

    std::filesystem::remove_all(dir);
}
