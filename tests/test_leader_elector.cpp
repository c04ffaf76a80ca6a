/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: test_leader_elector.cpp

    Description:
        Tests for the coordination store and the lease-based leader election.
        Most tests drive check_leadership() by hand with a long check
        interval so the background loop never interferes.

        Test Coverage:
        - Test 1: Single-instance mode leads immediately without a store
        - Test 2: First instance claims, second follows
        - Test 3: Expired lease is taken over, old leader is superseded
        - Test 4: Unparsable heartbeat counts as expired
        - Test 5: Store failure demotes, recovery re-elects
        - Test 6: stop() relinquishes only a lease it still holds
        - Test 7: FileSettingsStore basics, descriptor hygiene and corruption
        - Test 8: Two live electors on one file store never both lead

    Exit Codes:
        0: All tests passed
        1: One or more tests failed

*******************************************************************************/

#include "election/leader_elector.h"
#include "election/settings_store.h"
#include "common/logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

#include <dirent.h>
#include <unistd.h>

using namespace dss;

namespace {

// Delegates to an in-memory store until told to fail.
class FlakyStore : public SettingsStore {
public:
    InMemorySettingsStore inner;
    std::atomic<bool> failing{false};

    std::string get(const std::string& key) override {
        if (failing) throw StoreError("store unreachable");
        return inner.get(key);
    }

    void set(const std::string& key, const std::string& value) override {
        if (failing) throw StoreError("store unreachable");
        inner.set(key, value);
    }

    bool compare_and_set(const std::string& key, const std::string& desired,
                         const Condition& condition) override {
        if (failing) throw StoreError("store unreachable");
        return inner.compare_and_set(key, desired, condition);
    }
};

ElectionConfig scale_out_config(const std::string& id) {
    ElectionConfig config;
    config.instance_id = id;
    config.scale_out = true;
    config.lease_timeout_ms = 5000;
    config.check_interval_ms = 60000;
    config.retry_backoff_initial_ms = 60000;
    config.retry_backoff_max_ms = 60000;
    return config;
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string temp_path(const std::string& name) {
    return "/tmp/dss_test_" + name + "_" + std::to_string(::getpid()) + ".json";
}

void remove_store_files(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + ".lock").c_str());
}

int open_descriptor_count() {
    int count = 0;
    DIR* dir = ::opendir("/proc/self/fd");
    if (dir == nullptr) return -1;
    while (::readdir(dir) != nullptr) count++;
    ::closedir(dir);
    return count;
}

} // namespace

int main() {
    Logger::set_level(LogLevel::WARNING);

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Single-instance mode... ";
        try {
            ElectionConfig config;
            config.instance_id = "web-1:8080";
            config.scale_out = false;

            LeadershipChannel channel;
            auto events = channel.subscribe();
            LeaderElector elector(config, nullptr, channel);

            assert(!elector.is_ready());
            assert(elector.start());
            assert(elector.is_leader());
            assert(elector.is_ready());
            assert(elector.leader_id() == "web-1:8080");

            LeadershipEvent event;
            assert(events->try_pop(event));
            assert(event.is_leader);
            assert(event.instance_id == "web-1:8080");
            assert(!events->try_pop(event));

            elector.stop();

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: First claims, second follows... ";
        try {
            auto store = std::make_shared<InMemorySettingsStore>();
            LeadershipChannel channel_a;
            LeadershipChannel channel_b;
            LeaderElector a(scale_out_config("web-1:8080"), store, channel_a);
            LeaderElector b(scale_out_config("web-2:8080"), store, channel_b);

            assert(a.start());
            assert(a.is_ready());
            assert(a.is_leader());

            assert(b.start());
            assert(b.is_ready());
            assert(!b.is_leader());
            assert(b.leader_id() == "web-1:8080");

            // Renewal keeps the same leader
            assert(a.check_leadership());
            assert(b.check_leadership());
            assert(a.is_leader() && !b.is_leader());
            assert(store->get(kLeaderIdKey) == "web-1:8080");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Expired lease takeover and supersession... ";
        try {
            auto store = std::make_shared<InMemorySettingsStore>();
            LeadershipChannel channel_a;
            LeadershipChannel channel_b;
            auto events_a = channel_a.subscribe();
            auto events_b = channel_b.subscribe();
            LeaderElector a(scale_out_config("web-1:8080"), store, channel_a);
            LeaderElector b(scale_out_config("web-2:8080"), store, channel_b);

            a.start();
            b.start();
            assert(a.is_leader());

            // web-1 stops renewing
            store->set(kLeaderHeartbeatKey, std::to_string(epoch_ms() - 10000));

            assert(b.check_leadership());
            assert(b.is_leader());
            assert(store->get(kLeaderIdKey) == "web-2:8080");

            // web-1 comes back and finds a live lease held by web-2
            assert(a.check_leadership());
            assert(!a.is_leader());
            assert(a.leader_id() == "web-2:8080");

            LeadershipEvent event;
            assert(events_a->try_pop(event) && event.is_leader);
            assert(events_a->try_pop(event) && !event.is_leader);
            assert(events_b->try_pop(event) && event.is_leader);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Unparsable heartbeat is expired... ";
        try {
            auto store = std::make_shared<InMemorySettingsStore>();
            store->set(kLeaderIdKey, "web-9:8080");
            store->set(kLeaderHeartbeatKey, "not-a-timestamp");

            LeadershipChannel channel;
            LeaderElector elector(scale_out_config("web-1:8080"), store, channel);
            elector.start();

            assert(elector.is_leader());
            assert(store->get(kLeaderIdKey) == "web-1:8080");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Store failure demotes... ";
        try {
            auto store = std::make_shared<FlakyStore>();
            LeadershipChannel channel;
            LeaderElector elector(scale_out_config("web-1:8080"), store, channel);
            elector.start();
            assert(elector.is_leader());

            store->failing = true;
            assert(!elector.check_leadership());
            assert(!elector.is_leader());
            assert(elector.is_ready());

            // Lease still names us and is fresh: confirmed again on recovery
            store->failing = false;
            assert(elector.check_leadership());
            assert(elector.is_leader());

            // A store failure on the very first check still completes start()
            auto down = std::make_shared<FlakyStore>();
            down->failing = true;
            LeadershipChannel channel_down;
            LeaderElector isolated(scale_out_config("web-3:8080"), down, channel_down);
            assert(isolated.start());
            assert(isolated.is_ready());
            assert(!isolated.is_leader());
            isolated.stop();

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Relinquish on stop... ";
        try {
            auto store = std::make_shared<InMemorySettingsStore>();
            LeadershipChannel channel_a;
            LeadershipChannel channel_b;
            LeaderElector a(scale_out_config("web-1:8080"), store, channel_a);
            LeaderElector b(scale_out_config("web-2:8080"), store, channel_b);
            a.start();
            b.start();

            a.stop();
            assert(!a.is_leader());
            assert(store->get(kLeaderIdKey).empty());

            assert(b.check_leadership());
            assert(b.is_leader());

            // A stale leader must not clear someone else's lease
            auto other = std::make_shared<InMemorySettingsStore>();
            LeadershipChannel channel_c;
            LeaderElector c(scale_out_config("web-3:8080"), other, channel_c);
            c.start();
            assert(c.is_leader());
            other->set(kLeaderIdKey, "web-4:8080");
            c.stop();
            assert(other->get(kLeaderIdKey) == "web-4:8080");

            b.stop();

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: File store... ";
        std::string path = temp_path("settings");
        remove_store_files(path);
        try {
            FileSettingsStore store(path);
            assert(store.get(kLeaderIdKey).empty());

            store.set(kLeaderIdKey, "web-1:8080");
            store.set(kLeaderHeartbeatKey, "12345");

            FileSettingsStore reopened(path);
            assert(reopened.get(kLeaderIdKey) == "web-1:8080");
            assert(reopened.get(kLeaderHeartbeatKey) == "12345");

            bool written = reopened.compare_and_set(kLeaderIdKey, "web-2:8080",
                [](const std::string& current) { return current.empty(); });
            assert(!written);
            written = reopened.compare_and_set(kLeaderIdKey, "web-2:8080",
                [](const std::string& current) { return current == "web-1:8080"; });
            assert(written);
            assert(store.get(kLeaderIdKey) == "web-2:8080");

            store.set(kLeaderIdKey, "");
            assert(reopened.get(kLeaderIdKey).empty());

            // Repeated writes leave no descriptors behind.
            int descriptors_before = open_descriptor_count();
            for (int i = 0; i < 50; i++) {
                store.set(kLeaderHeartbeatKey, std::to_string(i));
            }
            assert(open_descriptor_count() == descriptors_before);
            assert(reopened.get(kLeaderHeartbeatKey) == "49");

            {
                std::ofstream corrupt(path, std::ios::trunc);
                corrupt << "{not json";
            }
            bool threw = false;
            try {
                store.get(kLeaderIdKey);
            } catch (const StoreError&) {
                threw = true;
            }
            assert(threw);

            remove_store_files(path);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            remove_store_files(path);
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: At most one leader with live election loops... ";
        std::string path = temp_path("fleet");
        remove_store_files(path);
        try {
            auto store_a = std::make_shared<FileSettingsStore>(path);
            auto store_b = std::make_shared<FileSettingsStore>(path);

            ElectionConfig config_a = scale_out_config("web-1:8080");
            ElectionConfig config_b = scale_out_config("web-2:8080");
            config_a.check_interval_ms = 20;
            config_b.check_interval_ms = 20;

            LeadershipChannel channel_a;
            LeadershipChannel channel_b;
            LeaderElector a(config_a, store_a, channel_a);
            LeaderElector b(config_b, store_b, channel_b);

            std::thread start_a([&a] { a.start(); });
            std::thread start_b([&b] { b.start(); });
            start_a.join();
            start_b.join();

            int leaders_seen = 0;
            for (int i = 0; i < 50; i++) {
                int leaders = (a.is_leader() ? 1 : 0) + (b.is_leader() ? 1 : 0);
                assert(leaders <= 1);
                leaders_seen += leaders;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            assert(leaders_seen > 0);

            a.stop();
            b.stop();
            remove_store_files(path);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            remove_store_files(path);
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return failed > 0 ? 1 : 0;
}
