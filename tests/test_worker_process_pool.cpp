#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "core/browser/pool_lease.hpp"
#include "core/browser/worker_process.hpp"
#include "core/browser/worker_process_pool.hpp"

using namespace BalanceMonitor::Browser;

namespace {

WorkerPoolSettings fake_driver_settings(size_t pool_size, size_t max_pool_size) {
    WorkerPoolSettings settings;
    settings.pool_size = pool_size;
    settings.max_pool_size = max_pool_size;
    settings.launch_spec.executable = FAKE_WEBDRIVER_PATH;
    settings.launch_spec.port_ready_timeout = std::chrono::milliseconds(5000);
    settings.launch_spec.port_poll_interval = std::chrono::milliseconds(20);
    return settings;
}

// Pool double that counts releases and hands out a single ticket when allowed.
class CountingPool : public WorkerPoolInterface {
public:
    bool has_worker = false;
    std::atomic<int> acquire_calls{0};
    std::atomic<int> release_calls{0};

    std::optional<PoolTicket> try_acquire() override {
        ++acquire_calls;
        if (!has_worker) {
            return std::nullopt;
        }
        PoolTicket ticket;
        ticket.endpoint = "http://127.0.0.1:1";
        ticket.slot_id = 7;
        return ticket;
    }

    void release(const PoolTicket&) override { ++release_calls; }

    PoolStats get_stats() override { return PoolStats(); }
};

} // namespace

TEST(WorkerProcessTest, FreePortIsUsable) {
    int port = find_free_local_port();
    EXPECT_GT(port, 0);
    EXPECT_FALSE(is_local_port_accepting(port, std::chrono::milliseconds(100)));
}

TEST(WorkerProcessPoolTest, WarmUpStartsPoolSizeWorkers) {
    WorkerProcessPool pool(fake_driver_settings(2, 3));
    EXPECT_EQ(pool.warm_up(), 2u);

    PoolStats stats = pool.get_stats();
    EXPECT_EQ(stats.total_workers, 2u);
    EXPECT_EQ(stats.idle_workers, 2u);
    EXPECT_EQ(stats.alive_workers, 2u);
    EXPECT_EQ(stats.total_created, 2u);
}

TEST(WorkerProcessPoolTest, ReleasedWorkerIsReusedImmediately) {
    WorkerProcessPool pool(fake_driver_settings(1, 2));
    pool.warm_up();

    std::optional<PoolTicket> first = pool.try_acquire();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->endpoint.rfind("http://127.0.0.1:", 0), 0u);
    pool.release(*first);

    std::optional<PoolTicket> second = pool.try_acquire();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->slot_id, first->slot_id);
    EXPECT_EQ(second->endpoint, first->endpoint);

    PoolStats stats = pool.get_stats();
    EXPECT_EQ(stats.total_created, 1u);
    EXPECT_EQ(stats.total_reused, 2u);
    EXPECT_EQ(stats.busy_workers, 1u);
    pool.release(*second);
}

TEST(WorkerProcessPoolTest, NeverExceedsMaximum) {
    WorkerProcessPool pool(fake_driver_settings(1, 2));

    std::optional<PoolTicket> first = pool.try_acquire();
    std::optional<PoolTicket> second = pool.try_acquire();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->slot_id, second->slot_id);
    EXPECT_NE(first->endpoint, second->endpoint);

    EXPECT_FALSE(pool.try_acquire().has_value());
    EXPECT_EQ(pool.get_stats().total_workers, 2u);

    pool.release(*second);
    std::optional<PoolTicket> third = pool.try_acquire();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->slot_id, second->slot_id);
}

TEST(WorkerProcessPoolTest, ConcurrentLeasesNeverShareAWorker) {
    WorkerProcessPool pool(fake_driver_settings(2, 2));
    pool.warm_up();

    std::mutex held_mutex;
    std::set<std::uint64_t> held;
    std::atomic<bool> overlap{false};
    std::atomic<int> completed{0};

    std::vector<std::thread> threads;
    for (int thread_index = 0; thread_index < 4; ++thread_index) {
        threads.emplace_back([&]() {
            for (int round = 0; round < 10; ++round) {
                PoolLease lease = acquire_worker_lease(pool, std::chrono::milliseconds(5000), std::chrono::milliseconds(5));
                {
                    std::lock_guard<std::mutex> lock(held_mutex);
                    if (!held.insert(lease.get_ticket().slot_id).second) {
                        overlap = true;
                    }
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                {
                    std::lock_guard<std::mutex> lock(held_mutex);
                    held.erase(lease.get_ticket().slot_id);
                }
                ++completed;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(overlap.load());
    EXPECT_EQ(completed.load(), 40);
    PoolStats stats = pool.get_stats();
    EXPECT_LE(stats.total_workers, 2u);
    EXPECT_EQ(stats.busy_workers, 0u);
}

TEST(WorkerProcessPoolTest, DeadIdleWorkerIsReplaced) {
    WorkerPoolSettings settings = fake_driver_settings(1, 1);
    settings.launch_spec.extra_args.push_back("--exit-after-ms=300");
    WorkerProcessPool pool(settings);
    ASSERT_EQ(pool.warm_up(), 1u);

    std::optional<PoolTicket> first = pool.try_acquire();
    ASSERT_TRUE(first.has_value());
    pool.release(*first);

    std::this_thread::sleep_for(std::chrono::milliseconds(900));

    std::optional<PoolTicket> second = pool.try_acquire();
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second->slot_id, first->slot_id);
    EXPECT_EQ(pool.get_stats().total_created, 2u);
}

TEST(WorkerProcessPoolTest, LeasedWorkerIsKeptEvenAfterItDies) {
    WorkerPoolSettings settings = fake_driver_settings(1, 2);
    settings.launch_spec.extra_args.push_back("--exit-after-ms=300");
    WorkerProcessPool pool(settings);

    std::optional<PoolTicket> leased = pool.try_acquire();
    ASSERT_TRUE(leased.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(900));

    std::optional<PoolTicket> other = pool.try_acquire();
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(other->slot_id, leased->slot_id);

    PoolStats stats = pool.get_stats();
    EXPECT_EQ(stats.total_workers, 2u);
    EXPECT_EQ(stats.busy_workers, 2u);
    EXPECT_FALSE(pool.try_acquire().has_value());
    EXPECT_EQ(pool.get_stats().total_workers, 2u);

    pool.release(*leased);
    stats = pool.get_stats();
    EXPECT_EQ(stats.total_workers, 2u);
    EXPECT_EQ(stats.idle_workers, 1u);

    // Once idle, the dead worker is dropped and its place taken by a new one
    std::optional<PoolTicket> replacement = pool.try_acquire();
    ASSERT_TRUE(replacement.has_value());
    EXPECT_NE(replacement->slot_id, leased->slot_id);
    EXPECT_EQ(pool.get_stats().total_created, 3u);
    pool.release(*other);
    pool.release(*replacement);
}

TEST(WorkerProcessPoolTest, ShutdownDuringAcquiresLeavesNothingBehind) {
    WorkerProcessPool pool(fake_driver_settings(2, 2));
    pool.warm_up();

    std::atomic<bool> stop{false};
    std::atomic<int> leases{0};
    std::vector<std::thread> threads;
    for (int thread_index = 0; thread_index < 4; ++thread_index) {
        threads.emplace_back([&]() {
            while (!stop.load()) {
                std::optional<PoolTicket> ticket = pool.try_acquire();
                if (ticket) {
                    ++leases;
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    pool.release(*ticket);
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    pool.shutdown();
    stop = true;
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_GT(leases.load(), 0);
    EXPECT_EQ(pool.get_stats().total_workers, 0u);
    EXPECT_FALSE(pool.try_acquire().has_value());
}

TEST(WorkerProcessPoolTest, SpawnFailurePropagatesAndFreesSlot) {
    WorkerPoolSettings settings = fake_driver_settings(1, 1);
    settings.launch_spec.executable = "/nonexistent/balance-monitor-driver";
    WorkerProcessPool pool(settings);

    EXPECT_THROW(pool.try_acquire(), WorkerSpawnError);
    EXPECT_EQ(pool.get_stats().total_workers, 0u);
    EXPECT_EQ(pool.warm_up(), 0u);
}

TEST(WorkerProcessPoolTest, ShutdownTerminatesWorkersAndRefusesAcquire) {
    WorkerProcessPool pool(fake_driver_settings(2, 2));
    pool.warm_up();
    std::optional<PoolTicket> ticket = pool.try_acquire();
    ASSERT_TRUE(ticket.has_value());

    pool.shutdown();
    EXPECT_EQ(pool.get_stats().total_workers, 0u);
    EXPECT_FALSE(pool.try_acquire().has_value());

    // Late release and a second shutdown are harmless
    pool.release(*ticket);
    pool.shutdown();
}

TEST(PoolLeaseTest, TimesOutWhenNoWorkerFrees) {
    CountingPool pool;
    auto started = std::chrono::steady_clock::now();
    try {
        acquire_worker_lease(pool, std::chrono::milliseconds(1000), std::chrono::milliseconds(50));
        FAIL() << "expected WorkerAcquireTimeout";
    } catch (const WorkerAcquireTimeout& timeout_error) {
        EXPECT_NE(std::string(timeout_error.what()).find("timed out"), std::string::npos);
    }
    auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_GE(waited, std::chrono::milliseconds(1000));
    EXPECT_GT(pool.acquire_calls.load(), 1);
}

TEST(PoolLeaseTest, ReleasesExactlyOnce) {
    CountingPool pool;
    pool.has_worker = true;
    {
        PoolLease lease = acquire_worker_lease(pool, std::chrono::milliseconds(100), std::chrono::milliseconds(10));
        EXPECT_EQ(lease.endpoint(), "http://127.0.0.1:1");
        PoolLease moved(std::move(lease));
        moved.release();
        moved.release();
    }
    EXPECT_EQ(pool.release_calls.load(), 1);
}

TEST(PoolLeaseTest, ReleasesWhenScopeUnwinds) {
    CountingPool pool;
    pool.has_worker = true;
    try {
        PoolLease lease = acquire_worker_lease(pool, std::chrono::milliseconds(100), std::chrono::milliseconds(10));
        throw std::runtime_error("attempt failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(pool.release_calls.load(), 1);
}
