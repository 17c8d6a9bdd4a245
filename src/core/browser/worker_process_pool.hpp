#ifndef WORKER_PROCESS_POOL_HPP
#define WORKER_PROCESS_POOL_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include "worker_pool_interface.hpp"
#include "worker_process.hpp"

namespace BalanceMonitor {
namespace Browser {

struct WorkerPoolSettings {
    size_t pool_size = 4;          // Warm-up floor
    size_t max_pool_size = 9;
    WorkerLaunchSpec launch_spec;
};

/**
 * Pool of long-lived worker processes with ticket based acquire/release.
 *
 * Slots live in a map keyed by a monotonically increasing id, so removing one
 * slot never invalidates tickets held for others. The pool mutex is not held
 * while a new process starts up or while an idle worker's liveness is checked:
 * the slot is reserved first and filled in (or dropped) later.
 */
class WorkerProcessPool : public WorkerPoolInterface {
public:
    explicit WorkerProcessPool(const WorkerPoolSettings& pool_settings);
    ~WorkerProcessPool() override;

    WorkerProcessPool(const WorkerProcessPool&) = delete;
    WorkerProcessPool& operator=(const WorkerProcessPool&) = delete;

    // Pre-creates up to pool_size idle workers; spawn failures are logged and skipped.
    size_t warm_up();

    std::optional<PoolTicket> try_acquire() override;
    void release(const PoolTicket& ticket) override;
    PoolStats get_stats() override;

    // Terminates every worker; later acquires return nothing. Safe to call twice.
    void shutdown();

    size_t get_max_pool_size() const { return settings.max_pool_size; }

private:
    struct WorkerSlot {
        std::unique_ptr<WorkerProcess> process;    // null while the process is starting
        bool busy = false;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
        unsigned long use_count = 0;
    };

    WorkerPoolSettings settings;
    std::mutex pool_mutex;
    std::map<std::uint64_t, WorkerSlot> slots;
    std::uint64_t next_slot_id = 1;
    bool shut_down = false;

    unsigned long total_created = 0;
    unsigned long total_reused = 0;
    unsigned long total_requests = 0;

    std::optional<PoolTicket> spawn_into_reserved_slot(std::uint64_t slot_id, bool mark_busy);
    std::string make_worker_id(std::uint64_t slot_id) const;
};

} // namespace Browser
} // namespace BalanceMonitor

#endif // WORKER_PROCESS_POOL_HPP
