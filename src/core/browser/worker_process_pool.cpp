#include "worker_process_pool.hpp"
#include "core/logging/logging_macros.hpp"
#include <algorithm>

namespace BalanceMonitor {
namespace Browser {

WorkerProcessPool::WorkerProcessPool(const WorkerPoolSettings& pool_settings)
    : settings(pool_settings) {
    settings.max_pool_size = std::max<size_t>(1, settings.max_pool_size);
    settings.pool_size = std::min(std::max<size_t>(1, settings.pool_size), settings.max_pool_size);
}

WorkerProcessPool::~WorkerProcessPool() {
    shutdown();
}

std::string WorkerProcessPool::make_worker_id(std::uint64_t slot_id) const {
    return "worker_" + std::to_string(slot_id);
}

// ========================================================================
// WARM-UP
// ========================================================================

size_t WorkerProcessPool::warm_up() {
    size_t started = 0;
    for (size_t index = 0; index < settings.pool_size; ++index) {
        std::uint64_t slot_id = 0;
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            if (shut_down || slots.size() >= settings.pool_size) {
                break;
            }
            slot_id = next_slot_id++;
            WorkerSlot& slot = slots[slot_id];
            slot.busy = true;
            slot.created_at = std::chrono::steady_clock::now();
        }

        try {
            if (spawn_into_reserved_slot(slot_id, false)) {
                ++started;
            }
        } catch (const WorkerSpawnError& spawn_error) {
            LOG_WARN("Warm-up worker " + std::to_string(index + 1) + " failed: " + spawn_error.what());
        }
    }

    LOG_INFO("Worker pool warmed up: " + std::to_string(started) + "/" + std::to_string(settings.pool_size) +
             " workers (max " + std::to_string(settings.max_pool_size) + ")");
    return started;
}

// ========================================================================
// ACQUIRE / RELEASE
// ========================================================================

// An idle candidate is reserved (marked busy, process moved out of its slot) before
// its liveness check, so the check runs without the pool mutex held. Leased workers
// are never checked or removed.
std::optional<PoolTicket> WorkerProcessPool::try_acquire() {
    while (true) {
        std::uint64_t slot_id = 0;
        std::unique_ptr<WorkerProcess> candidate;
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            if (shut_down) {
                return std::nullopt;
            }

            for (auto& entry : slots) {
                WorkerSlot& slot = entry.second;
                if (slot.busy || !slot.process) {
                    continue;
                }
                slot.busy = true;
                candidate = std::move(slot.process);
                slot_id = entry.first;
                break;
            }

            if (!candidate) {
                if (slots.size() >= settings.max_pool_size) {
                    return std::nullopt;
                }
                slot_id = next_slot_id++;
                WorkerSlot& slot = slots[slot_id];
                slot.busy = true;
                slot.created_at = std::chrono::steady_clock::now();
            }
        }

        if (!candidate) {
            return spawn_into_reserved_slot(slot_id, true);
        }

        bool alive = candidate->is_alive(settings.launch_spec.liveness_probe_timeout);
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            auto it = slots.find(slot_id);
            if (alive && !shut_down && it != slots.end()) {
                WorkerSlot& slot = it->second;
                slot.process = std::move(candidate);
                slot.use_count += 1;
                slot.last_used = std::chrono::steady_clock::now();
                total_reused += 1;
                total_requests += 1;
                PoolTicket ticket;
                ticket.endpoint = slot.process->get_endpoint();
                ticket.slot_id = slot_id;
                return ticket;
            }
            if (it != slots.end()) {
                slots.erase(it);
            }
        }

        if (!alive) {
            LOG_WARN("Removing dead worker " + candidate->get_id());
        }
        // Reaped or terminated outside the lock (WorkerProcess destructor)
        candidate.reset();
    }
}

std::optional<PoolTicket> WorkerProcessPool::spawn_into_reserved_slot(std::uint64_t slot_id, bool mark_busy) {
    std::unique_ptr<WorkerProcess> process;
    try {
        process = WorkerProcess::spawn(settings.launch_spec, make_worker_id(slot_id));
    } catch (const WorkerSpawnError&) {
        std::lock_guard<std::mutex> lock(pool_mutex);
        slots.erase(slot_id);
        throw;
    }

    std::lock_guard<std::mutex> lock(pool_mutex);
    auto it = slots.find(slot_id);
    if (shut_down || it == slots.end()) {
        // Pool shut down while the process was starting; process is terminated on scope exit
        return std::nullopt;
    }

    WorkerSlot& slot = it->second;
    slot.process = std::move(process);
    slot.busy = mark_busy;
    slot.last_used = std::chrono::steady_clock::now();
    total_created += 1;
    if (mark_busy) {
        slot.use_count = 1;
        total_requests += 1;
    }

    LOG_INFO("Started worker " + slot.process->get_id() + " at " + slot.process->get_endpoint() +
             " (" + std::to_string(slots.size()) + "/" + std::to_string(settings.max_pool_size) + ")");

    PoolTicket ticket;
    ticket.endpoint = slot.process->get_endpoint();
    ticket.slot_id = slot_id;
    return ticket;
}

void WorkerProcessPool::release(const PoolTicket& ticket) {
    std::lock_guard<std::mutex> lock(pool_mutex);
    auto it = slots.find(ticket.slot_id);
    if (it == slots.end()) {
        LOG_DEBUG("Release of unknown worker slot " + std::to_string(ticket.slot_id) + " ignored");
        return;
    }
    it->second.busy = false;
    it->second.last_used = std::chrono::steady_clock::now();
}

// ========================================================================
// STATISTICS AND SHUTDOWN
// ========================================================================

PoolStats WorkerProcessPool::get_stats() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    PoolStats stats;
    stats.total_workers = slots.size();
    for (auto& entry : slots) {
        WorkerSlot& slot = entry.second;
        if (slot.busy) {
            stats.busy_workers += 1;
        } else {
            stats.idle_workers += 1;
        }
        if (slot.process && slot.process->is_process_running()) {
            stats.alive_workers += 1;
        }
    }
    stats.total_created = total_created;
    stats.total_reused = total_reused;
    stats.total_requests = total_requests;
    stats.reuse_rate = total_requests > 0 ? static_cast<double>(total_reused) / static_cast<double>(total_requests) * 100.0 : 0.0;
    return stats;
}

void WorkerProcessPool::shutdown() {
    std::map<std::uint64_t, WorkerSlot> drained;
    {
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (shut_down) {
            return;
        }
        shut_down = true;
        drained.swap(slots);
    }

    size_t terminated = 0;
    for (auto& entry : drained) {
        if (entry.second.process) {
            entry.second.process->terminate();
            ++terminated;
        }
    }
    LOG_INFO("Worker pool shut down, terminated " + std::to_string(terminated) + " workers");
}

} // namespace Browser
} // namespace BalanceMonitor
