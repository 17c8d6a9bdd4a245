#include "pool_lease.hpp"
#include "core/logging/logging_macros.hpp"
#include <algorithm>
#include <thread>

namespace BalanceMonitor {
namespace Browser {

PoolLease::PoolLease(WorkerPoolInterface& worker_pool, const PoolTicket& pool_ticket)
    : pool(&worker_pool), ticket(pool_ticket), active(true) {}

PoolLease::PoolLease(PoolLease&& other) noexcept
    : pool(other.pool), ticket(std::move(other.ticket)), active(other.active) {
    other.active = false;
}

PoolLease::~PoolLease() {
    release();
}

void PoolLease::release() {
    if (!active) {
        return;
    }
    active = false;
    pool->release(ticket);
}

PoolLease acquire_worker_lease(WorkerPoolInterface& pool,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds poll_interval) {
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;
    while (true) {
        std::optional<PoolTicket> ticket = pool.try_acquire();
        if (ticket) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            if (waited.count() > 0) {
                LOG_DEBUG("Worker " + ticket->endpoint + " leased after waiting " + std::to_string(waited.count()) + "ms");
            }
            return PoolLease(pool, *ticket);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
            throw WorkerAcquireTimeout("timed out waiting for an available browser worker (" + std::to_string(seconds) + "s)");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(poll_interval, remaining));
    }
}

} // namespace Browser
} // namespace BalanceMonitor
