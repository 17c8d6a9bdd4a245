#ifndef POOL_LEASE_HPP
#define POOL_LEASE_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include "worker_pool_interface.hpp"

namespace BalanceMonitor {
namespace Browser {

class WorkerAcquireTimeout : public std::runtime_error {
public:
    explicit WorkerAcquireTimeout(const std::string& message) : std::runtime_error(message) {}
};

// Holds a ticket and releases it when destroyed.
class PoolLease {
public:
    PoolLease(WorkerPoolInterface& worker_pool, const PoolTicket& pool_ticket);
    ~PoolLease();

    PoolLease(PoolLease&& other) noexcept;
    PoolLease(const PoolLease&) = delete;
    PoolLease& operator=(const PoolLease&) = delete;
    PoolLease& operator=(PoolLease&&) = delete;

    const std::string& endpoint() const { return ticket.endpoint; }
    const PoolTicket& get_ticket() const { return ticket; }

    void release();

private:
    WorkerPoolInterface* pool;
    PoolTicket ticket;
    bool active;
};

/**
 * Polls try_acquire until a worker is free or the timeout passes.
 * Sleeps between polls happen without any pool lock held.
 * Throws WorkerAcquireTimeout on expiry; spawn errors from the pool propagate.
 */
PoolLease acquire_worker_lease(WorkerPoolInterface& pool,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds poll_interval);

} // namespace Browser
} // namespace BalanceMonitor

#endif // POOL_LEASE_HPP
