#ifndef WORKER_POOL_INTERFACE_HPP
#define WORKER_POOL_INTERFACE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace BalanceMonitor {
namespace Browser {

// Proof of exclusive use of one worker until released.
struct PoolTicket {
    std::string endpoint;      // http://127.0.0.1:<port>
    std::uint64_t slot_id = 0;
};

struct PoolStats {
    size_t total_workers = 0;
    size_t busy_workers = 0;
    size_t idle_workers = 0;
    size_t alive_workers = 0;
    unsigned long total_created = 0;
    unsigned long total_reused = 0;
    unsigned long total_requests = 0;
    double reuse_rate = 0.0;   // reused / requests * 100
};

class WorkerPoolInterface {
public:
    virtual ~WorkerPoolInterface() = default;

    // Never blocks waiting for a worker; empty when every slot is busy and the pool is at its maximum.
    virtual std::optional<PoolTicket> try_acquire() = 0;
    virtual void release(const PoolTicket& ticket) = 0;
    virtual PoolStats get_stats() = 0;
};

} // namespace Browser
} // namespace BalanceMonitor

#endif // WORKER_POOL_INTERFACE_HPP
