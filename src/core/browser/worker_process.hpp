#ifndef WORKER_PROCESS_HPP
#define WORKER_PROCESS_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace BalanceMonitor {
namespace Browser {

class WorkerSpawnError : public std::runtime_error {
public:
    explicit WorkerSpawnError(const std::string& message) : std::runtime_error(message) {}
};

// How a worker is started: "<executable> <extra args...> --port=<port>"
struct WorkerLaunchSpec {
    std::string executable;
    std::vector<std::string> extra_args;
    std::chrono::milliseconds port_ready_timeout{8000};
    std::chrono::milliseconds port_poll_interval{120};
    std::chrono::milliseconds liveness_probe_timeout{300};
};

// Binds 127.0.0.1:0 and returns the port the kernel picked.
int find_free_local_port();

// Connect probe against 127.0.0.1:<port>, bounded by timeout.
bool is_local_port_accepting(int port, std::chrono::milliseconds timeout);

/**
 * One external worker process listening on a local control port.
 * Owned by the pool; the destructor terminates and reaps the process.
 */
class WorkerProcess {
public:
    // Starts the process and waits until its port accepts connections.
    static std::unique_ptr<WorkerProcess> spawn(const WorkerLaunchSpec& launch_spec, const std::string& worker_id);

    ~WorkerProcess();
    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    const std::string& get_id() const { return worker_id; }
    int get_port() const { return port; }
    pid_t get_pid() const { return pid; }
    const std::string& get_endpoint() const { return endpoint; }

    // Non-blocking: false once the process has exited (and reaps it).
    bool is_process_running();

    // Process running and control port accepting connections.
    bool is_alive(std::chrono::milliseconds probe_timeout);

    // SIGTERM to the process group, SIGKILL after a grace period, then reap. Idempotent.
    void terminate();

private:
    WorkerProcess(const std::string& id, pid_t process_id, int control_port);

    std::string worker_id;
    pid_t pid;
    int port;
    std::string endpoint;
    bool reaped = false;
};

} // namespace Browser
} // namespace BalanceMonitor

#endif // WORKER_PROCESS_HPP
