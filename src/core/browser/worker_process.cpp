#include "worker_process.hpp"
#include "core/logging/logging_macros.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace BalanceMonitor {
namespace Browser {

namespace {
    constexpr auto TERMINATE_GRACE_PERIOD = std::chrono::milliseconds(1500);
    constexpr auto TERMINATE_POLL_INTERVAL = std::chrono::milliseconds(50);

    sockaddr_in loopback_address(int port) {
        sockaddr_in address;
        std::memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_port = htons(static_cast<uint16_t>(port));
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return address;
    }
}

int find_free_local_port() {
    int socket_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        throw WorkerSpawnError(std::string("socket() failed while picking a port: ") + std::strerror(errno));
    }

    sockaddr_in address = loopback_address(0);
    if (::bind(socket_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        int bind_errno = errno;
        ::close(socket_fd);
        throw WorkerSpawnError(std::string("bind() failed while picking a port: ") + std::strerror(bind_errno));
    }

    socklen_t length = sizeof(address);
    if (::getsockname(socket_fd, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        int name_errno = errno;
        ::close(socket_fd);
        throw WorkerSpawnError(std::string("getsockname() failed: ") + std::strerror(name_errno));
    }
    ::close(socket_fd);
    return ntohs(address.sin_port);
}

bool is_local_port_accepting(int port, std::chrono::milliseconds timeout) {
    int socket_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        return false;
    }
    int flags = ::fcntl(socket_fd, F_GETFL, 0);
    ::fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in address = loopback_address(port);
    bool connected = false;
    int rc = ::connect(socket_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address));
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        pollfd poll_descriptor;
        poll_descriptor.fd = socket_fd;
        poll_descriptor.events = POLLOUT;
        poll_descriptor.revents = 0;
        if (::poll(&poll_descriptor, 1, static_cast<int>(timeout.count())) == 1) {
            int socket_error = 0;
            socklen_t error_length = sizeof(socket_error);
            ::getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &socket_error, &error_length);
            connected = (socket_error == 0);
        }
    }
    ::close(socket_fd);
    return connected;
}

// ========================================================================
// PROCESS LIFECYCLE
// ========================================================================

WorkerProcess::WorkerProcess(const std::string& id, pid_t process_id, int control_port)
    : worker_id(id), pid(process_id), port(control_port),
      endpoint("http://127.0.0.1:" + std::to_string(control_port)) {}

WorkerProcess::~WorkerProcess() {
    terminate();
}

std::unique_ptr<WorkerProcess> WorkerProcess::spawn(const WorkerLaunchSpec& launch_spec, const std::string& worker_id) {
    if (launch_spec.executable.empty()) {
        throw WorkerSpawnError("Worker executable is not configured");
    }

    int port = find_free_local_port();

    // Build argv before fork; the child may only call async-signal-safe functions
    std::vector<std::string> arguments;
    arguments.push_back(launch_spec.executable);
    arguments.insert(arguments.end(), launch_spec.extra_args.begin(), launch_spec.extra_args.end());
    arguments.push_back("--port=" + std::to_string(port));
    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child_pid = ::fork();
    if (child_pid < 0) {
        throw WorkerSpawnError(std::string("fork() failed: ") + std::strerror(errno));
    }
    if (child_pid == 0) {
        ::setpgid(0, 0);
        int null_fd = ::open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
            ::dup2(null_fd, STDERR_FILENO);
            if (null_fd > STDERR_FILENO) ::close(null_fd);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    std::unique_ptr<WorkerProcess> worker(new WorkerProcess(worker_id, child_pid, port));

    auto deadline = std::chrono::steady_clock::now() + launch_spec.port_ready_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!worker->is_process_running()) {
            throw WorkerSpawnError("Worker " + worker_id + " (" + launch_spec.executable + ") exited before its port became ready");
        }
        if (is_local_port_accepting(port, launch_spec.port_poll_interval)) {
            LOG_DEBUG("Worker " + worker_id + " ready on port " + std::to_string(port) + " (pid " + std::to_string(child_pid) + ")");
            return worker;
        }
        std::this_thread::sleep_for(launch_spec.port_poll_interval);
    }

    // worker's destructor terminates the half-started process
    throw WorkerSpawnError("Worker " + worker_id + " did not open port " + std::to_string(port) + " within " +
                           std::to_string(launch_spec.port_ready_timeout.count()) + "ms");
}

bool WorkerProcess::is_process_running() {
    if (reaped) {
        return false;
    }
    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    // Exited (result == pid) or no longer our child (ECHILD)
    reaped = true;
    return false;
}

bool WorkerProcess::is_alive(std::chrono::milliseconds probe_timeout) {
    return is_process_running() && is_local_port_accepting(port, probe_timeout);
}

void WorkerProcess::terminate() {
    if (reaped) {
        return;
    }
    ::kill(-pid, SIGTERM);
    ::kill(pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE_PERIOD;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_process_running()) {
            return;
        }
        std::this_thread::sleep_for(TERMINATE_POLL_INTERVAL);
    }

    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
    reaped = true;
}

} // namespace Browser
} // namespace BalanceMonitor
