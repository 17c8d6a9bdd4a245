#include "hook_command_strategy.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace BalanceMonitor {
namespace WebCheck {

using json = nlohmann::json;

namespace {
    constexpr int MIN_HOOK_TIMEOUT_SECONDS = 5;

    std::string replace_all(std::string text, const std::string& placeholder, const std::string& value) {
        size_t position = 0;
        while ((position = text.find(placeholder, position)) != std::string::npos) {
            text.replace(position, placeholder.size(), value);
            position += value.size();
        }
        return text;
    }

    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void kill_and_reap(pid_t pid) {
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
    }
}

CommandOutput run_command_with_timeout(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        throw WebCheckError("web check command is empty");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (::pipe(stdout_pipe) != 0) {
        throw WebCheckError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe(stderr_pipe) != 0) {
        int pipe_errno = errno;
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        throw WebCheckError(std::string("pipe() failed: ") + std::strerror(pipe_errno));
    }

    std::vector<char*> child_argv;
    for (const auto& argument : argv) {
        child_argv.push_back(const_cast<char*>(argument.c_str()));
    }
    child_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int fork_errno = errno;
        ::close(stdout_pipe[0]); ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]); ::close(stderr_pipe[1]);
        throw WebCheckError(std::string("fork() failed: ") + std::strerror(fork_errno));
    }
    if (pid == 0) {
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[0]); ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]); ::close(stderr_pipe[1]);
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::execvp(child_argv[0], child_argv.data());
        _exit(127);
    }

    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    CommandOutput output;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            close_fd(out_fd);
            close_fd(err_fd);
            kill_and_reap(pid);
            throw WebCheckError("web check command timed out (" +
                                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) + "s)");
        }

        pollfd descriptors[2];
        int count = 0;
        if (out_fd >= 0) { descriptors[count].fd = out_fd; descriptors[count].events = POLLIN; descriptors[count].revents = 0; ++count; }
        if (err_fd >= 0) { descriptors[count].fd = err_fd; descriptors[count].events = POLLIN; descriptors[count].revents = 0; ++count; }

        int ready = ::poll(descriptors, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int poll_errno = errno;
            close_fd(out_fd);
            close_fd(err_fd);
            kill_and_reap(pid);
            throw WebCheckError(std::string("poll() failed: ") + std::strerror(poll_errno));
        }

        for (int index = 0; index < count; ++index) {
            if (descriptors[index].revents == 0) continue;
            ssize_t bytes = ::read(descriptors[index].fd, buffer, sizeof(buffer));
            bool is_stdout = descriptors[index].fd == out_fd;
            if (bytes > 0) {
                (is_stdout ? output.stdout_text : output.stderr_text).append(buffer, static_cast<size_t>(bytes));
            } else if (bytes == 0 || errno != EINTR) {
                close_fd(is_stdout ? out_fd : err_fd);
            }
        }
    }

    // Both pipes closed; the child has exited or is about to
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    return output;
}

WebCheckResult parse_hook_output(const std::string& stdout_text) {
    WebCheckResult result;
    std::string text = Utils::trim_copy(stdout_text);
    if (text.empty()) {
        result.success = true;
        result.message = "web check command finished without output";
        return result;
    }

    json document = json::parse(text, nullptr, false);
    if (!document.is_discarded() && document.is_object()) {
        result.success = document.value("success", false);
        if (document.contains("balance")) {
            const json& balance = document["balance"];
            if (balance.is_number()) {
                result.balance = balance.get<double>();
            } else if (balance.is_string()) {
                result.balance = Utils::parse_first_number(balance.get<std::string>());
            }
        }
        result.message = document.contains("message") && document["message"].is_string()
                             ? document["message"].get<std::string>()
                             : (result.success ? "web check command succeeded" : "web check command reported failure");
        if (document.contains("apikey_sync_success") && document["apikey_sync_success"].is_boolean()) {
            result.sync_success = document["apikey_sync_success"].get<bool>();
        }
        if (document.contains("apikey_sync_message") && document["apikey_sync_message"].is_string()) {
            result.sync_message = document["apikey_sync_message"].get<std::string>();
        }
        return result;
    }

    result.success = true;
    result.balance = Utils::parse_first_number(text);
    result.message = result.balance ? "web check command succeeded" : "web check command output had no number";
    return result;
}

HookCommandStrategy::HookCommandStrategy(const std::string& hook_command, const std::vector<std::string>& hook_args, int timeout_seconds)
    : command(Utils::trim_copy(hook_command)), args(hook_args),
      timeout(std::max(MIN_HOOK_TIMEOUT_SECONDS, timeout_seconds)) {}

std::vector<std::string> HookCommandStrategy::build_argv(const Core::Account& account) const {
    std::vector<std::string> argv;
    argv.push_back(command);
    for (const auto& argument : args) {
        std::string rendered = replace_all(argument, "{username}", account.username);
        rendered = replace_all(rendered, "{password}", account.password);
        rendered = replace_all(rendered, "{api_key}", account.api_key);
        argv.push_back(rendered);
    }
    return argv;
}

WebCheckResult HookCommandStrategy::run(const Core::Account& account) const {
    CommandOutput output = run_command_with_timeout(build_argv(account), timeout);
    if (output.exit_code != 0) {
        std::string detail = Utils::trim_copy(output.stderr_text);
        if (detail.empty()) detail = Utils::trim_copy(output.stdout_text);
        throw WebCheckError("web check command exited with code " + std::to_string(output.exit_code) +
                            (detail.empty() ? "" : ": " + detail.substr(0, 300)));
    }
    LOG_DEBUG("[" + account.username + "] web check command finished");
    return parse_hook_output(output.stdout_text);
}

} // namespace WebCheck
} // namespace BalanceMonitor
