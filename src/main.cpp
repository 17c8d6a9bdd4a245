// main.cpp
#include "core/system/system_manager.hpp"
#include "core/utils/http_utils.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace BalanceMonitor::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                request_shutdown(*state);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "balance_monitor";

    CommandLine command_line;
    try {
        command_line = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& usage_error) {
        std::cerr << "Error: " << usage_error.what() << "\n\n" << usage_text(program_name);
        return 2;
    }
    if (command_line.command == "help") {
        std::cout << usage_text(program_name);
        return 0;
    }

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // libcurl global state for the lifetime of the process
        CurlGlobalGuard curl_guard;

        std::unique_ptr<SystemState> system_state = initialize(command_line.config_dir);
        ShutdownHandler::get_instance().set_system_state(system_state.get());

        SystemThreads thread_handles = startup(*system_state);

        int exit_code = 1;
        try {
            exit_code = run_command(*system_state, command_line);
        } catch (const std::exception& command_error) {
            BalanceMonitor::Logging::log_message(std::string("ERROR Command failed: ") + command_error.what(), "");
            exit_code = 1;
        }

        shutdown(*system_state, thread_handles);
        ShutdownHandler::get_instance().set_system_state(nullptr);
        return exit_code;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
