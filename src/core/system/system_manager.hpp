#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "command_line.hpp"
#include "system_state.hpp"
#include "system_threads.hpp"

namespace BalanceMonitor {
namespace System {

// Resolves the configuration directory and loads runtime_config.csv. Throws ConfigError.
std::unique_ptr<SystemState> initialize(const std::string& cli_config_dir);

// Starts the logger and builds every module.
SystemThreads startup(SystemState& system_state);

// Returns the process exit code.
int run_command(SystemState& system_state, const CommandLine& command_line);

// Safe to call from a signal handler path: only flips flags and notifies.
void request_shutdown(SystemState& system_state);

void shutdown(SystemState& system_state, SystemThreads& handles);

} // namespace System
} // namespace BalanceMonitor

#endif // SYSTEM_MANAGER_HPP
