#include "system_manager.hpp"
#include "core/browser/driver_locator.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/monitor/cached_results.hpp"
#include "core/utils/balance_text.hpp"
#include "api/balance/balance_api_client.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <sstream>

namespace BalanceMonitor {
namespace System {

using namespace BalanceMonitor::Core;

// ========================================================================
// MODULE CONSTRUCTION
// ========================================================================

namespace {

Browser::WorkerPoolSettings create_pool_settings(const Config::WebCheckConfig& web_check) {
    Browser::WorkerPoolSettings settings;
    settings.pool_size = static_cast<size_t>(std::max(1, web_check.pool_size));
    settings.max_pool_size = std::max(settings.pool_size, static_cast<size_t>(std::max(1, web_check.max_pool_size)));
    settings.launch_spec.port_ready_timeout = std::chrono::milliseconds(std::max(100, web_check.port_ready_timeout_ms));

    std::optional<std::string> driver = Browser::locate_driver_executable(web_check);
    if (driver) {
        settings.launch_spec.executable = *driver;
        LOG_INFO("Using driver " + *driver);
    } else {
        settings.launch_spec.executable = Browser::DRIVER_EXECUTABLE_NAME;
        if (Utils::is_blank(web_check.command)) {
            LOG_WARN(std::string(Browser::DRIVER_EXECUTABLE_NAME) +
                     " not found; web login will fail until web_check.driver_path or a hook command is configured");
        }
    }
    return settings;
}

void create_modules(SystemState& state) {
    SystemModules& modules = *state.modules;

    modules.account_store = std::make_unique<AccountStore>(state.paths.credentials_file);

    modules.state_store = std::make_unique<StateStore>(state.paths.balance_cache_file, state.paths.cycle_state_file,
                                                       state.config.performance.daily_rollover_hour);
    modules.state_store->load();
    if (modules.state_store->get_corrected_entry_count() > 0) {
        LOG_INFO("Corrected " + std::to_string(modules.state_store->get_corrected_entry_count()) +
                 " cycle marker(s) written before the rollover hour");
    }

    modules.performance_monitor = std::make_unique<Metrics::PerformanceMonitor>(state.config.metrics);

    modules.worker_pool = std::make_unique<Browser::WorkerProcessPool>(create_pool_settings(state.config.web_check));
    modules.login_strategy = std::make_shared<WebCheck::WebLoginStrategy>(state.config.web_check.console_url);

    Browser::WorkerProcessPool* pool = modules.worker_pool.get();
    modules.web_check_runner = std::make_unique<WebCheck::WebCheckRunner>(
        state.config, *modules.worker_pool, modules.login_strategy, [pool]() { pool->warm_up(); });

    modules.progress_sink = std::make_unique<LoggingProgressSink>();

    const Config::ApiConfig& api_config = state.config.api;
    OrchestratorDependencies dependencies{
        *modules.state_store,
        *modules.web_check_runner,
        [&api_config]() -> API::FastBalanceProbePtr { return std::make_shared<API::BalanceApiClient>(api_config); },
        *modules.progress_sink,
        *modules.performance_monitor
    };
    modules.orchestrator = std::make_unique<BalanceCheckOrchestrator>(state.config, dependencies);
}

void log_startup_information(const SystemState& state) {
    LOG_SECTION_HEADER("BALANCE MONITOR");
    LOG_CONTENT("Config dir:     " + state.paths.config_dir);
    LOG_CONTENT("Credentials:    " + state.paths.credentials_file);
    LOG_CONTENT("API base URL:   " + state.config.api.base_url);
    LOG_CONTENT("Max workers:    " + std::to_string(state.config.performance.max_workers));
    LOG_CONTENT("Rollover hour:  " + std::to_string(state.config.performance.daily_rollover_hour));
    LOG_CONTENT("Web check:      " + std::string(Utils::is_blank(state.config.web_check.command) ? "browser worker pool" : "hook command"));
    LOG_SECTION_FOOTER();
}

// ========================================================================
// RESULT OUTPUT
// ========================================================================

void log_results(const std::vector<CheckResult>& results, const BatchSummary& summary) {
    LOG_SECTION_HEADER("RESULTS");
    LOG_RESULT_ROW(std::string("ACCOUNT"), std::string("STATUS"), std::string("BALANCE"), std::string("SOURCE / MESSAGE"));
    LOG_TABLE_SEPARATOR();
    for (const auto& result : results) {
        std::string detail = result.source;
        if (!result.message.empty()) {
            detail += " - " + result.message;
        }
        LOG_RESULT_ROW(result.username, std::string(result.success ? "OK" : "FAILED"), result.balance_text, detail);
    }
    LOG_TABLE_SEPARATOR();

    char elapsed_text[32];
    std::snprintf(elapsed_text, sizeof(elapsed_text), "%.2f", static_cast<double>(summary.elapsed_ms) / 1000.0);
    char total_text[32];
    std::snprintf(total_text, sizeof(total_text), "%.2f", summary.total_balance);

    LOG_CONTENT("Finished at " + summary.finished_at + " in " + elapsed_text + "s");
    LOG_CONTENT("Succeeded: " + std::to_string(summary.success_count) + "  Failed: " + std::to_string(summary.failure_count));
    LOG_CONTENT("Total balance: $" + std::string(total_text) + " over " + std::to_string(summary.balance_count) + " account(s)");
    LOG_SECTION_FOOTER();
}

void log_multiline(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        LOG_CONTENT(line);
    }
}

// ========================================================================
// COMMANDS
// ========================================================================

int run_batch_command(SystemState& state, QueryMode mode, const std::optional<std::string>& target) {
    std::lock_guard<std::mutex> batch_lock(state.batch_mutex);

    std::vector<Account> accounts = state.modules->account_store->load_accounts();
    if (accounts.empty()) {
        LOG_WARN("No accounts configured in " + state.modules->account_store->get_path());
        return 1;
    }
    if (target) {
        bool known = std::any_of(accounts.begin(), accounts.end(),
                                 [&target](const Account& account) { return account.username == *target; });
        if (!known) {
            LOG_ERROR("Unknown account: " + *target);
            return 1;
        }
    }

    unsigned long batch_number = ++state.batch_count;
    LOG_BATCH_HEADER(batch_number, query_mode_name(mode));

    auto started = std::chrono::steady_clock::now();
    std::vector<CheckResult> results = state.modules->orchestrator->run_batch(accounts, mode, target);
    long long elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    BatchSummary summary = summarize_results(results, elapsed_ms);
    log_results(results, summary);
    LOG_MESSAGE_BAR();
    return summary.failure_count == 0 ? 0 : 1;
}

int run_watch_command(SystemState& state) {
    auto interval = std::chrono::seconds(std::max(1, state.config.performance.query_interval_sec));
    LOG_INFO("Watching balances every " + std::to_string(interval.count()) + "s, Ctrl+C to stop");

    int exit_code = 0;
    while (state.running.load()) {
        exit_code = run_batch_command(state, QueryMode::NORMAL, std::nullopt);

        std::unique_lock<std::mutex> lock(state.mtx);
        state.cv.wait_for(lock, interval, [&state]() { return !state.running.load(); });
    }
    LOG_INFO("Watch stopped");
    return exit_code;
}

int run_cached_command(SystemState& state) {
    std::vector<Account> accounts = state.modules->account_store->load_accounts();
    std::vector<CheckResult> results = build_cached_results(accounts, *state.modules->state_store);
    BatchSummary summary = summarize_results(results, 0);
    log_results(results, summary);
    return 0;
}

int run_accounts_command(SystemState& state) {
    std::vector<Account> accounts = state.modules->account_store->load_accounts();
    LOG_SECTION_HEADER("ACCOUNTS (" + std::to_string(accounts.size()) + ")");
    for (const auto& account : accounts) {
        std::optional<std::string> cached = state.modules->state_store->get_cached_balance(account.username);
        LOG_CONTENT(Logging::pad_column(account.username, 24) + "| " +
                    Logging::pad_column(account.has_api_key() ? "api key" : "web only", 9) + "| " +
                    (cached ? *cached : "-"));
    }
    LOG_SECTION_FOOTER();
    return 0;
}

int run_add_account_command(SystemState& state, const std::vector<std::string>& arguments) {
    Account account;
    account.username = Utils::trim_copy(arguments[0]);
    account.password = arguments[1];
    if (arguments.size() > 2) {
        account.api_key = Utils::trim_copy(arguments[2]);
    }
    bool replaced = state.modules->account_store->upsert_account(account);
    LOG_INFO(std::string(replaced ? "Updated" : "Added") + " account " + account.username);
    return 0;
}

int run_remove_account_command(SystemState& state, const std::string& username) {
    if (!state.modules->account_store->remove_account(username)) {
        LOG_ERROR("Unknown account: " + username);
        return 1;
    }
    LOG_INFO("Removed account " + username);
    return 0;
}

int run_report_command(SystemState& state) {
    int exit_code = run_batch_command(state, QueryMode::NORMAL, std::nullopt);
    LOG_SECTION_HEADER("METRICS");
    log_multiline(state.modules->performance_monitor->generate_report());
    LOG_SECTION_FOOTER();
    return exit_code;
}

std::optional<std::string> optional_target(const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        return std::nullopt;
    }
    return arguments.front();
}

} // anonymous namespace

// ========================================================================
// LIFECYCLE
// ========================================================================

std::unique_ptr<SystemState> initialize(const std::string& cli_config_dir) {
    std::string config_dir = Config::resolve_config_dir(cli_config_dir);
    Config::SystemConfig config = Config::load_system_config(config_dir);
    Config::RuntimePaths paths = Config::build_runtime_paths(config_dir, config);
    return std::make_unique<SystemState>(config, paths);
}

SystemThreads startup(SystemState& state) {
    SystemThreads handles;

    Logging::set_logging_context(state.logging_context);
    state.logger = Logging::initialize_application_foundation(state.config, state.paths.log_file);

    state.modules = std::make_unique<SystemModules>();
    state.modules->logging_thread = std::make_unique<Threads::LoggingThread>(state.logger, state.config.logging);
    handles.logger = std::thread(std::ref(*state.modules->logging_thread));

    try {
        log_startup_information(state);
        create_modules(state);
    } catch (const std::exception& exception_error) {
        LOG_ERROR(std::string("Startup failed: ") + exception_error.what());
        shutdown(state, handles);
        throw;
    }
    return handles;
}

int run_command(SystemState& state, const CommandLine& command_line) {
    const std::string& command = command_line.command;
    if (command == "query") {
        return run_batch_command(state, QueryMode::NORMAL, optional_target(command_line.arguments));
    }
    if (command == "web-login") {
        return run_batch_command(state, QueryMode::WEB_ONLY, optional_target(command_line.arguments));
    }
    if (command == "watch") {
        return run_watch_command(state);
    }
    if (command == "cached") {
        return run_cached_command(state);
    }
    if (command == "accounts") {
        return run_accounts_command(state);
    }
    if (command == "add-account") {
        return run_add_account_command(state, command_line.arguments);
    }
    if (command == "remove-account") {
        return run_remove_account_command(state, command_line.arguments.front());
    }
    if (command == "report") {
        return run_report_command(state);
    }
    throw UsageError("unknown command: " + command);
}

void request_shutdown(SystemState& state) {
    state.running.store(false);
    state.shutdown_requested.store(true);
    state.cv.notify_all();
}

void shutdown(SystemState& state, SystemThreads& handles) {
    state.running.store(false);
    state.cv.notify_all();

    if (state.modules && state.modules->worker_pool) {
        state.modules->worker_pool->shutdown();
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - handles.start_time);
    LOG_INFO("Shutting down after " + std::to_string(uptime.count()) + "s");

    if (state.logger) {
        Logging::shutdown_global_logger(*state.logger);
    }
    if (handles.logger.joinable()) {
        handles.logger.join();
    }
    state.modules.reset();
}

} // namespace System
} // namespace BalanceMonitor
