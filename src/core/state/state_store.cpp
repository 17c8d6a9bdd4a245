#include "state_store.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include "core/utils/time_utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace BalanceMonitor {
namespace Core {

namespace {
    json read_json_file(const std::string& path, bool& exists) {
        exists = false;
        std::ifstream in(path);
        if (!in.is_open()) {
            return json::object();
        }
        exists = true;
        std::stringstream buffer;
        buffer << in.rdbuf();
        std::string content = buffer.str();
        if (Utils::is_blank(content)) {
            return json::object();
        }
        try {
            return json::parse(content);
        } catch (const json::parse_error& parse_error) {
            throw StateStoreError("Invalid JSON in " + path + ": " + parse_error.what());
        }
    }

    const json& accounts_section(const json& document) {
        if (document.is_object()) {
            auto accounts_it = document.find("accounts");
            if (accounts_it != document.end() && accounts_it->is_object()) {
                return *accounts_it;
            }
        }
        return document;
    }

    std::string value_to_text(const json& value) {
        if (value.is_string()) return Utils::trim_copy(value.get<std::string>());
        if (value.is_number_integer()) return std::to_string(value.get<long long>());
        if (value.is_number()) {
            std::ostringstream ss;
            ss << value.get<double>();
            return ss.str();
        }
        if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
        return "";
    }

    json build_document(const json& accounts, const std::string& saved_at) {
        json document;
        document["version"] = STATE_FILE_VERSION;
        document["updated_at"] = saved_at;
        document["accounts"] = accounts;
        return document;
    }
}

int normalize_rollover_hour(int rollover_hour) {
    if (rollover_hour < 0 || rollover_hour > 23) {
        return DEFAULT_ROLLOVER_HOUR;
    }
    return rollover_hour;
}

std::string compute_cycle_day(const std::tm& local_time, int rollover_hour) {
    std::string today = TimeUtils::format_date(local_time);
    if (local_time.tm_hour < normalize_rollover_hour(rollover_hour)) {
        return TimeUtils::shift_date_by_days(today, -1);
    }
    return today;
}

void write_json_file_atomically(const std::string& path, const json& document) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code dir_error;
        std::filesystem::create_directories(target.parent_path(), dir_error);
        if (dir_error) {
            throw StateStoreError("Cannot create directory " + target.parent_path().string() + ": " + dir_error.message());
        }
    }

    std::filesystem::path temp_path = target;
    temp_path.replace_extension(".tmp");
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            throw StateStoreError("Cannot open temp file " + temp_path.string());
        }
        out << document.dump(2);
        out.flush();
        if (!out.good()) {
            throw StateStoreError("Failed writing temp file " + temp_path.string());
        }
    }

    std::error_code rename_error;
    std::filesystem::rename(temp_path, target, rename_error);
    if (rename_error) {
        throw StateStoreError("Failed to replace " + path + ": " + rename_error.message());
    }
}

StateStore::StateStore(const std::string& balance_cache_path,
                       const std::string& cycle_state_path,
                       int rollover,
                       Clock clock_function)
    : balance_cache_file(balance_cache_path),
      cycle_state_file(cycle_state_path),
      rollover_hour(normalize_rollover_hour(rollover)),
      clock(std::move(clock_function)) {}

// ========================================================================
// LOADING
// ========================================================================

void StateStore::load() {
    std::lock_guard<std::mutex> lock(state_mutex);
    balance_cache.clear();
    cycle_markers.clear();
    corrected_entry_count = 0;

    load_balance_cache_locked();
    std::optional<std::string> saved_at = load_cycle_state_locked();

    if (saved_at) {
        corrected_entry_count = apply_legacy_cycle_correction_locked(*saved_at);
        if (corrected_entry_count > 0) {
            LOG_WARN("Corrected " + std::to_string(corrected_entry_count) +
                     " cycle markers saved before the rollover hour " + std::to_string(rollover_hour) + ":00");
            persist_cycle_state_locked();
        }
    }

    LOG_DEBUG("State loaded: " + std::to_string(balance_cache.size()) + " cached balances, " +
              std::to_string(cycle_markers.size()) + " cycle markers");
}

void StateStore::load_balance_cache_locked() {
    bool exists = false;
    json document = read_json_file(balance_cache_file, exists);
    const json& accounts = accounts_section(document);
    if (!accounts.is_object()) {
        return;
    }

    for (auto it = accounts.begin(); it != accounts.end(); ++it) {
        std::string username = Utils::trim_copy(it.key());
        if (username.empty()) continue;

        BalanceRecord record;
        const json& value = it.value();
        if (value.is_object()) {
            record.balance = value.contains("balance") ? value_to_text(value["balance"]) : "";
            record.updated_at = value.contains("updated_at") ? value_to_text(value["updated_at"]) : "";
            if (value.contains("apikey_sync_success") && value["apikey_sync_success"].is_boolean()) {
                record.sync_success = value["apikey_sync_success"].get<bool>();
            }
            if (value.contains("apikey_sync_message") && value["apikey_sync_message"].is_string()) {
                std::string message = Utils::trim_copy(value["apikey_sync_message"].get<std::string>());
                if (!message.empty()) {
                    record.sync_message = message;
                }
            }
        } else {
            record.balance = value_to_text(value);
        }

        if (record.balance.empty()) continue;
        balance_cache[username] = record;
    }
}

std::optional<std::string> StateStore::load_cycle_state_locked() {
    bool exists = false;
    json document = read_json_file(cycle_state_file, exists);
    const json& accounts = accounts_section(document);
    if (accounts.is_object()) {
        for (auto it = accounts.begin(); it != accounts.end(); ++it) {
            std::string username = Utils::trim_copy(it.key());
            if (username.empty() || !it.value().is_string()) continue;
            std::string day = Utils::trim_copy(it.value().get<std::string>());
            if (!TimeUtils::is_valid_date(day)) continue;
            cycle_markers[username] = day;
        }
    }

    if (document.is_object()) {
        auto updated_it = document.find("updated_at");
        if (updated_it != document.end() && updated_it->is_string()) {
            return updated_it->get<std::string>();
        }
    }
    return std::nullopt;
}

// Markers written by the old midnight rule carry the calendar date of a save made
// before the rollover hour; those belong to the previous cycle day.
size_t StateStore::apply_legacy_cycle_correction_locked(const std::string& saved_at) {
    std::string saved_date;
    int saved_hour = 0;
    if (!TimeUtils::parse_timestamp_date_and_hour(Utils::trim_copy(saved_at), saved_date, saved_hour)) {
        return 0;
    }
    if (saved_hour >= rollover_hour) {
        return 0;
    }

    std::string corrected_day = TimeUtils::shift_date_by_days(saved_date, -1);
    size_t corrected = 0;
    for (auto& entry : cycle_markers) {
        if (entry.second == saved_date) {
            entry.second = corrected_day;
            ++corrected;
        }
    }
    return corrected;
}

// ========================================================================
// CYCLE POLICY
// ========================================================================

std::string StateStore::current_cycle_day_locked() const {
    return compute_cycle_day(TimeUtils::to_local_tm(clock()), rollover_hour);
}

std::string StateStore::current_cycle_day() const {
    return current_cycle_day_locked();
}

bool StateStore::should_force_full(const std::string& username) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    std::string cycle_day = current_cycle_day_locked();
    auto it = cycle_markers.find(Utils::trim_copy(username));
    return it == cycle_markers.end() || it->second != cycle_day;
}

void StateStore::mark_cycle_fulfilled(const std::string& username) {
    std::string key = Utils::trim_copy(username);
    if (key.empty()) return;

    std::lock_guard<std::mutex> lock(state_mutex);
    cycle_markers[key] = current_cycle_day_locked();
    persist_cycle_state_locked();
}

// ========================================================================
// BALANCE CACHE
// ========================================================================

void StateStore::update_balance(const std::string& username,
                                const std::string& balance_text,
                                std::optional<bool> sync_success,
                                std::optional<std::string> sync_message) {
    std::string key = Utils::trim_copy(username);
    std::string balance = Utils::trim_copy(balance_text);
    if (key.empty() || balance.empty()) return;

    std::lock_guard<std::mutex> lock(state_mutex);
    BalanceRecord& record = balance_cache[key];
    record.balance = balance;
    record.updated_at = TimeUtils::format_rfc3339_local(clock());
    record.sync_success = sync_success;
    // A missing message leaves the previous one in place
    if (sync_message && !Utils::is_blank(*sync_message)) {
        record.sync_message = Utils::trim_copy(*sync_message);
    }
    persist_balance_cache_locked();
}

std::optional<std::string> StateStore::get_cached_balance(const std::string& username) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto it = balance_cache.find(Utils::trim_copy(username));
    if (it == balance_cache.end() || Utils::is_blank(it->second.balance)) {
        return std::nullopt;
    }
    return it->second.balance;
}

std::optional<BalanceRecord> StateStore::get_cached_record(const std::string& username) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto it = balance_cache.find(Utils::trim_copy(username));
    if (it == balance_cache.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> StateStore::get_cycle_marker(const std::string& username) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto it = cycle_markers.find(Utils::trim_copy(username));
    if (it == cycle_markers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, BalanceRecord> StateStore::get_all_records() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return balance_cache;
}

// ========================================================================
// PERSISTENCE
// ========================================================================

void StateStore::persist_balance_cache_locked() const {
    json accounts = json::object();
    for (const auto& entry : balance_cache) {
        json record;
        record["balance"] = entry.second.balance;
        record["updated_at"] = entry.second.updated_at;
        record["apikey_sync_success"] = entry.second.sync_success ? json(*entry.second.sync_success) : json(nullptr);
        record["apikey_sync_message"] = entry.second.sync_message.value_or("");
        accounts[entry.first] = record;
    }
    write_json_file_atomically(balance_cache_file, build_document(accounts, TimeUtils::format_rfc3339_local(clock())));
}

void StateStore::persist_cycle_state_locked() const {
    json accounts = json::object();
    for (const auto& entry : cycle_markers) {
        accounts[entry.first] = entry.second;
    }
    write_json_file_atomically(cycle_state_file, build_document(accounts, TimeUtils::format_rfc3339_local(clock())));
}

} // namespace Core
} // namespace BalanceMonitor
