#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <chrono>
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace BalanceMonitor {
namespace Core {

using json = nlohmann::json;

constexpr int DEFAULT_ROLLOVER_HOUR = 8;
constexpr int STATE_FILE_VERSION = 1;

class StateStoreError : public std::runtime_error {
public:
    explicit StateStoreError(const std::string& message) : std::runtime_error(message) {}
};

struct BalanceRecord {
    std::string balance;
    std::string updated_at;                      // RFC3339, local offset
    std::optional<bool> sync_success;            // Secondary sync outcome of the slow check, if any
    std::optional<std::string> sync_message;
};

// Hours outside 0-23 fall back to DEFAULT_ROLLOVER_HOUR.
int normalize_rollover_hour(int rollover_hour);

// Cycle day for a local wall-clock time: before the rollover hour the previous calendar day still counts.
std::string compute_cycle_day(const std::tm& local_time, int rollover_hour);

// Serialize to "<stem>.tmp" beside the target and rename over it.
void write_json_file_atomically(const std::string& path, const json& document);

/**
 * Durable per-account state: the balance cache and the cycle-day marker of the
 * last successful forced full acquisition.
 *
 * Every mutation holds the store mutex across read-modify-persist. When
 * persisting fails the in-memory state keeps the new value and StateStoreError
 * is thrown so the caller can log it.
 */
class StateStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    StateStore(const std::string& balance_cache_path,
               const std::string& cycle_state_path,
               int rollover_hour,
               Clock clock = [] { return std::chrono::system_clock::now(); });

    // Reads both files (missing files are empty state) and applies the legacy cycle correction.
    void load();

    std::string current_cycle_day() const;
    int get_rollover_hour() const { return rollover_hour; }

    bool should_force_full(const std::string& username) const;
    void mark_cycle_fulfilled(const std::string& username);

    void update_balance(const std::string& username,
                        const std::string& balance_text,
                        std::optional<bool> sync_success = std::nullopt,
                        std::optional<std::string> sync_message = std::nullopt);

    std::optional<std::string> get_cached_balance(const std::string& username) const;
    std::optional<BalanceRecord> get_cached_record(const std::string& username) const;
    std::optional<std::string> get_cycle_marker(const std::string& username) const;
    std::map<std::string, BalanceRecord> get_all_records() const;

    // Entries rewritten by the legacy correction during the last load()
    size_t get_corrected_entry_count() const { return corrected_entry_count; }

private:
    std::string balance_cache_file;
    std::string cycle_state_file;
    int rollover_hour;
    Clock clock;

    mutable std::mutex state_mutex;
    std::map<std::string, BalanceRecord> balance_cache;
    std::map<std::string, std::string> cycle_markers;
    size_t corrected_entry_count = 0;

    std::string current_cycle_day_locked() const;
    void load_balance_cache_locked();
    std::optional<std::string> load_cycle_state_locked();
    size_t apply_legacy_cycle_correction_locked(const std::string& saved_at);
    void persist_balance_cache_locked() const;
    void persist_cycle_state_locked() const;
};

} // namespace Core
} // namespace BalanceMonitor

#endif // STATE_STORE_HPP
