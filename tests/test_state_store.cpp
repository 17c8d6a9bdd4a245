#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "core/state/state_store.hpp"
#include "test_helpers.hpp"

using namespace BalanceMonitor::Core;
using BalanceMonitor::Testing::TempDir;
using BalanceMonitor::Testing::local_time_point;
using BalanceMonitor::Testing::local_tm;
using BalanceMonitor::Testing::read_text_file;
using BalanceMonitor::Testing::write_text_file;

namespace {

class StateStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    std::chrono::system_clock::time_point now = local_time_point(2024, 3, 10, 9);

    std::unique_ptr<StateStore> make_store(int rollover_hour = DEFAULT_ROLLOVER_HOUR) {
        auto store = std::make_unique<StateStore>(dir.file("balance_cache.json"),
                                                  dir.file("daily_web_login_state.json"),
                                                  rollover_hour,
                                                  [this]() { return now; });
        store->load();
        return store;
    }
};

} // namespace

TEST(CycleDayTest, HoursBeforeRolloverBelongToPreviousDay) {
    for (int rollover = 0; rollover < 24; ++rollover) {
        for (int hour = 0; hour < 24; ++hour) {
            std::string expected = hour < rollover ? "2024-03-09" : "2024-03-10";
            EXPECT_EQ(compute_cycle_day(local_tm(2024, 3, 10, hour), rollover), expected)
                << "rollover " << rollover << " hour " << hour;
        }
    }
}

TEST(CycleDayTest, CrossesMonthAndYearBoundaries) {
    EXPECT_EQ(compute_cycle_day(local_tm(2024, 3, 1, 7), 8), "2024-02-29");
    EXPECT_EQ(compute_cycle_day(local_tm(2025, 1, 1, 0), 8), "2024-12-31");
}

TEST(CycleDayTest, OutOfRangeRolloverFallsBackToDefault) {
    EXPECT_EQ(normalize_rollover_hour(-1), DEFAULT_ROLLOVER_HOUR);
    EXPECT_EQ(normalize_rollover_hour(24), DEFAULT_ROLLOVER_HOUR);
    EXPECT_EQ(normalize_rollover_hour(0), 0);
    EXPECT_EQ(compute_cycle_day(local_tm(2024, 3, 10, 7), 99), "2024-03-09");
}

TEST_F(StateStoreTest, ForcesFullCheckOncePerCycle) {
    auto store = make_store();
    EXPECT_TRUE(store->should_force_full("alice"));

    store->mark_cycle_fulfilled("alice");
    EXPECT_FALSE(store->should_force_full("alice"));
    EXPECT_TRUE(store->should_force_full("bob"));
    EXPECT_EQ(store->get_cycle_marker("alice").value(), "2024-03-10");

    // Still the same cycle at 07:59 the next morning
    now = local_time_point(2024, 3, 11, 7, 59);
    EXPECT_FALSE(store->should_force_full("alice"));

    now = local_time_point(2024, 3, 11, 8, 0);
    EXPECT_TRUE(store->should_force_full("alice"));
}

TEST_F(StateStoreTest, PersistsBalancesAndMarkersAcrossReload) {
    {
        auto store = make_store();
        store->update_balance("alice", "$42.5");
        store->update_balance("bob", "$10.0", true, std::string("key synced"));
        store->mark_cycle_fulfilled("bob");
    }

    auto reloaded = make_store();
    EXPECT_EQ(reloaded->get_cached_balance("alice").value(), "$42.5");
    auto bob = reloaded->get_cached_record("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->balance, "$10.0");
    EXPECT_EQ(bob->sync_success.value(), true);
    EXPECT_EQ(bob->sync_message.value(), "key synced");
    EXPECT_FALSE(bob->updated_at.empty());
    EXPECT_FALSE(reloaded->should_force_full("bob"));
    EXPECT_TRUE(reloaded->should_force_full("alice"));
    EXPECT_EQ(reloaded->get_all_records().size(), 2u);
}

TEST_F(StateStoreTest, BalanceFileKeepsRecordFieldTypes) {
    {
        auto store = make_store();
        store->update_balance("alice", "$42.5");
    }

    json document = json::parse(read_text_file(dir.file("balance_cache.json")));
    const json& alice = document["accounts"]["alice"];
    EXPECT_TRUE(alice["balance"].is_string());
    EXPECT_TRUE(alice["updated_at"].is_string());
    EXPECT_TRUE(alice["apikey_sync_success"].is_null());
    ASSERT_TRUE(alice["apikey_sync_message"].is_string());
    EXPECT_EQ(alice["apikey_sync_message"].get<std::string>(), "");

    auto reloaded = make_store();
    auto record = reloaded->get_cached_record("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->sync_message.has_value());
}

TEST_F(StateStoreTest, MissingSyncMessageKeepsPreviousOne) {
    auto store = make_store();
    store->update_balance("alice", "$1.0", false, std::string("sync failed"));
    store->update_balance("alice", "$2.0");

    auto record = store->get_cached_record("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->balance, "$2.0");
    EXPECT_FALSE(record->sync_success.has_value());
    EXPECT_EQ(record->sync_message.value(), "sync failed");
}

TEST_F(StateStoreTest, BlankBalanceIsIgnored) {
    auto store = make_store();
    store->update_balance("alice", "   ");
    EXPECT_FALSE(store->get_cached_balance("alice").has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.file("balance_cache.json")));
}

TEST_F(StateStoreTest, StaleTempFileLeavesTargetIntact) {
    {
        auto store = make_store();
        store->update_balance("alice", "$42.5");
    }
    // A crash between the temp write and the rename leaves only the temp file behind
    write_text_file(dir.file("balance_cache.tmp"), "{ \"accounts\": { \"alice\": { \"balan");

    auto reloaded = make_store();
    EXPECT_EQ(reloaded->get_cached_balance("alice").value(), "$42.5");

    reloaded->update_balance("alice", "$43.0");
    EXPECT_FALSE(std::filesystem::exists(dir.file("balance_cache.tmp")));
    EXPECT_EQ(make_store()->get_cached_balance("alice").value(), "$43.0");
}

TEST_F(StateStoreTest, ReadsLegacyFlatFiles) {
    write_text_file(dir.file("balance_cache.json"), R"({"alice": "$5.0", "bob": {"balance": "$7.5", "updated_at": "x"}, "carol": ""})");
    write_text_file(dir.file("daily_web_login_state.json"), R"({"alice": "2024-03-10", "bob": "not-a-date"})");

    auto store = make_store();
    EXPECT_EQ(store->get_cached_balance("alice").value(), "$5.0");
    EXPECT_EQ(store->get_cached_balance("bob").value(), "$7.5");
    EXPECT_FALSE(store->get_cached_record("carol").has_value());
    EXPECT_FALSE(store->should_force_full("alice"));
    EXPECT_FALSE(store->get_cycle_marker("bob").has_value());
}

TEST_F(StateStoreTest, CorrectsMarkersSavedBeforeRollover) {
    write_text_file(dir.file("daily_web_login_state.json"), R"({
        "version": 1,
        "updated_at": "2024-03-10T07:30:00+08:00",
        "accounts": {"alice": "2024-03-10", "bob": "2024-03-09"}
    })");
    now = local_time_point(2024, 3, 10, 7, 45);

    auto store = make_store();
    EXPECT_EQ(store->get_corrected_entry_count(), 1u);
    EXPECT_EQ(store->get_cycle_marker("alice").value(), "2024-03-09");
    EXPECT_EQ(store->get_cycle_marker("bob").value(), "2024-03-09");
    EXPECT_FALSE(store->should_force_full("alice"));

    // The corrected markers were written back
    std::string persisted = read_text_file(dir.file("daily_web_login_state.json"));
    EXPECT_EQ(persisted.find("\"2024-03-10\""), std::string::npos);
}

TEST_F(StateStoreTest, LeavesMarkersSavedAfterRolloverAlone) {
    write_text_file(dir.file("daily_web_login_state.json"), R"({
        "updated_at": "2024-03-10T09:15:00+08:00",
        "accounts": {"alice": "2024-03-10"}
    })");

    auto store = make_store();
    EXPECT_EQ(store->get_corrected_entry_count(), 0u);
    EXPECT_EQ(store->get_cycle_marker("alice").value(), "2024-03-10");
}

TEST_F(StateStoreTest, MalformedFileFailsLoad) {
    write_text_file(dir.file("balance_cache.json"), "{ not json");
    StateStore store(dir.file("balance_cache.json"), dir.file("daily_web_login_state.json"), 8, [this]() { return now; });
    EXPECT_THROW(store.load(), StateStoreError);
}
