#include <gtest/gtest.h>
#include "core/accounts/account_store.hpp"
#include "test_helpers.hpp"

using namespace BalanceMonitor::Core;
using BalanceMonitor::Testing::TempDir;
using BalanceMonitor::Testing::read_text_file;
using BalanceMonitor::Testing::write_text_file;

TEST(AccountStoreTest, MissingFileMeansNoAccounts) {
    TempDir dir;
    AccountStore store(dir.file("credentials.txt"));
    EXPECT_TRUE(store.load_accounts().empty());
}

TEST(AccountStoreTest, SkipsCommentsAndInvalidLinesAndSorts) {
    TempDir dir;
    write_text_file(dir.file("credentials.txt"),
                    "# header\n"
                    "zoe,zpass,sk-zoe\n"
                    "\n"
                    "broken-line\n"
                    ",nopass\n"
                    "  adam , apass \n");
    AccountStore store(dir.file("credentials.txt"));

    std::vector<Account> accounts = store.load_accounts();
    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[0].username, "adam");
    EXPECT_EQ(accounts[0].password, "apass");
    EXPECT_FALSE(accounts[0].has_api_key());
    EXPECT_EQ(accounts[1].username, "zoe");
    EXPECT_EQ(accounts[1].api_key, "sk-zoe");
}

TEST(AccountStoreTest, UpsertAddsThenReplaces) {
    TempDir dir;
    AccountStore store(dir.file("credentials.txt"));

    Account account;
    account.username = "alice";
    account.password = "first";
    EXPECT_FALSE(store.upsert_account(account));

    account.password = "second";
    account.api_key = "sk-alice";
    EXPECT_TRUE(store.upsert_account(account));

    std::vector<Account> accounts = store.load_accounts();
    ASSERT_EQ(accounts.size(), 1u);
    EXPECT_EQ(accounts[0].password, "second");
    EXPECT_EQ(accounts[0].api_key, "sk-alice");
    EXPECT_NE(read_text_file(dir.file("credentials.txt")).find("alice,second,sk-alice"), std::string::npos);
}

TEST(AccountStoreTest, RejectsCommasAndMissingFields) {
    TempDir dir;
    AccountStore store(dir.file("credentials.txt"));

    Account account;
    account.username = "alice";
    account.password = "pa,ss";
    EXPECT_THROW(store.upsert_account(account), AccountStoreError);

    account.password = "";
    EXPECT_THROW(store.upsert_account(account), AccountStoreError);
}

TEST(AccountStoreTest, RemoveReportsWhetherAccountExisted) {
    TempDir dir;
    write_text_file(dir.file("credentials.txt"), "alice,a\nbob,b\n");
    AccountStore store(dir.file("credentials.txt"));

    EXPECT_TRUE(store.remove_account("alice"));
    EXPECT_FALSE(store.remove_account("alice"));
    std::vector<Account> accounts = store.load_accounts();
    ASSERT_EQ(accounts.size(), 1u);
    EXPECT_EQ(accounts[0].username, "bob");
}
