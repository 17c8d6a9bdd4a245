#ifndef ACCOUNT_STORE_HPP
#define ACCOUNT_STORE_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include "account.hpp"

namespace BalanceMonitor {
namespace Core {

class AccountStoreError : public std::runtime_error {
public:
    explicit AccountStoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Credentials file management.
 * Format: one "username,password[,api_key]" per line, '#' starts a comment line.
 */
class AccountStore {
public:
    explicit AccountStore(const std::string& credentials_path) : credentials_file(credentials_path) {}

    // Missing file yields an empty list; malformed lines are skipped with a warning.
    std::vector<Account> load_accounts() const;
    void save_accounts(const std::vector<Account>& accounts) const;

    // Returns true when an existing account was replaced.
    bool upsert_account(const Account& account) const;
    bool remove_account(const std::string& username) const;

    const std::string& get_path() const { return credentials_file; }

private:
    std::string credentials_file;
};

void sort_accounts(std::vector<Account>& accounts);

} // namespace Core
} // namespace BalanceMonitor

#endif // ACCOUNT_STORE_HPP
