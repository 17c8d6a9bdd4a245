#include "account_store.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace BalanceMonitor {
namespace Core {

using Utils::trim_copy;

std::vector<Account> AccountStore::load_accounts() const {
    std::vector<Account> accounts;
    std::ifstream in(credentials_file);
    if (!in.is_open()) {
        LOG_WARN("Credentials file not found: " + credentials_file);
        return accounts;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(trim_copy(field));
        }

        if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
            LOG_WARN("Skipping invalid credentials line " + std::to_string(line_number) + " in " + credentials_file);
            continue;
        }

        Account account;
        account.username = fields[0];
        account.password = fields[1];
        if (fields.size() > 2) {
            account.api_key = fields[2];
        }
        accounts.push_back(account);
    }

    sort_accounts(accounts);
    LOG_INFO("Loaded " + std::to_string(accounts.size()) + " accounts from " + credentials_file);
    return accounts;
}

void AccountStore::save_accounts(const std::vector<Account>& accounts) const {
    std::filesystem::path path(credentials_file);
    if (path.has_parent_path()) {
        std::error_code dir_error;
        std::filesystem::create_directories(path.parent_path(), dir_error);
        if (dir_error) {
            throw AccountStoreError("Cannot create directory for " + credentials_file + ": " + dir_error.message());
        }
    }

    std::ofstream out(credentials_file, std::ios::trunc);
    if (!out.is_open()) {
        throw AccountStoreError("Cannot write credentials file: " + credentials_file);
    }

    out << "# Account credentials\n";
    out << "# Format: username,password,api_key (api_key optional)\n";
    for (const auto& account : accounts) {
        out << account.username << "," << account.password;
        if (!trim_copy(account.api_key).empty()) {
            out << "," << trim_copy(account.api_key);
        }
        out << "\n";
    }

    out.flush();
    if (!out.good()) {
        throw AccountStoreError("Failed writing credentials file: " + credentials_file);
    }
}

bool AccountStore::upsert_account(const Account& account) const {
    if (trim_copy(account.username).empty() || trim_copy(account.password).empty()) {
        throw AccountStoreError("Username and password are required");
    }
    if (account.username.find(',') != std::string::npos || account.password.find(',') != std::string::npos ||
        account.api_key.find(',') != std::string::npos) {
        throw AccountStoreError("Credentials must not contain commas");
    }

    std::vector<Account> accounts = load_accounts();
    bool replaced = false;
    for (auto& existing : accounts) {
        if (existing.username == account.username) {
            existing = account;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        accounts.push_back(account);
    }
    sort_accounts(accounts);
    save_accounts(accounts);
    return replaced;
}

bool AccountStore::remove_account(const std::string& username) const {
    std::vector<Account> accounts = load_accounts();
    auto original_size = accounts.size();
    accounts.erase(std::remove_if(accounts.begin(), accounts.end(),
                                  [&](const Account& account) { return account.username == username; }),
                   accounts.end());
    if (accounts.size() == original_size) {
        return false;
    }
    save_accounts(accounts);
    return true;
}

void sort_accounts(std::vector<Account>& accounts) {
    std::sort(accounts.begin(), accounts.end(),
              [](const Account& left, const Account& right) { return left.username < right.username; });
}

} // namespace Core
} // namespace BalanceMonitor
