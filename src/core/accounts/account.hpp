#ifndef ACCOUNT_HPP
#define ACCOUNT_HPP

#include <string>

namespace BalanceMonitor {
namespace Core {

struct Account {
    std::string username;      // Unique, case-sensitive identifier
    std::string password;
    std::string api_key;       // Empty when the account has no fast-path token

    bool has_api_key() const { return api_key.find_first_not_of(" \t\r\n") != std::string::npos; }
};

} // namespace Core
} // namespace BalanceMonitor

#endif // ACCOUNT_HPP
