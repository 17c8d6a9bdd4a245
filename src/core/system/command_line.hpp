#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace BalanceMonitor {
namespace System {

class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

struct CommandLine {
    std::string config_dir;                 // Empty: resolved from the environment
    std::string command;
    std::vector<std::string> arguments;
};

// Arguments without the program name. Throws UsageError on unknown commands or wrong argument counts.
CommandLine parse_command_line(const std::vector<std::string>& args);

std::string usage_text(const std::string& program_name);

} // namespace System
} // namespace BalanceMonitor

#endif // COMMAND_LINE_HPP
