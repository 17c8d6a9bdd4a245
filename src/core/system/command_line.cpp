#include "command_line.hpp"
#include <map>
#include <sstream>
#include <utility>

namespace BalanceMonitor {
namespace System {

namespace {

// command -> (minimum, maximum) positional arguments
const std::map<std::string, std::pair<size_t, size_t>>& command_arities() {
    static const std::map<std::string, std::pair<size_t, size_t>> arities = {
        {"query", {0, 1}},
        {"web-login", {0, 1}},
        {"watch", {0, 0}},
        {"cached", {0, 0}},
        {"accounts", {0, 0}},
        {"add-account", {2, 3}},
        {"remove-account", {1, 1}},
        {"report", {0, 0}},
        {"help", {0, 0}}
    };
    return arities;
}

const std::string CONFIG_DIR_OPTION = "--config-dir";

} // anonymous namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine command_line;
    std::vector<std::string> positional;

    for (size_t index = 0; index < args.size(); ++index) {
        const std::string& arg = args[index];
        if (arg == CONFIG_DIR_OPTION) {
            if (index + 1 >= args.size()) {
                throw UsageError(CONFIG_DIR_OPTION + " requires a directory");
            }
            command_line.config_dir = args[++index];
        } else if (arg.rfind(CONFIG_DIR_OPTION + "=", 0) == 0) {
            command_line.config_dir = arg.substr(CONFIG_DIR_OPTION.size() + 1);
        } else if (arg == "-h" || arg == "--help") {
            positional.insert(positional.begin(), "help");
        } else if (arg.size() > 1 && arg[0] == '-' && positional.empty()) {
            throw UsageError("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        command_line.command = "query";
        return command_line;
    }

    command_line.command = positional.front();
    command_line.arguments.assign(positional.begin() + 1, positional.end());

    auto arity = command_arities().find(command_line.command);
    if (arity == command_arities().end()) {
        throw UsageError("unknown command: " + command_line.command);
    }
    if (command_line.command == "help") {
        command_line.arguments.clear();
        return command_line;
    }
    size_t count = command_line.arguments.size();
    if (count < arity->second.first || count > arity->second.second) {
        throw UsageError("wrong number of arguments for " + command_line.command);
    }
    return command_line;
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream usage;
    usage << "Usage: " << program_name << " [--config-dir DIR] <command>\n"
          << "\n"
          << "Commands:\n"
          << "  query [account]                             Check balances (default)\n"
          << "  web-login [account]                         Check balances through web login only\n"
          << "  watch                                       Check balances every performance.query_interval_sec\n"
          << "  cached                                      Show cached balances\n"
          << "  accounts                                    List configured accounts\n"
          << "  add-account <user> <password> [api_key]     Add or update an account\n"
          << "  remove-account <user>                       Remove an account\n"
          << "  report                                      Check balances, then print the performance report\n"
          << "\n"
          << "The configuration directory defaults to $BALANCE_MONITOR_HOME, then ./config.\n";
    return usage.str();
}

} // namespace System
} // namespace BalanceMonitor
