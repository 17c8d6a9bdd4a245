#include "progress_sink.hpp"
#include "core/logging/logging_macros.hpp"

namespace BalanceMonitor {
namespace Core {

void LoggingProgressSink::emit(ProgressLevel level, const std::string& username, const std::string& message) {
    std::string line = username.empty() ? message : "[" + username + "] " + message;
    switch (level) {
        case ProgressLevel::ERROR: LOG_ERROR(line); break;
        case ProgressLevel::WARN:  LOG_WARN(line); break;
        case ProgressLevel::INFO:  LOG_INFO(line); break;
    }
}

} // namespace Core
} // namespace BalanceMonitor
