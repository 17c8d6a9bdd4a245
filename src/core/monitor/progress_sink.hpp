#ifndef PROGRESS_SINK_HPP
#define PROGRESS_SINK_HPP

#include <string>

namespace BalanceMonitor {
namespace Core {

enum class ProgressLevel {
    INFO,
    WARN,
    ERROR
};

// Fire-and-forget progress events; username is empty for batch-level events.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void emit(ProgressLevel level, const std::string& username, const std::string& message) = 0;
};

class LoggingProgressSink : public ProgressSink {
public:
    void emit(ProgressLevel level, const std::string& username, const std::string& message) override;
};

} // namespace Core
} // namespace BalanceMonitor

#endif // PROGRESS_SINK_HPP
