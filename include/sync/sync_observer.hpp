#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace luasync {

enum class LogSeverity : int {
    Info = 0,
    Success,
    Warning,
    Error,
    Header,
};

// Presentation-side sink for a sync run. Callbacks arrive on the thread that
// runs the orchestrator.
class ISyncObserver {
  public:
    virtual ~ISyncObserver() = default;
    virtual void OnProgress(std::size_t current, std::size_t total) = 0;
    virtual void OnLog(std::string_view message, LogSeverity severity) = 0;
    virtual void OnRunComplete(const std::vector<std::string>& succeeded,
                               const std::vector<std::string>& failed) = 0;
};

} // namespace luasync
