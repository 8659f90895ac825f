#pragma once

#include "sync/sync_observer.hpp"

#include <cstdio>

namespace luasync {

class ConsoleSyncObserver final : public ISyncObserver {
public:
    ConsoleSyncObserver() = default;
    explicit ConsoleSyncObserver(std::FILE* out) : out_(out) {}

    void OnProgress(std::size_t current, std::size_t total) override;
    void OnLog(std::string_view message, LogSeverity severity) override;
    void OnRunComplete(const std::vector<std::string>& succeeded,
                       const std::vector<std::string>& failed) override;

private:
    std::FILE* out_ = stdout;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace luasync
