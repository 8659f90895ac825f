#include "sync/console_observer.hpp"

#include <string>

namespace luasync {

namespace {
bool g_progress_line_active = false;
std::FILE* g_progress_stream = stdout;

const char* Marker(LogSeverity severity) {
    switch (severity) {
        case LogSeverity::Info:    return "   ";
        case LogSeverity::Success: return "[+]";
        case LogSeverity::Warning: return "[!]";
        case LogSeverity::Error:   return "[x]";
        case LogSeverity::Header:  return "==>";
    }
    return "   ";
}

void PrintList(std::FILE* out, const char* title, const std::vector<std::string>& names) {
    if (names.empty()) return;
    std::fprintf(out, "\n%s: %zu file(s)\n", title, names.size());
    for (const auto& n : names) {
        std::fprintf(out, "   - %s\n", n.c_str());
    }
}
} // namespace

void ConsoleSyncObserver::OnProgress(std::size_t current, std::size_t total) {
    int pct = 100;
    if (total > 0) {
        pct = static_cast<int>((current * 100U) / total);
        if (pct > 100)
            pct = 100;
    }

    std::fprintf(out_, "\r[%zu/%zu] %3d%%", current, total, pct);
    std::fflush(out_);
    g_progress_line_active = true;
    g_progress_stream = out_;

    if (current >= total) {
        std::fprintf(out_, "\n");
        g_progress_line_active = false;
    }
}

void ConsoleSyncObserver::OnLog(std::string_view message, LogSeverity severity) {
    ClearProgressLine();
    if (severity == LogSeverity::Header) {
        std::fprintf(out_, "\n");
    }
    std::fprintf(out_, "%s %.*s\n", Marker(severity), (int)message.size(), message.data());
    std::fflush(out_);
}

void ConsoleSyncObserver::OnRunComplete(const std::vector<std::string>& succeeded,
                                        const std::vector<std::string>& failed) {
    ClearProgressLine();
    const std::string rule(20, '-');
    std::fprintf(out_, "\n%s REPORT %s\n", rule.c_str(), rule.c_str());
    std::fprintf(out_, "Synchronization finished.\n");
    PrintList(out_, "Failed", failed);
    PrintList(out_, "Updated", succeeded);
    std::fprintf(out_, "%s\n", std::string(48, '-').c_str());
    std::fflush(out_);
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(g_progress_stream, "\n");
        g_progress_line_active = false;
    }
}

} // namespace luasync
