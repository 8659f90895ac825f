#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace luasync {

inline constexpr char kManifestCommentMarker = '\'';

// Reads the newline-delimited manifest. Comment lines are returned as-is;
// filtering them is left to the caller.
class ManifestReader {
  public:
    // ManifestMissing if |path| does not exist, ManifestReadError on I/O or
    // UTF-8 faults. An empty |out| is not an error.
    Result Read(const std::filesystem::path& path, std::vector<std::string>& out) const;

    // Splits on LF/CRLF, trims, drops blank lines. Fails on invalid UTF-8.
    Result Parse(std::string_view content, std::vector<std::string>& out) const;
};

inline bool IsCommentEntry(std::string_view entry) {
    return !entry.empty() && entry.front() == kManifestCommentMarker;
}

std::vector<std::string> ActiveEntries(const std::vector<std::string>& entries);

// Recommended starter list, sorted.
std::vector<std::string> DefaultManifestTemplate();

// Writes DefaultManifestTemplate() to |path|, one name per line.
Result WriteManifestTemplate(const std::filesystem::path& path);

} // namespace luasync
