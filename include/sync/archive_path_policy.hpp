#pragma once

#include "util/result.hpp"

#include <string>

namespace luasync {

// Maps archive entry names to paths relative to the extraction root and
// rejects names that would escape it.
class ArchivePathPolicy {
  public:
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace luasync
