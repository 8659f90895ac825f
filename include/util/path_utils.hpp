#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace luasync {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Relative paths are anchored at |root|; absolute ones are kept.
inline std::filesystem::path ResolveUnder(const std::filesystem::path& root,
                                          const std::filesystem::path& p) {
    if (p.empty() || p.is_absolute()) return p;
    return root / p;
}

inline std::string TmpPathFor(std::string_view dest) {
    return std::string(dest) + ".tmp";
}

} // namespace luasync
