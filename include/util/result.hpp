#pragma once
#include <string>
#include <utility>

namespace luasync {

enum class ErrorKind : int {
    None = 0,
    ManifestMissing,
    ManifestReadError,
    NetworkError,
    ArchiveError,
    UnrecognizedEntry,
    FileSystemError,
    ConfigError,
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::ManifestMissing:   return "ManifestMissing";
        case ErrorKind::ManifestReadError: return "ManifestReadError";
        case ErrorKind::NetworkError:      return "NetworkError";
        case ErrorKind::ArchiveError:      return "ArchiveError";
        case ErrorKind::UnrecognizedEntry: return "UnrecognizedEntry";
        case ErrorKind::FileSystemError:   return "FileSystemError";
        case ErrorKind::ConfigError:       return "ConfigError";
    }
    return "Unknown";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
};

} // namespace luasync
