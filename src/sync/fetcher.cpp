#include "sync/fetcher.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace luasync {

namespace fs = std::filesystem;

Fetcher::Fetcher(IHttpClient& http, ISyncObserver& observer, long timeout_sec)
    : http_(http), observer_(observer), timeout_sec_(timeout_sec) {}

bool Fetcher::Download(const std::string& url, const fs::path& destination) {
    const std::string name = destination.filename().string();
    observer_.OnLog("Downloading: " + name, LogSeverity::Info);

    auto res = Fetch(url, destination);
    if (!res.is_ok()) {
        LogWarn("download %s failed: %s", url.c_str(), res.msg.c_str());
        observer_.OnLog("Download failed for " + name + ": " + res.msg, LogSeverity::Error);
        return false;
    }

    observer_.OnLog("Updated: " + name, LogSeverity::Success);
    return true;
}

Result Fetcher::Fetch(const std::string& url, const fs::path& destination) const {
    HttpResponse resp;
    auto res = http_.Get(url, timeout_sec_, resp);
    if (!res.is_ok()) return res;

    if (!resp.IsSuccess()) {
        return Result::Fail(ErrorKind::NetworkError,
                            "HTTP " + std::to_string(resp.status) + " for " + url);
    }

    res = WriteBody(resp.body, destination);
    if (!res.is_ok()) return res;

    LogDebug("wrote %zu bytes to %s", resp.body.size(), destination.string().c_str());
    return Result::Ok();
}

Result Fetcher::WriteBody(std::string_view body, const fs::path& destination) {
    if (destination.empty()) {
        return Result::Fail(ErrorKind::FileSystemError, "destination path is empty");
    }

    const fs::path parent = destination.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Result::Fail(ErrorKind::FileSystemError,
                                "create_directories failed: " + parent.string() + ": " + ec.message());
        }
    }

    const std::string final_path = destination.string();
    const std::string tmp_path = TmpPathFor(final_path);

    FileWriter writer;
    auto res = FileWriter::Open(tmp_path, writer);
    if (!res.is_ok()) return res;

    res = writer.WriteAll({reinterpret_cast<const std::uint8_t*>(body.data()), body.size()});
    if (res.is_ok()) res = writer.FsyncNow();
    if (res.is_ok()) res = writer.Close();
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(ErrorKind::FileSystemError,
                            "rename to " + final_path + " failed: " + std::strerror(err));
    }

    return Result::Ok();
}

} // namespace luasync
