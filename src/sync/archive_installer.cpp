#include "sync/archive_installer.hpp"

#include "sync/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace luasync {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

Result Fail(const std::string& what, archive* a) {
    return Result::Fail(ErrorKind::ArchiveError, what + ": " + ArchiveErr(a));
}

} // namespace

ArchiveInstaller::ArchiveInstaller(ISyncObserver& observer) : observer_(observer) {}

bool ArchiveInstaller::Install(const fs::path& archive_path, const fs::path& install_root) {
    const std::string name = archive_path.filename().string();
    observer_.OnLog("Extracting archive: " + name, LogSeverity::Info);

    std::size_t extracted = 0;
    auto res = Extract(archive_path, install_root, &extracted);
    if (!res.is_ok()) {
        LogWarn("extract %s failed: %s", archive_path.string().c_str(), res.msg.c_str());
        observer_.OnLog("Extraction failed for " + name + ": " + res.msg, LogSeverity::Error);
        return false;
    }

    std::error_code ec;
    fs::remove(archive_path, ec);
    if (ec) {
        observer_.OnLog("Extracted " + name + " but could not remove it: " + ec.message(),
                        LogSeverity::Error);
        return false;
    }

    LogInfo("extracted %zu entries from %s into %s",
            extracted, name.c_str(), install_root.string().c_str());
    observer_.OnLog("Archive extracted: " + name, LogSeverity::Success);
    return true;
}

Result ArchiveInstaller::Extract(const fs::path& archive_path,
                                 const fs::path& root,
                                 std::size_t* extracted) const {
    if (extracted) *extracted = 0;

    std::error_code ec;
    if (!fs::is_regular_file(archive_path, ec)) {
        return Result::Fail(ErrorKind::ArchiveError, "Archive not found: " + archive_path.string());
    }
    fs::create_directories(root, ec);
    if (ec) {
        return Result::Fail(ErrorKind::FileSystemError,
                            "create_directories failed: " + root.string() + ": " + ec.message());
    }
    // Rewritten entry paths are absolute. SECURE_NODOTDOT and SECURE_SYMLINKS
    // check every component, so the root must carry no ".." and no symlinks.
    const fs::path install_root = fs::canonical(root, ec);
    if (ec) {
        return Result::Fail(ErrorKind::FileSystemError, "cannot resolve " + root.string() + ": " + ec.message());
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::ArchiveError, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Fail("Could not open archive " + archive_path.string(), ar.get());
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::ArchiveError, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under install_root, so
    // NOABSOLUTEPATHS would reject every target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const ArchivePathPolicy path_policy{};
    std::size_t count = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("archive_read_next_header: %s", ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Fail("archive_read_next_header", ar.get());
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (install_root / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (install_root / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("entry: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh == ARCHIVE_WARN) {
            LogWarn("archive_write_header %s: %s", rel.c_str(), ArchiveErr(aw.get()).c_str());
        } else if (wh != ARCHIVE_OK) {
            return Fail("archive_write_header " + rel, aw.get());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Fail("archive_read_data_block " + rel, ar.get());

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww < ARCHIVE_OK) return Fail("archive_write_data_block " + rel, aw.get());
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf < ARCHIVE_WARN) return Fail("archive_write_finish_entry " + rel, aw.get());
        ++count;
    }

    if (archive_write_close(aw.get()) < ARCHIVE_WARN) {
        return Fail("archive_write_close", aw.get());
    }

    if (count == 0) {
        return Result::Fail(ErrorKind::ArchiveError, "Archive has no entries: " + archive_path.string());
    }

    if (extracted) *extracted = count;
    return Result::Ok();
}

} // namespace luasync
