#pragma once

#include "sync/sync_observer.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <filesystem>

namespace luasync {

class ArchiveInstaller {
public:
    explicit ArchiveInstaller(ISyncObserver& observer);

    // Extracts |archive_path| under |install_root| and deletes the archive.
    // On failure the archive stays on disk and entries already written are
    // left in place.
    bool Install(const std::filesystem::path& archive_path, const std::filesystem::path& install_root);

    // Extraction only. |extracted| counts entries written.
    Result Extract(const std::filesystem::path& archive_path,
                   const std::filesystem::path& install_root,
                   std::size_t* extracted = nullptr) const;

private:
    ISyncObserver& observer_;
};

} // namespace luasync
