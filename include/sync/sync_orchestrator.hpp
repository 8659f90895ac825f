#pragma once

#include "net/http_client.hpp"
#include "sync/archive_installer.hpp"
#include "sync/fetcher.hpp"
#include "sync/manifest_reader.hpp"
#include "sync/release_resolver.hpp"
#include "sync/route_classifier.hpp"
#include "sync/sync_observer.hpp"
#include "util/sync_config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace luasync {

enum class SyncState : int {
    Idle = 0,
    Running,
    Completed,
};

struct DownloadOutcome {
    std::string name;
    bool success = false;
};

struct SyncReport {
    // Both lists follow manifest order.
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;

    bool nothing_to_do = false;
    // ManifestMissing / ManifestReadError when the manifest could not be read.
    ErrorKind manifest_error = ErrorKind::None;

    std::size_t Attempted() const { return succeeded.size() + failed.size(); }
    bool AllSucceeded() const { return manifest_error == ErrorKind::None && failed.empty(); }
};

// Runs one sync pass over the manifest: every active entry is attempted once,
// strictly in order, and no entry's failure stops the run.
class SyncOrchestrator {
public:
    SyncOrchestrator(config::SyncConfig cfg, IHttpClient& http, ISyncObserver& observer);

    SyncReport Run();

    SyncState State() const { return state_; }

private:
    DownloadOutcome SyncEntry(const std::string& name);
    bool SyncAggregateArchive();
    SyncReport Finish(SyncReport report);

    config::SyncConfig cfg_;
    ISyncObserver& observer_;

    ManifestReader manifest_reader_;
    RouteClassifier classifier_;
    ReleaseResolver release_resolver_;
    Fetcher fetcher_;
    ArchiveInstaller archive_installer_;

    SyncState state_ = SyncState::Idle;
};

} // namespace luasync
