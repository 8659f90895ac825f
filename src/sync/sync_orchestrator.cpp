#include "sync/sync_orchestrator.hpp"

#include "util/logger.hpp"

#include <optional>
#include <utility>

namespace luasync {

namespace fs = std::filesystem;

SyncOrchestrator::SyncOrchestrator(config::SyncConfig cfg, IHttpClient& http, ISyncObserver& observer)
    : cfg_(std::move(cfg)),
      observer_(observer),
      classifier_(RouteLayout::FromConfig(cfg_)),
      release_resolver_(http, ReleaseResolver::Options::FromConfig(cfg_)),
      fetcher_(http, observer, cfg_.download_timeout_sec),
      archive_installer_(observer) {}

SyncReport SyncOrchestrator::Run() {
    state_ = SyncState::Running;
    observer_.OnLog("Starting synchronization", LogSeverity::Header);

    const fs::path manifest_path = cfg_.ManifestPath();
    std::vector<std::string> entries;
    auto read_res = manifest_reader_.Read(manifest_path, entries);
    if (!read_res.is_ok()) {
        LogError("%s: %s", ToString(read_res.kind), read_res.msg.c_str());
        observer_.OnLog("Cannot read manifest (" + read_res.msg + "). Nothing to do.",
                        LogSeverity::Error);
        SyncReport report;
        report.nothing_to_do = true;
        report.manifest_error = read_res.kind;
        return Finish(std::move(report));
    }

    if (entries.empty()) {
        observer_.OnLog("Manifest " + manifest_path.string() + " is empty. Nothing to do.",
                        LogSeverity::Warning);
        SyncReport report;
        report.nothing_to_do = true;
        return Finish(std::move(report));
    }

    const std::vector<std::string> active = ActiveEntries(entries);
    const std::size_t total = active.size();
    observer_.OnLog("Files to process: " + std::to_string(total), LogSeverity::Info);
    LogDebug("manifest: %zu lines, %zu active", entries.size(), total);

    SyncReport report;
    for (std::size_t i = 0; i < total; ++i) {
        observer_.OnProgress(i, total);

        const DownloadOutcome outcome = SyncEntry(active[i]);
        if (outcome.success) {
            report.succeeded.push_back(outcome.name);
        } else {
            report.failed.push_back(outcome.name);
        }
    }
    observer_.OnProgress(total, total);

    return Finish(std::move(report));
}

DownloadOutcome SyncOrchestrator::SyncEntry(const std::string& name) {
    DownloadOutcome outcome{.name = name};

    const Route route = classifier_.Classify(name);
    LogDebug("%s -> %s", name.c_str(), ToString(route.kind));

    switch (route.kind) {
        case RouteKind::AggregateArchive:
            outcome.success = SyncAggregateArchive();
            break;
        case RouteKind::Direct:
            outcome.success = fetcher_.Download(route.source_url, route.destination);
            break;
        case RouteKind::Unknown:
            LogWarn("%s: %s", ToString(ErrorKind::UnrecognizedEntry), name.c_str());
            observer_.OnLog("Unrecognized file type: " + name + ". Skipped.", LogSeverity::Error);
            outcome.success = false;
            break;
    }
    return outcome;
}

bool SyncOrchestrator::SyncAggregateArchive() {
    observer_.OnLog("Looking up the latest " + cfg_.aggregate_archive_name + " release",
                    LogSeverity::Info);

    std::optional<ReleaseAsset> asset;
    auto res = release_resolver_.ResolveLatestArchive(asset);
    if (!res.is_ok()) {
        LogWarn("release lookup failed: %s", res.msg.c_str());
        observer_.OnLog("Release lookup failed: " + res.msg, LogSeverity::Error);
        return false;
    }
    if (!asset) {
        observer_.OnLog("No " + cfg_.asset_extension + " asset matching '" + cfg_.asset_keyword +
                            "' in the latest release",
                        LogSeverity::Warning);
        return false;
    }

    // Asset names come from a remote document; keep only the final component.
    const fs::path file_name = fs::path(asset->name).filename();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        observer_.OnLog("Release asset has an unusable name: " + asset->name, LogSeverity::Error);
        return false;
    }
    observer_.OnLog("Found release asset: " + asset->name, LogSeverity::Success);

    const fs::path archive_path = cfg_.install_root / file_name;
    if (!fetcher_.Download(asset->download_url, archive_path)) return false;

    return archive_installer_.Install(archive_path, cfg_.install_root);
}

SyncReport SyncOrchestrator::Finish(SyncReport report) {
    if (!report.nothing_to_do) {
        observer_.OnLog("Synchronization finished: " + std::to_string(report.succeeded.size()) +
                            " updated, " + std::to_string(report.failed.size()) + " failed",
                        report.failed.empty() ? LogSeverity::Header : LogSeverity::Warning);
    }
    observer_.OnRunComplete(report.succeeded, report.failed);
    state_ = SyncState::Completed;
    return report;
}

} // namespace luasync
