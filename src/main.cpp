#include "net/curl_http_client.hpp"
#include "sync/console_observer.hpp"
#include "sync/manifest_reader.hpp"
#include "sync/sync_orchestrator.hpp"
#include "util/logger.hpp"
#include "util/sync_config.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <system_error>

namespace {

namespace fs = std::filesystem;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-r <install-root>] [-m <manifest>] [-t] [-v|-q]\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON config file overriding folders, URLs and timeouts\n"
        "  -r, --root             Player installation root (default: executable directory)\n"
        "  -m, --manifest         Manifest file (default: <root>/luasync.ini)\n"
        "  -t, --no-template      Do not create a manifest template when it is missing\n"
        "  -v, --verbose          Debug diagnostics on stderr\n"
        "  -q, --quiet            Errors only on stderr\n"
        "  -h, --help             Show this help\n",
        argv);
}

fs::path ExecutableDir() {
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && exe.has_parent_path()) return exe.parent_path();
    const fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

} // namespace

int main(int argc, char **argv) {
    const char *config_path = nullptr;
    const char *root_cli = nullptr;
    const char *manifest_cli = nullptr;
    bool create_template = true;
    bool verbose = false;
    bool quiet = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"root", required_argument, nullptr, 'r'},
        {"manifest", required_argument, nullptr, 'm'},
        {"no-template", no_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:r:m:tvq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_path = optarg;
                break;
            case 'r':
                root_cli = optarg;
                break;
            case 'm':
                manifest_cli = optarg;
                break;
            case 't':
                create_template = false;
                break;
            case 'v':
                verbose = true;
                break;
            case 'q':
                quiet = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc || (verbose && quiet)) {
        PrintUsage(argv[0]);
        return 2;
    }

    luasync::config::SyncConfig cfg;
    cfg.install_root = ExecutableDir();

    if (config_path) {
        auto res = cfg.LoadFile(config_path);
        if (!res.is_ok()) {
            std::fprintf(stderr, "ERROR: config: %s\n", res.msg.c_str());
            return 2;
        }
    }
    if (root_cli) cfg.install_root = root_cli;
    if (manifest_cli) cfg.manifest_path = manifest_cli;

    if (cfg.log_level) luasync::Logger::Instance().SetLevel(*cfg.log_level);
    if (verbose) luasync::Logger::Instance().SetLevel(luasync::LogLevel::Debug);
    if (quiet) luasync::Logger::Instance().SetLevel(luasync::LogLevel::Error);

    luasync::ConsoleSyncObserver observer;

    const fs::path manifest = cfg.ManifestPath();
    std::error_code ec;
    if (create_template && !fs::exists(manifest, ec) && !ec) {
        observer.OnLog("Manifest not found, creating template: " + manifest.string(),
                       luasync::LogSeverity::Warning);
        auto res = luasync::WriteManifestTemplate(manifest);
        if (res.is_ok()) {
            observer.OnLog("Manifest template created.", luasync::LogSeverity::Success);
        } else {
            observer.OnLog("Could not create manifest template: " + res.msg,
                           luasync::LogSeverity::Error);
        }
    }

    luasync::CurlHttpClient http(cfg.user_agent);
    luasync::SyncOrchestrator orchestrator(cfg, http, observer);
    const luasync::SyncReport report = orchestrator.Run();

    return report.AllSucceeded() ? 0 : 1;
}
