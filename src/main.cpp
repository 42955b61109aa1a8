#include <iostream>
#include <optional>
#include <string>

#include "config.hpp"
#include "status.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "utils.hpp"

void printHelp()
{
    std::cout << "Usage: opkgsync [options]\n\n"
              << "opkgsync mirrors an opkg package feed ('Packages' file plus the\n"
              << "package files it lists) into a local directory, downloading only\n"
              << "what is new or changed and removing what is gone upstream.\n\n"
              << "Options:\n"
              << "  -d, --download_path PATH   Path to download packages to (default: .)\n"
              << "  -p, --packages_url URL     URL of the Packages file\n"
              << "  -c, --config FILE          YAML file listing mirrors and settings\n"
              << "  -r, --retries N            Download attempts per file (default: 3)\n"
              << "      --no-verify            Do not check downloads against size/md5sum\n"
              << "  -n, --dry-run              Show what would change, change nothing\n"
              << "  -v                         Increase verbosity (-vv, -vvv for more)\n"
              << "  -h, --help                 Show this help\n";
}

int main(int argc, char* argv[])
{
    std::optional<std::string> downloadPath;
    std::optional<std::string> packagesUrl;
    std::optional<std::string> configPath;
    std::optional<int>         retries;
    bool noVerify  = false;
    bool dryRun    = false;
    int  verbosity = 0;

    // Collect arguments; options taking a value consume the next argv entry
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool takesValue = (arg == "-d" || arg == "--download_path" ||
                           arg == "-p" || arg == "--packages_url" ||
                           arg == "-c" || arg == "--config" ||
                           arg == "-r" || arg == "--retries");

        if (takesValue && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument.\n";
            return 1;
        }

        if (arg == "-h" || arg == "--help") {
            printHelp();
            return 0;
        }
        else if (arg == "-d" || arg == "--download_path") {
            downloadPath = argv[++i];
        }
        else if (arg == "-p" || arg == "--packages_url") {
            packagesUrl = argv[++i];
        }
        else if (arg == "-c" || arg == "--config") {
            configPath = argv[++i];
        }
        else if (arg == "-r" || arg == "--retries") {
            std::uintmax_t value = 0;
            std::string text = argv[++i];
            if (!Opkgsync::parseUnsigned(text, value) || value == 0 || value > 100) {
                std::cerr << "Error: --retries expects a number between 1 and 100.\n";
                return 1;
            }
            retries = static_cast<int>(value);
        }
        else if (arg == "--no-verify") {
            noVerify = true;
        }
        else if (arg == "-n" || arg == "--dry-run") {
            dryRun = true;
        }
        else if (arg.size() >= 2 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos) {
            verbosity += static_cast<int>(arg.size() - 1);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printHelp();
            return 1;
        }
    }

    Opkgsync::Config config;
    if (configPath && !config.loadFromFile(*configPath)) {
        return 1;
    }

    // Command line values override the configuration file
    if (verbosity > 0) {
        config.verbosity = verbosity;
    }
    if (retries) {
        config.retries = *retries;
    }
    if (noVerify) {
        config.verify = false;
    }
    if (dryRun) {
        config.dryRun = true;
    }
    if (packagesUrl) {
        Opkgsync::MirrorConfig mirror;
        mirror.packagesUrl = *packagesUrl;
        if (downloadPath) {
            mirror.downloadPath = *downloadPath;
        }
        config.addMirror(mirror);
    }

    Opkgsync::setLogLevel(Opkgsync::logLevelFromVerbosity(config.verbosity));

    if (downloadPath && !packagesUrl) {
        Opkgsync::log_warning("--download_path has no effect without --packages_url");
    }

    if (config.mirrors.empty()) {
        std::cerr << "Error: no mirror given; use --packages_url or --config.\n\n";
        printHelp();
        return 1;
    }

    Opkgsync::CurlTransport transport;
    Opkgsync::Syncer syncer(transport, config.executorOptions());

    for (const auto& mirror : config.mirrors) {
        Opkgsync::log_message("Synchronizing " + mirror.packagesUrl + " -> " + mirror.downloadPath);

        Opkgsync::SyncResult result = syncer.run(mirror, config.dryRun);
        if (config.dryRun) {
            std::cout << mirror.packagesUrl << " -> " << mirror.downloadPath << ":\n";
            Opkgsync::Syncer::printPlan(result.actions, std::cout);
        }

        if (!result.status.ok()) {
            Opkgsync::log_error(std::string("Sync failed (") +
                                Opkgsync::errorKindName(result.status.kind) + "): " +
                                result.status.message);
            return 1;
        }

        Opkgsync::log_message("Done: " + std::to_string(result.fetched) + " downloaded, " +
                              std::to_string(result.deleted) + " removed");
    }

    return 0;
}
