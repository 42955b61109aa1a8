#include "sync.hpp"
#include "local_state.hpp"
#include "manifest.hpp"
#include "reconcile.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Opkgsync {

Syncer::Syncer(Transport& transport, ExecutorOptions options)
    : transport_(transport),
      options_(options)
{
}

Status Syncer::fetchManifest(const std::string& url, std::string& bytes)
{
    log_message("Fetching '" + std::string(manifestFileName) + "' from " + url + " ...");

    std::ostringstream buffer;
    Status status = transport_.fetch(url, buffer);
    if (!status.ok()) {
        return status;
    }
    bytes = buffer.str();
    log_debug("Received " + std::to_string(bytes.size()) + " manifest bytes");
    return Status::success();
}

Status Syncer::commitManifest(const std::string& directory, const std::string& bytes)
{
    log_message("Writing local '" + std::string(manifestFileName) + "' file ...");

    fs::path target  = fs::path(directory) / manifestFileName;
    fs::path staging = fs::path(directory) / (std::string(manifestFileName) + ".new");

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Status::failure(ErrorKind::Filesystem,
                                   "Unable to open " + staging.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (out.fail()) {
            std::error_code ec;
            fs::remove(staging, ec);
            return Status::failure(ErrorKind::Filesystem, "Failed to write " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return Status::failure(ErrorKind::Filesystem,
                               "Failed to replace " + target.string() + ": " + ec.message());
    }
    return Status::success();
}

void Syncer::printPlan(const ActionList& actions, std::ostream& out)
{
    for (const auto& filename : actions.deletions) {
        out << "delete " << filename << "\n";
    }
    for (const auto& filename : actions.fetches) {
        out << "fetch  " << filename << "\n";
    }
    if (actions.empty()) {
        out << "Mirror is up to date.\n";
    }
}

SyncResult Syncer::run(const MirrorConfig& mirror, bool dryRun)
{
    SyncResult result;
    const std::string& directory = mirror.downloadPath;

    std::string manifestBytes;
    result.status = fetchManifest(mirror.packagesUrl, manifestBytes);
    if (!result.status.ok()) {
        return result;
    }

    log_message("Extracting package information from remote manifest ...");
    const PackageSet remote = Manifest::parseString(manifestBytes);
    const PackageSet local  = LocalState::load(directory);

    result.actions = Planner::plan(Reconciler::merge(local, remote));

    if (dryRun) {
        log_message("Dry run, leaving " + directory + " untouched");
        return result;
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        result.status = Status::failure(ErrorKind::Filesystem,
                                        "Cannot create download directory " + directory +
                                        ": " + ec.message());
        return result;
    }

    FetchExecutor executor(transport_, directory, mirror.packagesUrl, options_);

    // Deletions and downloads are independent; both run before deciding
    Status deleteStatus = executor.applyDeletions(result.actions.deletions, result.deleted);
    if (!deleteStatus.ok()) {
        log_error(deleteStatus.message);
    }
    Status fetchStatus = executor.fetchAll(result.actions.fetches, remote, result.fetched);

    if (!deleteStatus.ok()) {
        result.status = deleteStatus;
    } else if (!fetchStatus.ok()) {
        result.status = fetchStatus;
    }
    if (!result.status.ok()) {
        log_warning("Keeping previous local manifest after failed run");
        return result;
    }

    result.status    = commitManifest(directory, manifestBytes);
    result.committed = result.status.ok();

    return result;
}

} // namespace Opkgsync
