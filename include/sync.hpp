#ifndef SYNC_HPP
#define SYNC_HPP

#include "config.hpp"
#include "executor.hpp"
#include "planner.hpp"
#include "status.hpp"
#include "transport.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace Opkgsync {

/**
 * @struct SyncResult
 * @brief Outcome of synchronizing one mirror.
 */
struct SyncResult
{
    Status      status;
    ActionList  actions;        // what was planned
    std::size_t deleted   = 0;  // files removed
    std::size_t fetched   = 0;  // files downloaded
    bool        committed = false; // new manifest written
};

/**
 * @class Syncer
 * @brief Runs the full reconciliation for a mirror: fetch the remote manifest,
 *        validate local state, plan, apply, then commit the new manifest.
 */
class Syncer
{
public:
    /**
     * @param transport Transport for the manifest and every package file.
     * @param options   Retry and verification settings for package downloads.
     */
    explicit Syncer(Transport& transport, ExecutorOptions options = ExecutorOptions());

    /**
     * @brief Synchronizes one mirror.
     *
     * The remote manifest is written to <download_path>/Packages, byte for
     * byte, only after every deletion and download succeeded. On any failure
     * the previous local manifest is left untouched.
     *
     * @param mirror The feed URL and target directory.
     * @param dryRun If true, only plan and print; nothing on disk changes.
     * @return The status plus what was planned and done.
     */
    SyncResult run(const MirrorConfig& mirror, bool dryRun = false);

    /**
     * @brief Prints a plan as "delete <file>" / "fetch <file>" lines.
     */
    static void printPlan(const ActionList& actions, std::ostream& out);

private:
    Status fetchManifest(const std::string& url, std::string& bytes);

    static Status commitManifest(const std::string& directory, const std::string& bytes);

    Transport&      transport_;
    ExecutorOptions options_;
};

} // namespace Opkgsync

#endif // SYNC_HPP
