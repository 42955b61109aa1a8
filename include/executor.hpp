#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include "manifest.hpp"
#include "status.hpp"
#include "transport.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace Opkgsync {

/**
 * @struct ExecutorOptions
 * @brief Reliability knobs for downloading package files.
 */
struct ExecutorOptions
{
    int  retries = 3;    // attempts per file, at least one
    bool verify  = true; // check size/md5sum of each download against the remote record
};

/**
 * @class FetchExecutor
 * @brief Applies a plan to a mirror directory: removes stale files and
 *        downloads new or changed ones, one after another.
 */
class FetchExecutor
{
public:
    /**
     * @param transport   Transport used for every download.
     * @param directory   The mirror directory.
     * @param manifestUrl URL of the remote manifest; targets are resolved against it.
     * @param options     Retry and verification settings.
     */
    FetchExecutor(Transport& transport,
                  std::string directory,
                  std::string manifestUrl,
                  ExecutorOptions options = ExecutorOptions());

    /**
     * @brief Removes each named file from the mirror directory.
     *
     * Files that are already gone count as removed.
     *
     * @param filenames Manifest-relative filenames.
     * @param removed   Incremented once per file handled.
     * @return ErrorKind::Filesystem on the first removal that fails.
     */
    Status applyDeletions(const std::vector<std::string>& filenames, std::size_t& removed);

    /**
     * @brief Downloads every target, stopping at the first one that keeps failing.
     *
     * @param filenames Manifest-relative filenames to download.
     * @param remote    Remote records, used to verify downloads by filename.
     * @param fetched   Incremented once per completed download.
     * @return The failure of the first target that exhausted its attempts.
     */
    Status fetchAll(const std::vector<std::string>& filenames,
                    const PackageSet& remote,
                    std::size_t& fetched);

    /**
     * @brief Removes one file; a missing file is not an error.
     */
    Status removeFile(const std::string& filename);

    /**
     * @brief Downloads one file with retries.
     *
     * @param filename Manifest-relative filename.
     * @param expected Remote record to verify against, or nullptr.
     */
    Status fetchFile(const std::string& filename, const PackageRecord* expected);

private:
    Status fetchOnce(const std::string& url,
                     const std::string& localPath,
                     const PackageRecord* expected);

    Status verifyDownload(const std::string& localPath,
                          const PackageRecord& expected) const;

    Transport&      transport_;
    std::string     directory_;
    std::string     manifestUrl_;
    ExecutorOptions options_;
};

} // namespace Opkgsync

#endif // EXECUTOR_HPP
