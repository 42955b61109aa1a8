#include "executor.hpp"
#include "checksum.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace Opkgsync {

FetchExecutor::FetchExecutor(Transport& transport,
                             std::string directory,
                             std::string manifestUrl,
                             ExecutorOptions options)
    : transport_(transport),
      directory_(std::move(directory)),
      manifestUrl_(std::move(manifestUrl)),
      options_(options)
{
    if (options_.retries < 1) {
        options_.retries = 1;
    }
}

Status FetchExecutor::removeFile(const std::string& filename)
{
    std::string localPath;
    if (!resolveUnder(directory_, filename, localPath)) {
        return Status::failure(ErrorKind::Filesystem,
                               "Refusing to remove '" + filename + "' outside " + directory_);
    }

    std::error_code ec;
    bool existed = fs::remove(localPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Status::failure(ErrorKind::Filesystem,
                               "Failed to remove " + localPath + ": " + ec.message());
    }

    log_debug(existed ? "Removed " + localPath : "Already absent: " + localPath);
    return Status::success();
}

Status FetchExecutor::applyDeletions(const std::vector<std::string>& filenames,
                                     std::size_t& removed)
{
    if (!filenames.empty()) {
        log_message("Removing " + std::to_string(filenames.size()) + " file(s) ...");
    }

    for (const auto& filename : filenames) {
        Status status = removeFile(filename);
        if (!status.ok()) {
            return status;
        }
        ++removed;
    }
    return Status::success();
}

Status FetchExecutor::verifyDownload(const std::string& localPath,
                                     const PackageRecord& expected) const
{
    if (expected.size) {
        std::error_code ec;
        std::uintmax_t actual = fs::file_size(localPath, ec);
        if (ec) {
            return Status::failure(ErrorKind::Filesystem,
                                   "Cannot stat " + localPath + ": " + ec.message());
        }
        if (actual != *expected.size) {
            return Status::failure(ErrorKind::Integrity,
                                   "Size mismatch for " + expected.filename + ": expected " +
                                   std::to_string(*expected.size) + ", got " +
                                   std::to_string(actual));
        }
    }

    if (expected.md5sum) {
        std::string actual;
        if (!Checksum::md5File(localPath, actual)) {
            return Status::failure(ErrorKind::Filesystem, "Cannot hash " + localPath);
        }
        if (!Checksum::digestsEqual(*expected.md5sum, actual)) {
            return Status::failure(ErrorKind::Integrity,
                                   "md5sum mismatch for " + expected.filename);
        }
    }

    return Status::success();
}

Status FetchExecutor::fetchOnce(const std::string& url,
                                const std::string& localPath,
                                const PackageRecord* expected)
{
    Status status;
    {
        std::ofstream outFile(localPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            return Status::failure(ErrorKind::Filesystem,
                                   "Failed to open file for writing: " + localPath);
        }

        status = transport_.fetch(url, outFile);
        outFile.close();
        if (status.ok() && outFile.fail()) {
            status = Status::failure(ErrorKind::Filesystem, "Failed to write " + localPath);
        }
    }

    if (status.ok() && options_.verify && expected != nullptr) {
        status = verifyDownload(localPath, *expected);
    }

    if (!status.ok()) {
        std::error_code ec;
        fs::remove(localPath, ec); // remove partial file
    }
    return status;
}

Status FetchExecutor::fetchFile(const std::string& filename, const PackageRecord* expected)
{
    std::string localPath;
    if (!resolveUnder(directory_, filename, localPath)) {
        return Status::failure(ErrorKind::Filesystem,
                               "Refusing to write '" + filename + "' outside " + directory_);
    }

    fs::path parentDir = fs::path(localPath).parent_path();
    if (!parentDir.empty()) {
        std::error_code ec;
        fs::create_directories(parentDir, ec);
        if (ec) {
            return Status::failure(ErrorKind::Filesystem,
                                   "Error creating directory " + parentDir.string() +
                                   ": " + ec.message());
        }
    }

    const std::string url = resolveUrl(manifestUrl_, filename);

    Status status;
    for (int attempt = 1; attempt <= options_.retries; ++attempt) {
        status = fetchOnce(url, localPath, expected);
        if (status.ok() || status.kind == ErrorKind::Filesystem) {
            return status;
        }
        log_warning("Attempt " + std::to_string(attempt) + " of " +
                    std::to_string(options_.retries) + " for " + url +
                    " failed: " + status.message);
    }
    return status;
}

Status FetchExecutor::fetchAll(const std::vector<std::string>& filenames,
                               const PackageSet& remote,
                               std::size_t& fetched)
{
    const std::size_t fileCount = filenames.size();
    log_message("Downloading " + std::to_string(fileCount) + " files ...");

    std::map<std::string, const PackageRecord*> byFilename;
    for (const auto& [name, record] : remote) {
        byFilename[record.filename] = &record;
    }

    std::size_t index = 0;
    for (const auto& filename : filenames) {
        ++index;
        log_debug("Downloading file (" + std::to_string(index) + " of " +
                  std::to_string(fileCount) + ") '" + filename + "' ...");

        auto it = byFilename.find(filename);
        const PackageRecord* expected = (it == byFilename.end()) ? nullptr : it->second;

        Status status = fetchFile(filename, expected);
        if (!status.ok()) {
            return status;
        }
        ++fetched;
    }
    return Status::success();
}

} // namespace Opkgsync
