#include "local_state.hpp"
#include "checksum.hpp"
#include "utils.hpp"

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Opkgsync {

bool LocalState::corroborate(const std::string& directory,
                             PackageRecord& record,
                             std::string& reason)
{
    if (!record.isValid()) {
        reason = "record has no filename";
        return false;
    }

    std::string filePath;
    if (!resolveUnder(directory, record.filename, filePath)) {
        reason = "filename points outside the mirror directory";
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        reason = "file is missing";
        return false;
    }

    std::uintmax_t fileSize = fs::file_size(filePath, ec);
    if (ec) {
        reason = "cannot stat file: " + ec.message();
        return false;
    }
    if (!record.size) {
        record.size = fileSize;
    } else if (*record.size != fileSize) {
        reason = "size mismatch (recorded " + std::to_string(*record.size) +
                 ", actual " + std::to_string(fileSize) + ")";
        return false;
    }

    std::string fileMd5;
    if (!Checksum::md5File(filePath, fileMd5)) {
        reason = "cannot hash file";
        return false;
    }
    if (!record.md5sum) {
        record.md5sum = fileMd5;
    } else if (!Checksum::digestsEqual(*record.md5sum, fileMd5)) {
        reason = "md5sum mismatch";
        return false;
    }

    return true;
}

PackageSet LocalState::load(const std::string& directory)
{
    log_message("Preparing local package information ...");

    fs::path manifestPath = fs::path(directory) / manifestFileName;
    std::error_code ec;
    if (!fs::is_regular_file(manifestPath, ec) ||
        access(manifestPath.c_str(), R_OK) != 0) {
        log_message("No readable local manifest at " + manifestPath.string() +
                    ", starting from an empty mirror");
        return PackageSet();
    }

    // Snapshot first, then build the trusted set as a new container
    const PackageSet parsed = Manifest::parseFile(manifestPath.string());

    PackageSet trusted;
    for (const auto& [name, parsedRecord] : parsed) {
        PackageRecord record = parsedRecord;
        std::string reason;
        if (!corroborate(directory, record, reason)) {
            log_debug("Discarding local record '" + name + "': " + reason);
            continue;
        }
        trusted.emplace(name, record);
    }

    log_message("Trusted " + std::to_string(trusted.size()) + " of " +
                std::to_string(parsed.size()) + " local package(s)");
    return trusted;
}

} // namespace Opkgsync
