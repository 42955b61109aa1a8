#include "reconcile.hpp"
#include "utils.hpp"

#include <utility>

namespace Opkgsync {

std::vector<MergedEntry> Reconciler::merge(const PackageSet& local,
                                           const PackageSet& remote)
{
    log_message("Merging package lists ...");

    std::vector<MergedEntry> merged;
    merged.reserve(local.size() + remote.size());

    // Both sets are ordered by name, so walk them side by side
    auto localIt  = local.begin();
    auto remoteIt = remote.begin();
    while (localIt != local.end() || remoteIt != remote.end()) {
        MergedEntry entry;
        if (remoteIt == remote.end() ||
            (localIt != local.end() && localIt->first < remoteIt->first)) {
            entry.name  = localIt->first;
            entry.local = localIt->second;
            ++localIt;
        } else if (localIt == local.end() || remoteIt->first < localIt->first) {
            entry.name   = remoteIt->first;
            entry.remote = remoteIt->second;
            ++remoteIt;
        } else {
            entry.name   = localIt->first;
            entry.local  = localIt->second;
            entry.remote = remoteIt->second;
            ++localIt;
            ++remoteIt;
        }
        merged.push_back(std::move(entry));
    }

    return merged;
}

bool Reconciler::equivalent(const PackageRecord& lhs, const PackageRecord& rhs)
{
    if (lhs.filename.empty() || rhs.filename.empty()) {
        return false;
    }
    return lhs.filename == rhs.filename;
}

} // namespace Opkgsync
