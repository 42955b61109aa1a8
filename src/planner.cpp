#include "planner.hpp"
#include "utils.hpp"

#include <set>

namespace Opkgsync {

namespace {

// Remote records that cannot be fetched safely take no part in the plan.
const PackageRecord* usableRemote(const MergedEntry& entry)
{
    if (!entry.remote) {
        return nullptr;
    }
    if (!entry.remote->isValid()) {
        log_warning("Ignoring remote package '" + entry.name + "' without a filename");
        return nullptr;
    }
    std::string resolved;
    if (!resolveUnder(".", entry.remote->filename, resolved)) {
        log_warning("Ignoring remote package '" + entry.name + "' with unsafe filename '" +
                    entry.remote->filename + "'");
        return nullptr;
    }
    return &*entry.remote;
}

} // anonymous namespace

ActionList Planner::plan(const std::vector<MergedEntry>& merged)
{
    log_message("Processing " + std::to_string(merged.size()) + " packages ...");

    std::vector<const PackageRecord*> remotes;
    std::set<std::string> referenced;
    remotes.reserve(merged.size());
    for (const auto& entry : merged) {
        const PackageRecord* remote = usableRemote(entry);
        remotes.push_back(remote);
        if (remote) {
            referenced.insert(remote->filename);
        }
    }

    ActionList actions;
    std::size_t unchanged = 0;

    for (std::size_t i = 0; i < merged.size(); ++i) {
        const MergedEntry& entry = merged[i];
        const PackageRecord* remote = remotes[i];

        if (!entry.local && !remote) {
            continue;
        }

        if (!remote) {
            log_debug("Package '" + entry.name + "' was removed upstream");
            if (referenced.count(entry.local->filename)) {
                log_debug("Keeping " + entry.local->filename + ", still listed upstream");
                continue;
            }
            actions.deletions.push_back(entry.local->filename);
        } else if (!entry.local) {
            log_debug("Package '" + entry.name + "' is new");
            actions.fetches.push_back(remote->filename);
        } else if (!Reconciler::equivalent(*entry.local, *remote)) {
            log_debug("Package '" + entry.name + "' changed: " +
                      entry.local->filename + " -> " + remote->filename);
            actions.fetches.push_back(remote->filename);
        } else {
            ++unchanged;
        }
    }

    log_message("Planned " + std::to_string(actions.deletions.size()) + " deletion(s), " +
                std::to_string(actions.fetches.size()) + " download(s), " +
                std::to_string(unchanged) + " unchanged");
    return actions;
}

} // namespace Opkgsync
