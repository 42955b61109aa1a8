#ifndef RECONCILE_HPP
#define RECONCILE_HPP

#include "manifest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Opkgsync {

/**
 * @struct MergedEntry
 * @brief One package name with its local and remote records, either of which
 *        may be absent (never both).
 */
struct MergedEntry
{
    std::string                  name;
    std::optional<PackageRecord> local;
    std::optional<PackageRecord> remote;
};

/**
 * @class Reconciler
 * @brief Pairs up the local and remote package sets by name.
 */
class Reconciler
{
public:
    /**
     * @brief Produces one entry for every name in local ∪ remote, in name order.
     *
     * @param local  The trusted local set.
     * @param remote The set parsed from the remote manifest.
     * @return The merged entries; each name appears exactly once.
     */
    static std::vector<MergedEntry> merge(const PackageSet& local,
                                          const PackageSet& remote);

    /**
     * @brief Two records are the same package if their filenames are identical.
     *
     * Size and md5sum are deliberately not compared. Records without a
     * filename are never equivalent.
     */
    static bool equivalent(const PackageRecord& lhs, const PackageRecord& rhs);
};

} // namespace Opkgsync

#endif // RECONCILE_HPP
