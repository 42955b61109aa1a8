#ifndef PLANNER_HPP
#define PLANNER_HPP

#include "reconcile.hpp"

#include <string>
#include <vector>

namespace Opkgsync {

/**
 * @struct ActionList
 * @brief Filesystem changes needed to bring a mirror in line with the remote.
 *
 * The two lists are independent: deletions never wait for fetches and
 * vice versa.
 */
struct ActionList
{
    std::vector<std::string> deletions; // local filenames to remove
    std::vector<std::string> fetches;   // remote filenames to download

    bool empty() const { return deletions.empty() && fetches.empty(); }
};

/**
 * @class Planner
 * @brief Classifies merged entries into delete/fetch actions.
 */
class Planner
{
public:
    /**
     * @brief Builds the action list for a merged view.
     *
     * - local only: delete the local file
     * - remote only: fetch the remote file
     * - both, not equivalent: fetch the remote file
     * - both, equivalent: nothing
     *
     * A remote record without a filename, or whose filename would leave the
     * mirror directory, is treated as absent. A local file is never deleted
     * while another remote record still lists it.
     *
     * @param merged Output of Reconciler::merge().
     * @return The deletions and fetch targets, in entry order.
     */
    static ActionList plan(const std::vector<MergedEntry>& merged);
};

} // namespace Opkgsync

#endif // PLANNER_HPP
