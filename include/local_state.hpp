#ifndef LOCAL_STATE_HPP
#define LOCAL_STATE_HPP

#include "manifest.hpp"

#include <string>

namespace Opkgsync {

/**
 * @class LocalState
 * @brief Loads the manifest cached in a mirror directory and keeps only the
 *        records whose files on disk corroborate them.
 */
class LocalState
{
public:
    /**
     * @brief Reads <directory>/Packages and validates every record against its file.
     *
     * A missing or unreadable manifest yields an empty set (a fresh mirror).
     * Records whose file is missing, or whose size or md5sum disagree with the
     * file, are left out. Missing size/md5sum fields are filled in from the file.
     *
     * @param directory The mirror directory.
     * @return The trusted local package set.
     */
    static PackageSet load(const std::string& directory);

    /**
     * @brief Checks one record against the file it names, backfilling size and md5sum.
     *
     * @param directory The mirror directory.
     * @param record    The record to check; may be updated in place.
     * @param reason    Receives a short explanation when the record is rejected.
     * @return True if the record is trustworthy.
     */
    static bool corroborate(const std::string& directory,
                            PackageRecord& record,
                            std::string& reason);
};

} // namespace Opkgsync

#endif // LOCAL_STATE_HPP
