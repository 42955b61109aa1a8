#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace Opkgsync {

/**
 * @brief Name of the manifest file, both remotely and inside a mirror directory.
 */
const char* const manifestFileName = "Packages";

/**
 * @struct PackageRecord
 * @brief The recognized fields of one manifest stanza.
 *
 * size and md5sum are optional at parse time; the local state validator may
 * backfill them from the file on disk.
 */
struct PackageRecord
{
    std::string                   name;
    std::string                   filename;
    std::optional<std::uintmax_t> size;
    std::optional<std::string>    md5sum;

    /**
     * @brief A record can take part in matching only if it has a name and a filename.
     */
    bool isValid() const { return !name.empty() && !filename.empty(); }
};

/**
 * @brief Package name -> record. Ordered so that plans and logs are deterministic.
 */
using PackageSet = std::map<std::string, PackageRecord>;

/**
 * @class Manifest
 * @brief Parser for the "Packages" stanza format.
 *
 * Stanzas are blocks of "key: value" lines separated by blank lines. Only the
 * keys package, filename, size and md5sum are kept. Parsing never fails:
 * malformed input just produces fewer records.
 */
class Manifest
{
public:
    /**
     * @brief Parses a manifest from a byte stream.
     *
     * Lines containing non-ASCII bytes are skipped. A stanza is committed only
     * when a blank line terminates it; a trailing stanza without one is dropped.
     *
     * @param stream The stream to read until EOF.
     * @return All committed stanzas keyed by package name (last one wins).
     */
    static PackageSet parse(std::istream& stream);

    /**
     * @brief Convenience overload for manifest text already held in memory.
     */
    static PackageSet parseString(const std::string& text);

    /**
     * @brief Parses the manifest stored at the given path.
     *
     * @param path Path of a manifest file.
     * @return The parsed set, or an empty set if the file cannot be opened.
     */
    static PackageSet parseFile(const std::string& path);

private:
    /**
     * @brief True for the keys retained in a PackageRecord.
     */
    static bool isRecognizedKey(const std::string& key);

    /**
     * @brief Stores one recognized key/value pair into the record.
     */
    static void assignField(PackageRecord& record,
                            const std::string& key,
                            const std::string& value);
};

} // namespace Opkgsync

#endif // MANIFEST_HPP
