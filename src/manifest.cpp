#include "manifest.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>

namespace Opkgsync {

namespace {

const char* const keySeparator = ": ";

} // anonymous namespace

bool Manifest::isRecognizedKey(const std::string& key)
{
    return key == "package" || key == "filename" ||
           key == "size"    || key == "md5sum";
}

void Manifest::assignField(PackageRecord& record,
                           const std::string& key,
                           const std::string& value)
{
    if (key == "package") {
        record.name = value;
    } else if (key == "filename") {
        record.filename = value;
    } else if (key == "size") {
        std::uintmax_t size = 0;
        if (parseUnsigned(value, size)) {
            record.size = size;
        } else {
            // An unusable size counts as absent
            log_debug("Ignoring invalid size '" + value + "'");
            record.size.reset();
        }
    } else if (key == "md5sum") {
        record.md5sum = value;
    }
}

PackageSet Manifest::parse(std::istream& stream)
{
    PackageSet packages;
    std::optional<PackageRecord> current;
    std::size_t skippedLines = 0;

    std::string line;
    while (std::getline(stream, line)) {
        trim(line);

        // all information should be plain ASCII
        if (!isAscii(line)) {
            ++skippedLines;
            continue;
        }

        if (line.empty()) {
            if (!current) {
                continue;
            }
            if (!current->name.empty()) {
                packages[current->name] = *current;
            }
            current.reset();
            continue;
        }

        std::string key;
        std::string value;
        std::size_t sepPos = line.find(keySeparator);
        if (sepPos == std::string::npos) {
            key = line;
        } else {
            key   = line.substr(0, sepPos);
            value = line.substr(sepPos + 2);
        }
        trim(key);
        key = toLower(key);
        trim(value);

        if (value.empty() || !isRecognizedKey(key)) {
            continue;
        }

        if (!current) {
            current = PackageRecord();
        }
        assignField(*current, key, value);
    }

    if (current) {
        log_debug("Dropping unterminated trailing stanza" +
                  (current->name.empty() ? std::string() : " '" + current->name + "'"));
    }
    if (skippedLines > 0) {
        log_debug("Skipped " + std::to_string(skippedLines) + " non-ASCII line(s)");
    }

    return packages;
}

PackageSet Manifest::parseString(const std::string& text)
{
    std::istringstream stream(text);
    return parse(stream);
}

PackageSet Manifest::parseFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        log_debug("Unable to open manifest: " + path);
        return PackageSet();
    }
    return parse(file);
}

} // namespace Opkgsync
