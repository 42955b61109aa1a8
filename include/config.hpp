#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "executor.hpp"

#include <string>
#include <vector>

namespace Opkgsync {

/**
 * @struct MirrorConfig
 * @brief One remote feed and the local directory it is mirrored into.
 */
struct MirrorConfig
{
    std::string packagesUrl;
    std::string downloadPath = ".";
};

class Config
{
public:
    /**
     * @brief The mirrors to synchronize, in order.
     */
    std::vector<MirrorConfig> mirrors;

    int  verbosity = 0;
    int  retries   = 3;
    bool verify    = true;
    bool dryRun    = false;

    /**
     * @brief Merges settings from a YAML configuration file into this instance.
     *
     * Recognized keys: verbosity, retries, verify, dry_run and a "mirrors"
     * sequence of {packages_url, download_path} maps.
     *
     * @param path Path to the configuration file.
     * @return False if the file is missing, unreadable or not valid YAML.
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Adds a mirror unless one with the same URL and directory exists.
     * @param mirror The mirror to add.
     * @return True if the mirror was added.
     */
    bool addMirror(const MirrorConfig& mirror);

    /**
     * @brief Retry/verify settings for the fetch executor.
     */
    ExecutorOptions executorOptions() const;
};

} // namespace Opkgsync

#endif // CONFIG_HPP
