#include "config.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Opkgsync {

    bool Config::loadFromFile(const std::string& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            log_error("Configuration file not found: " + path);
            return false;
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            log_error("Unable to parse configuration file " + path + ": " + e.what());
            return false;
        }

        if (!root.IsDefined() || root.IsNull()) {
            // An empty file is a valid, empty configuration
            return true;
        }
        if (!root.IsMap()) {
            log_error("Configuration file " + path + " must contain a mapping");
            return false;
        }

        try {
            if (root["verbosity"]) {
                verbosity = root["verbosity"].as<int>();
            }
            if (root["retries"]) {
                retries = std::max(1, root["retries"].as<int>());
            }
            if (root["verify"]) {
                verify = root["verify"].as<bool>();
            }
            if (root["dry_run"]) {
                dryRun = root["dry_run"].as<bool>();
            }

            const YAML::Node mirrorNodes = root["mirrors"];
            if (mirrorNodes && !mirrorNodes.IsSequence()) {
                log_error("'mirrors' in " + path + " must be a sequence");
                return false;
            }
            if (mirrorNodes) {
                for (const auto& node : mirrorNodes) {
                    if (!node.IsMap() || !node["packages_url"]) {
                        log_warning("Skipping mirror entry without packages_url in " + path);
                        continue;
                    }
                    MirrorConfig mirror;
                    mirror.packagesUrl = node["packages_url"].as<std::string>();
                    if (node["download_path"]) {
                        mirror.downloadPath = node["download_path"].as<std::string>();
                    }
                    addMirror(mirror);
                }
            }
        } catch (const YAML::Exception& e) {
            log_error("Invalid value in configuration file " + path + ": " + e.what());
            return false;
        }

        return true;
    }

    bool Config::addMirror(const MirrorConfig& mirror) {
        // Ensures that the mirror does not already exist
        auto it = std::find_if(mirrors.begin(), mirrors.end(), [&](const MirrorConfig& m) {
            return m.packagesUrl == mirror.packagesUrl && m.downloadPath == mirror.downloadPath;
        });
        if (it != mirrors.end()) {
            log_warning("Mirror already configured: " + mirror.packagesUrl +
                        " -> " + mirror.downloadPath);
            return false;
        }

        mirrors.push_back(mirror);
        return true;
    }

    ExecutorOptions Config::executorOptions() const {
        ExecutorOptions options;
        options.retries = std::max(1, retries);
        options.verify  = verify;
        return options;
    }
}
