#pragma once

#include <revise/result.hpp>
#include <revise/log.hpp>
#include <string>
#include <optional>

namespace revise {

struct VersioningOptions {
    bool allow_prerelease = false;  // resolution and latest lookups may pick prereleases
    bool strict = true;             // first failing migration step aborts the run
    bool create_backups = true;     // snapshot the document before migrating
};

// Layered configuration: global > project
// Lower layers override higher layers, but only for keys they actually set.
struct Config {
    VersioningOptions versioning;
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool allow_prerelease_set = false;
    bool strict_set = false;
    bool create_backups_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Push [log] settings into the process-wide logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.revise/config.toml
std::string global_config_path();

} // namespace revise
