#include <revise/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace revise {

// Reads an optional boolean key, rejecting values of any other type
static Result<std::optional<bool>> read_bool(const toml::table& tbl,
                                              const char* section,
                                              const char* key) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::optional<bool>>::ok(std::nullopt);
    if (auto b = node->value<bool>()) {
        return Result<std::optional<bool>>::ok(*b);
    }
    return ReviseError{ReviseError::Config,
        std::string("[") + section + "] " + key + " must be a boolean"};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ReviseError{ReviseError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [versioning] section
    if (auto ver = doc["versioning"].as_table()) {
        auto pre = read_bool(*ver, "versioning", "allow-prerelease");
        if (pre.is_err()) return std::move(pre).error();
        if (pre.value()) {
            cfg.versioning.allow_prerelease = *pre.value();
            cfg.allow_prerelease_set = true;
        }

        auto strict = read_bool(*ver, "versioning", "strict");
        if (strict.is_err()) return std::move(strict).error();
        if (strict.value()) {
            cfg.versioning.strict = *strict.value();
            cfg.strict_set = true;
        }

        auto backups = read_bool(*ver, "versioning", "create-backups");
        if (backups.is_err()) return std::move(backups).error();
        if (backups.value()) {
            cfg.versioning.create_backups = *backups.value();
            cfg.create_backups_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* node = lg->get("level")) {
            auto name = node->value<std::string>();
            if (!name) {
                return ReviseError{ReviseError::Config,
                    "[log] level must be a string"};
            }
            auto lvl = log::parse_level(*name);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }

        auto color = read_bool(*lg, "log", "color");
        if (color.is_err()) return std::move(color).error();
        if (color.value()) {
            cfg.log_color = *color.value();
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ReviseError{ReviseError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.allow_prerelease_set) {
        versioning.allow_prerelease = other.versioning.allow_prerelease;
        allow_prerelease_set = true;
    }
    if (other.strict_set) {
        versioning.strict = other.versioning.strict;
        strict_set = true;
    }
    if (other.create_backups_set) {
        versioning.create_backups = other.versioning.create_backups;
        create_backups_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.revise/config.toml";
}

} // namespace revise
