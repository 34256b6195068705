#pragma once

#include <revise/result.hpp>
#include <revise/version.hpp>
#include <revise/config.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace revise {

struct Deprecation {
    std::string message;
    std::string replaced_by;     // suggested replacement version, may be empty
};

// One registered version of one template
struct TemplateVersion {
    std::string template_id;
    SemanticVersion version;
    std::string changelog;
    std::optional<VersionRange> compatible_with;
    std::map<std::string, VersionRange> dependencies;   // template id -> range
    std::map<std::string, std::string> migration_from;  // version -> migration id
    std::string release_date;                           // ISO-8601
    std::optional<Deprecation> deprecated;
};

struct VersionRegistryEntry {
    std::string template_id;
    std::vector<TemplateVersion> versions;   // sorted newest first
    SemanticVersion latest;
    std::optional<SemanticVersion> latest_stable;  // unset until a release is registered
};

struct UpgradeSuggestion {
    std::string from;
    std::string to;
    bool migration_required = false;
};

struct CompatibilityCheck {
    bool compatible = true;
    std::string reason;
    std::optional<UpgradeSuggestion> suggested_upgrade;
};

struct ValidationReport {
    std::vector<std::string> errors;
    bool valid() const { return errors.empty(); }
};

class VersionRegistry {
public:
    explicit VersionRegistry(VersioningOptions options = {});

    // Append a version; the entry is re-sorted and latest/latest_stable updated.
    // Registering the same version twice keeps both entries.
    void register_version(TemplateVersion tv);

    // First registered entry comparing equal to version (nullptr if none)
    const TemplateVersion* get(const std::string& template_id,
                               const SemanticVersion& version) const;

    // Latest release, or latest including prereleases when requested or
    // when the options allow them
    const TemplateVersion* get_latest(const std::string& template_id,
                                      bool include_prerelease = false) const;

    const VersionRegistryEntry* entry(const std::string& template_id) const;
    std::vector<std::string> ids() const;

    Result<CompatibilityCheck> check_compatibility(const TemplateVersion& a,
                                                   const TemplateVersion& b) const;

    ValidationReport validate_version(const TemplateVersion& tv) const;

    void clear();

    const VersioningOptions& options() const { return options_; }

private:
    VersioningOptions options_;
    std::unordered_map<std::string, VersionRegistryEntry> entries_;
};

// YYYY-MM-DD with an optional THH:MM[:SS[.fff]] time and Z or +HH:MM offset
bool is_iso8601_date(const std::string& s);

} // namespace revise
