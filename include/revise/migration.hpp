#pragma once

#include <revise/document.hpp>
#include <revise/version.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace revise {

// Outcome of one migration step, or of a whole migration run
struct MigrationResult {
    bool success = false;
    std::optional<Document> migrated;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::int64_t execution_ms = 0;
    std::optional<std::string> backup_path;
};

using MigrateFn = std::function<MigrationResult(const Document&)>;
using RollbackFn = std::function<Document(const Document&)>;
using TransformFn = std::function<Document(const Document&)>;

// One edge of the upgrade chain: from_version -> to_version
struct MigrationScript {
    std::string id;
    SemanticVersion from_version;
    SemanticVersion to_version;
    std::string description;
    MigrateFn migrate;
    RollbackFn rollback;                       // required when reversible
    std::optional<double> estimated_duration;  // seconds
    bool reversible = false;
};

struct MigrationPath {
    SemanticVersion from;
    SemanticVersion to;
    std::vector<MigrationScript> steps;
    bool reversible = true;
    double total_duration = 0.0;
};

struct MigrationStatistics {
    size_t total_migrations = 0;
    size_t reversible_count = 0;
    double average_duration = 0.0;
    std::vector<std::pair<std::string, std::string>> version_coverage;  // from, to
};

// Wraps a plain transform into a step. An exception from the transform
// becomes a failed outcome carrying its message.
MigrationScript make_migration(std::string id,
                               SemanticVersion from,
                               SemanticVersion to,
                               std::string description,
                               TransformFn transform,
                               RollbackFn rollback = {},
                               std::optional<double> estimated_duration = {});

class MigrationRegistry {
public:
    // Kept sorted by from_version; equal sources stay in registration order
    void add(const std::string& template_id, MigrationScript script);

    const std::vector<MigrationScript>& migrations(const std::string& template_id) const;
    bool has(const std::string& template_id) const;

    MigrationStatistics statistics(const std::string& template_id) const;

    void clear();

private:
    std::unordered_map<std::string, std::vector<MigrationScript>> scripts_;
};

// Walks the upgrade chain forward from a version. Each version has at most
// one usable outgoing step: the first one registered for it.
class MigrationPathfinder {
public:
    explicit MigrationPathfinder(const MigrationRegistry& registry);

    // nullopt for an unknown template, a missing link, a cycle, or a chain
    // that jumps past the target
    std::optional<MigrationPath> find(const std::string& template_id,
                                      const SemanticVersion& from,
                                      const SemanticVersion& to) const;

    bool can_migrate(const std::string& template_id,
                     const SemanticVersion& from,
                     const SemanticVersion& to) const;

private:
    const MigrationRegistry& registry_;
};

} // namespace revise
