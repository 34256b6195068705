#pragma once

#include <revise/result.hpp>
#include <revise/config.hpp>
#include <revise/migration.hpp>
#include <revise/registry.hpp>

#include <optional>
#include <string>

namespace revise {

class MigrationExecutor {
public:
    MigrationExecutor(const VersionRegistry& versions,
                      const MigrationRegistry& migrations,
                      VersioningOptions options = {});

    // Applies path.steps in order, each step seeing the previous step's
    // output. With backups enabled and a backup_dir given, the input document
    // is written to disk first.
    //
    // Strict mode: the first failing step ends the run with a
    // ReviseError::Migration naming the step. Lenient mode: failures are
    // collected and the run continues; the result reports success == false.
    // Backup I/O failures are returned as errors in both modes.
    Result<MigrationResult> migrate(const std::string& template_id,
                                    const Document& doc,
                                    const MigrationPath& path,
                                    const std::optional<std::string>& backup_dir = {}) const;

    // Restores a snapshot written by migrate(). Per-step rollback functions
    // are not consulted.
    Result<Document> rollback(const std::string& backup_path) const;

    // Migrates from current to the latest registered version, or returns
    // the document untouched with a warning when it is already there.
    Result<MigrationResult> auto_migrate(const std::string& template_id,
                                         const Document& doc,
                                         const SemanticVersion& current,
                                         const std::optional<std::string>& backup_dir = {}) const;

    static ValidationReport validate_migration(const MigrationScript& script);

    const VersioningOptions& options() const { return options_; }

private:
    const VersionRegistry& versions_;
    const MigrationRegistry& migrations_;
    VersioningOptions options_;
};

} // namespace revise
