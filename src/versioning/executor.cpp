#include <revise/executor.hpp>
#include <revise/backup.hpp>
#include <revise/log.hpp>

#include <chrono>
#include <stdexcept>

namespace revise {

MigrationExecutor::MigrationExecutor(const VersionRegistry& versions,
                                     const MigrationRegistry& migrations,
                                     VersioningOptions options)
    : versions_(versions), migrations_(migrations), options_(options) {}

static std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

static std::string step_label(size_t index, const MigrationScript& step) {
    return "migration step " + std::to_string(index + 1) + " (" + step.id + ")";
}

// ---------------------------------------------------------------------------
// migrate()
// ---------------------------------------------------------------------------

Result<MigrationResult> MigrationExecutor::migrate(
    const std::string& template_id,
    const Document& doc,
    const MigrationPath& path,
    const std::optional<std::string>& backup_dir) const
{
    using clock = std::chrono::steady_clock;
    auto start = clock::now();

    MigrationResult result;

    if (options_.create_backups && backup_dir) {
        auto written = write_backup(template_id, doc, *backup_dir);
        if (written.is_err()) return std::move(written).error();
        result.backup_path = std::move(written).value();
    }

    Document current = doc;
    const size_t total = path.steps.size();

    for (size_t i = 0; i < total; ++i) {
        const auto& step = path.steps[i];
        auto step_start = clock::now();
        std::string failure;

        if (!step.migrate) {
            failure = step_label(i, step) + " has no migrate function";
        } else {
            try {
                MigrationResult out = step.migrate(current);
                if (!out.success) {
                    failure = step_label(i, step) + " failed: " + join(out.errors, ", ");
                }
                result.warnings.insert(result.warnings.end(),
                                       out.warnings.begin(), out.warnings.end());
                if (out.migrated) current = std::move(*out.migrated);
            } catch (const std::exception& e) {
                failure = step_label(i, step) + " threw error: " + e.what();
            } catch (...) {
                failure = step_label(i, step) + " threw a non-standard exception";
            }
        }

        if (!failure.empty()) {
            log::warn("%s", failure.c_str());
            if (options_.strict) {
                ReviseError err{ReviseError::Migration,
                    "Migration failed at step " + std::to_string(i + 1) + "/" +
                    std::to_string(total) + ": " + failure};
                if (result.backup_path) {
                    err.hint = "the original document was saved to " + *result.backup_path;
                }
                return err;
            }
            result.errors.push_back(std::move(failure));
            continue;
        }

        auto step_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - step_start).count();
        log::info("migration step %zu/%zu completed in %lldms",
                  i + 1, total, static_cast<long long>(step_ms));
    }

    result.success = result.errors.empty();
    result.migrated = std::move(current);
    result.execution_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock::now() - start).count();
    return Result<MigrationResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// rollback()
// ---------------------------------------------------------------------------

Result<Document> MigrationExecutor::rollback(const std::string& backup_path) const {
    auto restored = read_backup(backup_path);
    if (restored.is_err()) {
        log::warn("%s", restored.error().message.c_str());
        return restored;
    }
    log::info("restored document from %s", backup_path.c_str());
    return restored;
}

// ---------------------------------------------------------------------------
// auto_migrate()
// ---------------------------------------------------------------------------

Result<MigrationResult> MigrationExecutor::auto_migrate(
    const std::string& template_id,
    const Document& doc,
    const SemanticVersion& current,
    const std::optional<std::string>& backup_dir) const
{
    const TemplateVersion* latest = versions_.get_latest(template_id);
    if (!latest) {
        if (versions_.entry(template_id)) {
            return ReviseError{ReviseError::Migration,
                "No stable version registered for template: " + template_id,
                "allow prereleases to migrate to a prerelease version"};
        }
        return ReviseError{ReviseError::Migration,
            "No versions registered for template: " + template_id};
    }

    if (compare(current, latest->version) == Ordering::Equal) {
        MigrationResult noop;
        noop.success = true;
        noop.migrated = doc;
        noop.warnings.push_back("Template is already at the latest version");
        return Result<MigrationResult>::ok(std::move(noop));
    }

    MigrationPathfinder finder(migrations_);
    auto path = finder.find(template_id, current, latest->version);
    if (!path) {
        return ReviseError{ReviseError::Migration,
            "No migration path found from " + current.to_string() +
            " to " + latest->version.to_string()};
    }

    return migrate(template_id, doc, *path, backup_dir);
}

// ---------------------------------------------------------------------------
// validate_migration()
// ---------------------------------------------------------------------------

ValidationReport MigrationExecutor::validate_migration(const MigrationScript& script) {
    ValidationReport report;

    Ordering order = compare(script.from_version, script.to_version);
    if (order == Ordering::Equal) {
        report.errors.push_back("Migration from_version and to_version must be different");
    } else if (order == Ordering::Greater) {
        report.errors.push_back(
            "Migration to_version must be greater than from_version (no downgrades)");
    }

    if (!script.migrate) {
        report.errors.push_back("Migration must have a migrate function");
    }

    if (script.reversible && !script.rollback) {
        report.errors.push_back("Reversible migrations must have a rollback function");
    }

    return report;
}

} // namespace revise
