// demo_migrate.cpp
//
// Walks one template through the whole versioning pipeline: register
// versions (from a catalog file if given), resolve constraints, migrate a
// document with a backup, then restore the backup.  Run it with:
//
//     ./demo_migrate                              # built-in versions
//     ./demo_migrate catalog.toml                 # versions from a catalog
//     ./demo_migrate catalog.toml config.toml     # plus a config layer
//
// Backups land in ./revise-demo-backups.  Watch stderr for log output.

#include <revise/catalog.hpp>
#include <revise/config.hpp>
#include <revise/executor.hpp>
#include <revise/log.hpp>
#include <revise/resolver.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace revise;

// ---------------------------------------------------------------------------
// Setup
// ---------------------------------------------------------------------------

static Result<Config> load_config(int argc, char** argv) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty()) {
        auto g = Config::load(global_path);
        if (g.is_ok()) global = std::move(g).value();
    }

    std::optional<Config> project;
    if (argc >= 3) {
        auto p = Config::load(argv[2]);
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

static Status register_versions(VersionRegistry& registry, int argc, char** argv) {
    if (argc >= 2) {
        auto catalog = Catalog::load(argv[1]);
        if (catalog.is_err()) return std::move(catalog).error();
        catalog.value().register_all(registry);
        return ok_status();
    }

    for (const char* v : {"1.0.0", "1.1.0", "2.0.0-beta.1", "2.0.0"}) {
        auto parsed = SemanticVersion::parse(v);
        if (parsed.is_err()) return std::move(parsed).error();

        TemplateVersion tv;
        tv.template_id = "api-design";
        tv.version = std::move(parsed).value();
        tv.release_date = "2025-01-10";
        registry.register_version(std::move(tv));
    }
    return ok_status();
}

static Status register_migrations(MigrationRegistry& migrations) {
    auto v100 = SemanticVersion::parse("1.0.0");
    auto v110 = SemanticVersion::parse("1.1.0");
    auto v200 = SemanticVersion::parse("2.0.0");
    REVISE_TRY(v100);
    REVISE_TRY(v110);
    REVISE_TRY(v200);

    migrations.add("api-design", make_migration(
        "api-design-add-owner", v100.value(), v110.value(),
        "add an owner field",
        [](const Document& d) {
            Document out = d;
            out["owner"] = "unassigned";
            return out;
        },
        [](const Document& d) {
            Document out = d;
            out.erase("owner");
            return out;
        },
        0.5));

    migrations.add("api-design", make_migration(
        "api-design-sections-to-steps", v110.value(), v200.value(),
        "rename sections to steps",
        [](const Document& d) {
            Document out = d;
            out["steps"] = out.value("sections", Document::array());
            out.erase("sections");
            return out;
        }));

    return ok_status();
}

static void report(const ReviseError& err) {
    std::cerr << err.format() << "\n";
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    if (cfg.is_err()) {
        report(cfg.error());
        return 1;
    }
    cfg.value().apply_logging();
    const auto& options = cfg.value().versioning;

    VersionRegistry versions(options);
    MigrationRegistry migrations;

    auto status = register_versions(versions, argc, argv);
    if (status.is_err()) {
        report(status.error());
        return 1;
    }
    status = register_migrations(migrations);
    if (status.is_err()) {
        report(status.error());
        return 1;
    }

    // Resolve
    ConstraintResolver resolver(versions);
    auto resolved = resolver.resolve(
        {{"api-design", {VersionRange::expression_of("^1.0.0")}}});
    if (resolved.is_err()) {
        report(resolved.error());
        return 1;
    }
    for (const auto& [id, version] : resolved.value().resolved) {
        std::cout << "resolved " << id << " -> " << version.to_string() << "\n";
    }
    for (const auto& conflict : resolved.value().conflicts) {
        std::cout << "conflict on " << conflict.template_id << "\n";
    }

    // Migrate
    Document doc = {
        {"name", "api-design"},
        {"sections", {"goals", "constraints", "rollout"}},
    };

    auto from = SemanticVersion::parse("1.0.0");
    if (from.is_err()) {
        report(from.error());
        return 1;
    }

    MigrationExecutor executor(versions, migrations, options);
    auto migrated = executor.auto_migrate("api-design", doc, from.value(),
                                          std::string("revise-demo-backups"));
    if (migrated.is_err()) {
        report(migrated.error());
        return 1;
    }

    const auto& result = migrated.value();
    std::cout << (result.success ? "migrated" : "migration finished with errors")
              << " in " << result.execution_ms << "ms\n";
    if (result.migrated) std::cout << result.migrated->dump(2) << "\n";
    for (const auto& w : result.warnings) std::cout << "warning: " << w << "\n";
    for (const auto& e : result.errors) std::cout << "error: " << e << "\n";

    // Restore
    if (result.backup_path) {
        auto restored = executor.rollback(*result.backup_path);
        if (restored.is_err()) {
            report(restored.error());
            return 1;
        }
        std::cout << "restored from " << *result.backup_path << ":\n"
                  << restored.value().dump(2) << "\n";
    }

    return result.success ? 0 : 1;
}
