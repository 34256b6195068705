#include <revise/migration.hpp>
#include <revise/log.hpp>

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>

namespace revise {

// ---------------------------------------------------------------------------
// make_migration()
// ---------------------------------------------------------------------------

MigrationScript make_migration(std::string id,
                               SemanticVersion from,
                               SemanticVersion to,
                               std::string description,
                               TransformFn transform,
                               RollbackFn rollback,
                               std::optional<double> estimated_duration)
{
    MigrationScript script;
    script.id = std::move(id);
    script.from_version = std::move(from);
    script.to_version = std::move(to);
    script.description = std::move(description);
    script.reversible = static_cast<bool>(rollback);
    script.rollback = std::move(rollback);
    script.estimated_duration = estimated_duration;

    script.migrate = [transform = std::move(transform)](const Document& doc) {
        using clock = std::chrono::steady_clock;
        auto start = clock::now();

        MigrationResult out;
        try {
            out.migrated = transform(doc);
            out.success = true;
        } catch (const std::exception& e) {
            out.success = false;
            out.errors.push_back(e.what());
        }
        out.execution_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - start).count();
        return out;
    };

    return script;
}

// ---------------------------------------------------------------------------
// MigrationRegistry
// ---------------------------------------------------------------------------

void MigrationRegistry::add(const std::string& template_id, MigrationScript script) {
    log::debug("registering migration '%s' for %s: %s -> %s",
               script.id.c_str(), template_id.c_str(),
               script.from_version.to_string().c_str(),
               script.to_version.to_string().c_str());

    auto& list = scripts_[template_id];
    list.push_back(std::move(script));
    std::stable_sort(list.begin(), list.end(),
        [](const MigrationScript& a, const MigrationScript& b) {
            return compare(a.from_version, b.from_version) == Ordering::Less;
        });
}

const std::vector<MigrationScript>& MigrationRegistry::migrations(
    const std::string& template_id) const
{
    static const std::vector<MigrationScript> empty;
    auto it = scripts_.find(template_id);
    return it == scripts_.end() ? empty : it->second;
}

bool MigrationRegistry::has(const std::string& template_id) const {
    return scripts_.count(template_id) > 0;
}

MigrationStatistics MigrationRegistry::statistics(const std::string& template_id) const {
    MigrationStatistics stats;
    double total = 0.0;

    for (const auto& m : migrations(template_id)) {
        ++stats.total_migrations;
        if (m.reversible) ++stats.reversible_count;
        total += m.estimated_duration.value_or(0.0);
        stats.version_coverage.emplace_back(m.from_version.to_string(),
                                            m.to_version.to_string());
    }

    if (stats.total_migrations > 0) {
        stats.average_duration = total / static_cast<double>(stats.total_migrations);
    }
    return stats;
}

void MigrationRegistry::clear() {
    scripts_.clear();
}

// ---------------------------------------------------------------------------
// MigrationPathfinder
// ---------------------------------------------------------------------------

MigrationPathfinder::MigrationPathfinder(const MigrationRegistry& registry)
    : registry_(registry) {}

std::optional<MigrationPath> MigrationPathfinder::find(
    const std::string& template_id,
    const SemanticVersion& from,
    const SemanticVersion& to) const
{
    if (!registry_.has(template_id)) return std::nullopt;

    // Unique next edge per source version; emplace keeps the first registered
    std::map<SemanticVersion, const MigrationScript*> next;
    for (const auto& script : registry_.migrations(template_id)) {
        next.emplace(script.from_version, &script);
    }

    MigrationPath path;
    path.from = from;
    path.to = to;

    std::set<SemanticVersion> visited;
    SemanticVersion current = from;

    while (compare(current, to) != Ordering::Equal) {
        if (!visited.insert(current).second) {
            log::debug("migration chain for %s loops back to %s",
                       template_id.c_str(), current.to_string().c_str());
            return std::nullopt;
        }

        auto it = next.find(current);
        if (it == next.end()) {
            log::debug("no migration for %s starts at %s",
                       template_id.c_str(), current.to_string().c_str());
            return std::nullopt;
        }

        path.steps.push_back(*it->second);
        current = it->second->to_version;

        if (compare(current, to) == Ordering::Greater) {
            log::debug("migration chain for %s jumps past %s",
                       template_id.c_str(), to.to_string().c_str());
            return std::nullopt;
        }
    }

    for (const auto& step : path.steps) {
        path.reversible = path.reversible && step.reversible;
        path.total_duration += step.estimated_duration.value_or(0.0);
    }
    return path;
}

bool MigrationPathfinder::can_migrate(const std::string& template_id,
                                      const SemanticVersion& from,
                                      const SemanticVersion& to) const {
    return find(template_id, from, to).has_value();
}

} // namespace revise
