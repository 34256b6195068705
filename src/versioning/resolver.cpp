#include <revise/resolver.hpp>
#include <revise/log.hpp>

namespace revise {

ConstraintResolver::ConstraintResolver(const VersionRegistry& registry)
    : registry_(registry) {}

static VersionConflict make_conflict(const std::string& template_id,
                                     const std::vector<VersionRange>& ranges) {
    VersionConflict conflict;
    conflict.template_id = template_id;
    for (const auto& range : ranges) {
        conflict.conflicts.push_back({"unknown", range});
    }
    return conflict;
}

Result<const TemplateVersion*> ConstraintResolver::pick(
    const VersionRegistryEntry& entry,
    const std::vector<VersionRange>& ranges) const
{
    bool allow_prerelease = registry_.options().allow_prerelease;

    // Entries are newest first, so the first match is the most recent one
    for (const auto& tv : entry.versions) {
        if (tv.version.is_prerelease() && !allow_prerelease) continue;

        bool all = true;
        for (const auto& range : ranges) {
            auto ok = satisfies(tv.version, range);
            if (ok.is_err()) return std::move(ok).error();
            if (!ok.value()) {
                all = false;
                break;
            }
        }
        if (all) return Result<const TemplateVersion*>::ok(&tv);
    }
    return Result<const TemplateVersion*>::ok(nullptr);
}

Result<ResolutionResult> ConstraintResolver::resolve(
    const Requirements& requirements) const
{
    ResolutionResult result;

    for (const auto& [template_id, ranges] : requirements) {
        const auto* entry = registry_.entry(template_id);
        if (!entry) {
            log::debug("cannot resolve '%s': template is not registered",
                       template_id.c_str());
            result.conflicts.push_back(make_conflict(template_id, ranges));
            continue;
        }

        auto chosen = pick(*entry, ranges);
        if (chosen.is_err()) return std::move(chosen).error();

        const TemplateVersion* tv = chosen.value();
        if (!tv) {
            log::debug("cannot resolve '%s': no version satisfies %zu range(s)",
                       template_id.c_str(), ranges.size());
            result.conflicts.push_back(make_conflict(template_id, ranges));
            continue;
        }

        result.resolved[template_id] = tv->version;
        if (tv->deprecated) {
            result.warnings.push_back(template_id + "@" + tv->version.to_string() +
                " is deprecated: " + tv->deprecated->message);
        }
    }

    result.success = result.conflicts.empty();
    if (!result.success) result.resolved.clear();

    return Result<ResolutionResult>::ok(std::move(result));
}

} // namespace revise
