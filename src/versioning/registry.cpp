#include <revise/registry.hpp>
#include <revise/log.hpp>

#include <algorithm>
#include <cctype>

namespace revise {

VersionRegistry::VersionRegistry(VersioningOptions options)
    : options_(options) {}

// ---------------------------------------------------------------------------
// Registration and lookup
// ---------------------------------------------------------------------------

void VersionRegistry::register_version(TemplateVersion tv) {
    auto it = entries_.find(tv.template_id);
    if (it == entries_.end()) {
        VersionRegistryEntry fresh;
        fresh.template_id = tv.template_id;
        fresh.latest = tv.version;
        it = entries_.emplace(tv.template_id, std::move(fresh)).first;
    }

    log::debug("registering %s@%s", tv.template_id.c_str(),
               tv.version.to_string().c_str());

    auto& entry = it->second;
    entry.versions.push_back(std::move(tv));
    std::stable_sort(entry.versions.begin(), entry.versions.end(),
        [](const TemplateVersion& a, const TemplateVersion& b) {
            return compare(a.version, b.version) == Ordering::Greater;
        });

    entry.latest = entry.versions.front().version;
    auto stable = std::find_if(entry.versions.begin(), entry.versions.end(),
        [](const TemplateVersion& v) { return !v.version.is_prerelease(); });
    if (stable != entry.versions.end()) {
        entry.latest_stable = stable->version;
    }
}

const TemplateVersion* VersionRegistry::get(const std::string& template_id,
                                            const SemanticVersion& version) const {
    auto it = entries_.find(template_id);
    if (it == entries_.end()) return nullptr;

    for (const auto& tv : it->second.versions) {
        if (compare(tv.version, version) == Ordering::Equal) return &tv;
    }
    return nullptr;
}

const TemplateVersion* VersionRegistry::get_latest(const std::string& template_id,
                                                   bool include_prerelease) const {
    auto it = entries_.find(template_id);
    if (it == entries_.end()) return nullptr;

    const auto& entry = it->second;
    if (include_prerelease || options_.allow_prerelease) {
        return get(template_id, entry.latest);
    }
    if (!entry.latest_stable) return nullptr;
    return get(template_id, *entry.latest_stable);
}

const VersionRegistryEntry* VersionRegistry::entry(const std::string& template_id) const {
    auto it = entries_.find(template_id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> VersionRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void VersionRegistry::clear() {
    entries_.clear();
}

// ---------------------------------------------------------------------------
// Compatibility
// ---------------------------------------------------------------------------

static UpgradeSuggestion suggest_upgrade(const TemplateVersion& from,
                                         const TemplateVersion& to) {
    UpgradeSuggestion s;
    s.from = from.version.to_string();
    s.to = to.version.to_string();
    s.migration_required = from.migration_from.count(s.to) > 0;
    return s;
}

Result<CompatibilityCheck> VersionRegistry::check_compatibility(
    const TemplateVersion& a, const TemplateVersion& b) const
{
    CompatibilityCheck check;

    if (a.compatible_with) {
        auto ok = satisfies(b.version, *a.compatible_with);
        if (ok.is_err()) return std::move(ok).error();
        if (!ok.value()) {
            check.compatible = false;
            check.reason = "Version " + a.version.to_string() +
                " is not compatible with " + b.version.to_string();
            check.suggested_upgrade = suggest_upgrade(a, b);
            return Result<CompatibilityCheck>::ok(std::move(check));
        }
    }

    if (b.compatible_with) {
        auto ok = satisfies(a.version, *b.compatible_with);
        if (ok.is_err()) return std::move(ok).error();
        if (!ok.value()) {
            check.compatible = false;
            check.reason = "Version " + b.version.to_string() +
                " is not compatible with " + a.version.to_string();
            check.suggested_upgrade = suggest_upgrade(b, a);
            return Result<CompatibilityCheck>::ok(std::move(check));
        }
    }

    const TemplateVersion* dep = a.deprecated ? &a : (b.deprecated ? &b : nullptr);
    if (dep) {
        check.reason = "Warning: Version " + dep->version.to_string() +
            " is deprecated. " + dep->deprecated->message;
    }
    return Result<CompatibilityCheck>::ok(std::move(check));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

ValidationReport VersionRegistry::validate_version(const TemplateVersion& tv) const {
    ValidationReport report;

    auto reparsed = SemanticVersion::parse(tv.version.to_string());
    if (reparsed.is_err()) {
        report.errors.push_back("Invalid version format: " + reparsed.error().message);
    }

    if (tv.compatible_with && tv.compatible_with->expression) {
        SemanticVersion probe;
        probe.major = 1;
        auto r = satisfies_expression(probe, *tv.compatible_with->expression);
        if (r.is_err()) {
            report.errors.push_back("Invalid compatibility range: " + r.error().message);
        }
    }

    if (!is_iso8601_date(tv.release_date)) {
        report.errors.push_back("Invalid release date: " + tv.release_date);
    }

    return report;
}

bool is_iso8601_date(const std::string& s) {
    auto digits = [&](size_t pos, size_t n) {
        if (pos + n > s.size()) return false;
        for (size_t i = pos; i < pos + n; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        return true;
    };
    auto num = [&](size_t pos, size_t n) {
        int v = 0;
        for (size_t i = pos; i < pos + n; ++i) v = v * 10 + (s[i] - '0');
        return v;
    };

    if (!digits(0, 4) || s.size() < 10 || s[4] != '-' || !digits(5, 2) ||
        s[7] != '-' || !digits(8, 2)) {
        return false;
    }

    int year = num(0, 4);
    int month = num(5, 2);
    int day = num(8, 2);
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    int max_day = kDays[month - 1] + (month == 2 && leap ? 1 : 0);
    if (day > max_day) return false;

    if (s.size() == 10) return true;

    // Time of day
    if (s[10] != 'T' || !digits(11, 2) || s.size() < 16 || s[13] != ':' ||
        !digits(14, 2)) {
        return false;
    }
    if (num(11, 2) > 23 || num(14, 2) > 59) return false;

    size_t p = 16;
    if (p < s.size() && s[p] == ':') {
        if (!digits(p + 1, 2) || num(p + 1, 2) > 60) return false;
        p += 3;
        if (p < s.size() && s[p] == '.') {
            size_t start = ++p;
            while (p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]))) ++p;
            if (p == start) return false;
        }
    }

    if (p == s.size()) return true;
    if (s[p] == 'Z') return p + 1 == s.size();
    if (s[p] == '+' || s[p] == '-') {
        return p + 6 == s.size() && digits(p + 1, 2) && s[p + 3] == ':' &&
               digits(p + 4, 2) && num(p + 1, 2) <= 23 && num(p + 4, 2) <= 59;
    }
    return false;
}

} // namespace revise
