#include <revise/catalog.hpp>
#include <revise/log.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace revise {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<SemanticVersion> parse_version_field(const toml::table& tbl,
                                                   const char* key,
                                                   const std::string& where) {
    auto s = tbl[key].value<std::string>();
    if (!s) {
        return ReviseError{ReviseError::Parse,
            where + ": '" + key + "' must be a version string"};
    }
    auto v = SemanticVersion::parse(*s);
    if (v.is_err()) {
        auto err = std::move(v).error();
        err.message = where + ": " + err.message;
        return err;
    }
    return v;
}

// A range is either an expression string or a table with exact or min/max
static Result<VersionRange> parse_range(const toml::node& node,
                                        const std::string& where) {
    if (auto s = node.value<std::string>()) {
        return Result<VersionRange>::ok(VersionRange::expression_of(*s));
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        return ReviseError{ReviseError::Parse,
            where + ": range must be a string or a table"};
    }

    if (tbl->contains("exact")) {
        auto v = parse_version_field(*tbl, "exact", where);
        if (v.is_err()) return std::move(v).error();
        return Result<VersionRange>::ok(VersionRange::exactly(std::move(v).value()));
    }

    std::optional<SemanticVersion> lo;
    std::optional<SemanticVersion> hi;
    if (tbl->contains("min")) {
        auto v = parse_version_field(*tbl, "min", where);
        if (v.is_err()) return std::move(v).error();
        lo = std::move(v).value();
    }
    if (tbl->contains("max")) {
        auto v = parse_version_field(*tbl, "max", where);
        if (v.is_err()) return std::move(v).error();
        hi = std::move(v).value();
    }
    return Result<VersionRange>::ok(VersionRange::between(std::move(lo), std::move(hi)));
}

static Result<TemplateVersion> parse_template(const toml::table& tbl, size_t index) {
    std::string where = "template #" + std::to_string(index + 1);

    TemplateVersion tv;

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) {
        return ReviseError{ReviseError::Parse, where + ": missing 'id'"};
    }
    tv.template_id = *id;
    where = "template '" + tv.template_id + "'";

    auto version = parse_version_field(tbl, "version", where);
    if (version.is_err()) return std::move(version).error();
    tv.version = std::move(version).value();

    auto date = tbl["release-date"].value<std::string>();
    if (!date) {
        return ReviseError{ReviseError::Parse, where + ": missing 'release-date'"};
    }
    tv.release_date = *date;

    if (auto v = tbl["changelog"].value<std::string>()) tv.changelog = *v;

    if (const toml::node* compat = tbl.get("compatible-with")) {
        auto range = parse_range(*compat, where + " compatible-with");
        if (range.is_err()) return std::move(range).error();
        tv.compatible_with = std::move(range).value();
    }

    if (auto dep = tbl["deprecated"].as_table()) {
        Deprecation d;
        auto msg = (*dep)["message"].value<std::string>();
        if (!msg) {
            return ReviseError{ReviseError::Parse,
                where + ": deprecated.message is required"};
        }
        d.message = *msg;
        if (auto r = (*dep)["replaced-by"].value<std::string>()) d.replaced_by = *r;
        tv.deprecated = std::move(d);
    }

    if (auto mig = tbl["migration-from"].as_table()) {
        for (const auto& [key, val] : *mig) {
            auto script = val.value<std::string>();
            if (!script) {
                return ReviseError{ReviseError::Parse,
                    where + ": migration-from values must be strings"};
            }
            tv.migration_from[std::string(key)] = *script;
        }
    }

    if (auto deps = tbl["dependencies"].as_table()) {
        for (const auto& [key, val] : *deps) {
            std::string dep_id(key);
            auto range = parse_range(val, where + " dependency '" + dep_id + "'");
            if (range.is_err()) return std::move(range).error();
            tv.dependencies[dep_id] = std::move(range).value();
        }
    }

    return Result<TemplateVersion>::ok(std::move(tv));
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

Result<Catalog> Catalog::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ReviseError{ReviseError::Parse,
            std::string("catalog TOML parse error: ") + e.what()};
    }

    Catalog catalog;
    const toml::array* entries = nullptr;
    if (const toml::node* node = doc.get("template")) {
        entries = node->as_array();
        if (!entries || (!entries->empty() && !entries->is_array_of_tables())) {
            return ReviseError{ReviseError::Parse,
                "'template' must be an array of tables",
                "declare each entry with [[template]]"};
        }
    }
    if (entries) {
        for (size_t i = 0; i < entries->size(); ++i) {
            const auto* tbl = entries->get(i)->as_table();
            auto tv = parse_template(*tbl, i);
            if (tv.is_err()) return std::move(tv).error();
            catalog.versions.push_back(std::move(tv).value());
        }
    }

    return Result<Catalog>::ok(std::move(catalog));
}

Result<Catalog> Catalog::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ReviseError{ReviseError::IO,
            "cannot open catalog file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto catalog = Catalog::parse(ss.str());
    if (catalog.is_err()) {
        auto err = std::move(catalog).error();
        err.file = path;
        return err;
    }
    return catalog;
}

void Catalog::register_all(VersionRegistry& registry) const {
    for (const auto& tv : versions) {
        registry.register_version(tv);
    }
    log::debug("registered %zu template version(s) from catalog", versions.size());
}

} // namespace revise
