#pragma once

#include <revise/result.hpp>
#include <revise/registry.hpp>

#include <string>
#include <vector>

namespace revise {

// A catalog lists template versions in TOML:
//
//   [[template]]
//   id = "api-design"
//   version = "1.2.0"
//   release-date = "2025-01-10"
//   compatible-with = "^1.0.0"        # or { min = "1.0.0", max = "2.0.0" }
//   deprecated = { message = "use 2.x", replaced-by = "2.0.0" }
//
//   [template.migration-from]
//   "1.1.0" = "api-design-1.1-to-1.2"
//
//   [template.dependencies]
//   "error-catalog" = ">=1.0.0"
struct Catalog {
    std::vector<TemplateVersion> versions;   // in file order

    static Result<Catalog> load(const std::string& path);
    static Result<Catalog> parse(const std::string& toml_str);

    // Register every entry, in file order
    void register_all(VersionRegistry& registry) const;
};

} // namespace revise
