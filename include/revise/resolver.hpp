#pragma once

#include <revise/result.hpp>
#include <revise/registry.hpp>

#include <map>
#include <string>
#include <vector>

namespace revise {

// template id -> ranges that must all hold for the chosen version
using Requirements = std::map<std::string, std::vector<VersionRange>>;

struct ConflictingRequirement {
    std::string required_by;     // requester identity is not tracked yet
    VersionRange range;
};

struct VersionConflict {
    std::string template_id;
    std::vector<ConflictingRequirement> conflicts;
};

struct ResolutionResult {
    bool success = false;
    std::map<std::string, SemanticVersion> resolved;  // empty unless success
    std::vector<VersionConflict> conflicts;
    std::vector<std::string> warnings;
};

class ConstraintResolver {
public:
    explicit ConstraintResolver(const VersionRegistry& registry);

    // Picks, per template, the newest registered version satisfying every
    // range. Unresolvable templates are reported as conflicts; only a
    // malformed range expression makes the call itself fail.
    Result<ResolutionResult> resolve(const Requirements& requirements) const;

private:
    Result<const TemplateVersion*> pick(const VersionRegistryEntry& entry,
                                        const std::vector<VersionRange>& ranges) const;

    const VersionRegistry& registry_;
};

} // namespace revise
