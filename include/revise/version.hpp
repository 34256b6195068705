#pragma once

#include <revise/result.hpp>
#include <optional>
#include <string>

namespace revise {

enum class Ordering { Less = -1, Equal = 0, Greater = 1 };

// Semantic version: major.minor.patch[-prerelease][+build]
// Build metadata is carried for display only; it never takes part in ordering.
struct SemanticVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;      // dot-separated identifiers, empty for release
    std::string build_metadata;

    static Result<SemanticVersion> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }

    bool operator==(const SemanticVersion& o) const;
    bool operator!=(const SemanticVersion& o) const;
    bool operator<(const SemanticVersion& o) const;
    bool operator<=(const SemanticVersion& o) const;
    bool operator>(const SemanticVersion& o) const;
    bool operator>=(const SemanticVersion& o) const;
};

// Total order over versions. Prerelease identifiers are compared one by
// one: numeric against numeric by value, anything else as strings, and the
// shorter identifier list sorts first.
Ordering compare(const SemanticVersion& a, const SemanticVersion& b);

// Exactly one form is populated: exact, expression, or the min/max window
// (min inclusive, max exclusive, either side optional).
struct VersionRange {
    std::optional<SemanticVersion> exact;
    std::optional<std::string> expression;  // ^X.Y.Z, ~X.Y.Z, >=, <=, >, < or bare
    std::optional<SemanticVersion> min;
    std::optional<SemanticVersion> max;

    static VersionRange exactly(SemanticVersion v);
    static VersionRange expression_of(std::string expr);
    static VersionRange between(std::optional<SemanticVersion> lo,
                                std::optional<SemanticVersion> hi);

    std::string to_string() const;
};

// Errors only when an expression operand is not a valid version.
Result<bool> satisfies(const SemanticVersion& v, const VersionRange& range);
Result<bool> satisfies_expression(const SemanticVersion& v, const std::string& expr);

} // namespace revise
