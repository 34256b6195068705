#include <revise/version.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <vector>

namespace revise {

static const char* kVersionFormatHint =
    "expected format: MAJOR.MINOR.PATCH[-prerelease][+build]";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

// Dot-separated, non-empty identifiers of [0-9A-Za-z-]
static bool valid_identifiers(const std::string& s) {
    for (const auto& part : split_dots(s)) {
        if (part.empty()) return false;
        for (char c : part) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return false;
            }
        }
    }
    return true;
}

// Core components are decimal without leading zeros so parse/to_string round-trips
static bool parse_component(const std::string& s, int& out) {
    if (!is_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;
    int value = 0;
    for (char c : s) {
        int d = c - '0';
        if (value > (INT_MAX - d) / 10) return false;
        value = value * 10 + d;
    }
    out = value;
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Numeric identifiers of any length: strip leading zeros, then the longer
// digit string is the larger number.
static int compare_numeric(const std::string& a, const std::string& b) {
    size_t ia = a.find_first_not_of('0');
    size_t ib = b.find_first_not_of('0');
    std::string na = ia == std::string::npos ? "" : a.substr(ia);
    std::string nb = ib == std::string::npos ? "" : b.substr(ib);
    if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
    return na.compare(nb);
}

static Ordering to_ordering(int c) {
    if (c < 0) return Ordering::Less;
    if (c > 0) return Ordering::Greater;
    return Ordering::Equal;
}

// ---------------------------------------------------------------------------
// SemanticVersion
// ---------------------------------------------------------------------------

Result<SemanticVersion> SemanticVersion::parse(const std::string& s) {
    if (s.empty()) {
        return ReviseError{ReviseError::InvalidVersion,
            "empty version string", kVersionFormatHint};
    }

    SemanticVersion v;

    size_t plus = s.find('+');
    std::string head = s.substr(0, plus);
    if (plus != std::string::npos) {
        v.build_metadata = s.substr(plus + 1);
        if (!valid_identifiers(v.build_metadata)) {
            return ReviseError{ReviseError::InvalidVersion,
                "invalid build metadata in '" + s + "'", kVersionFormatHint};
        }
    }

    // The numeric core never contains '-', so the first one starts the prerelease
    size_t dash = head.find('-');
    std::string core = head.substr(0, dash);
    if (dash != std::string::npos) {
        v.prerelease = head.substr(dash + 1);
        if (!valid_identifiers(v.prerelease)) {
            return ReviseError{ReviseError::InvalidVersion,
                "invalid prerelease in '" + s + "'", kVersionFormatHint};
        }
    }

    auto parts = split_dots(core);
    if (parts.size() != 3) {
        return ReviseError{ReviseError::InvalidVersion,
            "invalid version '" + s + "'", kVersionFormatHint};
    }
    if (!parse_component(parts[0], v.major)) {
        return ReviseError{ReviseError::InvalidVersion,
            "invalid major version in '" + s + "'", kVersionFormatHint};
    }
    if (!parse_component(parts[1], v.minor)) {
        return ReviseError{ReviseError::InvalidVersion,
            "invalid minor version in '" + s + "'", kVersionFormatHint};
    }
    if (!parse_component(parts[2], v.patch)) {
        return ReviseError{ReviseError::InvalidVersion,
            "invalid patch version in '" + s + "'", kVersionFormatHint};
    }

    return Result<SemanticVersion>::ok(std::move(v));
}

std::string SemanticVersion::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + prerelease;
    }
    if (!build_metadata.empty()) {
        s += "+" + build_metadata;
    }
    return s;
}

Ordering compare(const SemanticVersion& a, const SemanticVersion& b) {
    if (a.major != b.major) return a.major < b.major ? Ordering::Less : Ordering::Greater;
    if (a.minor != b.minor) return a.minor < b.minor ? Ordering::Less : Ordering::Greater;
    if (a.patch != b.patch) return a.patch < b.patch ? Ordering::Less : Ordering::Greater;

    // A release outranks any prerelease of the same core version
    if (a.prerelease.empty() && b.prerelease.empty()) return Ordering::Equal;
    if (a.prerelease.empty()) return Ordering::Greater;
    if (b.prerelease.empty()) return Ordering::Less;

    auto pa = split_dots(a.prerelease);
    auto pb = split_dots(b.prerelease);
    size_t n = std::max(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        if (i >= pa.size()) return Ordering::Less;
        if (i >= pb.size()) return Ordering::Greater;

        int c = 0;
        if (is_digits(pa[i]) && is_digits(pb[i])) {
            c = compare_numeric(pa[i], pb[i]);
        } else {
            c = pa[i].compare(pb[i]);
        }
        if (c != 0) return to_ordering(c);
    }
    return Ordering::Equal;
}

bool SemanticVersion::operator==(const SemanticVersion& o) const {
    return compare(*this, o) == Ordering::Equal;
}

bool SemanticVersion::operator!=(const SemanticVersion& o) const { return !(*this == o); }

bool SemanticVersion::operator<(const SemanticVersion& o) const {
    return compare(*this, o) == Ordering::Less;
}

bool SemanticVersion::operator<=(const SemanticVersion& o) const { return !(o < *this); }
bool SemanticVersion::operator>(const SemanticVersion& o) const { return o < *this; }
bool SemanticVersion::operator>=(const SemanticVersion& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// VersionRange
// ---------------------------------------------------------------------------

VersionRange VersionRange::exactly(SemanticVersion v) {
    VersionRange r;
    r.exact = std::move(v);
    return r;
}

VersionRange VersionRange::expression_of(std::string expr) {
    VersionRange r;
    r.expression = std::move(expr);
    return r;
}

VersionRange VersionRange::between(std::optional<SemanticVersion> lo,
                                   std::optional<SemanticVersion> hi) {
    VersionRange r;
    r.min = std::move(lo);
    r.max = std::move(hi);
    return r;
}

std::string VersionRange::to_string() const {
    if (exact) return "=" + exact->to_string();
    if (expression) return *expression;

    std::string s;
    if (min) s += ">=" + min->to_string();
    if (max) {
        if (!s.empty()) s += " ";
        s += "<" + max->to_string();
    }
    return s.empty() ? "*" : s;
}

// ---------------------------------------------------------------------------
// Range evaluation
// ---------------------------------------------------------------------------

Result<bool> satisfies(const SemanticVersion& v, const VersionRange& range) {
    if (range.exact) {
        return Result<bool>::ok(compare(v, *range.exact) == Ordering::Equal);
    }

    if (range.expression) {
        return satisfies_expression(v, *range.expression);
    }

    if (range.min && compare(v, *range.min) == Ordering::Less) {
        return Result<bool>::ok(false);
    }
    if (range.max && compare(v, *range.max) != Ordering::Less) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::ok(true);
}

Result<bool> satisfies_expression(const SemanticVersion& v, const std::string& expr) {
    std::string e = trim(expr);

    auto operand = [&](size_t skip) {
        return SemanticVersion::parse(trim(e.substr(skip)));
    };

    if (e.rfind("^", 0) == 0) {
        auto base = operand(1);
        if (base.is_err()) return std::move(base).error();
        const auto& b = base.value();

        if (compare(v, b) == Ordering::Less) return Result<bool>::ok(false);

        // ^X.Y.Z (X>0): same major
        // ^0.Y.Z (Y>0): same 0.Y
        // ^0.0.Z: pinned
        if (b.major > 0) {
            return Result<bool>::ok(v.major == b.major);
        }
        if (b.minor > 0) {
            return Result<bool>::ok(v.major == 0 && v.minor == b.minor);
        }
        return Result<bool>::ok(v.major == 0 && v.minor == 0 && v.patch == b.patch);
    }

    if (e.rfind("~", 0) == 0) {
        auto base = operand(1);
        if (base.is_err()) return std::move(base).error();
        const auto& b = base.value();

        if (compare(v, b) == Ordering::Less) return Result<bool>::ok(false);
        return Result<bool>::ok(v.major == b.major && v.minor == b.minor);
    }

    if (e.rfind(">=", 0) == 0) {
        auto base = operand(2);
        if (base.is_err()) return std::move(base).error();
        return Result<bool>::ok(compare(v, base.value()) != Ordering::Less);
    }

    if (e.rfind("<=", 0) == 0) {
        auto base = operand(2);
        if (base.is_err()) return std::move(base).error();
        return Result<bool>::ok(compare(v, base.value()) != Ordering::Greater);
    }

    if (e.rfind(">", 0) == 0) {
        auto base = operand(1);
        if (base.is_err()) return std::move(base).error();
        return Result<bool>::ok(compare(v, base.value()) == Ordering::Greater);
    }

    if (e.rfind("<", 0) == 0) {
        auto base = operand(1);
        if (base.is_err()) return std::move(base).error();
        return Result<bool>::ok(compare(v, base.value()) == Ordering::Less);
    }

    auto base = SemanticVersion::parse(e);
    if (base.is_err()) return std::move(base).error();
    return Result<bool>::ok(compare(v, base.value()) == Ordering::Equal);
}

} // namespace revise
