#pragma once

#include <zb/result.hpp>
#include <string>
#include <vector>

namespace zb {

// Homebrew-style version: dotted numeric components with an optional
// trailing letter suffix, pre-release label and packaging revision.
//   "3.2.1"      parts {3,2,1}
//   "1.1.1w"     parts {1,1,1} suffix "w"   (sorts after 1.1.1)
//   "2.0.0-rc1"  parts {2,0,0} label "rc1"  (sorts before 2.0.0)
//   "9.5_1"      parts {9,5}   revision 1
struct Version {
    std::vector<int> parts;
    std::string suffix;
    std::string label;
    int revision = 0;

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // Component i, zero when absent (1.2 == 1.2.0)
    int part(size_t i) const { return i < parts.size() ? parts[i] : 0; }

    // Ordering ignoring the revision
    int compare_base(const Version& o) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for constraints: "1", "1.2", "1.2.3"
struct PartialVersion {
    std::vector<int> parts;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3 (also a bare version)
    Caret,       // ^1.2.3 (compatible with)
    Tilde,       // ~1.2.3 (patch-level changes)
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Exact;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound constraint: ">=1.0, <2.0". No constraints matches everything.
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    static VersionReq any() { return VersionReq{}; }

    bool is_any() const { return constraints.empty(); }
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace zb
