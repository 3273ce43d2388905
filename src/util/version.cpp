#include <zb/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace zb {

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

static Result<int> parse_component(const std::string& text, const std::string& whole) {
    if (!all_digits(text)) {
        return ZbError{ZbError::Version,
            "invalid version component '" + text + "' in '" + whole + "'"};
    }
    try {
        return Result<int>::ok(std::stoi(text));
    } catch (const std::out_of_range&) {
        return ZbError{ZbError::Version,
            "version component out of range in '" + whole + "'"};
    }
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    if (input.empty()) {
        return ZbError{ZbError::Version, "empty version string"};
    }

    std::string s = input;
    if (s.size() > 1 && (s[0] == 'v' || s[0] == 'V') &&
        std::isdigit(static_cast<unsigned char>(s[1]))) {
        s = s.substr(1);
    }

    Version v;

    // Revision: trailing "_N"
    size_t us = s.rfind('_');
    if (us != std::string::npos) {
        std::string rev = s.substr(us + 1);
        if (!all_digits(rev)) {
            return ZbError{ZbError::Version,
                "invalid revision in version '" + input + "'",
                "expected format: 1.2.3[_revision]"};
        }
        auto r = parse_component(rev, input);
        if (r.is_err()) return std::move(r).error();
        v.revision = r.value();
        s = s.substr(0, us);
    }

    // Pre-release label: "-label"
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        v.label = s.substr(dash + 1);
        if (v.label.empty()) {
            return ZbError{ZbError::Version,
                "empty label after '-' in '" + input + "'"};
        }
        s = s.substr(0, dash);
    }

    if (s.empty()) {
        return ZbError{ZbError::Version, "invalid version '" + input + "'",
            "expected format: major[.minor[.micro...]][suffix][-label][_revision]"};
    }

    std::vector<std::string> comps;
    std::istringstream stream(s);
    std::string comp;
    while (std::getline(stream, comp, '.')) {
        comps.push_back(comp);
    }
    if (comps.empty() || s.back() == '.') {
        return ZbError{ZbError::Version, "invalid version '" + input + "'"};
    }

    for (size_t i = 0; i < comps.size(); ++i) {
        std::string c = comps[i];
        if (i + 1 == comps.size()) {
            // Only the last component may carry a letter suffix
            size_t n = 0;
            while (n < c.size() && std::isdigit(static_cast<unsigned char>(c[n]))) ++n;
            if (n > 0 && n < c.size()) {
                v.suffix = c.substr(n);
                if (!std::all_of(v.suffix.begin(), v.suffix.end(), [](char ch) {
                        return std::isalnum(static_cast<unsigned char>(ch));
                    })) {
                    return ZbError{ZbError::Version,
                        "invalid suffix '" + v.suffix + "' in version '" + input + "'"};
                }
                c = c.substr(0, n);
            }
        }
        auto r = parse_component(c, input);
        if (r.is_err()) return std::move(r).error();
        v.parts.push_back(r.value());
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(parts[i]);
    }
    s += suffix;
    if (!label.empty()) {
        s += "-" + label;
    }
    if (revision > 0) {
        s += "_" + std::to_string(revision);
    }
    return s;
}

int Version::compare_base(const Version& o) const {
    size_t n = std::max(parts.size(), o.parts.size());
    for (size_t i = 0; i < n; ++i) {
        if (part(i) != o.part(i)) return part(i) < o.part(i) ? -1 : 1;
    }
    // Post-release suffix: "1.1.1" < "1.1.1a" < "1.1.1b"
    if (suffix != o.suffix) {
        if (suffix.empty()) return -1;
        if (o.suffix.empty()) return 1;
        return suffix < o.suffix ? -1 : 1;
    }
    // Pre-release (non-empty label) < release (empty label)
    if (label != o.label) {
        if (label.empty()) return 1;
        if (o.label.empty()) return -1;
        return label < o.label ? -1 : 1;
    }
    return 0;
}

bool Version::operator==(const Version& o) const {
    return compare_base(o) == 0 && revision == o.revision;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    int c = compare_base(o);
    if (c != 0) return c < 0;
    return revision < o.revision;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return ZbError{ZbError::Version, "empty partial version string"};
    }
    if (s.back() == '.') {
        return ZbError{ZbError::Version, "invalid partial version '" + s + "'"};
    }

    PartialVersion pv;
    std::istringstream stream(s);
    std::string comp;
    while (std::getline(stream, comp, '.')) {
        auto r = parse_component(comp, s);
        if (r.is_err()) {
            return ZbError{ZbError::Version, "invalid partial version '" + s + "'"};
        }
        pv.parts.push_back(r.value());
    }
    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(parts[i]);
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    // Pre-releases never satisfy a constraint
    if (!v.label.empty()) return false;

    Version req;
    req.parts = version.parts;
    int cmp = v.compare_base(req);
    int req_major = req.part(0);
    int req_minor = req.part(1);

    switch (op) {
    case ConstraintOp::Exact:
        // "=1.2" accepts 1.2, 1.2.0 and 1.2a but not 1.2.1
        {
            Version bare = v;
            bare.suffix.clear();
            return bare.compare_base(req) == 0;
        }

    case ConstraintOp::Caret:
        // ^X.Y.Z (X>0): >=X.Y.Z, <(X+1).0.0
        // ^0.Y.Z (Y>0): >=0.Y.Z, <0.(Y+1).0
        // ^0.0.Z: only 0.0.Z
        if (cmp < 0) return false;
        if (req_major > 0) {
            return v.part(0) == req_major;
        }
        if (req_minor > 0) {
            return v.part(0) == 0 && v.part(1) == req_minor;
        }
        return v.part(0) == 0 && v.part(1) == 0 && v.part(2) == req.part(2);

    case ConstraintOp::Tilde:
        // ~X.Y.Z: >=X.Y.Z, <X.(Y+1).0
        if (cmp < 0) return false;
        return v.part(0) == req_major && v.part(1) == req_minor;

    case ConstraintOp::GreaterEq:
        return cmp >= 0;

    case ConstraintOp::Greater:
        return cmp > 0;

    case ConstraintOp::LessEq:
        return cmp <= 0;

    case ConstraintOp::Less:
        return cmp < 0;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size() && s[pos] == ' ') ++pos;

    // A bare version pins exactly
    ConstraintOp op = ConstraintOp::Exact;
    if (pos < s.size()) {
        if (s[pos] == '^') {
            op = ConstraintOp::Caret;
            ++pos;
        } else if (s[pos] == '~') {
            op = ConstraintOp::Tilde;
            ++pos;
        } else if (pos + 1 < s.size() && s[pos] == '=' && s[pos + 1] == '=') {
            op = ConstraintOp::Exact;
            pos += 2;
        } else if (s[pos] == '=') {
            op = ConstraintOp::Exact;
            ++pos;
        } else if (pos + 1 < s.size() && s[pos] == '>' && s[pos + 1] == '=') {
            op = ConstraintOp::GreaterEq;
            pos += 2;
        } else if (s[pos] == '>') {
            op = ConstraintOp::Greater;
            ++pos;
        } else if (pos + 1 < s.size() && s[pos] == '<' && s[pos + 1] == '=') {
            op = ConstraintOp::LessEq;
            pos += 2;
        } else if (s[pos] == '<') {
            op = ConstraintOp::Less;
            ++pos;
        }
    }

    while (pos < s.size() && s[pos] == ' ') ++pos;

    std::string ver_str = s.substr(pos);
    while (!ver_str.empty() && ver_str.back() == ' ') ver_str.pop_back();

    if (ver_str.empty()) {
        return ZbError{ZbError::Version,
            "missing version in constraint '" + s + "'"};
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();

    VersionConstraint vc;
    vc.op = op;
    vc.version = std::move(pv).value();
    return Result<VersionConstraint>::ok(std::move(vc));
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    std::string trimmed = s;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    if (trimmed.empty()) {
        return ZbError{ZbError::Version, "empty version requirement"};
    }
    if (trimmed == "*") {
        return Result<VersionReq>::ok(VersionReq::any());
    }

    VersionReq req;
    std::istringstream stream(trimmed);
    std::string token;

    while (std::getline(stream, token, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    if (req.constraints.empty()) {
        return ZbError{ZbError::Version,
            "no constraints in version requirement '" + s + "'"};
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    if (constraints.empty()) return "*";
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace zb
