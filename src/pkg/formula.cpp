#include <zb/formula.hpp>
#include <zb/sha256.hpp>
#include <algorithm>
#include <cctype>
#include <set>

namespace zb {

bool is_valid_formula_name(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalnum(static_cast<unsigned char>(name[0]))) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        unsigned char u = static_cast<unsigned char>(c);
        return std::isalnum(u) ||
               c == '@' || c == '.' || c == '_' || c == '+' || c == '-';
    });
}

Result<std::string> normalize_formula_name(const std::string& name) {
    std::string trimmed = name;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) {
        trimmed.pop_back();
    }

    size_t slash = trimmed.rfind('/');
    if (slash != std::string::npos) {
        std::string tap = trimmed.substr(0, slash);
        if (tap != "homebrew/core") {
            return ZbError{ZbError::UnsupportedTap,
                "tap '" + tap + "' is not supported for '" + trimmed + "'",
                "only homebrew/core formulas can be installed"};
        }
        trimmed = trimmed.substr(slash + 1);
    }

    if (!is_valid_formula_name(trimmed)) {
        return ZbError{ZbError::InvalidArg, "invalid formula name '" + name + "'"};
    }
    return Result<std::string>::ok(std::move(trimmed));
}

// ---------------------------------------------------------------------------
// Dependency
// ---------------------------------------------------------------------------

Result<Dependency> Dependency::parse(const std::string& text) {
    // Name runs until the first whitespace or constraint operator
    size_t end = 0;
    while (end < text.size()) {
        char c = text[end];
        if (c == ' ' || c == '\t' || c == '=' || c == '<' || c == '>' ||
            c == '^' || c == '~' || c == ',') {
            break;
        }
        ++end;
    }

    auto name = normalize_formula_name(text.substr(0, end));
    if (name.is_err()) return std::move(name).error();

    Dependency dep;
    dep.name = std::move(name).value();

    std::string rest = text.substr(end);
    rest.erase(0, rest.find_first_not_of(" \t"));
    if (!rest.empty()) {
        auto req = VersionReq::parse(rest);
        if (req.is_err()) {
            return ZbError{ZbError::Version,
                "invalid constraint in '" + text + "': " + req.error().message};
        }
        dep.req = std::move(req).value();
    }
    return Result<Dependency>::ok(std::move(dep));
}

std::string Dependency::to_string() const {
    if (req.is_any()) return name;
    return name + " " + req.to_string();
}

// ---------------------------------------------------------------------------
// Formula
// ---------------------------------------------------------------------------

Status Formula::validate() const {
    if (!is_valid_formula_name(name)) {
        return ZbError{ZbError::Parse, "invalid formula name '" + name + "'"};
    }
    if (version.parts.empty()) {
        return ZbError{ZbError::Parse, "formula '" + name + "' has no version"};
    }

    std::set<std::string> seen;
    for (auto& dep : dependencies) {
        if (!seen.insert(dep.name).second) {
            return ZbError{ZbError::Parse,
                "formula '" + name + "' lists dependency '" + dep.name + "' twice"};
        }
    }

    for (auto& [tag, bottle] : bottles) {
        if (tag != bottle.platform_tag()) {
            return ZbError{ZbError::Parse,
                "bottle key '" + tag + "' does not match platform '" +
                bottle.platform_tag() + "' in formula '" + name + "'"};
        }
        if (bottle.url.empty()) {
            return ZbError{ZbError::Parse,
                "bottle '" + tag + "' of formula '" + name + "' has no url"};
        }
        if (!Sha256::is_hex_digest(bottle.sha256)) {
            return ZbError{ZbError::Parse,
                "bottle '" + tag + "' of formula '" + name +
                "' has an invalid sha256 '" + bottle.sha256 + "'",
                "expected 64 lower-case hex digits"};
        }
    }
    return ok_status();
}

std::vector<std::string> Formula::dependency_names() const {
    std::vector<std::string> names;
    names.reserve(dependencies.size());
    for (auto& d : dependencies) names.push_back(d.name);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace zb
