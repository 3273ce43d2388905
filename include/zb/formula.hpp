#pragma once

#include <zb/platform.hpp>
#include <zb/result.hpp>
#include <zb/version.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace zb {

struct Dependency {
    std::string name;
    VersionReq req;

    // "name" or "name >=2.0"; also accepts "name>=2.0"
    static Result<Dependency> parse(const std::string& text);
    std::string to_string() const;
};

// One precompiled artifact for one platform
struct BottleSpec {
    Platform platform;
    std::string url;
    std::string sha256;     // 64 lower-case hex digits
    uint64_t size = 0;      // 0 = unknown

    std::string platform_tag() const { return platform.to_string(); }
};

struct Formula {
    std::string name;
    Version version;                     // includes the packaging revision
    std::string desc;
    std::string homepage;
    std::vector<Dependency> dependencies;
    std::map<std::string, BottleSpec> bottles;   // keyed by canonical platform tag

    // Checks names, hashes and bottle keys; does not touch the network
    Status validate() const;

    std::vector<std::string> dependency_names() const;

    // "name 1.2.3"
    std::string id() const { return name + " " + version.to_string(); }
};

// Formula names: letters, digits and "@._+-", starting alphanumeric
bool is_valid_formula_name(const std::string& name);

// "homebrew/core/foo" -> "foo"; any other tap is UnsupportedTap
Result<std::string> normalize_formula_name(const std::string& name);

} // namespace zb
