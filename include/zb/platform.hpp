#pragma once

#include <zb/result.hpp>
#include <string>
#include <vector>

namespace zb {

enum class Os { Any, Linux, MacOS };
enum class Arch { Any, X86_64, Arm64 };

// A bottle platform tag. Accepted spellings:
//   linux-x86_64, macos-arm64, macos-arm64-sonoma   (canonical)
//   x86_64_linux, arm64_linux, arm64_sonoma, sonoma (Homebrew)
//   all                                             (universal)
// A Homebrew tag with no arch prefix ("sonoma") means Intel macOS.
struct Platform {
    Os os = Os::Any;
    Arch arch = Arch::Any;
    std::string release;   // macOS codename, empty when unspecified

    static Result<Platform> parse(const std::string& tag);
    static Platform universal() { return Platform{}; }

    // Running system, from uname(2)
    static Platform host();

    bool is_universal() const { return os == Os::Any; }

    std::string to_string() const;
    std::string homebrew_tag() const;

    bool operator==(const Platform& o) const;
    bool operator!=(const Platform& o) const { return !(*this == o); }
    bool operator<(const Platform& o) const;
};

const char* os_name(Os os);
const char* arch_name(Arch arch);

// Known macOS codenames, oldest first
const std::vector<std::string>& macos_releases();

// Index into macos_releases(), -1 if unknown
int macos_release_rank(const std::string& codename);

// Codename for a Darwin kernel major version (23 -> "sonoma"). Kernels newer
// than the table map to its newest release; older ones to "".
std::string macos_release_for_darwin(int darwin_major);

// Tags a host accepts, best first: the exact tag, older macOS releases of
// the same arch newest first, the release-less tag, then "all".
std::vector<Platform> compatibility_chain(const Platform& host);

} // namespace zb
