#include <zb/platform.hpp>
#include <algorithm>
#include <cstdlib>

#include <sys/utsname.h>

namespace zb {

const char* os_name(Os os) {
    switch (os) {
        case Os::Any:   return "all";
        case Os::Linux: return "linux";
        case Os::MacOS: return "macos";
    }
    return "unknown";
}

const char* arch_name(Arch arch) {
    switch (arch) {
        case Arch::Any:    return "any";
        case Arch::X86_64: return "x86_64";
        case Arch::Arm64:  return "arm64";
    }
    return "unknown";
}

const std::vector<std::string>& macos_releases() {
    static const std::vector<std::string> releases = {
        "high_sierra", "mojave", "catalina", "big_sur",
        "monterey", "ventura", "sonoma", "sequoia", "tahoe",
    };
    return releases;
}

int macos_release_rank(const std::string& codename) {
    auto& rel = macos_releases();
    auto it = std::find(rel.begin(), rel.end(), codename);
    return it == rel.end() ? -1 : static_cast<int>(it - rel.begin());
}

std::string macos_release_for_darwin(int darwin_major) {
    // Darwin 17 is High Sierra; 25 is Tahoe. Newer kernels map to the
    // newest known release.
    int idx = darwin_major - 17;
    auto& rel = macos_releases();
    if (idx < 0) return "";
    if (idx >= static_cast<int>(rel.size())) return rel.back();
    return rel[idx];
}

static bool parse_arch(const std::string& s, Arch& out) {
    if (s == "x86_64" || s == "amd64") { out = Arch::X86_64; return true; }
    if (s == "arm64" || s == "aarch64") { out = Arch::Arm64; return true; }
    return false;
}

static ZbError bad_tag(const std::string& tag) {
    return ZbError{ZbError::InvalidArg, "unrecognized platform tag '" + tag + "'",
        "expected e.g. linux-x86_64, macos-arm64-sonoma, arm64_sonoma or all"};
}

// ---------------------------------------------------------------------------
// Platform
// ---------------------------------------------------------------------------

Result<Platform> Platform::parse(const std::string& tag) {
    if (tag == "all" || tag == "any") {
        return Result<Platform>::ok(Platform::universal());
    }

    Platform p;

    // Canonical: os-arch[-release]
    if (tag.find('-') != std::string::npos) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t dash = tag.find('-', start);
            parts.push_back(tag.substr(start, dash - start));
            if (dash == std::string::npos) break;
            start = dash + 1;
        }
        if (parts.size() < 2 || parts.size() > 3) return bad_tag(tag);

        if (parts[0] == "linux") {
            p.os = Os::Linux;
        } else if (parts[0] == "macos" || parts[0] == "darwin") {
            p.os = Os::MacOS;
        } else {
            return bad_tag(tag);
        }
        if (!parse_arch(parts[1], p.arch)) return bad_tag(tag);

        if (parts.size() == 3) {
            if (p.os != Os::MacOS || macos_release_rank(parts[2]) < 0) {
                return bad_tag(tag);
            }
            p.release = parts[2];
        }
        return Result<Platform>::ok(std::move(p));
    }

    // Homebrew: <arch>_linux, arm64_<release>, x86_64_<release>, <release>
    const std::string linux_suffix = "_linux";
    if (tag.size() > linux_suffix.size() &&
        tag.compare(tag.size() - linux_suffix.size(), linux_suffix.size(), linux_suffix) == 0) {
        p.os = Os::Linux;
        if (!parse_arch(tag.substr(0, tag.size() - linux_suffix.size()), p.arch)) {
            return bad_tag(tag);
        }
        return Result<Platform>::ok(std::move(p));
    }

    p.os = Os::MacOS;
    std::string release = tag;
    if (tag.rfind("arm64_", 0) == 0) {
        p.arch = Arch::Arm64;
        release = tag.substr(6);
    } else if (tag.rfind("x86_64_", 0) == 0) {
        p.arch = Arch::X86_64;
        release = tag.substr(7);
    } else {
        p.arch = Arch::X86_64;
    }
    if (macos_release_rank(release) < 0) return bad_tag(tag);
    p.release = release;
    return Result<Platform>::ok(std::move(p));
}

Platform Platform::host() {
    Platform p;
    struct utsname un;
    if (uname(&un) != 0) {
        return p;
    }

    std::string sys = un.sysname;
    std::string machine = un.machine;

    if (!parse_arch(machine, p.arch)) {
        p.arch = Arch::Any;
    }

    if (sys == "Darwin") {
        p.os = Os::MacOS;
        int major = std::atoi(un.release);
        p.release = macos_release_for_darwin(major);
    } else if (sys == "Linux") {
        p.os = Os::Linux;
    }

    if (p.arch == Arch::Any) {
        return Platform::universal();
    }
    return p;
}

std::string Platform::to_string() const {
    if (is_universal()) return "all";
    std::string s = std::string(os_name(os)) + "-" + arch_name(arch);
    if (!release.empty()) s += "-" + release;
    return s;
}

std::string Platform::homebrew_tag() const {
    if (is_universal()) return "all";
    if (os == Os::Linux) return std::string(arch_name(arch)) + "_linux";
    if (release.empty()) return to_string();
    if (arch == Arch::Arm64) return "arm64_" + release;
    return release;
}

bool Platform::operator==(const Platform& o) const {
    if (is_universal() || o.is_universal()) {
        return is_universal() == o.is_universal();
    }
    return os == o.os && arch == o.arch && release == o.release;
}

bool Platform::operator<(const Platform& o) const {
    return to_string() < o.to_string();
}

// ---------------------------------------------------------------------------
// Compatibility
// ---------------------------------------------------------------------------

std::vector<Platform> compatibility_chain(const Platform& host) {
    std::vector<Platform> chain;
    auto push = [&](const Platform& p) {
        if (std::find(chain.begin(), chain.end(), p) == chain.end()) {
            chain.push_back(p);
        }
    };

    if (host.is_universal()) {
        push(Platform::universal());
        return chain;
    }

    push(host);

    if (host.os == Os::MacOS) {
        int rank = macos_release_rank(host.release);
        // Apple Silicon bottles start at Big Sur
        int floor = host.arch == Arch::Arm64 ? macos_release_rank("big_sur") : 0;
        for (int i = rank - 1; i >= floor; --i) {
            push(Platform{Os::MacOS, host.arch, macos_releases()[i]});
        }
    }

    push(Platform{host.os, host.arch, ""});
    push(Platform::universal());
    return chain;
}

} // namespace zb
