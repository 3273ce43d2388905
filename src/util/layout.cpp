#include <zb/layout.hpp>
#include <zb/log.hpp>

#include <cerrno>

namespace fs = std::filesystem;

namespace zb {

Layout::Layout(fs::path root_dir, fs::path prefix_dir)
    : root(fs::absolute(root_dir).lexically_normal()),
      prefix(fs::absolute(prefix_dir).lexically_normal()) {}

Layout Layout::under(const fs::path& root_dir) {
    return Layout(root_dir, root_dir / "prefix");
}

Status Layout::init() const {
    if (root.empty() || prefix.empty()) {
        return ZbError{ZbError::InvalidArg, "root and prefix must be set"};
    }

    const fs::path dirs[] = {
        store_dir(), store_dir() / ".staging", db_dir(), cache_dir(), lock_dir(),
        bin_dir(), cellar_dir(),
    };
    for (auto& dir : dirs) {
        std::error_code ec;
        if (fs::create_directories(dir, ec)) {
            log::debug("created %s", dir.c_str());
        }
        if (ec) {
            if (ec.value() == ENOSPC) {
                return ZbError{ZbError::DiskFull, "no space left creating " + dir.string()};
            }
            return ZbError{ZbError::IO,
                "cannot create " + dir.string() + ": " + ec.message(),
                "check permissions on " + root.string()};
        }
    }
    return ok_status();
}

bool Layout::initialized() const {
    std::error_code ec;
    return fs::is_directory(store_dir(), ec) && fs::is_directory(db_dir(), ec) &&
           fs::is_directory(lock_dir(), ec) && fs::is_directory(cellar_dir(), ec);
}

} // namespace zb
