#pragma once

#include <zb/result.hpp>
#include <filesystem>
#include <string>

namespace zb {

// On-disk roots of one installation:
//   <root>/store  <root>/db  <root>/cache  <root>/locks
//   <prefix>/bin  <prefix>/Cellar
struct Layout {
    std::filesystem::path root;
    std::filesystem::path prefix;

    Layout() = default;
    Layout(std::filesystem::path root_dir, std::filesystem::path prefix_dir);

    // Prefix defaults to <root>/prefix
    static Layout under(const std::filesystem::path& root_dir);

    std::filesystem::path store_dir() const { return root / "store"; }
    std::filesystem::path db_dir() const { return root / "db"; }
    std::filesystem::path db_path() const { return root / "db" / "zb.db"; }
    std::filesystem::path cache_dir() const { return root / "cache"; }
    std::filesystem::path lock_dir() const { return root / "locks"; }
    std::filesystem::path bin_dir() const { return prefix / "bin"; }
    std::filesystem::path cellar_dir() const { return prefix / "Cellar"; }

    // Create every directory; existing ones are left alone
    Status init() const;

    // True once init() has run
    bool initialized() const;
};

} // namespace zb
