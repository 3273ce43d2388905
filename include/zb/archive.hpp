#pragma once

#include <zb/result.hpp>
#include <cstddef>
#include <filesystem>

namespace zb {

// Extract a tarball (any compression libarchive understands) below
// `dest`, which must exist. Absolute paths, ".." components, symlinks
// pointing outside `dest` and entries reached through an extracted symlink
// are rejected. Returns the number of entries written.
// Errors: ExtractionFailure, DiskFull, IO.
Result<size_t> extract_archive(const std::filesystem::path& archive_path,
                               const std::filesystem::path& dest);

// True if `target`, taken relative to the directory holding `link`, stays
// inside `root`. All paths are relative to `root`.
bool link_target_within(const std::filesystem::path& link,
                        const std::filesystem::path& target);

} // namespace zb
