#include <zb/archive.hpp>
#include <zb/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <iterator>
#include <memory>
#include <set>
#include <string>

namespace fs = std::filesystem;

namespace zb {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

ZbError archive_failure(struct archive* a, const fs::path& archive_path,
                        const std::string& what) {
    const char* msg = a ? archive_error_string(a) : nullptr;
    if (a && archive_errno(a) == ENOSPC) {
        return ZbError{ZbError::DiskFull,
            "no space left extracting " + archive_path.string()};
    }
    return ZbError{ZbError::ExtractionFailure,
        what + " " + archive_path.string() + (msg ? std::string(": ") + msg : "")};
}

// Relative, no "..", not empty
bool safe_relative(const fs::path& p) {
    if (p.empty() || p.is_absolute()) return false;
    for (auto& part : p.lexically_normal()) {
        if (part == "..") return false;
    }
    return true;
}

// First proper ancestor of `rel` that is one of `links`, if any
const fs::path* through_link(const fs::path& rel, const std::set<fs::path>& links) {
    fs::path prefix;
    for (auto it = rel.begin(); it != rel.end(); ++it) {
        if (std::next(it) == rel.end()) break;
        prefix /= *it;
        auto found = links.find(prefix);
        if (found != links.end()) return &*found;
    }
    return nullptr;
}

} // namespace

bool link_target_within(const fs::path& link, const fs::path& target) {
    if (target.is_absolute()) return false;
    fs::path resolved = (link.parent_path() / target).lexically_normal();
    if (resolved.empty()) return true;
    auto first = *resolved.begin();
    return first != "..";
}

Result<size_t> extract_archive(const fs::path& archive_path, const fs::path& dest_dir) {
    // libarchive refuses to write through any symlink on the path, so the
    // destination itself is resolved first
    std::error_code ec;
    const fs::path dest = fs::canonical(dest_dir, ec);
    if (ec) {
        return ZbError{ZbError::IO, "cannot resolve " + dest_dir.string() + ": " + ec.message()};
    }

    ArchiveReadHandle in(archive_read_new());
    archive_read_support_filter_all(in.get());
    archive_read_support_format_all(in.get());

    ArchiveWriteHandle out(archive_write_disk_new());
    archive_write_disk_set_options(out.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT);
    archive_write_disk_set_standard_lookup(out.get());

    if (archive_read_open_filename(in.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return archive_failure(in.get(), archive_path, "cannot open");
    }

    size_t count = 0;
    std::set<fs::path> symlinks;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK) {
        fs::path rel = fs::path(archive_entry_pathname(entry)).lexically_normal();
        if (rel == ".") continue;
        if (!safe_relative(rel)) {
            return ZbError{ZbError::ExtractionFailure,
                "entry '" + rel.string() + "' in " + archive_path.string() +
                " escapes the extraction directory"};
        }

        if (const fs::path* link = through_link(rel, symlinks)) {
            return ZbError{ZbError::ExtractionFailure,
                "entry '" + rel.string() + "' in " + archive_path.string() +
                " is reached through symlink '" + link->string() + "'"};
        }

        if (archive_entry_filetype(entry) == AE_IFLNK) {
            const char* target = archive_entry_symlink(entry);
            if (!target || !link_target_within(rel, target)) {
                return ZbError{ZbError::ExtractionFailure,
                    "symlink '" + rel.string() + "' in " + archive_path.string() +
                    " points outside the extraction directory"};
            }
            symlinks.insert(rel);
        }

        if (const char* hard = archive_entry_hardlink(entry)) {
            fs::path hard_rel = fs::path(hard).lexically_normal();
            if (!safe_relative(hard_rel) || through_link(hard_rel, symlinks) ||
                symlinks.count(hard_rel)) {
                return ZbError{ZbError::ExtractionFailure,
                    "hard link '" + rel.string() + "' in " + archive_path.string() +
                    " escapes the extraction directory"};
            }
            std::string hard_dest = (dest / hard_rel).string();
            archive_entry_set_hardlink(entry, hard_dest.c_str());
        }

        std::string entry_dest = (dest / rel).string();
        archive_entry_set_pathname(entry, entry_dest.c_str());

        if (archive_write_header(out.get(), entry) < ARCHIVE_OK) {
            return archive_failure(out.get(), archive_path, "cannot extract");
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while ((r = archive_read_data_block(in.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(out.get(), buff, size, offset) < ARCHIVE_OK) {
                return archive_failure(out.get(), archive_path, "cannot write");
            }
        }
        if (r != ARCHIVE_EOF) {
            return archive_failure(in.get(), archive_path, "corrupt data in");
        }
        if (archive_write_finish_entry(out.get()) < ARCHIVE_OK) {
            return archive_failure(out.get(), archive_path, "cannot finish");
        }
        ++count;
    }

    if (r != ARCHIVE_EOF) {
        return archive_failure(in.get(), archive_path, "cannot read");
    }

    log::debug("extracted %zu entries from %s", count, archive_path.filename().c_str());
    return Result<size_t>::ok(count);
}

} // namespace zb
