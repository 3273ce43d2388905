#include <zb/store.hpp>
#include <zb/archive.hpp>
#include <zb/log.hpp>
#include <zb/sha256.hpp>
#include <zb/uuid.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <set>

namespace fs = std::filesystem;

namespace zb {

namespace {

// Removes a staging directory unless disarmed
struct StagingGuard {
    fs::path path;
    bool keep = false;

    ~StagingGuard() {
        if (!keep && !path.empty()) {
            std::error_code ec;
            fs::remove_all(path, ec);
            if (ec) {
                log::warn("cannot remove staging directory %s: %s",
                          path.c_str(), ec.message().c_str());
            }
        }
    }
};

uint64_t tree_size(const fs::path& root) {
    uint64_t total = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
            total += it->file_size(ec);
        }
    }
    return total;
}

bool older_than(const fs::path& p, std::chrono::seconds age) {
    std::error_code ec;
    auto mtime = fs::last_write_time(p, ec);
    if (ec) return false;
    return fs::file_time_type::clock::now() - mtime > age;
}

// "package 'foo'" for links into <prefix>/Cellar/foo/..., otherwise a
// generic description
std::string describe_owner(const fs::path& path, const fs::path& cellar_root) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (fs::is_symlink(st)) {
        fs::path target = fs::read_symlink(path, ec);
        fs::path rel = target.lexically_relative(cellar_root);
        if (!ec && !rel.empty() && *rel.begin() != "..") {
            return "package '" + rel.begin()->string() + "'";
        }
        return "a symlink to " + target.string();
    }
    if (fs::is_directory(st)) return "a directory";
    return "a file not managed by zb";
}

} // namespace

const std::vector<std::string>& StoreManager::linked_dirs() {
    static const std::vector<std::string> dirs = {
        "bin", "sbin", "lib", "include", "share", "etc",
    };
    return dirs;
}

StoreManager::StoreManager(fs::path store_dir, fs::path prefix,
                           const LockManager& locks, Database& db,
                           std::chrono::milliseconds lock_timeout)
    : store_dir_(fs::absolute(store_dir).lexically_normal()),
      prefix_(fs::absolute(prefix).lexically_normal()),
      locks_(locks), db_(db), lock_timeout_(lock_timeout) {}

fs::path StoreManager::entry_path(const std::string& key) const {
    return store_dir_ / key;
}

bool StoreManager::contains(const std::string& key) const {
    std::error_code ec;
    return Sha256::is_hex_digest(key) && fs::is_directory(entry_path(key), ec);
}

fs::path StoreManager::cellar_path(const std::string& name, const std::string& version) const {
    return prefix_ / "Cellar" / name / version;
}

fs::path StoreManager::keg_dir(const StoreEntry& entry, const std::string& name,
                               const std::string& version) const {
    std::error_code ec;
    fs::path homebrew = entry.path / name / version;
    if (fs::is_directory(homebrew, ec)) return homebrew;

    // <name>/<some-version> with a single child
    fs::path by_name = entry.path / name;
    if (fs::is_directory(by_name, ec)) {
        std::vector<fs::path> children;
        for (auto& child : fs::directory_iterator(by_name, ec)) {
            if (child.is_directory(ec)) children.push_back(child.path());
        }
        if (children.size() == 1) return children.front();
    }
    return entry.path;
}

// ---------------------------------------------------------------------------
// Install
// ---------------------------------------------------------------------------

Status StoreManager::check_staged_tree(const fs::path& staging) const {
    std::error_code ec;
    size_t entries = 0;
    for (auto it = fs::recursive_directory_iterator(staging, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        ++entries;
        auto st = it->symlink_status(ec);
        fs::path rel = it->path().lexically_relative(staging);
        if (fs::is_symlink(st)) {
            fs::path target = fs::read_symlink(it->path(), ec);
            if (ec || !link_target_within(rel, target)) {
                return ZbError{ZbError::ExtractionFailure,
                    "symlink '" + rel.string() + "' escapes the store entry"};
            }
        } else if (!fs::is_regular_file(st) && !fs::is_directory(st)) {
            return ZbError{ZbError::ExtractionFailure,
                "unsupported file type at '" + rel.string() + "'"};
        }
    }
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot scan " + staging.string() + ": " + ec.message()};
    }
    if (entries == 0) {
        return ZbError{ZbError::ExtractionFailure, "bottle extracted to an empty tree"};
    }
    return ok_status();
}

Result<Lock> StoreManager::lock_root() const {
    return locks_.acquire(LockManager::store_root(), lock_timeout_);
}

Result<StoreEntry> StoreManager::install(const Artifact& artifact,
                                         const std::string& declared_key,
                                         Lock* root_lock) {
    if (!Sha256::is_hex_digest(declared_key)) {
        return ZbError{ZbError::InvalidArg, "invalid store key '" + declared_key + "'"};
    }
    if (artifact.sha256() != declared_key) {
        return ZbError{ZbError::IntegrityError,
            "artifact hash " + artifact.sha256() + " does not match store key " + declared_key};
    }

    StoreEntry entry;
    entry.key = declared_key;
    entry.path = entry_path(declared_key);

    // Present entries are reused under the lock so gc cannot drop them
    // between the check and the caller's record
    auto reuse = [&](Lock lock, const char* why) -> Result<StoreEntry> {
        auto digest = Sha256::hash_tree(entry.path);
        if (digest.is_err()) return std::move(digest).error();
        entry.tree_hash = std::move(digest).value();
        entry.reused = true;
        log::debug("store entry %s %s", declared_key.c_str(), why);
        if (root_lock) *root_lock = std::move(lock);
        return Result<StoreEntry>::ok(std::move(entry));
    };

    std::error_code ec;
    if (fs::is_directory(entry.path, ec)) {
        auto lock = lock_root();
        if (lock.is_err()) return std::move(lock).error();
        if (fs::is_directory(entry.path, ec)) {
            return reuse(std::move(lock).value(), "already present");
        }
    }

    StagingGuard staging;
    staging.path = staging_dir() / (declared_key + "." + Uuid::v4().short_hex());
    fs::create_directories(staging.path, ec);
    if (ec) {
        if (ec.value() == ENOSPC) {
            return ZbError{ZbError::DiskFull, "no space left creating " + staging.path.string()};
        }
        return ZbError{ZbError::IO,
            "cannot create " + staging.path.string() + ": " + ec.message()};
    }

    auto extracted = extract_archive(artifact.path(), staging.path);
    if (extracted.is_err()) return std::move(extracted).error();

    ZB_TRY(check_staged_tree(staging.path));

    auto digest = Sha256::hash_tree(staging.path);
    if (digest.is_err()) return std::move(digest).error();
    entry.tree_hash = std::move(digest).value();

    // Visibility point
    auto lock = lock_root();
    if (lock.is_err()) return std::move(lock).error();

    if (fs::is_directory(entry.path, ec)) {
        return reuse(std::move(lock).value(), "appeared while staging; reusing");
    }

    // The entry's age is counted from activation, not extraction
    fs::last_write_time(staging.path, fs::file_time_type::clock::now(), ec);

    if (std::rename(staging.path.c_str(), entry.path.c_str()) != 0) {
        int err = errno;
        if ((err == EEXIST || err == ENOTEMPTY) && fs::is_directory(entry.path, ec)) {
            return reuse(std::move(lock).value(), "lost the rename race; reusing");
        }
        if (err == ENOSPC) {
            return ZbError{ZbError::DiskFull, "no space left activating " + entry.path.string()};
        }
        return ZbError{ZbError::RenameRaceLost,
            "cannot move " + staging.path.string() + " to " + entry.path.string() +
            ": " + std::strerror(err)};
    }
    staging.keep = true;

    log::debug("stored %s (%zu entries)", declared_key.c_str(), extracted.value());
    if (root_lock) *root_lock = std::move(lock).value();
    return Result<StoreEntry>::ok(std::move(entry));
}

// ---------------------------------------------------------------------------
// Prefix links
// ---------------------------------------------------------------------------

Result<LinkReport> StoreManager::link_into_prefix(const StoreEntry& entry,
                                                  const std::string& name,
                                                  const std::string& version) {
    const fs::path keg = keg_dir(entry, name, version);
    const fs::path cellar = cellar_path(name, version);
    const fs::path cellar_root = prefix_ / "Cellar";

    LinkReport report;
    report.keg = cellar;

    std::vector<fs::path> created_links;
    std::vector<fs::path> created_dirs;
    std::optional<fs::path> replaced_cellar_target;

    auto rollback = [&]() {
        std::error_code rec;
        for (auto it = created_links.rbegin(); it != created_links.rend(); ++it) {
            fs::remove(*it, rec);
        }
        for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
            if (fs::is_empty(*it, rec)) fs::remove(*it, rec);
        }
        if (replaced_cellar_target) {
            fs::remove(cellar, rec);
            fs::create_directory_symlink(*replaced_cellar_target, cellar, rec);
        }
    };

    auto fail = [&](ZbError err) -> Result<LinkReport> {
        rollback();
        return err;
    };

    std::error_code ec;

    // Cellar/<name>/<version> -> keg
    fs::create_directories(cellar.parent_path(), ec);
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot create " + cellar.parent_path().string() + ": " + ec.message()};
    }

    auto cellar_status = fs::symlink_status(cellar, ec);
    if (fs::is_symlink(cellar_status)) {
        fs::path current = fs::read_symlink(cellar, ec);
        if (current == keg) {
            ++report.already_linked;
        } else {
            // Same package, different store entry: swap atomically
            fs::path tmp = cellar.parent_path() / ("." + version + "." + Uuid::v4().short_hex());
            fs::create_directory_symlink(keg, tmp, ec);
            if (!ec) fs::rename(tmp, cellar, ec);
            if (ec) {
                fs::remove(tmp, ec);
                return ZbError{ZbError::IO, "cannot relink " + cellar.string()};
            }
            replaced_cellar_target = current;
        }
    } else if (fs::exists(cellar_status)) {
        return ZbError{ZbError::LinkConflict,
            cellar.string() + " exists and is not managed by zb",
            "remove it or install with --no-link"};
    } else {
        fs::create_directory_symlink(keg, cellar, ec);
        if (ec) {
            return ZbError{ZbError::IO,
                "cannot link " + cellar.string() + ": " + ec.message()};
        }
        created_links.push_back(cellar);
    }

    for (auto& dir : linked_dirs()) {
        fs::path src = keg / dir;
        if (!fs::is_directory(src, ec)) continue;

        fs::path top = prefix_ / dir;
        if (!fs::is_directory(top, ec)) {
            if (fs::exists(fs::symlink_status(top, ec))) {
                return fail(ZbError{ZbError::LinkConflict,
                    top.string() + " is not a directory"});
            }
            fs::create_directories(top, ec);
            if (ec) {
                return fail(ZbError{ZbError::IO,
                    "cannot create " + top.string() + ": " + ec.message()});
            }
            created_dirs.push_back(top);
        }

        for (auto it = fs::recursive_directory_iterator(src, ec);
             it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;

            fs::path rel = it->path().lexically_relative(keg);
            fs::path dest = prefix_ / rel;
            fs::path target = cellar / rel;
            auto src_status = it->symlink_status(ec);
            auto dest_status = fs::symlink_status(dest, ec);

            if (fs::is_directory(src_status)) {
                if (fs::is_directory(dest_status)) continue;
                if (fs::exists(dest_status)) {
                    return fail(ZbError{ZbError::LinkConflict,
                        dest.string() + " is owned by " + describe_owner(dest, cellar_root) +
                        " and blocks " + name});
                }
                fs::create_directory(dest, ec);
                if (ec) {
                    return fail(ZbError{ZbError::IO,
                        "cannot create " + dest.string() + ": " + ec.message()});
                }
                created_dirs.push_back(dest);
                continue;
            }

            if (fs::exists(dest_status) || fs::is_symlink(dest_status)) {
                if (fs::is_symlink(dest_status) && fs::read_symlink(dest, ec) == target) {
                    ++report.already_linked;
                    continue;
                }
                return fail(ZbError{ZbError::LinkConflict,
                    dest.string() + " is owned by " + describe_owner(dest, cellar_root) +
                    ", cannot link " + name,
                    "uninstall the other package or install with --no-link"});
            }

            fs::create_symlink(target, dest, ec);
            if (ec) {
                return fail(ZbError{ZbError::IO,
                    "cannot link " + dest.string() + ": " + ec.message()});
            }
            created_links.push_back(dest);
        }
        if (ec) {
            return fail(ZbError{ZbError::IO,
                "cannot scan " + src.string() + ": " + ec.message()});
        }
    }

    report.created = std::move(created_links);
    log::debug("linked %s %s: %zu new, %zu existing", name.c_str(), version.c_str(),
               report.created.size(), report.already_linked);
    return Result<LinkReport>::ok(std::move(report));
}

Status StoreManager::unlink_from_prefix(const std::string& name, const std::string& version) {
    const fs::path cellar = cellar_path(name, version);
    std::error_code ec;

    for (auto& dir : linked_dirs()) {
        fs::path top = prefix_ / dir;
        if (!fs::is_directory(top, ec)) continue;

        std::vector<fs::path> links;
        std::vector<fs::path> dirs;
        for (auto it = fs::recursive_directory_iterator(top, ec);
             it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            auto st = it->symlink_status(ec);
            if (fs::is_symlink(st)) {
                fs::path target = fs::read_symlink(it->path(), ec);
                fs::path rel = target.lexically_relative(cellar);
                if (!ec && !rel.empty() && *rel.begin() != "..") {
                    links.push_back(it->path());
                }
            } else if (fs::is_directory(st)) {
                dirs.push_back(it->path());
            }
        }
        if (ec) {
            return ZbError{ZbError::IO, "cannot scan " + top.string() + ": " + ec.message()};
        }

        for (auto& link : links) {
            fs::remove(link, ec);
            if (ec) {
                return ZbError{ZbError::IO, "cannot remove " + link.string() + ": " + ec.message()};
            }
        }

        // Prune directories left empty, deepest first
        std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
            return a.native().size() > b.native().size();
        });
        for (auto& d : dirs) {
            if (fs::is_empty(d, ec)) fs::remove(d, ec);
        }
    }

    if (fs::is_symlink(fs::symlink_status(cellar, ec))) {
        fs::remove(cellar, ec);
        if (ec) {
            return ZbError{ZbError::IO, "cannot remove " + cellar.string() + ": " + ec.message()};
        }
    }
    fs::path name_dir = cellar.parent_path();
    if (fs::is_directory(name_dir, ec) && fs::is_empty(name_dir, ec)) {
        fs::remove(name_dir, ec);
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// References and garbage collection
// ---------------------------------------------------------------------------

Result<int64_t> StoreManager::retain(const std::string& key) {
    auto count = db_.retain(key);
    if (count.is_ok()) log::trace("retain %s -> %lld", key.c_str(),
                                  static_cast<long long>(count.value()));
    return count;
}

Result<int64_t> StoreManager::release(const std::string& key) {
    auto count = db_.release(key);
    if (count.is_ok()) log::trace("release %s -> %lld", key.c_str(),
                                  static_cast<long long>(count.value()));
    return count;
}

Result<GcReport> StoreManager::collect_garbage(const std::vector<fs::path>& partial_dirs,
                                               std::chrono::seconds stale_after) {
    auto lock = locks_.acquire(LockManager::store_root(), lock_timeout_);
    if (lock.is_err()) return std::move(lock).error();

    auto records = db_.list();
    if (records.is_err()) return std::move(records).error();
    auto counts = db_.refcounts();
    if (counts.is_err()) return std::move(counts).error();

    std::map<std::string, int64_t> users;
    for (auto& r : records.value()) ++users[r.store_key];

    GcReport report;
    std::error_code ec;

    std::vector<std::string> keys;
    if (fs::is_directory(store_dir_, ec)) {
        for (auto& e : fs::directory_iterator(store_dir_, ec)) {
            std::string key = e.path().filename().string();
            if (Sha256::is_hex_digest(key) && e.is_directory(ec)) keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());

    for (auto& key : keys) {
        int64_t used = users.count(key) ? users[key] : 0;
        int64_t counter = counts.value().count(key) ? counts.value().at(key) : 0;

        // Records are authoritative; repair counters that drifted
        if (counter != used) {
            log::debug("refcount of %s is %lld, %lld record(s) use it", key.c_str(),
                       static_cast<long long>(counter), static_cast<long long>(used));
            ZB_TRY(db_.set_refcount(key, used));
        }
        if (used > 0) continue;

        fs::path path = entry_path(key);
        if (!counts.value().count(key) && !older_than(path, stale_after)) {
            log::debug("keeping young orphan %s", key.c_str());
            report.young_orphans.push_back(key);
            continue;
        }
        uint64_t bytes = tree_size(path);
        fs::remove_all(path, ec);
        if (ec) {
            return ZbError{ZbError::IO, "cannot remove " + path.string() + ": " + ec.message()};
        }
        ZB_TRY(db_.forget_store_key(key));
        report.removed_keys.push_back(key);
        report.bytes_freed += bytes;
        log::info("removed store entry %s", key.c_str());
    }

    // Staging dirs of crashed runs; fresh ones may belong to a live install
    if (fs::is_directory(staging_dir(), ec)) {
        for (auto& e : fs::directory_iterator(staging_dir(), ec)) {
            if (!older_than(e.path(), stale_after)) continue;
            report.bytes_freed += tree_size(e.path());
            fs::remove_all(e.path(), ec);
            if (!ec) ++report.stale_staging;
        }
    }

    for (auto& dir : partial_dirs) {
        if (!fs::is_directory(dir, ec)) continue;
        for (auto& e : fs::directory_iterator(dir, ec)) {
            if (e.path().extension() != ".part" || !older_than(e.path(), stale_after)) continue;
            uint64_t bytes = e.file_size(ec);
            fs::remove(e.path(), ec);
            if (!ec) {
                ++report.stale_partials;
                report.bytes_freed += bytes;
            }
        }
    }

    return Result<GcReport>::ok(std::move(report));
}

} // namespace zb
