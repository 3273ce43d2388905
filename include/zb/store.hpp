#pragma once

#include <zb/database.hpp>
#include <zb/fetcher.hpp>
#include <zb/lock.hpp>
#include <zb/result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace zb {

// Immutable extracted bottle at <store>/<key>, key = sha256 of the bottle
struct StoreEntry {
    std::string key;
    std::filesystem::path path;
    std::string tree_hash;
    bool reused = false;       // already present, nothing was extracted
};

struct LinkReport {
    std::filesystem::path keg;                   // <prefix>/Cellar/<name>/<version>
    std::vector<std::filesystem::path> created;  // links made by this call
    size_t already_linked = 0;
};

struct GcReport {
    std::vector<std::string> removed_keys;
    std::vector<std::string> young_orphans;    // unreferenced but kept for now
    size_t stale_staging = 0;
    size_t stale_partials = 0;
    uint64_t bytes_freed = 0;
};

// Content-addressed store plus the prefix links that expose it.
//
// Extraction happens in <store>/.staging/<key>.<uuid>; the rename into
// <store>/<key> is the only point where an entry becomes visible and runs
// under the store-root lock. Entries are never modified after that and
// are deleted only by collect_garbage(), which takes the same lock.
class StoreManager {
public:
    StoreManager(std::filesystem::path store_dir, std::filesystem::path prefix,
                 const LockManager& locks, Database& db,
                 std::chrono::milliseconds lock_timeout);

    // Errors: IntegrityError (artifact hash != key), ExtractionFailure,
    // RenameRaceLost, DiskFull, LockTimeout, IO
    //
    // With `root_lock`, the store-root lock taken for the reuse check or
    // the rename is handed to the caller on success, so the database
    // record can be committed before collect_garbage() sees the entry.
    Result<StoreEntry> install(const Artifact& artifact, const std::string& declared_key,
                               Lock* root_lock = nullptr);

    Result<Lock> lock_root() const;

    bool contains(const std::string& key) const;
    std::filesystem::path entry_path(const std::string& key) const;

    // Keg directory inside an entry: <entry>/<name>/<version> in Homebrew
    // bottles, otherwise the entry root
    std::filesystem::path keg_dir(const StoreEntry& entry, const std::string& name,
                                  const std::string& version) const;

    // <prefix>/Cellar/<name>/<version> -> keg, plus a link for every file
    // under the keg's bin, sbin, lib, include, share and etc. Idempotent.
    // A path owned by anything else is LinkConflict; links made by this
    // call are removed again.
    Result<LinkReport> link_into_prefix(const StoreEntry& entry, const std::string& name,
                                        const std::string& version);

    // Removes links that point into the package's Cellar keg, then the keg link
    Status unlink_from_prefix(const std::string& name, const std::string& version);

    std::filesystem::path cellar_path(const std::string& name, const std::string& version) const;

    // Explicit reference counters; release never deletes
    Result<int64_t> retain(const std::string& key);
    Result<int64_t> release(const std::string& key);

    // Under the store-root lock: drop entries that no installed record uses,
    // plus staging dirs and *.part files in `partial_dirs` older than
    // `stale_after`. An entry with neither a record nor a counter is an
    // orphan of an interrupted install and is dropped only once it is
    // older than `stale_after` too.
    Result<GcReport> collect_garbage(const std::vector<std::filesystem::path>& partial_dirs = {},
                                     std::chrono::seconds stale_after = std::chrono::hours(1));

    const std::filesystem::path& store_dir() const { return store_dir_; }
    const std::filesystem::path& prefix() const { return prefix_; }
    std::filesystem::path staging_dir() const { return store_dir_ / ".staging"; }

    // Prefix subdirectories that receive links
    static const std::vector<std::string>& linked_dirs();

private:
    Status check_staged_tree(const std::filesystem::path& staging) const;

    std::filesystem::path store_dir_;
    std::filesystem::path prefix_;
    const LockManager& locks_;
    Database& db_;
    std::chrono::milliseconds lock_timeout_;
};

} // namespace zb
