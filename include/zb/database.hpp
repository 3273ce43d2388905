#pragma once

#include <zb/result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zb {

struct InstalledRecord {
    std::string name;
    std::string version;
    std::string store_key;                 // sha256 of the bottle
    std::vector<std::string> dependencies; // direct, by name
    int64_t installed_at = 0;              // unix seconds
    bool linked = true;
    std::string tree_hash;
    bool requested = false;                // named by the user, not pulled in
};

// Durable record of installed packages and store reference counters,
// kept in SQLite at <root>/db/zb.db. Every mutation is one transaction.
class Database {
public:
    Database();
    ~Database();
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    // Lifecycle. A damaged file is DatabaseCorrupt and is left untouched.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Installed packages
    Status upsert(const InstalledRecord& record);
    Status remove(const std::string& name);
    Result<InstalledRecord> get(const std::string& name);
    Result<std::vector<InstalledRecord>> list();

    // Names of installed packages whose bottle is `store_key`
    Result<std::vector<std::string>> packages_using(const std::string& store_key);

    // Names of installed packages that depend on `name`
    Result<std::vector<std::string>> dependents_of(const std::string& name);

    // Store reference counters; release never goes below zero
    Result<int64_t> retain(const std::string& store_key);
    Result<int64_t> release(const std::string& store_key);
    Result<int64_t> refcount(const std::string& store_key);
    Result<std::map<std::string, int64_t>> refcounts();
    Status set_refcount(const std::string& store_key, int64_t count);
    Status forget_store_key(const std::string& store_key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace zb
