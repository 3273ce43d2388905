#pragma once

#include <zb/result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace zb {

// Held exclusive lock on <locks>/<name>.lock. Move-only; released in the
// destructor. The kernel drops it if the holder dies.
class Lock {
public:
    Lock() = default;
    ~Lock();

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;
    Lock(Lock&& other) noexcept;
    Lock& operator=(Lock&& other) noexcept;

    const std::string& name() const { return name_; }
    const std::filesystem::path& path() const { return path_; }
    bool held() const { return fd_ >= 0; }

    // Set when the previous holder died without releasing
    bool recovered_stale() const { return stale_.has_value(); }
    const std::optional<ZbError>& stale_notice() const { return stale_; }

    void release();

private:
    friend class LockManager;
    Lock(std::string name, std::filesystem::path path, int fd);

    std::string name_;
    std::filesystem::path path_;
    int fd_ = -1;
    std::optional<ZbError> stale_;
};

class LockManager {
public:
    explicit LockManager(std::filesystem::path lock_dir);

    // Poll until the lock is free or `timeout` expires (LockTimeout)
    Result<Lock> acquire(const std::string& name, std::chrono::milliseconds timeout) const;

    // Single attempt
    Result<Lock> try_acquire(const std::string& name) const;

    // Serializes store renames and garbage collection
    static std::string store_root() { return "store"; }
    static std::string package(const std::string& pkg) { return "pkg-" + pkg; }

    std::filesystem::path lock_path(const std::string& name) const;
    const std::filesystem::path& dir() const { return dir_; }

private:
    Result<Lock> attempt(const std::string& name, bool& busy) const;

    std::filesystem::path dir_;
};

} // namespace zb
