#pragma once

#include <zb/formula.hpp>
#include <zb/result.hpp>
#include <zb/transport.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace zb {

// A verified download on disk. Move-only; an ephemeral artifact deletes
// its file when destroyed, a cached one leaves the blob in place.
class Artifact {
public:
    Artifact() = default;
    Artifact(std::filesystem::path path, std::string sha256, uint64_t size,
             bool ephemeral, bool from_cache);
    ~Artifact();

    Artifact(const Artifact&) = delete;
    Artifact& operator=(const Artifact&) = delete;
    Artifact(Artifact&& other) noexcept;
    Artifact& operator=(Artifact&& other) noexcept;

    const std::filesystem::path& path() const { return path_; }
    const std::string& sha256() const { return sha256_; }
    uint64_t size() const { return size_; }
    bool from_cache() const { return from_cache_; }
    bool valid() const { return !path_.empty(); }

private:
    void reset();

    std::filesystem::path path_;
    std::string sha256_;
    uint64_t size_ = 0;
    bool ephemeral_ = false;
    bool from_cache_ = false;
};

struct FetchOptions {
    int retries = 3;                                   // extra attempts after the first
    std::chrono::milliseconds backoff{250};            // doubled per retry
    bool cache_blobs = true;                           // promote into cache/blobs
};

// Downloads bottles into <cache>/tmp/<uuid>.part while hashing, then
// promotes verified bytes to <cache>/blobs/<sha256>.
class Fetcher {
public:
    Fetcher(Transport& transport, std::filesystem::path cache_dir, FetchOptions opts = {});

    // Errors: IntegrityError (never retried), TransportFailure, Timeout,
    // DiskFull, IO
    Result<Artifact> fetch(const BottleSpec& spec) const;

    std::filesystem::path blob_path(const std::string& sha256) const;
    std::filesystem::path tmp_dir() const;
    const std::filesystem::path& cache_dir() const { return cache_dir_; }
    const FetchOptions& options() const { return opts_; }

private:
    Result<Artifact> fetch_once(const BottleSpec& spec) const;
    Result<Artifact> from_blob_cache(const BottleSpec& spec) const;

    Transport& transport_;
    std::filesystem::path cache_dir_;
    FetchOptions opts_;
};

// Fetches independent bottles concurrently. Requests with the same hash
// share one download.
class ParallelFetcher {
public:
    ParallelFetcher(const Fetcher& fetcher, size_t concurrency);

    // One result per input spec, in input order
    std::vector<Result<std::shared_ptr<Artifact>>> fetch_all(
        const std::vector<BottleSpec>& specs) const;

private:
    const Fetcher& fetcher_;
    size_t concurrency_;
};

} // namespace zb
