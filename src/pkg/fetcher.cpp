#include <zb/fetcher.hpp>
#include <zb/log.hpp>
#include <zb/sha256.hpp>
#include <zb/uuid.hpp>

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <map>
#include <optional>
#include <thread>

#include <unistd.h>

namespace fs = std::filesystem;

namespace zb {

// ---------------------------------------------------------------------------
// Artifact
// ---------------------------------------------------------------------------

Artifact::Artifact(fs::path path, std::string sha256, uint64_t size,
                   bool ephemeral, bool from_cache)
    : path_(std::move(path)), sha256_(std::move(sha256)), size_(size),
      ephemeral_(ephemeral), from_cache_(from_cache) {}

Artifact::~Artifact() {
    reset();
}

Artifact::Artifact(Artifact&& other) noexcept
    : path_(std::move(other.path_)), sha256_(std::move(other.sha256_)),
      size_(other.size_), ephemeral_(other.ephemeral_), from_cache_(other.from_cache_) {
    other.path_.clear();
    other.ephemeral_ = false;
}

Artifact& Artifact::operator=(Artifact&& other) noexcept {
    if (this != &other) {
        reset();
        path_ = std::move(other.path_);
        sha256_ = std::move(other.sha256_);
        size_ = other.size_;
        ephemeral_ = other.ephemeral_;
        from_cache_ = other.from_cache_;
        other.path_.clear();
        other.ephemeral_ = false;
    }
    return *this;
}

void Artifact::reset() {
    if (ephemeral_ && !path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    path_.clear();
    ephemeral_ = false;
}

// ---------------------------------------------------------------------------
// Fetcher
// ---------------------------------------------------------------------------

namespace {

// Removes the partial download unless disarmed
struct PartFile {
    fs::path path;
    std::FILE* fp = nullptr;
    bool keep = false;

    ~PartFile() {
        if (fp) std::fclose(fp);
        if (!keep && !path.empty()) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
};

ZbError write_error(const fs::path& path, int err) {
    if (err == ENOSPC) {
        return ZbError{ZbError::DiskFull, "no space left writing " + path.string()};
    }
    return ZbError{ZbError::IO,
        "cannot write " + path.string() + ": " + std::strerror(err)};
}

} // namespace

Fetcher::Fetcher(Transport& transport, fs::path cache_dir, FetchOptions opts)
    : transport_(transport), cache_dir_(std::move(cache_dir)), opts_(opts) {}

fs::path Fetcher::blob_path(const std::string& sha256) const {
    return cache_dir_ / "blobs" / sha256;
}

fs::path Fetcher::tmp_dir() const {
    return cache_dir_ / "tmp";
}

Result<Artifact> Fetcher::from_blob_cache(const BottleSpec& spec) const {
    fs::path blob = blob_path(spec.sha256);
    std::error_code ec;
    if (!fs::is_regular_file(blob, ec)) {
        return ZbError{ZbError::NotFound, "not cached"};
    }

    auto digest = Sha256::hash_file(blob);
    if (digest.is_err() || digest.value() != spec.sha256) {
        log::warn("cached blob %s is damaged, discarding", spec.sha256.c_str());
        fs::remove(blob, ec);
        return ZbError{ZbError::NotFound, "not cached"};
    }

    uint64_t size = fs::file_size(blob, ec);
    log::debug("using cached blob %s", spec.sha256.c_str());
    return Result<Artifact>::ok(Artifact(blob, spec.sha256, ec ? 0 : size, false, true));
}

Result<Artifact> Fetcher::fetch_once(const BottleSpec& spec) const {
    std::error_code ec;
    fs::create_directories(tmp_dir(), ec);
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot create " + tmp_dir().string() + ": " + ec.message()};
    }

    PartFile part;
    part.path = tmp_dir() / (Uuid::v4().short_hex() + ".part");
    part.fp = std::fopen(part.path.c_str(), "wb");
    if (!part.fp) {
        return write_error(part.path, errno);
    }

    Sha256 hasher;
    uint64_t received = 0;
    std::optional<ZbError> sink_error;

    auto sink = [&](const uint8_t* data, size_t len) {
        if (std::fwrite(data, 1, len, part.fp) != len) {
            sink_error = write_error(part.path, errno);
            return false;
        }
        hasher.update(data, len);
        received += len;
        return true;
    };

    auto got = transport_.get(spec.url, sink);
    if (sink_error) return *sink_error;
    if (got.is_err()) return std::move(got).error();

    if (std::fflush(part.fp) != 0 || ::fsync(fileno(part.fp)) != 0) {
        return write_error(part.path, errno);
    }
    std::fclose(part.fp);
    part.fp = nullptr;

    std::string actual = hasher.hex_digest();
    // Short bodies are interrupted transfers and retried; long ones are not
    if (spec.size > 0 && received < spec.size) {
        return ZbError{ZbError::TransportFailure,
            spec.url + ": transfer ended early, expected " + std::to_string(spec.size) +
            " bytes, got " + std::to_string(received)};
    }
    if (spec.size > 0 && received > spec.size) {
        return ZbError{ZbError::IntegrityError,
            spec.url + ": expected " + std::to_string(spec.size) + " bytes, got " +
            std::to_string(received)};
    }
    if (actual != spec.sha256) {
        return ZbError{ZbError::IntegrityError,
            spec.url + ": sha256 mismatch (expected " + spec.sha256 +
            ", got " + actual + ")",
            "the bottle or the formula is corrupt; nothing was installed"};
    }

    if (!opts_.cache_blobs) {
        part.keep = true;
        return Result<Artifact>::ok(Artifact(part.path, actual, received, true, false));
    }

    fs::path blob = blob_path(actual);
    fs::create_directories(blob.parent_path(), ec);
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot create " + blob.parent_path().string() + ": " + ec.message()};
    }
    fs::rename(part.path, blob, ec);
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot promote download into " + blob.string() + ": " + ec.message()};
    }
    part.keep = true;
    return Result<Artifact>::ok(Artifact(blob, actual, received, false, false));
}

Result<Artifact> Fetcher::fetch(const BottleSpec& spec) const {
    if (!Sha256::is_hex_digest(spec.sha256)) {
        return ZbError{ZbError::InvalidArg,
            "refusing to fetch " + spec.url + " without a valid sha256"};
    }

    if (opts_.cache_blobs) {
        auto cached = from_blob_cache(spec);
        if (cached.is_ok()) return cached;
    }

    auto delay = opts_.backoff;
    for (int attempt = 0;; ++attempt) {
        auto result = fetch_once(spec);
        if (result.is_ok()) return result;

        auto code = result.code();
        bool transient = code == ZbError::TransportFailure || code == ZbError::Timeout;
        if (!transient || attempt >= opts_.retries) {
            return result;
        }

        log::warn("%s (attempt %d of %d), retrying in %lld ms",
                  result.error().message.c_str(), attempt + 1, opts_.retries + 1,
                  static_cast<long long>(delay.count()));
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

// ---------------------------------------------------------------------------
// ParallelFetcher
// ---------------------------------------------------------------------------

ParallelFetcher::ParallelFetcher(const Fetcher& fetcher, size_t concurrency)
    : fetcher_(fetcher), concurrency_(concurrency == 0 ? 1 : concurrency) {}

std::vector<Result<std::shared_ptr<Artifact>>> ParallelFetcher::fetch_all(
    const std::vector<BottleSpec>& specs) const
{
    // One download per distinct hash
    std::map<std::string, size_t> first_index;
    std::vector<size_t> unique;
    for (size_t i = 0; i < specs.size(); ++i) {
        if (first_index.emplace(specs[i].sha256, i).second) {
            unique.push_back(i);
        }
    }

    std::vector<std::optional<Result<std::shared_ptr<Artifact>>>> slots(specs.size());

    tbb::task_arena arena(static_cast<int>(std::min(concurrency_, unique.size() + 1)));
    arena.execute([&] {
        tbb::task_group tg;
        for (size_t idx : unique) {
            tg.run([&, idx] {
                auto r = fetcher_.fetch(specs[idx]);
                if (r.is_ok()) {
                    slots[idx] = Result<std::shared_ptr<Artifact>>::ok(
                        std::make_shared<Artifact>(std::move(r).value()));
                } else {
                    slots[idx] = Result<std::shared_ptr<Artifact>>::err(std::move(r).error());
                }
            });
        }
        tg.wait();
    });

    std::vector<Result<std::shared_ptr<Artifact>>> out;
    out.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        size_t src = first_index.at(specs[i].sha256);
        out.push_back(*slots[src]);
    }
    return out;
}

} // namespace zb
