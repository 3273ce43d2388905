#include <zb/lock.hpp>
#include <zb/log.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace zb {

// ---------------------------------------------------------------------------
// Lock
// ---------------------------------------------------------------------------

Lock::Lock(std::string name, fs::path path, int fd)
    : name_(std::move(name)), path_(std::move(path)), fd_(fd) {}

Lock::~Lock() {
    release();
}

Lock::Lock(Lock&& other) noexcept
    : name_(std::move(other.name_)), path_(std::move(other.path_)),
      fd_(other.fd_), stale_(std::move(other.stale_)) {
    other.fd_ = -1;
}

Lock& Lock::operator=(Lock&& other) noexcept {
    if (this != &other) {
        release();
        name_ = std::move(other.name_);
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        stale_ = std::move(other.stale_);
        other.fd_ = -1;
    }
    return *this;
}

void Lock::release() {
    if (fd_ < 0) return;

    // Empty holder record marks a clean release
    if (::ftruncate(fd_, 0) != 0) {
        log::warn("cannot clear lock file %s: %s", path_.c_str(), std::strerror(errno));
    }
    if (::flock(fd_, LOCK_UN) != 0) {
        log::warn("cannot unlock %s: %s", path_.c_str(), std::strerror(errno));
    }
    ::close(fd_);
    fd_ = -1;
    log::trace("released lock '%s'", name_.c_str());
}

// ---------------------------------------------------------------------------
// LockManager
// ---------------------------------------------------------------------------

namespace {

bool valid_lock_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               c == '.' || c == '_' || c == '-' || c == '@' || c == '+';
    });
}

// Holder record: "<pid> <unix-time>\n"
pid_t read_holder_pid(int fd) {
    char buf[64] = {0};
    ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) return 0;
    long pid = std::strtol(buf, nullptr, 10);
    return pid > 0 ? static_cast<pid_t>(pid) : 0;
}

bool process_alive(pid_t pid) {
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

void write_holder(int fd) {
    std::string record = std::to_string(::getpid()) + " " +
                         std::to_string(static_cast<long long>(std::time(nullptr))) + "\n";
    if (::ftruncate(fd, 0) != 0 ||
        ::pwrite(fd, record.data(), record.size(), 0) != static_cast<ssize_t>(record.size())) {
        log::warn("cannot record lock holder: %s", std::strerror(errno));
    }
}

} // namespace

LockManager::LockManager(fs::path lock_dir) : dir_(std::move(lock_dir)) {}

fs::path LockManager::lock_path(const std::string& name) const {
    return dir_ / (name + ".lock");
}

Result<Lock> LockManager::attempt(const std::string& name, bool& busy) const {
    busy = false;
    if (!valid_lock_name(name)) {
        return ZbError{ZbError::InvalidArg, "invalid lock name '" + name + "'"};
    }

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return ZbError{ZbError::IO,
            "cannot create lock directory " + dir_.string() + ": " + ec.message()};
    }

    fs::path path = lock_path(name);
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        return ZbError{ZbError::IO,
            "cannot open lock file " + path.string() + ": " + std::strerror(errno)};
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        if (err == EWOULDBLOCK) {
            busy = true;
            pid_t holder = read_holder_pid(fd);
            ::close(fd);
            std::string msg = "lock '" + name + "' is held";
            if (holder > 0) msg += " by pid " + std::to_string(holder);
            return ZbError{ZbError::LockTimeout, msg};
        }
        ::close(fd);
        return ZbError{ZbError::IO,
            "cannot lock " + path.string() + ": " + std::strerror(err)};
    }

    Lock lock(name, path, fd);

    // A non-empty record means the last holder never released
    pid_t previous = read_holder_pid(fd);
    if (previous > 0 && previous != ::getpid() && !process_alive(previous)) {
        lock.stale_ = ZbError{ZbError::StaleLockRecovered,
            "recovered lock '" + name + "' left by dead process " + std::to_string(previous)};
        log::warn("%s", lock.stale_->message.c_str());
    }

    write_holder(fd);
    log::trace("acquired lock '%s'", name.c_str());
    return Result<Lock>::ok(std::move(lock));
}

Result<Lock> LockManager::try_acquire(const std::string& name) const {
    bool busy = false;
    return attempt(name, busy);
}

Result<Lock> LockManager::acquire(const std::string& name,
                                  std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;
    auto delay = std::chrono::milliseconds(5);
    bool logged = false;

    while (true) {
        bool busy = false;
        auto result = attempt(name, busy);
        if (result.is_ok() || !busy) return result;

        auto now = clock::now();
        if (now >= deadline) {
            return ZbError{ZbError::LockTimeout,
                result.error().message + "; gave up after " +
                std::to_string(timeout.count()) + " ms",
                "another zb instance may be running"};
        }

        if (!logged) {
            log::info("waiting for %s", result.error().message.c_str());
            logged = true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(delay, remaining));
        delay = std::min(delay * 2, std::chrono::milliseconds(100));
    }
}

} // namespace zb
