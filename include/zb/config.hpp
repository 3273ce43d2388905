#pragma once

#include <zb/platform.hpp>
#include <zb/result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace zb {

// Effective settings after layering
struct Settings {
    std::filesystem::path root;
    std::filesystem::path prefix;
    std::filesystem::path formulas;
    size_t concurrency = 48;
    std::optional<Platform> platform;       // unset = detect the host
    bool link = true;
    bool keep_going = true;
    int fetch_retries = 3;
    std::chrono::milliseconds fetch_backoff{250};
    long fetch_timeout_s = 300;
    std::chrono::milliseconds lock_timeout{30000};

    Platform host() const { return platform ? *platform : Platform::host(); }
};

// One configuration layer. Unset fields leave lower layers alone.
//   defaults < global file < <root>/config.toml < environment < flags
struct Config {
    std::optional<std::string> root;
    std::optional<std::string> prefix;
    std::optional<std::string> formulas;
    std::optional<long> concurrency;
    std::optional<std::string> platform;

    // [install]
    std::optional<bool> link;
    std::optional<bool> keep_going;

    // [fetch]
    std::optional<long> fetch_retries;
    std::optional<long> fetch_backoff_ms;
    std::optional<long> fetch_timeout_s;

    // [lock]
    std::optional<long> lock_timeout_ms;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // ZEROBREW_ROOT, ZEROBREW_PREFIX, ZB_CONCURRENCY, ZB_PLATFORM
    static Result<Config> from_env();

    // Other's set fields override this
    void merge(const Config& other);

    // Fill defaults and validate ranges and the platform tag
    Result<Settings> resolve() const;
};

// $XDG_CONFIG_HOME/zb/config.toml, else ~/.config/zb/config.toml
std::string global_config_path();

// $ZEROBREW_ROOT, /opt/zerobrew when present or on macOS, else
// $XDG_DATA_HOME/zerobrew (~/.local/share/zerobrew)
std::string default_root();

// Defaults, global file, <root>/config.toml, environment, then `flags`.
// Missing files are skipped; unreadable or invalid ones are errors.
Result<Settings> load_settings(const Config& flags);

} // namespace zb
