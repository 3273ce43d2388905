#include <zb/config.hpp>
#include <zb/log.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace zb {

namespace {

template<typename T>
void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ZbError{ZbError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto v = doc["root"].value<std::string>()) cfg.root = *v;
    if (auto v = doc["prefix"].value<std::string>()) cfg.prefix = *v;
    if (auto v = doc["formulas"].value<std::string>()) cfg.formulas = *v;
    if (auto v = doc["concurrency"].value<int64_t>()) cfg.concurrency = static_cast<long>(*v);
    if (auto v = doc["platform"].value<std::string>()) cfg.platform = *v;

    // [install] section
    if (auto install = doc["install"].as_table()) {
        if (auto v = (*install)["link"].value<bool>()) cfg.link = *v;
        if (auto v = (*install)["keep_going"].value<bool>()) cfg.keep_going = *v;
    }

    // [fetch] section
    if (auto fetch = doc["fetch"].as_table()) {
        if (auto v = (*fetch)["retries"].value<int64_t>())
            cfg.fetch_retries = static_cast<long>(*v);
        if (auto v = (*fetch)["backoff_ms"].value<int64_t>())
            cfg.fetch_backoff_ms = static_cast<long>(*v);
        if (auto v = (*fetch)["timeout_s"].value<int64_t>())
            cfg.fetch_timeout_s = static_cast<long>(*v);
    }

    // [lock] section
    if (auto lock = doc["lock"].as_table()) {
        if (auto v = (*lock)["timeout_ms"].value<int64_t>())
            cfg.lock_timeout_ms = static_cast<long>(*v);
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ZbError{ZbError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

Result<Config> Config::from_env() {
    Config cfg;
    cfg.root = env("ZEROBREW_ROOT");
    cfg.prefix = env("ZEROBREW_PREFIX");
    cfg.platform = env("ZB_PLATFORM");
    if (auto v = env("ZB_CONCURRENCY")) {
        char* end = nullptr;
        long n = std::strtol(v->c_str(), &end, 10);
        if (end == v->c_str() || *end != '\0') {
            return ZbError{ZbError::Config,
                "ZB_CONCURRENCY must be an integer, got '" + *v + "'"};
        }
        cfg.concurrency = n;
    }
    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    take(root, other.root);
    take(prefix, other.prefix);
    take(formulas, other.formulas);
    take(concurrency, other.concurrency);
    take(platform, other.platform);
    take(link, other.link);
    take(keep_going, other.keep_going);
    take(fetch_retries, other.fetch_retries);
    take(fetch_backoff_ms, other.fetch_backoff_ms);
    take(fetch_timeout_s, other.fetch_timeout_s);
    take(lock_timeout_ms, other.lock_timeout_ms);
}

Result<Settings> Config::resolve() const {
    Settings s;
    s.root = fs::path(root ? *root : default_root());
    s.prefix = prefix ? fs::path(*prefix) : s.root / "prefix";
    s.formulas = formulas ? fs::path(*formulas) : s.root / "formulas";

    if (concurrency) {
        if (*concurrency < 1) {
            return ZbError{ZbError::Config, "concurrency must be at least 1"};
        }
        s.concurrency = static_cast<size_t>(*concurrency);
    }
    if (platform) {
        auto p = Platform::parse(*platform);
        if (p.is_err()) {
            return ZbError{ZbError::Config,
                "invalid platform '" + *platform + "': " + p.error().message};
        }
        s.platform = p.value();
    }
    if (link) s.link = *link;
    if (keep_going) s.keep_going = *keep_going;
    if (fetch_retries) {
        if (*fetch_retries < 0) {
            return ZbError{ZbError::Config, "fetch.retries cannot be negative"};
        }
        s.fetch_retries = static_cast<int>(*fetch_retries);
    }
    if (fetch_backoff_ms) {
        if (*fetch_backoff_ms < 0) {
            return ZbError{ZbError::Config, "fetch.backoff_ms cannot be negative"};
        }
        s.fetch_backoff = std::chrono::milliseconds(*fetch_backoff_ms);
    }
    if (fetch_timeout_s) {
        if (*fetch_timeout_s < 0) {
            return ZbError{ZbError::Config, "fetch.timeout_s cannot be negative"};
        }
        s.fetch_timeout_s = *fetch_timeout_s;
    }
    if (lock_timeout_ms) {
        if (*lock_timeout_ms < 0) {
            return ZbError{ZbError::Config, "lock.timeout_ms cannot be negative"};
        }
        s.lock_timeout = std::chrono::milliseconds(*lock_timeout_ms);
    }
    return Result<Settings>::ok(std::move(s));
}

std::string global_config_path() {
    if (auto xdg = env("XDG_CONFIG_HOME")) return *xdg + "/zb/config.toml";
    auto home = env("HOME");
    if (!home) return "";
    return *home + "/.config/zb/config.toml";
}

std::string default_root() {
    if (auto root = env("ZEROBREW_ROOT")) return *root;
    std::error_code ec;
    if (fs::is_directory("/opt/zerobrew", ec)) return "/opt/zerobrew";
#ifdef __APPLE__
    return "/opt/zerobrew";
#else
    if (auto xdg = env("XDG_DATA_HOME")) return *xdg + "/zerobrew";
    if (auto home = env("HOME")) return *home + "/.local/share/zerobrew";
    return "/opt/zerobrew";
#endif
}

Result<Settings> load_settings(const Config& flags) {
    auto environment = Config::from_env();
    if (environment.is_err()) return std::move(environment).error();

    Config effective;
    std::error_code ec;

    std::string global = global_config_path();
    if (!global.empty() && fs::exists(global, ec)) {
        auto cfg = Config::load(global);
        if (cfg.is_err()) return std::move(cfg).error();
        effective.merge(cfg.value());
        log::debug("loaded %s", global.c_str());
    }

    // The root itself may come from any layer but the root file
    Config locating = effective;
    locating.merge(environment.value());
    locating.merge(flags);
    fs::path root = locating.root ? fs::path(*locating.root) : fs::path(default_root());

    fs::path local = root / "config.toml";
    if (fs::exists(local, ec)) {
        auto cfg = Config::load(local.string());
        if (cfg.is_err()) return std::move(cfg).error();
        effective.merge(cfg.value());
        log::debug("loaded %s", local.c_str());
    }

    effective.merge(environment.value());
    effective.merge(flags);
    if (!effective.root) effective.root = root.string();
    return effective.resolve();
}

} // namespace zb
