#include <zb/config.hpp>
#include <zb/installer.hpp>
#include <zb/layout.hpp>
#include <zb/log.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace zb;

namespace {

int fail(const ZbError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return 1;
}

std::string human_bytes(uint64_t n) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(n);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, units[u]);
    return buf;
}

// Everything a command needs, built from the layered settings
struct Session {
    Settings settings;
    FormulaRepository formulas;
    std::unique_ptr<CurlTransport> transport;
    std::unique_ptr<Installer> installer;
};

Result<std::unique_ptr<Session>> open_session(const Config& flags, bool need_formulas) {
    auto settings = load_settings(flags);
    if (settings.is_err()) return std::move(settings).error();

    auto session = std::make_unique<Session>();
    session->settings = std::move(settings).value();
    const Settings& s = session->settings;

    auto loaded = session->formulas.load_directory(s.formulas);
    if (loaded.is_err()) {
        if (need_formulas || loaded.code() != ZbError::NotFound) {
            return std::move(loaded).error();
        }
        log::debug("no formula directory at %s", s.formulas.c_str());
    }

    TransportOptions topts;
    topts.timeout_s = s.fetch_timeout_s;
    session->transport = std::make_unique<CurlTransport>(topts);

    FetchOptions fopts;
    fopts.retries = s.fetch_retries;
    fopts.backoff = s.fetch_backoff;

    session->installer = std::make_unique<Installer>(
        Layout(s.root, s.prefix), session->formulas, *session->transport,
        s.host(), fopts, s.lock_timeout);
    auto opened = session->installer->open();
    if (opened.is_err()) return std::move(opened).error();

    log::debug("root %s, prefix %s, platform %s", s.root.c_str(), s.prefix.c_str(),
               session->installer->host().to_string().c_str());
    return Result<std::unique_ptr<Session>>::ok(std::move(session));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_init(const Config& flags) {
    auto settings = load_settings(flags);
    if (settings.is_err()) return fail(settings.error());
    Layout layout(settings.value().root, settings.value().prefix);
    auto st = layout.init();
    if (st.is_err()) return fail(st.error());
    std::printf("initialized %s (prefix %s)\n", layout.root.c_str(), layout.prefix.c_str());
    return 0;
}

int cmd_install(const Config& flags, const std::vector<std::string>& names,
                bool no_link, bool fail_fast) {
    auto session = open_session(flags, true);
    if (session.is_err()) return fail(session.error());
    Session& s = *session.value();

    InstallOptions opts;
    opts.link = s.settings.link && !no_link;
    opts.keep_going = s.settings.keep_going && !fail_fast;
    opts.concurrency = s.settings.concurrency;

    InstallReport report = s.installer->install(names, opts);
    if (report.plan_error) return fail(*report.plan_error);

    for (auto& e : report.entries) {
        if (e.ok()) {
            std::printf("==> %s %s%s\n", e.name.c_str(), e.version.c_str(),
                        e.already_installed ? " (already installed)" : "");
        } else if (e.error) {
            std::fprintf(stderr, "%s\n", e.error->format().c_str());
        }
    }
    if (!report.ok()) {
        std::fprintf(stderr, "%zu of %zu packages failed\n",
                     report.failed(), report.entries.size());
        return 1;
    }
    return 0;
}

int cmd_uninstall(const Config& flags, const std::string& name, bool force) {
    auto session = open_session(flags, false);
    if (session.is_err()) return fail(session.error());
    Installer& installer = *session.value()->installer;

    if (name.empty()) {
        auto removed = installer.uninstall_all();
        if (removed.is_err()) return fail(removed.error());
        if (removed.value().empty()) {
            std::printf("no packages installed\n");
            return 0;
        }
        for (auto& n : removed.value()) std::printf("uninstalled %s\n", n.c_str());
        return 0;
    }

    auto st = installer.uninstall(name, force);
    if (st.is_err()) return fail(st.error());
    std::printf("uninstalled %s\n", name.c_str());
    return 0;
}

int cmd_list(const Config& flags) {
    auto session = open_session(flags, false);
    if (session.is_err()) return fail(session.error());
    auto records = session.value()->installer->list_installed();
    if (records.is_err()) return fail(records.error());
    for (auto& r : records.value()) {
        std::printf("%s %s%s%s\n", r.name.c_str(), r.version.c_str(),
                    r.requested ? "" : " (dependency)",
                    r.linked ? "" : " (not linked)");
    }
    return 0;
}

int cmd_info(const Config& flags, const std::string& name) {
    auto session = open_session(flags, false);
    if (session.is_err()) return fail(session.error());
    Session& s = *session.value();

    auto normalized = normalize_formula_name(name);
    if (normalized.is_err()) return fail(normalized.error());

    const Formula* formula = s.formulas.find(normalized.value());
    auto installed = s.installer->get_installed(normalized.value());
    if (installed.is_err() && installed.code() != ZbError::NotInstalled) {
        return fail(installed.error());
    }
    if (!formula && installed.is_err()) {
        return fail(ZbError{ZbError::UnknownFormula,
            "no formula or installed package named '" + normalized.value() + "'"});
    }

    if (formula) {
        std::printf("%s %s\n", formula->name.c_str(), formula->version.to_string().c_str());
        if (!formula->desc.empty()) std::printf("%s\n", formula->desc.c_str());
        if (!formula->homepage.empty()) std::printf("%s\n", formula->homepage.c_str());
        if (!formula->dependencies.empty()) {
            std::printf("dependencies:\n");
            for (auto& d : formula->dependencies) std::printf("  %s\n", d.to_string().c_str());
        }
        std::printf("bottles:\n");
        for (auto& [tag, bottle] : formula->bottles) {
            std::printf("  %s %s\n", tag.c_str(), bottle.sha256.c_str());
        }
    }
    if (installed.is_ok()) {
        auto& r = installed.value();
        std::printf("installed: %s (store %s%s)\n", r.version.c_str(),
                    r.store_key.substr(0, 12).c_str(), r.linked ? ", linked" : "");
    } else {
        std::printf("not installed\n");
    }
    return 0;
}

int cmd_gc(const Config& flags) {
    auto session = open_session(flags, false);
    if (session.is_err()) return fail(session.error());
    auto report = session.value()->installer->gc();
    if (report.is_err()) return fail(report.error());
    auto& r = report.value();
    for (auto& key : r.removed_keys) std::printf("removed %s\n", key.c_str());
    std::printf("%zu store entries, %zu staging dirs, %zu partial downloads removed; %s freed\n",
                r.removed_keys.size(), r.stale_staging, r.stale_partials,
                human_bytes(r.bytes_freed).c_str());
    if (!r.young_orphans.empty()) {
        std::printf("%zu unrecorded entries kept until they are an hour old\n",
                    r.young_orphans.size());
    }
    return 0;
}

int cmd_plan(const Config& flags, const std::vector<std::string>& names) {
    auto session = open_session(flags, true);
    if (session.is_err()) return fail(session.error());
    auto plan = session.value()->installer->plan(names);
    if (plan.is_err()) return fail(plan.error());
    for (auto& e : plan.value().entries) {
        if (e.satisfied) {
            std::printf("%s [installed]\n", e.id().c_str());
        } else {
            std::printf("%s %s\n", e.id().c_str(), e.bottle->platform_tag().c_str());
        }
    }
    return 0;
}

int cmd_deps(const Config& flags, const std::string& name) {
    auto session = open_session(flags, true);
    if (session.is_err()) return fail(session.error());
    auto plan = session.value()->installer->plan({name});
    if (plan.is_err()) return fail(plan.error());
    const auto& root = plan.value().roots.front();
    std::printf("%s", plan.value().tree_display(root).c_str());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"zb - binary package manager"};

    Config flags;
    std::string root, prefix, formulas, platform;
    long concurrency = 0;
    bool verbose = false;

    app.add_option("--root", root, "Installation root (store, db, cache, locks)");
    app.add_option("--prefix", prefix, "Prefix receiving Cellar and bin links");
    app.add_option("--formulas", formulas, "Directory of formula JSON documents");
    auto* conc_opt = app.add_option("--concurrency", concurrency, "Parallel downloads");
    app.add_option("--platform", platform, "Platform tag overriding host detection");
    app.add_flag("-v,--verbose", verbose, "Debug logging");
    app.require_subcommand(1);

    auto* init = app.add_subcommand("init", "Create the directory layout");

    std::vector<std::string> install_names;
    bool no_link = false, fail_fast = false;
    auto* install = app.add_subcommand("install", "Install packages and their dependencies");
    install->add_option("names", install_names, "Packages, optionally with constraints")->required();
    install->add_flag("--no-link", no_link, "Do not link into the prefix");
    install->add_flag("--fail-fast", fail_fast, "Stop at the first failed package");

    std::string uninstall_name;
    bool force = false;
    auto* uninstall = app.add_subcommand("uninstall", "Remove an installed package, or all of them");
    uninstall->add_option("name", uninstall_name, "Package; every installed package if omitted");
    uninstall->add_flag("--force", force, "Remove even if other packages depend on it");

    auto* list = app.add_subcommand("list", "List installed packages");

    std::string info_name;
    auto* info = app.add_subcommand("info", "Show a formula and its install state");
    info->add_option("name", info_name, "Package")->required();

    auto* gc = app.add_subcommand("gc", "Remove unreferenced store entries");

    std::vector<std::string> plan_names;
    auto* plan = app.add_subcommand("plan", "Show the install plan without installing");
    plan->add_option("names", plan_names, "Packages")->required();

    std::string deps_name;
    auto* deps = app.add_subcommand("deps", "Show the dependency tree of a package");
    deps->add_option("name", deps_name, "Package")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (verbose) log::set_level(log::Debug);
    log::init_from_env();

    if (!root.empty()) flags.root = root;
    if (!prefix.empty()) flags.prefix = prefix;
    if (!formulas.empty()) flags.formulas = formulas;
    if (!platform.empty()) flags.platform = platform;
    if (conc_opt->count() > 0) flags.concurrency = concurrency;

    if (init->parsed()) return cmd_init(flags);
    if (install->parsed()) return cmd_install(flags, install_names, no_link, fail_fast);
    if (uninstall->parsed()) return cmd_uninstall(flags, uninstall_name, force);
    if (list->parsed()) return cmd_list(flags);
    if (info->parsed()) return cmd_info(flags, info_name);
    if (gc->parsed()) return cmd_gc(flags);
    if (plan->parsed()) return cmd_plan(flags, plan_names);
    if (deps->parsed()) return cmd_deps(flags, deps_name);
    return 1;
}
