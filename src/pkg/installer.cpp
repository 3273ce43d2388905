#include <zb/installer.hpp>
#include <zb/log.hpp>

#include <algorithm>
#include <ctime>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace zb {

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

const char* install_state_name(InstallState s) {
    switch (s) {
        case InstallState::Pending:   return "Pending";
        case InstallState::Selecting: return "Selecting";
        case InstallState::Fetching:  return "Fetching";
        case InstallState::Verifying: return "Verifying";
        case InstallState::Storing:   return "Storing";
        case InstallState::Linking:   return "Linking";
        case InstallState::Recorded:  return "Recorded";
        case InstallState::Failed:    return "Failed";
    }
    return "Unknown";
}

bool EntryState::allowed(InstallState from, InstallState to) {
    using S = InstallState;
    if (from == S::Recorded || from == S::Failed) return false;
    if (to == S::Failed) return true;
    switch (from) {
        case S::Pending:   return to == S::Selecting || to == S::Recorded;
        case S::Selecting: return to == S::Fetching;
        case S::Fetching:  return to == S::Verifying;
        case S::Verifying: return to == S::Storing;
        case S::Storing:   return to == S::Linking || to == S::Recorded;
        case S::Linking:   return to == S::Recorded;
        default:           return false;
    }
}

Status EntryState::advance(InstallState next) {
    if (next == InstallState::Failed) {
        return ZbError{ZbError::InvalidArg, "use fail() to enter the Failed state"};
    }
    if (!allowed(state_, next)) {
        return ZbError{ZbError::InvalidArg,
            std::string("illegal install transition ") + install_state_name(state_) +
            " -> " + install_state_name(next)};
    }
    state_ = next;
    history_.push_back(next);
    return ok_status();
}

Status EntryState::fail(ZbError reason) {
    if (!allowed(state_, InstallState::Failed)) {
        return ZbError{ZbError::InvalidArg,
            std::string("cannot fail an entry in state ") + install_state_name(state_)};
    }
    state_ = InstallState::Failed;
    history_.push_back(InstallState::Failed);
    reason_ = std::move(reason);
    return ok_status();
}

// ---------------------------------------------------------------------------
// InstallReport
// ---------------------------------------------------------------------------

bool InstallReport::ok() const {
    if (plan_error) return false;
    for (auto& e : entries) {
        if (!e.ok()) return false;
    }
    return true;
}

size_t InstallReport::installed() const {
    size_t n = 0;
    for (auto& e : entries) {
        if (e.ok() && !e.already_installed) ++n;
    }
    return n;
}

size_t InstallReport::failed() const {
    size_t n = 0;
    for (auto& e : entries) {
        if (e.state == InstallState::Failed) ++n;
    }
    return n;
}

const EntryOutcome* InstallReport::find(const std::string& name) const {
    for (auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

namespace {

void remove_links(const LinkReport& links) {
    for (auto it = links.created.rbegin(); it != links.created.rend(); ++it) {
        std::error_code ec;
        fs::remove(*it, ec);
        if (ec) log::warn("cannot remove link %s: %s", it->c_str(), ec.message().c_str());
    }
}

ZbError not_opened() {
    return ZbError{ZbError::InvalidArg, "installer used before open()"};
}

} // namespace

Installer::Installer(Layout layout, const FormulaLookup& formulas, Transport& transport,
                     Platform host, FetchOptions fetch_opts,
                     std::chrono::milliseconds lock_timeout)
    : layout_(std::move(layout)),
      formulas_(formulas),
      selector_(std::move(host)),
      locks_(layout_.lock_dir()),
      fetcher_(transport, layout_.cache_dir(), fetch_opts),
      store_(layout_.store_dir(), layout_.prefix, locks_, db_, lock_timeout),
      lock_timeout_(lock_timeout) {}

Status Installer::open() {
    ZB_TRY(layout_.init());
    ZB_TRY(db_.open(layout_.db_path().string()));
    opened_ = true;
    return ok_status();
}

Result<InstalledSet> Installer::installed_set() {
    if (!opened_) return not_opened();

    auto records = db_.list();
    if (records.is_err()) return std::move(records).error();

    InstalledSet set;
    for (auto& rec : records.value()) {
        if (!store_.contains(rec.store_key)) {
            log::warn("%s %s references missing store entry %s; it will be reinstalled",
                      rec.name.c_str(), rec.version.c_str(), rec.store_key.c_str());
            continue;
        }
        auto version = Version::parse(rec.version);
        if (version.is_err()) {
            log::warn("%s has unreadable version '%s'; it will be reinstalled",
                      rec.name.c_str(), rec.version.c_str());
            continue;
        }
        set.add(InstalledPackage{rec.name, std::move(version).value(), rec.dependencies});
    }
    return Result<InstalledSet>::ok(std::move(set));
}

Result<ResolvedPlan> Installer::plan(const std::vector<std::string>& names) {
    auto installed = installed_set();
    if (installed.is_err()) return std::move(installed).error();

    auto plan = Resolver(formulas_, installed.value()).resolve(names);
    if (plan.is_err()) return plan;

    for (auto& entry : plan.value().entries) {
        if (entry.satisfied) continue;
        auto bottle = selector_.select(*entry.formula);
        if (bottle.is_err()) return std::move(bottle).error();
        entry.bottle = std::move(bottle).value();
    }
    return plan;
}

InstallReport Installer::install(const std::vector<std::string>& names,
                                 const InstallOptions& opts) {
    InstallReport report;

    auto installed = installed_set();
    if (installed.is_err()) {
        report.plan_error = std::move(installed).error();
        return report;
    }

    auto resolved = Resolver(formulas_, installed.value()).resolve(names);
    if (resolved.is_err()) {
        report.plan_error = std::move(resolved).error();
        return report;
    }
    auto& entries = resolved.value().entries;
    const size_t n = entries.size();

    std::vector<EntryState> states(n);
    report.entries.resize(n);
    for (size_t i = 0; i < n; ++i) {
        report.entries[i].name = entries[i].name;
        report.entries[i].version = entries[i].version.to_string();
        report.entries[i].requested = entries[i].requested;
    }

    std::set<std::string> failed;
    bool aborted = false;

    auto fail_entry = [&](size_t i, ZbError err) {
        log::debug("%s failed: %s", entries[i].id().c_str(), err.message.c_str());
        auto st = states[i].fail(std::move(err));
        if (st.is_err()) log::error("%s", st.error().message.c_str());
        failed.insert(entries[i].name);
        if (!opts.keep_going) aborted = true;
    };

    // Phase 1: selection for every entry before anything touches disk
    for (size_t i = 0; i < n; ++i) {
        if (entries[i].satisfied) {
            report.entries[i].already_installed = true;
            auto st = states[i].advance(InstallState::Recorded);
            if (st.is_err()) fail_entry(i, std::move(st).error());
            continue;
        }
        auto st = states[i].advance(InstallState::Selecting);
        if (st.is_err()) {
            fail_entry(i, std::move(st).error());
            continue;
        }
        auto bottle = selector_.select(*entries[i].formula);
        if (bottle.is_err()) {
            fail_entry(i, std::move(bottle).error());
            continue;
        }
        entries[i].bottle = std::move(bottle).value();
        log::debug("%s: bottle %s", entries[i].id().c_str(),
                   entries[i].bottle->platform_tag().c_str());
    }

    // Phase 2: fetch every selected bottle concurrently
    std::vector<BottleSpec> specs;
    std::vector<int> slot(n, -1);
    if (!aborted) {
        for (size_t i = 0; i < n; ++i) {
            if (states[i].state() != InstallState::Selecting) continue;
            slot[i] = static_cast<int>(specs.size());
            specs.push_back(*entries[i].bottle);
        }
    }
    auto fetched = ParallelFetcher(fetcher_, opts.concurrency).fetch_all(specs);

    // Phase 3: one transaction per entry, dependencies first
    for (size_t i = 0; i < n; ++i) {
        if (states[i].terminal()) continue;

        if (aborted) {
            fail_entry(i, ZbError{ZbError::Aborted,
                "not attempted: an earlier entry failed and --fail-fast is set"});
            continue;
        }

        std::string broken;
        for (auto& dep : entries[i].dependencies) {
            if (failed.count(dep)) {
                broken = dep;
                break;
            }
        }
        if (!broken.empty()) {
            fail_entry(i, ZbError{ZbError::DependencyFailed,
                "not attempted: dependency '" + broken + "' of '" + entries[i].name + "' failed"});
            continue;
        }

        auto st = run_entry(entries[i], fetched[static_cast<size_t>(slot[i])], opts,
                            states[i], report.entries[i]);
        if (st.is_err()) {
            fail_entry(i, std::move(st).error());
        } else {
            log::info("installed %s", entries[i].id().c_str());
        }
    }

    for (size_t i = 0; i < n; ++i) {
        auto& out = report.entries[i];
        out.state = states[i].state();
        out.history = states[i].history();
        out.error = states[i].reason();
    }

    log::debug("install finished: %zu installed, %zu failed, %zu entries",
               report.installed(), report.failed(), n);
    return report;
}

Status Installer::run_entry(const PlanEntry& entry,
                            Result<std::shared_ptr<Artifact>>& prefetched,
                            const InstallOptions& opts, EntryState& state,
                            EntryOutcome& outcome) {
    const BottleSpec& bottle = *entry.bottle;
    const std::string version = entry.version.to_string();

    auto lock = locks_.acquire(LockManager::package(entry.name), lock_timeout_);
    if (lock.is_err()) return std::move(lock).error();

    // Read under the lock so a concurrent install of the same name is seen
    std::optional<InstalledRecord> previous;
    auto existing = db_.get(entry.name);
    if (existing.is_ok()) {
        previous = std::move(existing).value();
    } else if (existing.code() != ZbError::NotInstalled) {
        return std::move(existing).error();
    }

    ZB_TRY(state.advance(InstallState::Fetching));
    if (prefetched.is_err()) return prefetched.error();
    const Artifact& artifact = *prefetched.value();

    ZB_TRY(state.advance(InstallState::Verifying));
    if (artifact.sha256() != bottle.sha256 ||
        (bottle.size != 0 && artifact.size() != bottle.size)) {
        return ZbError{ZbError::IntegrityError,
            "artifact for " + entry.id() + " does not match its bottle declaration"};
    }

    ZB_TRY(state.advance(InstallState::Storing));

    // Held until the record and counter are committed; gc takes it too
    Lock root;
    auto stored = store_.install(artifact, bottle.sha256, &root);
    if (stored.is_err()) return std::move(stored).error();
    const StoreEntry& store_entry = stored.value();
    outcome.store_key = store_entry.key;
    outcome.reused_store = store_entry.reused;

    // A different version of this name was linked; its links go first
    if (previous && previous->linked && previous->version != version) {
        ZB_TRY(store_.unlink_from_prefix(previous->name, previous->version));
    }

    LinkReport links;
    bool linked = previous && previous->linked && previous->version == version;
    if (opts.link) {
        ZB_TRY(state.advance(InstallState::Linking));
        auto made = store_.link_into_prefix(store_entry, entry.name, version);
        if (made.is_err()) return std::move(made).error();
        links = std::move(made).value();
        linked = true;
    }

    InstalledRecord record;
    record.name = entry.name;
    record.version = version;
    record.store_key = store_entry.key;
    record.dependencies = entry.dependencies;
    record.installed_at = static_cast<int64_t>(std::time(nullptr));
    record.linked = linked;
    record.tree_hash = store_entry.tree_hash;
    record.requested = entry.requested || (previous && previous->requested);

    auto upserted = db_.upsert(record);
    if (upserted.is_err()) {
        remove_links(links);
        return std::move(upserted).error();
    }

    // Counters trail the records; gc reconciles any drift
    if (!previous || previous->store_key != store_entry.key) {
        auto count = store_.retain(store_entry.key);
        if (count.is_err()) {
            log::warn("cannot retain %s: %s", store_entry.key.c_str(),
                      count.error().message.c_str());
        }
        if (previous) {
            auto old = store_.release(previous->store_key);
            if (old.is_err()) {
                log::warn("cannot release %s: %s", previous->store_key.c_str(),
                          old.error().message.c_str());
            }
        }
    }

    return state.advance(InstallState::Recorded);
}

Status Installer::uninstall(const std::string& name, bool force) {
    if (!opened_) return not_opened();

    auto normalized = normalize_formula_name(name);
    if (normalized.is_err()) return std::move(normalized).error();
    const std::string& pkg = normalized.value();

    auto lock = locks_.acquire(LockManager::package(pkg), lock_timeout_);
    if (lock.is_err()) return std::move(lock).error();

    auto record = db_.get(pkg);
    if (record.is_err()) return std::move(record).error();

    auto dependents = db_.dependents_of(pkg);
    if (dependents.is_err()) return std::move(dependents).error();
    if (!dependents.value().empty()) {
        std::string list;
        for (auto& d : dependents.value()) {
            if (!list.empty()) list += ", ";
            list += d;
        }
        if (!force) {
            return ZbError{ZbError::HasDependents,
                "cannot uninstall '" + pkg + "': required by " + list,
                "use --force to remove it anyway"};
        }
        log::warn("removing '%s' although %s depend on it", pkg.c_str(), list.c_str());
    }

    const InstalledRecord& rec = record.value();
    if (rec.linked) {
        ZB_TRY(store_.unlink_from_prefix(rec.name, rec.version));
    }

    auto root = store_.lock_root();
    if (root.is_err()) return std::move(root).error();
    ZB_TRY(db_.remove(pkg));

    auto count = store_.release(rec.store_key);
    if (count.is_err()) {
        log::warn("cannot release %s: %s", rec.store_key.c_str(),
                  count.error().message.c_str());
    }

    log::info("uninstalled %s %s", rec.name.c_str(), rec.version.c_str());
    return ok_status();
}

Result<std::vector<std::string>> Installer::uninstall_all() {
    if (!opened_) return not_opened();

    auto records = db_.list();
    if (records.is_err()) return std::move(records).error();

    // Installed dependents still present, per package
    std::map<std::string, std::set<std::string>> users;
    for (auto& rec : records.value()) users[rec.name];
    for (auto& rec : records.value()) {
        for (auto& dep : rec.dependencies) {
            auto it = users.find(dep);
            if (it != users.end()) it->second.insert(rec.name);
        }
    }

    std::vector<std::string> removed;
    while (!users.empty()) {
        // Leaves first; a leftover cycle is broken at its first name
        auto next = std::find_if(users.begin(), users.end(),
                                 [](const auto& u) { return u.second.empty(); });
        bool force = next == users.end();
        if (force) next = users.begin();
        std::string name = next->first;

        ZB_TRY(uninstall(name, force));
        removed.push_back(name);
        users.erase(name);
        for (auto& u : users) u.second.erase(name);
    }

    log::info("uninstalled %zu packages", removed.size());
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

Result<std::vector<InstalledRecord>> Installer::list_installed() {
    if (!opened_) return not_opened();
    return db_.list();
}

Result<InstalledRecord> Installer::get_installed(const std::string& name) {
    if (!opened_) return not_opened();
    auto normalized = normalize_formula_name(name);
    if (normalized.is_err()) return std::move(normalized).error();
    return db_.get(normalized.value());
}

Result<GcReport> Installer::gc(std::chrono::seconds stale_after) {
    if (!opened_) return not_opened();
    return store_.collect_garbage({fetcher_.tmp_dir()}, stale_after);
}

} // namespace zb
