#pragma once

#include <zb/bottle_selector.hpp>
#include <zb/database.hpp>
#include <zb/fetcher.hpp>
#include <zb/formula_repository.hpp>
#include <zb/layout.hpp>
#include <zb/lock.hpp>
#include <zb/resolver.hpp>
#include <zb/result.hpp>
#include <zb/store.hpp>
#include <zb/transport.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zb {

enum class InstallState {
    Pending,
    Selecting,
    Fetching,
    Verifying,
    Storing,
    Linking,
    Recorded,
    Failed,
};

const char* install_state_name(InstallState s);

// Per-entry state holder. Only forward steps of
//   Pending -> Selecting -> Fetching -> Verifying -> Storing -> Linking -> Recorded
// are accepted, plus Storing -> Recorded for unlinked installs,
// Pending -> Recorded for satisfied entries and Failed from any
// non-terminal state. Anything else is rejected with InvalidArg.
class EntryState {
public:
    InstallState state() const { return state_; }
    bool terminal() const {
        return state_ == InstallState::Recorded || state_ == InstallState::Failed;
    }
    const std::optional<ZbError>& reason() const { return reason_; }
    const std::vector<InstallState>& history() const { return history_; }

    Status advance(InstallState next);
    Status fail(ZbError reason);

    static bool allowed(InstallState from, InstallState to);

private:
    InstallState state_ = InstallState::Pending;
    std::optional<ZbError> reason_;
    std::vector<InstallState> history_{InstallState::Pending};
};

struct InstallOptions {
    bool link = true;          // create prefix links
    bool keep_going = true;    // false: first failure aborts the rest
    size_t concurrency = 48;   // parallel downloads
};

struct EntryOutcome {
    std::string name;
    std::string version;
    bool requested = false;
    bool already_installed = false;
    bool reused_store = false;          // bottle was already in the store
    std::string store_key;
    InstallState state = InstallState::Pending;
    std::vector<InstallState> history;
    std::optional<ZbError> error;

    bool ok() const { return state == InstallState::Recorded; }
};

struct InstallReport {
    std::optional<ZbError> plan_error;  // resolution failed; nothing was attempted
    std::vector<EntryOutcome> entries;  // plan order

    bool ok() const;
    size_t installed() const;           // recorded by this run
    size_t failed() const;
    const EntryOutcome* find(const std::string& name) const;
};

// Runs install transactions against one Layout. Several installers, in
// one process or many, may share a layout.
class Installer {
public:
    Installer(Layout layout, const FormulaLookup& formulas, Transport& transport,
              Platform host, FetchOptions fetch_opts = {},
              std::chrono::milliseconds lock_timeout = std::chrono::seconds(30));

    Installer(const Installer&) = delete;
    Installer& operator=(const Installer&) = delete;

    // Create the layout and open the database; required before anything else
    Status open();

    // Resolve, select, fetch, store, link and record every plan entry.
    // Entry failures are reported, not returned.
    InstallReport install(const std::vector<std::string>& names, const InstallOptions& opts = {});

    // Resolution and bottle selection only; nothing on disk changes
    Result<ResolvedPlan> plan(const std::vector<std::string>& names);

    // Refuses with HasDependents while other installed packages need `name`
    // unless `force`. The store entry stays until gc().
    Status uninstall(const std::string& name, bool force = false);

    // Uninstalls every installed package, dependents before their
    // dependencies, and returns the names in removal order. Stops at the
    // first failure; packages removed before it stay removed.
    Result<std::vector<std::string>> uninstall_all();

    Result<std::vector<InstalledRecord>> list_installed();
    Result<InstalledRecord> get_installed(const std::string& name);

    Result<GcReport> gc(std::chrono::seconds stale_after = std::chrono::hours(1));

    // Installed packages the resolver may treat as satisfied: records whose
    // store entry exists on disk
    Result<InstalledSet> installed_set();

    const Layout& layout() const { return layout_; }
    const Platform& host() const { return selector_.host(); }
    Database& database() { return db_; }
    StoreManager& store() { return store_; }
    const Fetcher& fetcher() const { return fetcher_; }

private:
    // Fetching through Recorded for one selected entry; called under its
    // package lock
    Status run_entry(const PlanEntry& entry, Result<std::shared_ptr<Artifact>>& prefetched,
                     const InstallOptions& opts, EntryState& state, EntryOutcome& outcome);

    Layout layout_;
    const FormulaLookup& formulas_;
    BottleSelector selector_;
    LockManager locks_;
    Database db_;
    Fetcher fetcher_;
    StoreManager store_;
    std::chrono::milliseconds lock_timeout_;
    bool opened_ = false;
};

} // namespace zb
