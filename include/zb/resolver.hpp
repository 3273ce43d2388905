#pragma once

#include <zb/formula.hpp>
#include <zb/formula_repository.hpp>
#include <zb/result.hpp>
#include <zb/version.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zb {

// What the resolver needs to know about an installed package
struct InstalledPackage {
    std::string name;
    Version version;
    std::vector<std::string> dependencies;
};

class InstalledLookup {
public:
    virtual ~InstalledLookup() = default;
    virtual std::optional<InstalledPackage> find_installed(const std::string& name) const = 0;
};

// Map-backed InstalledLookup
class InstalledSet : public InstalledLookup {
public:
    void add(InstalledPackage pkg);
    std::optional<InstalledPackage> find_installed(const std::string& name) const override;
    bool empty() const { return packages_.empty(); }

private:
    std::map<std::string, InstalledPackage> packages_;
};

// A user request: "name", "name>=2.0", "homebrew/core/name ^1.2"
struct Request {
    std::string name;
    VersionReq req;

    static Result<Request> parse(const std::string& text);
    std::string to_string() const;
};

struct PlanEntry {
    std::string name;
    Version version;
    const Formula* formula = nullptr;      // null only for a satisfied entry whose formula is gone
    std::optional<BottleSpec> bottle;      // filled in by bottle selection
    bool satisfied = false;                // already installed at a compatible version
    bool requested = false;                // named by the caller
    std::vector<std::string> dependencies; // direct, sorted

    std::string id() const { return name + " " + version.to_string(); }
};

// Dependency-first install order with no duplicate names
struct ResolvedPlan {
    std::vector<PlanEntry> entries;
    std::vector<std::string> roots;        // requested names, sorted

    const PlanEntry* find(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    // Indented dependency tree below `root`; repeated subtrees are marked (*)
    std::string tree_display(const std::string& root) const;
};

// Depth-first resolver over an arena of nodes keyed by name. Constraints on
// one name are collected from every requester; a late constraint that
// invalidates an earlier choice restarts resolution with what was learned.
class Resolver {
public:
    Resolver(const FormulaLookup& formulas, const InstalledLookup& installed);

    Result<ResolvedPlan> resolve(const std::vector<std::string>& requests) const;
    Result<ResolvedPlan> resolve(const std::vector<Request>& requests) const;

private:
    const FormulaLookup& formulas_;
    const InstalledLookup& installed_;
};

Result<ResolvedPlan> resolve(const std::vector<std::string>& requests,
                             const FormulaLookup& formulas,
                             const InstalledLookup& installed);

} // namespace zb
