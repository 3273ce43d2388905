#include <zb/resolver.hpp>
#include <zb/log.hpp>

#include <algorithm>
#include <functional>
#include <set>
#include <sstream>

namespace zb {

// ---------------------------------------------------------------------------
// InstalledSet / Request
// ---------------------------------------------------------------------------

void InstalledSet::add(InstalledPackage pkg) {
    std::string name = pkg.name;
    packages_[name] = std::move(pkg);
}

std::optional<InstalledPackage> InstalledSet::find_installed(const std::string& name) const {
    auto it = packages_.find(name);
    if (it == packages_.end()) return std::nullopt;
    return it->second;
}

Result<Request> Request::parse(const std::string& text) {
    auto dep = Dependency::parse(text);
    if (dep.is_err()) return std::move(dep).error();
    Request r;
    r.name = std::move(dep.value().name);
    r.req = std::move(dep.value().req);
    return Result<Request>::ok(std::move(r));
}

std::string Request::to_string() const {
    if (req.is_any()) return name;
    return name + " " + req.to_string();
}

// ---------------------------------------------------------------------------
// ResolvedPlan
// ---------------------------------------------------------------------------

const PlanEntry* ResolvedPlan::find(const std::string& name) const {
    for (auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

std::vector<std::string> ResolvedPlan::names() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (auto& e : entries) out.push_back(e.name);
    return out;
}

std::string ResolvedPlan::tree_display(const std::string& root) const {
    std::ostringstream out;
    std::set<std::string> visited;

    std::function<void(const std::string&, const std::string&, bool, bool)> walk =
        [&](const std::string& name, const std::string& prefix, bool is_last, bool top) {
            const PlanEntry* e = find(name);
            out << prefix;
            if (!top) out << (is_last ? "└── " : "├── ");
            out << (e ? e->id() : name);
            if (e && e->satisfied) out << " [installed]";

            if (!visited.insert(name).second) {
                out << " (*)\n";
                return;
            }
            out << "\n";
            if (!e) return;

            std::string child_prefix = top ? "" : prefix + (is_last ? "    " : "│   ");
            for (size_t i = 0; i < e->dependencies.size(); ++i) {
                walk(e->dependencies[i], child_prefix, i + 1 == e->dependencies.size(), false);
            }
        };

    walk(root, "", true, true);
    return out.str();
}

// ---------------------------------------------------------------------------
// Resolution state
// ---------------------------------------------------------------------------

namespace {

enum class Mark { Unvisited, InProgress, Done };

struct Requirement {
    VersionReq req;
    std::string requester;                 // empty for a top-level request
    std::optional<Version> requester_version;

    std::string describe() const {
        std::string from = requester.empty()
            ? "requested"
            : "required by " + requester + " " + requester_version->to_string();
        return req.to_string() + " (" + from + ")";
    }

    bool same_as(const Requirement& o) const {
        return requester == o.requester &&
               requester_version == o.requester_version &&
               req.to_string() == o.req.to_string();
    }
};

struct Node {
    Mark mark = Mark::Unvisited;
    Version version;
    const Formula* formula = nullptr;
    bool satisfied = false;
    std::vector<std::string> deps;
    std::map<std::string, VersionReq> dep_reqs;
};

using RequirementMap = std::map<std::string, std::vector<Requirement>>;

class Pass {
public:
    Pass(const FormulaLookup& formulas, const InstalledLookup& installed,
         RequirementMap& reqs)
        : formulas_(formulas), installed_(installed), reqs_(reqs) {}

    bool needs_restart() const { return restart_; }
    const std::vector<std::string>& order() const { return order_; }
    const std::map<std::string, Node>& nodes() const { return nodes_; }

    Status visit(const std::string& name, const std::string& parent) {
        Node& node = nodes_[name];
        if (node.mark == Mark::Done) return ok_status();
        if (node.mark == Mark::InProgress) return cycle_error(name);

        ZB_TRY(choose(name, parent, node));

        node.mark = Mark::InProgress;
        stack_.push_back(name);

        for (auto& dep : node.deps) {
            auto r = node.dep_reqs.find(dep);
            if (r != node.dep_reqs.end() && !r->second.is_any()) {
                Requirement req{r->second, name, node.version};
                bool added = add_requirement(dep, req);

                auto done = nodes_.find(dep);
                if (done != nodes_.end() && done->second.mark == Mark::Done &&
                    !req.req.matches(done->second.version)) {
                    if (done->second.satisfied || !added) {
                        return conflict_error(dep, applicable(dep), {});
                    }
                    log::debug("constraint %s on %s invalidates %s, restarting",
                               req.describe().c_str(), dep.c_str(),
                               done->second.version.to_string().c_str());
                    restart_ = true;
                    return ok_status();
                }
            }

            ZB_TRY(visit(dep, name));
            if (restart_) return ok_status();
        }

        stack_.pop_back();
        node.mark = Mark::Done;
        order_.push_back(name);
        return ok_status();
    }

private:
    const FormulaLookup& formulas_;
    const InstalledLookup& installed_;
    RequirementMap& reqs_;

    std::map<std::string, Node> nodes_;
    std::vector<std::string> stack_;
    std::vector<std::string> order_;
    bool restart_ = false;

    bool add_requirement(const std::string& name, const Requirement& req) {
        auto& list = reqs_[name];
        for (auto& existing : list) {
            if (existing.same_as(req)) return false;
        }
        list.push_back(req);
        return true;
    }

    // Requirements whose requester has not been chosen at another version
    // in this pass
    std::vector<Requirement> applicable(const std::string& name) const {
        std::vector<Requirement> out;
        auto it = reqs_.find(name);
        if (it == reqs_.end()) return out;
        for (auto& r : it->second) {
            if (!r.requester.empty()) {
                auto n = nodes_.find(r.requester);
                if (n != nodes_.end() && n->second.mark != Mark::Unvisited &&
                    n->second.version != *r.requester_version) {
                    continue;
                }
            }
            out.push_back(r);
        }
        return out;
    }

    Status choose(const std::string& name, const std::string& parent, Node& node) {
        auto reqs = applicable(name);
        auto satisfies_all = [&](const Version& v) {
            return std::all_of(reqs.begin(), reqs.end(),
                [&](const Requirement& r) { return r.req.matches(v); });
        };

        auto candidates = formulas_.candidates(name);

        if (auto inst = installed_.find_installed(name)) {
            if (!satisfies_all(inst->version)) {
                return conflict_error(name, reqs, {"installed " + inst->version.to_string()});
            }
            node.version = inst->version;
            node.satisfied = true;
            for (auto* f : candidates) {
                if (f->version == inst->version) node.formula = f;
            }
            node.deps = inst->dependencies;
            std::sort(node.deps.begin(), node.deps.end());
            node.deps.erase(std::unique(node.deps.begin(), node.deps.end()), node.deps.end());
            return ok_status();
        }

        if (candidates.empty()) {
            std::string msg = "unknown formula '" + name + "'";
            if (!parent.empty()) msg += " (required by '" + parent + "')";
            return ZbError{ZbError::UnknownFormula, msg};
        }

        for (auto* f : candidates) {
            if (!satisfies_all(f->version)) continue;
            node.version = f->version;
            node.formula = f;
            node.deps = f->dependency_names();
            for (auto& d : f->dependencies) node.dep_reqs[d.name] = d.req;
            return ok_status();
        }

        std::vector<std::string> available;
        for (auto* f : candidates) available.push_back(f->version.to_string());
        return conflict_error(name, reqs, available);
    }

    ZbError cycle_error(const std::string& name) const {
        auto start = std::find(stack_.begin(), stack_.end(), name);
        std::string path;
        for (auto it = start; it != stack_.end(); ++it) {
            path += *it + " -> ";
        }
        path += name;
        return ZbError{ZbError::CyclicDependency, "dependency cycle: " + path};
    }

    static ZbError conflict_error(const std::string& name,
                                  const std::vector<Requirement>& reqs,
                                  const std::vector<std::string>& available) {
        std::string msg = "no version of '" + name + "' satisfies all constraints: ";
        for (size_t i = 0; i < reqs.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += reqs[i].describe();
        }
        if (!available.empty()) {
            msg += "; available: ";
            for (size_t i = 0; i < available.size(); ++i) {
                if (i > 0) msg += ", ";
                msg += available[i];
            }
        }
        return ZbError{ZbError::VersionConflict, msg};
    }
};

// Every restart adds a requirement, so this is only reached on pathological input
constexpr int MAX_PASSES = 512;

} // namespace

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(const FormulaLookup& formulas, const InstalledLookup& installed)
    : formulas_(formulas), installed_(installed) {}

Result<ResolvedPlan> Resolver::resolve(const std::vector<std::string>& requests) const {
    std::vector<Request> parsed;
    for (auto& text : requests) {
        auto r = Request::parse(text);
        if (r.is_err()) return std::move(r).error();
        parsed.push_back(std::move(r).value());
    }
    return resolve(parsed);
}

Result<ResolvedPlan> Resolver::resolve(const std::vector<Request>& requests) const {
    if (requests.empty()) {
        return ZbError{ZbError::InvalidArg, "nothing to resolve"};
    }

    RequirementMap reqs;
    std::set<std::string> roots;
    for (auto& r : requests) {
        roots.insert(r.name);
        if (!r.req.is_any()) {
            reqs[r.name].push_back(Requirement{r.req, "", std::nullopt});
        }
    }

    for (int attempt = 0; attempt < MAX_PASSES; ++attempt) {
        Pass pass(formulas_, installed_, reqs);

        for (auto& root : roots) {
            ZB_TRY(pass.visit(root, ""));
            if (pass.needs_restart()) break;
        }
        if (pass.needs_restart()) continue;

        ResolvedPlan plan;
        plan.roots.assign(roots.begin(), roots.end());
        for (auto& name : pass.order()) {
            const Node& node = pass.nodes().at(name);
            PlanEntry e;
            e.name = name;
            e.version = node.version;
            e.formula = node.formula;
            e.satisfied = node.satisfied;
            e.requested = roots.count(name) > 0;
            e.dependencies = node.deps;
            plan.entries.push_back(std::move(e));
        }

        log::debug("resolved %zu package(s) in %d pass(es)", plan.size(), attempt + 1);
        return Result<ResolvedPlan>::ok(std::move(plan));
    }

    return ZbError{ZbError::VersionConflict,
        "version constraints did not settle after " + std::to_string(MAX_PASSES) + " passes"};
}

Result<ResolvedPlan> resolve(const std::vector<std::string>& requests,
                             const FormulaLookup& formulas,
                             const InstalledLookup& installed) {
    return Resolver(formulas, installed).resolve(requests);
}

} // namespace zb
