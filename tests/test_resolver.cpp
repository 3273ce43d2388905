#include <catch2/catch.hpp>
#include <zb/resolver.hpp>

using namespace zb;

static Formula make_formula(const std::string& name, const std::string& version,
                            const std::vector<std::string>& deps = {}) {
    Formula f;
    f.name = name;
    f.version = Version::parse(version).value();
    for (auto& d : deps) f.dependencies.push_back(Dependency::parse(d).value());
    return f;
}

static void add(FormulaRepository& repo, const std::string& name, const std::string& version,
                const std::vector<std::string>& deps = {}) {
    auto st = repo.add(make_formula(name, version, deps));
    REQUIRE(st.is_ok());
}

static InstalledPackage installed(const std::string& name, const std::string& version,
                                  const std::vector<std::string>& deps = {}) {
    return InstalledPackage{name, Version::parse(version).value(), deps};
}

// Every entry appears after all of its dependencies
static bool topologically_valid(const ResolvedPlan& plan) {
    std::map<std::string, size_t> pos;
    for (size_t i = 0; i < plan.entries.size(); ++i) pos[plan.entries[i].name] = i;
    if (pos.size() != plan.entries.size()) return false;
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        for (auto& d : plan.entries[i].dependencies) {
            if (!pos.count(d) || pos[d] >= i) return false;
        }
    }
    return true;
}

// ===== Basic ordering =====

TEST_CASE("dependency comes before dependent", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgB"});
    add(repo, "pkgB", "1.0");
    InstalledSet none;

    auto plan = resolve({"pkgA"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().names() == std::vector<std::string>{"pkgB", "pkgA"});
    REQUIRE(plan.value().roots == std::vector<std::string>{"pkgA"});
    REQUIRE(plan.value().find("pkgA")->requested);
    REQUIRE_FALSE(plan.value().find("pkgB")->requested);
    REQUIRE(plan.value().find("pkgB")->formula != nullptr);
}

TEST_CASE("diamond dependencies are deduplicated", "[resolver]") {
    FormulaRepository repo;
    add(repo, "app", "1.0", {"left", "right"});
    add(repo, "left", "1.0", {"base"});
    add(repo, "right", "1.0", {"base"});
    add(repo, "base", "1.0");
    InstalledSet none;

    auto plan = resolve({"app"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().names() ==
            std::vector<std::string>{"base", "left", "right", "app"});
    REQUIRE(topologically_valid(plan.value()));
}

TEST_CASE("resolution is deterministic regardless of request order", "[resolver]") {
    FormulaRepository repo;
    add(repo, "zeta", "1.0", {"shared", "alpha"});
    add(repo, "alpha", "1.0", {"shared"});
    add(repo, "mid", "1.0", {"shared"});
    add(repo, "shared", "1.0");
    InstalledSet none;

    auto one = resolve({"zeta", "mid"}, repo, none);
    auto two = resolve({"mid", "zeta", "mid"}, repo, none);
    REQUIRE(one.is_ok());
    REQUIRE(two.is_ok());
    REQUIRE(one.value().names() == two.value().names());
    REQUIRE(one.value().names() ==
            std::vector<std::string>{"shared", "mid", "alpha", "zeta"});
}

TEST_CASE("larger graph yields a topologically valid plan", "[resolver]") {
    FormulaRepository repo;
    // Layered graph: layer i depends on every package in layer i+1
    const int layers = 5, width = 4;
    for (int l = 0; l < layers; ++l) {
        for (int w = 0; w < width; ++w) {
            std::vector<std::string> deps;
            if (l + 1 < layers) {
                for (int d = 0; d < width; ++d) {
                    deps.push_back("p" + std::to_string(l + 1) + "_" + std::to_string(d));
                }
            }
            add(repo, "p" + std::to_string(l) + "_" + std::to_string(w), "1.0", deps);
        }
    }
    InstalledSet none;
    auto plan = resolve({"p0_0", "p0_3"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().size() == 2 + width * (layers - 1));
    REQUIRE(topologically_valid(plan.value()));
}

// ===== Failures =====

TEST_CASE("cycle is reported with its path and no plan", "[resolver]") {
    FormulaRepository repo;
    add(repo, "a", "1.0", {"b"});
    add(repo, "b", "1.0", {"c"});
    add(repo, "c", "1.0", {"a"});
    InstalledSet none;

    auto plan = resolve({"a"}, repo, none);
    REQUIRE(plan.is_err());
    REQUIRE(plan.code() == ZbError::CyclicDependency);
    REQUIRE(plan.error().message == "dependency cycle: a -> b -> c -> a");
}

TEST_CASE("formula depending on itself is a cycle", "[resolver]") {
    FormulaRepository repo;
    add(repo, "a", "1.0", {"a"});
    add(repo, "b", "1.0");
    InstalledSet none;

    auto plan = resolve({"a"}, repo, none);
    REQUIRE(plan.code() == ZbError::CyclicDependency);
    REQUIRE(plan.error().message == "dependency cycle: a -> a");

    // The rest of the repository is still usable
    REQUIRE(resolve({"b"}, repo, none).is_ok());
}

TEST_CASE("unknown formula names its requester", "[resolver]") {
    FormulaRepository repo;
    add(repo, "a", "1.0", {"ghost"});
    InstalledSet none;

    auto plan = resolve({"a"}, repo, none);
    REQUIRE(plan.code() == ZbError::UnknownFormula);
    REQUIRE(plan.error().message.find("'ghost'") != std::string::npos);
    REQUIRE(plan.error().message.find("required by 'a'") != std::string::npos);

    auto direct = resolve({"nothing"}, repo, none);
    REQUIRE(direct.code() == ZbError::UnknownFormula);
}

TEST_CASE("unsupported tap in a request", "[resolver]") {
    FormulaRepository repo;
    add(repo, "a", "1.0");
    InstalledSet none;
    REQUIRE(resolve({"third/party/a"}, repo, none).code() == ZbError::UnsupportedTap);
    REQUIRE(resolve({"homebrew/core/a"}, repo, none).is_ok());
}

TEST_CASE("empty request is rejected", "[resolver]") {
    FormulaRepository repo;
    InstalledSet none;
    REQUIRE(resolve(std::vector<std::string>{}, repo, none).code() == ZbError::InvalidArg);
}

// ===== Constraints =====

TEST_CASE("highest satisfying version is chosen", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgC >=2.0"});
    add(repo, "pkgC", "1.5");
    add(repo, "pkgC", "2.0");
    add(repo, "pkgC", "2.4");
    add(repo, "pkgC", "3.0-rc1");
    InstalledSet none;

    auto plan = resolve({"pkgA"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().find("pkgC")->version.to_string() == "2.4");
}

TEST_CASE("request constraints pin versions", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgC", "1.5");
    add(repo, "pkgC", "2.0");
    InstalledSet none;

    auto plan = resolve({"pkgC<2.0"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().find("pkgC")->version.to_string() == "1.5");

    auto pinned = resolve({"pkgC 2.0"}, repo, none);
    REQUIRE(pinned.value().find("pkgC")->version.to_string() == "2.0");
}

TEST_CASE("conflicting constraints from two requesters", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgC >=2.0"});
    add(repo, "pkgB", "1.0", {"pkgC <2.0"});
    add(repo, "pkgC", "1.5");
    add(repo, "pkgC", "2.1");
    InstalledSet none;

    auto plan = resolve({"pkgA", "pkgB"}, repo, none);
    REQUIRE(plan.is_err());
    REQUIRE(plan.code() == ZbError::VersionConflict);
    auto& msg = plan.error().message;
    REQUIRE(msg.find("'pkgC'") != std::string::npos);
    REQUIRE(msg.find(">=2.0 (required by pkgA 1.0)") != std::string::npos);
    REQUIRE(msg.find("<2.0 (required by pkgB 1.0)") != std::string::npos);
}

TEST_CASE("late constraint restarts resolution with a lower version", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgC"});
    add(repo, "pkgB", "1.0", {"pkgC <2.0"});
    add(repo, "pkgC", "1.5");
    add(repo, "pkgC", "2.1");
    InstalledSet none;

    auto plan = resolve({"pkgA", "pkgB"}, repo, none);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().find("pkgC")->version.to_string() == "1.5");
    REQUIRE(plan.value().names() == std::vector<std::string>{"pkgC", "pkgA", "pkgB"});
}

TEST_CASE("requirements of an unchosen requester version are ignored", "[resolver]") {
    FormulaRepository repo;
    add(repo, "tool", "2.0", {"lib >=3"});
    add(repo, "tool", "1.0", {"lib"});
    add(repo, "lib", "2.0");
    InstalledSet none;

    // tool 2.0 needs lib >=3 which does not exist
    auto latest = resolve({"tool"}, repo, none);
    REQUIRE(latest.code() == ZbError::VersionConflict);

    auto older = resolve({"tool <2"}, repo, none);
    REQUIRE(older.is_ok());
    REQUIRE(older.value().find("lib")->version.to_string() == "2.0");
}

// ===== Installed packages =====

TEST_CASE("installed packages are satisfied and keep their snapshot", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgB"});
    add(repo, "pkgB", "2.0", {"newdep"});
    add(repo, "newdep", "1.0");
    add(repo, "olddep", "1.0");

    InstalledSet inst;
    inst.add(installed("pkgB", "1.0", {"olddep"}));

    auto plan = resolve({"pkgA"}, repo, inst);
    REQUIRE(plan.is_ok());
    auto* b = plan.value().find("pkgB");
    REQUIRE(b->satisfied);
    REQUIRE(b->version.to_string() == "1.0");
    REQUIRE(b->dependencies == std::vector<std::string>{"olddep"});
    REQUIRE(plan.value().find("newdep") == nullptr);
    REQUIRE(plan.value().names() == std::vector<std::string>{"olddep", "pkgB", "pkgA"});
}

TEST_CASE("installed version must satisfy constraints", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"pkgC >=2.0"});
    add(repo, "pkgC", "2.0");
    InstalledSet inst;
    inst.add(installed("pkgC", "1.0"));

    auto plan = resolve({"pkgA"}, repo, inst);
    REQUIRE(plan.code() == ZbError::VersionConflict);
    REQUIRE(plan.error().message.find("installed 1.0") != std::string::npos);
}

TEST_CASE("installed package without a formula still resolves", "[resolver]") {
    FormulaRepository repo;
    add(repo, "pkgA", "1.0", {"legacy"});
    InstalledSet inst;
    inst.add(installed("legacy", "0.9"));

    auto plan = resolve({"pkgA"}, repo, inst);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().find("legacy")->satisfied);
    REQUIRE(plan.value().find("legacy")->formula == nullptr);
}

// ===== Display =====

TEST_CASE("dependency tree marks repeated subtrees", "[resolver]") {
    FormulaRepository repo;
    add(repo, "app", "1.0", {"left", "right"});
    add(repo, "left", "1.0", {"base"});
    add(repo, "right", "2.0", {"base"});
    add(repo, "base", "0.3");
    InstalledSet inst;
    inst.add(installed("base", "0.3"));

    auto plan = resolve({"app"}, repo, inst);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().tree_display("app") ==
            "app 1.0\n"
            "├── left 1.0\n"
            "│   └── base 0.3 [installed]\n"
            "└── right 2.0\n"
            "    └── base 0.3 [installed] (*)\n");
}
