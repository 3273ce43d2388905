#include <catch2/catch.hpp>
#include <zb/database.hpp>
#include "test_support.hpp"

using namespace zb;
using namespace zb_test;

static const std::string KEY_A(64, 'a');
static const std::string KEY_B(64, 'b');

static InstalledRecord record(const std::string& name, const std::string& key,
                              const std::vector<std::string>& deps = {}) {
    InstalledRecord r;
    r.name = name;
    r.version = "1.0";
    r.store_key = key;
    r.dependencies = deps;
    r.tree_hash = std::string(64, 'f');
    return r;
}

TEST_CASE("open creates the schema and is reusable", "[db]") {
    TempDir td;
    std::string path = (td.path / "db" / "zb.db").string();
    {
        Database db;
        REQUIRE(db.open(path).is_ok());
        REQUIRE(db.is_open());
        REQUIRE(db.upsert(record("pkgA", KEY_A)).is_ok());
        db.close();
        REQUIRE_FALSE(db.is_open());
    }
    Database again;
    REQUIRE(again.open(path).is_ok());
    REQUIRE(again.get("pkgA").is_ok());
}

TEST_CASE("records round through upsert and get", "[db]") {
    TempDir td;
    Database db;
    REQUIRE(db.open((td.path / "zb.db").string()).is_ok());

    auto r = record("wget", KEY_A, {"openssl@3", "libidn2"});
    r.installed_at = 1700000000;
    r.linked = false;
    r.requested = true;
    REQUIRE(db.upsert(r).is_ok());

    auto got = db.get("wget");
    REQUIRE(got.is_ok());
    auto& g = got.value();
    REQUIRE(g.version == "1.0");
    REQUIRE(g.store_key == KEY_A);
    REQUIRE(g.installed_at == 1700000000);
    REQUIRE_FALSE(g.linked);
    REQUIRE(g.requested);
    REQUIRE(g.dependencies == std::vector<std::string>{"libidn2", "openssl@3"});

    // Replacing updates dependencies too
    r.version = "1.1";
    r.dependencies = {"openssl@3"};
    REQUIRE(db.upsert(r).is_ok());
    REQUIRE(db.get("wget").value().version == "1.1");
    REQUIRE(db.get("wget").value().dependencies == std::vector<std::string>{"openssl@3"});
}

TEST_CASE("missing records are NotInstalled", "[db]") {
    TempDir td;
    Database db;
    REQUIRE(db.open((td.path / "zb.db").string()).is_ok());
    REQUIRE(db.get("ghost").code() == ZbError::NotInstalled);
    REQUIRE(db.remove("ghost").code() == ZbError::NotInstalled);
    REQUIRE(db.upsert(record("", KEY_A)).code() == ZbError::InvalidArg);
}

TEST_CASE("list, packages_using and dependents_of", "[db]") {
    TempDir td;
    Database db;
    REQUIRE(db.open((td.path / "zb.db").string()).is_ok());
    REQUIRE(db.upsert(record("pkgB", KEY_B)).is_ok());
    REQUIRE(db.upsert(record("pkgA", KEY_A, {"pkgB"})).is_ok());
    REQUIRE(db.upsert(record("pkgC", KEY_A, {"pkgB"})).is_ok());

    auto all = db.list();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 3);
    REQUIRE(all.value()[0].name == "pkgA");
    REQUIRE(all.value()[0].dependencies == std::vector<std::string>{"pkgB"});

    REQUIRE(db.packages_using(KEY_A).value() == std::vector<std::string>{"pkgA", "pkgC"});
    REQUIRE(db.packages_using(std::string(64, '0')).value().empty());
    REQUIRE(db.dependents_of("pkgB").value() == std::vector<std::string>{"pkgA", "pkgC"});

    REQUIRE(db.remove("pkgC").is_ok());
    REQUIRE(db.dependents_of("pkgB").value() == std::vector<std::string>{"pkgA"});
    REQUIRE(db.packages_using(KEY_A).value() == std::vector<std::string>{"pkgA"});
}

TEST_CASE("reference counters", "[db][refcount]") {
    TempDir td;
    Database db;
    REQUIRE(db.open((td.path / "zb.db").string()).is_ok());

    REQUIRE(db.refcount(KEY_A).value() == 0);
    REQUIRE(db.retain(KEY_A).value() == 1);
    REQUIRE(db.retain(KEY_A).value() == 2);
    REQUIRE(db.retain(KEY_B).value() == 1);
    REQUIRE(db.release(KEY_A).value() == 1);

    auto counts = db.refcounts();
    REQUIRE(counts.is_ok());
    REQUIRE(counts.value().at(KEY_A) == 1);
    REQUIRE(counts.value().at(KEY_B) == 1);

    SECTION("release floors at zero") {
        REQUIRE(db.release(KEY_B).value() == 0);
        REQUIRE(db.release(KEY_B).value() == 0);
        REQUIRE(db.refcount(KEY_B).value() == 0);
    }
    SECTION("set and forget") {
        REQUIRE(db.set_refcount(KEY_A, 5).is_ok());
        REQUIRE(db.refcount(KEY_A).value() == 5);
        REQUIRE(db.set_refcount(KEY_A, -3).is_ok());
        REQUIRE(db.refcount(KEY_A).value() == 0);
        REQUIRE(db.forget_store_key(KEY_A).is_ok());
        REQUIRE(db.refcounts().value().count(KEY_A) == 0);
    }
}

TEST_CASE("corrupt database file is reported and kept", "[db]") {
    TempDir td;
    std::string garbage(8192, '\x5a');
    auto path = td.write_file("zb.db", garbage);

    Database db;
    auto st = db.open(path.string());
    REQUIRE(st.is_err());
    REQUIRE(st.code() == ZbError::DatabaseCorrupt);
    REQUIRE_FALSE(db.is_open());
    REQUIRE(read_file(path) == garbage);
}
