#include <catch2/catch.hpp>
#include <zb/store.hpp>
#include "test_support.hpp"

#include <optional>
#include <thread>

using namespace zb;
using namespace zb_test;
using namespace std::chrono_literals;

namespace {

// Store, prefix, locks and database under one temp dir
struct StoreFixture {
    TempDir td;
    LockManager locks{td.path / "locks"};
    Database db;
    std::unique_ptr<StoreManager> store;

    StoreFixture() {
        REQUIRE(db.open((td.path / "db" / "zb.db").string()).is_ok());
        store = std::make_unique<StoreManager>(td.path / "store", td.path / "prefix",
                                               locks, db, 2s);
    }

    // Bottle tarball on disk wrapped as a cached artifact
    Artifact artifact(const std::string& body, const std::string& file = "bottle.tar.gz") {
        auto path = td.write_file("artifacts/" + file, body);
        return Artifact(path, Sha256::hash_hex(body), body.size(), false, false);
    }

    fs::path prefix(const std::string& rel = "") const {
        return rel.empty() ? td.path / "prefix" : td.path / "prefix" / rel;
    }
};

InstalledRecord record_for(const std::string& name, const std::string& key) {
    InstalledRecord r;
    r.name = name;
    r.version = "1.0";
    r.store_key = key;
    return r;
}

} // namespace

// ===== Install =====

TEST_CASE("install extracts into a content-addressed entry", "[store]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));

    auto r = f.store->install(art, art.sha256());
    REQUIRE(r.is_ok());
    auto& entry = r.value();
    REQUIRE_FALSE(entry.reused);
    REQUIRE(entry.path == f.store->entry_path(art.sha256()));
    REQUIRE(f.store->contains(art.sha256()));
    REQUIRE(fs::is_regular_file(entry.path / "pkgA/1.0/bin/pkgA"));
    REQUIRE(Sha256::is_hex_digest(entry.tree_hash));
    REQUIRE(entry.tree_hash == Sha256::hash_tree(entry.path).value());

    // Nothing left in staging
    REQUIRE(fs::is_empty(f.store->staging_dir()));
}

TEST_CASE("second install of the same key reuses the entry", "[store]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto first = f.store->install(art, art.sha256());
    REQUIRE(first.is_ok());

    auto second = f.store->install(art, art.sha256());
    REQUIRE(second.is_ok());
    REQUIRE(second.value().reused);
    REQUIRE(second.value().tree_hash == first.value().tree_hash);
}

TEST_CASE("concurrent installs of one key produce one entry", "[store][concurrency]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    const int n = 6;
    std::vector<std::optional<Result<StoreEntry>>> results(n);

    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i] { results[i] = f.store->install(art, art.sha256()); });
    }
    for (auto& t : threads) t.join();

    int fresh = 0;
    for (auto& r : results) {
        REQUIRE(r->is_ok());
        if (!r->value().reused) ++fresh;
    }
    REQUIRE(fresh == 1);
    REQUIRE(fs::is_empty(f.store->staging_dir()));
}

TEST_CASE("artifact hash must match the store key", "[store]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    std::string other(64, 'e');

    auto r = f.store->install(art, other);
    REQUIRE(r.code() == ZbError::IntegrityError);
    REQUIRE_FALSE(f.store->contains(other));
    REQUIRE_FALSE(f.store->contains(art.sha256()));

    REQUIRE(f.store->install(art, "not-a-key").code() == ZbError::InvalidArg);
}

TEST_CASE("unsafe bottles never become visible", "[store]") {
    StoreFixture f;

    SECTION("escaping symlink") {
        auto art = f.artifact(make_tarball({
            TarEntry::dir("evil/1.0"),
            TarEntry::symlink("evil/1.0/passwd", "../../../../etc/passwd"),
        }));
        REQUIRE(f.store->install(art, art.sha256()).code() == ZbError::ExtractionFailure);
        REQUIRE_FALSE(f.store->contains(art.sha256()));
    }
    SECTION("symlink chain") {
        auto art = f.artifact(make_tarball({
            TarEntry::symlink("l", "."),
            TarEntry::symlink("l/l/x", "../.."),
            TarEntry::file("l/l/x/PLANTED", "owned"),
        }));
        REQUIRE(f.store->install(art, art.sha256()).code() == ZbError::ExtractionFailure);
        REQUIRE_FALSE(f.store->contains(art.sha256()));
        REQUIRE_FALSE(fs::exists(f.store->store_dir() / "PLANTED"));
        REQUIRE_FALSE(fs::exists(f.store->staging_dir() / "PLANTED"));
    }
    SECTION("empty bottle") {
        auto art = f.artifact(make_tarball({}));
        REQUIRE(f.store->install(art, art.sha256()).code() == ZbError::ExtractionFailure);
        REQUIRE_FALSE(f.store->contains(art.sha256()));
    }
    REQUIRE(fs::is_empty(f.store->staging_dir()));
}

// ===== Links =====

TEST_CASE("linking exposes keg files under the prefix", "[store][link]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto entry = f.store->install(art, art.sha256()).value();

    auto r = f.store->link_into_prefix(entry, "pkgA", "1.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().keg == f.store->cellar_path("pkgA", "1.0"));
    REQUIRE(r.value().already_linked == 0);

    auto cellar = f.prefix("Cellar/pkgA/1.0");
    REQUIRE(fs::is_symlink(cellar));
    REQUIRE(fs::read_symlink(cellar) == entry.path / "pkgA/1.0");

    auto bin = f.prefix("bin/pkgA");
    REQUIRE(fs::is_symlink(bin));
    REQUIRE(fs::read_symlink(bin) == cellar / "bin/pkgA");
    REQUIRE(read_file(bin).find("echo pkgA 1.0") != std::string::npos);
    REQUIRE(fs::is_symlink(f.prefix("share/pkgA/README")));
}

TEST_CASE("linking twice is idempotent", "[store][link]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto entry = f.store->install(art, art.sha256()).value();

    auto first = f.store->link_into_prefix(entry, "pkgA", "1.0");
    REQUIRE(first.is_ok());
    auto second = f.store->link_into_prefix(entry, "pkgA", "1.0");
    REQUIRE(second.is_ok());
    REQUIRE(second.value().created.empty());
    REQUIRE(second.value().already_linked == first.value().created.size());
}

TEST_CASE("conflicting file rolls back every new link", "[store][link]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto entry = f.store->install(art, art.sha256()).value();

    // A file zb does not own sits where a share link would go
    f.td.write_file("prefix/share/pkgA/README", "mine");

    auto r = f.store->link_into_prefix(entry, "pkgA", "1.0");
    REQUIRE(r.is_err());
    REQUIRE(r.code() == ZbError::LinkConflict);
    REQUIRE(r.error().message.find("not managed by zb") != std::string::npos);

    REQUIRE(read_file(f.prefix("share/pkgA/README")) == "mine");
    REQUIRE_FALSE(fs::exists(fs::symlink_status(f.prefix("bin/pkgA"))));
    REQUIRE_FALSE(fs::exists(fs::symlink_status(f.prefix("Cellar/pkgA/1.0"))));
}

TEST_CASE("conflict names the owning package", "[store][link]") {
    StoreFixture f;
    std::string shared_a = make_tarball({
        TarEntry::dir("toolA/1.0/bin"),
        TarEntry::file("toolA/1.0/bin/tool", "a", 0755),
    });
    std::string shared_b = make_tarball({
        TarEntry::dir("toolB/2.0/bin"),
        TarEntry::file("toolB/2.0/bin/tool", "b", 0755),
    });
    auto art_a = f.artifact(shared_a, "a.tar.gz");
    auto art_b = f.artifact(shared_b, "b.tar.gz");
    auto a = f.store->install(art_a, art_a.sha256()).value();
    auto b = f.store->install(art_b, art_b.sha256()).value();

    REQUIRE(f.store->link_into_prefix(a, "toolA", "1.0").is_ok());
    auto r = f.store->link_into_prefix(b, "toolB", "2.0");
    REQUIRE(r.code() == ZbError::LinkConflict);
    REQUIRE(r.error().message.find("package 'toolA'") != std::string::npos);
    REQUIRE(fs::read_symlink(f.prefix("bin/tool")) == f.prefix("Cellar/toolA/1.0/bin/tool"));
}

TEST_CASE("unlink removes only the package's links", "[store][link]") {
    StoreFixture f;
    auto art_a = f.artifact(make_bottle("pkgA", "1.0"), "a.tar.gz");
    auto art_b = f.artifact(make_bottle("pkgB", "2.0"), "b.tar.gz");
    auto a = f.store->install(art_a, art_a.sha256()).value();
    auto b = f.store->install(art_b, art_b.sha256()).value();
    REQUIRE(f.store->link_into_prefix(a, "pkgA", "1.0").is_ok());
    REQUIRE(f.store->link_into_prefix(b, "pkgB", "2.0").is_ok());

    REQUIRE(f.store->unlink_from_prefix("pkgA", "1.0").is_ok());
    REQUIRE_FALSE(fs::exists(fs::symlink_status(f.prefix("bin/pkgA"))));
    REQUIRE_FALSE(fs::exists(f.prefix("share/pkgA")));
    REQUIRE_FALSE(fs::exists(f.prefix("Cellar/pkgA")));
    REQUIRE(fs::is_symlink(f.prefix("bin/pkgB")));
    REQUIRE(fs::is_symlink(f.prefix("Cellar/pkgB/2.0")));

    // Store entry stays until garbage collection
    REQUIRE(f.store->contains(art_a.sha256()));

    // Unlinking something that is not linked is harmless
    REQUIRE(f.store->unlink_from_prefix("pkgA", "1.0").is_ok());
}

// ===== Garbage collection =====

TEST_CASE("gc keeps referenced entries and removes the rest", "[store][gc]") {
    StoreFixture f;
    auto art_a = f.artifact(make_bottle("pkgA", "1.0"), "a.tar.gz");
    auto art_b = f.artifact(make_bottle("pkgB", "1.0"), "b.tar.gz");
    auto a = f.store->install(art_a, art_a.sha256()).value();
    auto b = f.store->install(art_b, art_b.sha256()).value();

    REQUIRE(f.db.upsert(record_for("pkgA", a.key)).is_ok());
    REQUIRE(f.store->retain(a.key).value() == 1);

    // A counter without a record does not keep an entry alive
    REQUIRE(f.store->retain(b.key).value() == 1);

    auto r = f.store->collect_garbage();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed_keys == std::vector<std::string>{b.key});
    REQUIRE(r.value().bytes_freed > 0);
    REQUIRE(f.store->contains(a.key));
    REQUIRE_FALSE(f.store->contains(b.key));
    REQUIRE(f.db.refcounts().value().count(b.key) == 0);
}

TEST_CASE("gc repairs counters from records", "[store][gc]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto entry = f.store->install(art, art.sha256()).value();

    REQUIRE(f.db.upsert(record_for("pkgA", entry.key)).is_ok());
    REQUIRE(f.db.upsert(record_for("pkgA-alias", entry.key)).is_ok());
    REQUIRE(f.db.set_refcount(entry.key, 7).is_ok());

    auto r = f.store->collect_garbage();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed_keys.empty());
    REQUIRE(f.db.refcount(entry.key).value() == 2);
    REQUIRE(f.store->contains(entry.key));
}

TEST_CASE("gc sweeps only stale staging dirs and partial downloads", "[store][gc]") {
    StoreFixture f;
    fs::create_directories(f.store->staging_dir());
    auto old_stage = f.store->staging_dir() / "dead.1234";
    auto new_stage = f.store->staging_dir() / "live.5678";
    f.td.write_file("store/.staging/dead.1234/file", "x");
    f.td.write_file("store/.staging/live.5678/file", "y");
    auto old_part = f.td.write_file("cache/tmp/old.part", "partial");
    auto new_part = f.td.write_file("cache/tmp/new.part", "partial");
    auto other = f.td.write_file("cache/tmp/keep.txt", "not a partial");

    auto past = fs::file_time_type::clock::now() - std::chrono::hours(3);
    fs::last_write_time(old_stage, past);
    fs::last_write_time(old_part, past);
    fs::last_write_time(other, past);

    auto r = f.store->collect_garbage({f.td.path / "cache/tmp"}, std::chrono::hours(1));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stale_staging == 1);
    REQUIRE(r.value().stale_partials == 1);
    REQUIRE_FALSE(fs::exists(old_stage));
    REQUIRE(fs::exists(new_stage));
    REQUIRE_FALSE(fs::exists(old_part));
    REQUIRE(fs::exists(new_part));
    REQUIRE(fs::exists(other));
}

TEST_CASE("gc cannot collect an entry before its record is committed", "[store][gc]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    StoreManager collector(f.td.path / "store", f.td.path / "prefix", f.locks, f.db, 50ms);

    Lock root;
    auto entry = f.store->install(art, art.sha256(), &root);
    REQUIRE(entry.is_ok());
    REQUIRE(root.held());
    REQUIRE(root.name() == LockManager::store_root());

    // Installed but not yet recorded
    REQUIRE(collector.collect_garbage({}, 0s).code() == ZbError::LockTimeout);
    REQUIRE(f.store->contains(art.sha256()));

    REQUIRE(f.store->link_into_prefix(entry.value(), "pkgA", "1.0").is_ok());
    REQUIRE(f.db.upsert(record_for("pkgA", art.sha256())).is_ok());
    REQUIRE(f.store->retain(art.sha256()).value() == 1);
    root.release();

    auto r = collector.collect_garbage({}, 0s);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed_keys.empty());
    REQUIRE(f.store->contains(art.sha256()));
    REQUIRE(read_file(f.prefix("bin/pkgA")).find("echo pkgA 1.0") != std::string::npos);

    SECTION("reusing a present entry also hands over the lock") {
        Lock again;
        auto reused = f.store->install(art, art.sha256(), &again);
        REQUIRE(reused.is_ok());
        REQUIRE(reused.value().reused);
        REQUIRE(again.held());
        REQUIRE(collector.collect_garbage({}, 0s).code() == ZbError::LockTimeout);
    }
}

TEST_CASE("gc keeps young orphans", "[store][gc]") {
    StoreFixture f;
    auto art = f.artifact(make_bottle("pkgA", "1.0"));
    auto entry = f.store->install(art, art.sha256()).value();

    // No record and no counter: an install that died before committing
    auto young = f.store->collect_garbage();
    REQUIRE(young.is_ok());
    REQUIRE(young.value().removed_keys.empty());
    REQUIRE(young.value().young_orphans == std::vector<std::string>{entry.key});
    REQUIRE(f.store->contains(entry.key));

    fs::last_write_time(entry.path, fs::file_time_type::clock::now() - std::chrono::hours(3));
    auto old = f.store->collect_garbage();
    REQUIRE(old.is_ok());
    REQUIRE(old.value().removed_keys == std::vector<std::string>{entry.key});
    REQUIRE_FALSE(f.store->contains(entry.key));
}

TEST_CASE("gc waits for the store lock", "[store][gc]") {
    StoreFixture f;
    LockManager other(f.td.path / "locks");
    auto held = other.acquire(LockManager::store_root(), 100ms);
    REQUIRE(held.is_ok());

    StoreManager impatient(f.td.path / "store", f.td.path / "prefix", f.locks, f.db, 50ms);
    REQUIRE(impatient.collect_garbage().code() == ZbError::LockTimeout);
}
