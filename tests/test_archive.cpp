#include <catch2/catch.hpp>
#include <zb/archive.hpp>
#include "test_support.hpp"

using namespace zb;
using namespace zb_test;

static fs::path write_tarball(const TempDir& td, const std::vector<TarEntry>& entries) {
    return td.write_file("bottle.tar.gz", make_tarball(entries));
}

TEST_CASE("bottle extracts with modes and links intact", "[archive]") {
    TempDir td;
    auto tarball = write_tarball(td, {
        TarEntry::dir("pkgA/1.0"),
        TarEntry::dir("pkgA/1.0/bin"),
        TarEntry::file("pkgA/1.0/bin/pkgA", "#!/bin/sh\n", 0755),
        TarEntry::dir("pkgA/1.0/lib"),
        TarEntry::file("pkgA/1.0/lib/libA.so.1", "elf"),
        TarEntry::symlink("pkgA/1.0/lib/libA.so", "libA.so.1"),
        TarEntry::hardlink("pkgA/1.0/lib/libA.copy", "pkgA/1.0/lib/libA.so.1"),
    });

    fs::path dest = td.path / "out";
    fs::create_directories(dest);
    auto r = extract_archive(tarball, dest);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 7);

    auto exe = dest / "pkgA/1.0/bin/pkgA";
    REQUIRE(fs::is_regular_file(exe));
    REQUIRE((fs::status(exe).permissions() & fs::perms::owner_exec) != fs::perms::none);
    REQUIRE(fs::is_symlink(dest / "pkgA/1.0/lib/libA.so"));
    REQUIRE(fs::read_symlink(dest / "pkgA/1.0/lib/libA.so") == "libA.so.1");
    REQUIRE(read_file(dest / "pkgA/1.0/lib/libA.copy") == "elf");
}

TEST_CASE("parent directory entries are rejected", "[archive]") {
    TempDir td;
    auto tarball = write_tarball(td, {
        TarEntry::file("pkgA/../../evil", "x"),
    });
    fs::create_directories(td.path / "out");
    auto r = extract_archive(tarball, td.path / "out");
    REQUIRE(r.is_err());
    REQUIRE(r.code() == ZbError::ExtractionFailure);
    REQUIRE_FALSE(fs::exists(td.path / "evil"));
}

TEST_CASE("absolute entries are rejected", "[archive]") {
    TempDir td;
    auto tarball = write_tarball(td, {
        TarEntry::file((td.path / "abs").string(), "x"),
    });
    fs::create_directories(td.path / "out");
    auto r = extract_archive(tarball, td.path / "out");
    REQUIRE(r.code() == ZbError::ExtractionFailure);
    REQUIRE_FALSE(fs::exists(td.path / "abs"));
}

TEST_CASE("symlinks escaping the tree are rejected", "[archive]") {
    TempDir td;
    fs::create_directories(td.path / "out");

    SECTION("relative escape") {
        auto tarball = write_tarball(td, {
            TarEntry::dir("pkgA"),
            TarEntry::symlink("pkgA/up", "../../etc/passwd"),
        });
        REQUIRE(extract_archive(tarball, td.path / "out").code() == ZbError::ExtractionFailure);
    }
    SECTION("absolute target") {
        auto tarball = write_tarball(td, {
            TarEntry::symlink("root", "/etc"),
        });
        REQUIRE(extract_archive(tarball, td.path / "out").code() == ZbError::ExtractionFailure);
    }
}

TEST_CASE("entries below an extracted symlink are rejected", "[archive]") {
    TempDir td;
    fs::path dest = td.path / "stage" / "out";
    fs::create_directories(dest);

    SECTION("chained links that only escape on disk") {
        // Each target stays inside lexically, but l/l/x resolves to stage/
        auto tarball = write_tarball(td, {
            TarEntry::symlink("l", "."),
            TarEntry::symlink("l/l/x", "../.."),
            TarEntry::file("l/l/x/PLANTED", "owned"),
        });
        auto r = extract_archive(tarball, dest);
        REQUIRE(r.code() == ZbError::ExtractionFailure);
        REQUIRE(r.error().message.find("through symlink 'l'") != std::string::npos);
        REQUIRE_FALSE(fs::exists(td.path / "stage" / "PLANTED"));
        REQUIRE_FALSE(fs::exists(td.path / "PLANTED"));
    }
    SECTION("file written into a linked directory") {
        auto tarball = write_tarball(td, {
            TarEntry::dir("real"),
            TarEntry::symlink("alias", "real"),
            TarEntry::file("alias/file", "x"),
        });
        REQUIRE(extract_archive(tarball, dest).code() == ZbError::ExtractionFailure);
        REQUIRE_FALSE(fs::exists(dest / "real" / "file"));
    }
    SECTION("hard link through a symlink") {
        auto tarball = write_tarball(td, {
            TarEntry::dir("real"),
            TarEntry::file("real/file", "x"),
            TarEntry::symlink("alias", "real"),
            TarEntry::hardlink("copy", "alias/file"),
        });
        REQUIRE(extract_archive(tarball, dest).code() == ZbError::ExtractionFailure);
    }
}

TEST_CASE("destination reached through a symlink still extracts", "[archive]") {
    TempDir td;
    fs::create_directories(td.path / "real");
    fs::create_directory_symlink(td.path / "real", td.path / "via");
    auto tarball = write_tarball(td, {
        TarEntry::dir("pkgA"),
        TarEntry::file("pkgA/file", "x"),
    });
    auto r = extract_archive(tarball, td.path / "via");
    REQUIRE(r.is_ok());
    REQUIRE(read_file(td.path / "real" / "pkgA" / "file") == "x");
}

TEST_CASE("garbage is not an archive", "[archive]") {
    TempDir td;
    auto junk = td.write_file("junk.tar.gz", std::string(512, '\xff'));
    fs::create_directories(td.path / "out");
    auto r = extract_archive(junk, td.path / "out");
    REQUIRE(r.is_err());
    REQUIRE(r.code() == ZbError::ExtractionFailure);
}

TEST_CASE("link_target_within", "[archive]") {
    REQUIRE(link_target_within("a/b/link", "c"));
    REQUIRE(link_target_within("a/b/link", "../c"));
    REQUIRE(link_target_within("a/b/link", "../../c"));
    REQUIRE_FALSE(link_target_within("a/b/link", "../../../c"));
    REQUIRE_FALSE(link_target_within("link", "/abs"));
}
