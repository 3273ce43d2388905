#include <catch2/catch.hpp>
#include <zb/bottle_selector.hpp>

using namespace zb;

static Formula with_bottles(const std::vector<std::string>& tags) {
    Formula f;
    f.name = "pkgA";
    f.version = Version::parse("1.0").value();
    for (auto& tag : tags) {
        BottleSpec b;
        b.platform = Platform::parse(tag).value();
        b.url = "https://bottles.test/pkgA-" + tag + ".tar.gz";
        b.sha256 = std::string(64, 'c');
        f.bottles[b.platform_tag()] = b;
    }
    return f;
}

static Platform host(const std::string& tag) {
    return Platform::parse(tag).value();
}

TEST_CASE("exact platform bottle is selected", "[selector]") {
    auto f = with_bottles({"linux-x86_64", "linux-arm64", "macos-arm64-sonoma"});
    auto r = select_bottle(f, host("linux-arm64"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().platform_tag() == "linux-arm64");
    REQUIRE(r.value().url == "https://bottles.test/pkgA-linux-arm64.tar.gz");
}

TEST_CASE("no compatible bottle for another os", "[selector]") {
    auto f = with_bottles({"macos-arm64"});
    auto r = select_bottle(f, host("linux-x86_64"));
    REQUIRE(r.is_err());
    REQUIRE(r.code() == ZbError::NoCompatibleBottle);
    REQUIRE(r.error().message.find("macos-arm64") != std::string::npos);
    REQUIRE(r.error().message.find("linux-x86_64") != std::string::npos);
}

TEST_CASE("formula without bottles", "[selector]") {
    auto r = select_bottle(with_bottles({}), host("linux-x86_64"));
    REQUIRE(r.code() == ZbError::NoCompatibleBottle);
    REQUIRE(r.error().message.find("offered: none") != std::string::npos);
}

TEST_CASE("older macOS release is accepted, newest first", "[selector]") {
    auto f = with_bottles({"macos-arm64-big_sur", "macos-arm64-ventura", "macos-arm64-tahoe"});
    auto r = select_bottle(f, host("macos-arm64-sonoma"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().platform_tag() == "macos-arm64-ventura");
}

TEST_CASE("newer macOS release is never accepted", "[selector]") {
    auto f = with_bottles({"macos-arm64-sequoia"});
    REQUIRE(select_bottle(f, host("macos-arm64-sonoma")).code() == ZbError::NoCompatibleBottle);
}

TEST_CASE("arch must match", "[selector]") {
    auto f = with_bottles({"macos-x86_64-sonoma"});
    REQUIRE(select_bottle(f, host("macos-arm64-sonoma")).code() == ZbError::NoCompatibleBottle);
}

TEST_CASE("release-less and universal fallbacks", "[selector]") {
    SECTION("release-less tag after release chain") {
        auto f = with_bottles({"macos-arm64", "all"});
        auto r = select_bottle(f, host("macos-arm64-sonoma"));
        REQUIRE(r.value().platform_tag() == "macos-arm64");
    }
    SECTION("universal bottle last") {
        auto f = with_bottles({"all", "macos-arm64-sonoma"});
        auto r = select_bottle(f, host("linux-x86_64"));
        REQUIRE(r.is_ok());
        REQUIRE(r.value().platform_tag() == "all");
    }
}

TEST_CASE("BottleSelector uses its host", "[selector]") {
    BottleSelector sel(host("linux-x86_64"));
    REQUIRE(sel.host().to_string() == "linux-x86_64");
    REQUIRE(sel.select(with_bottles({"linux-x86_64"})).is_ok());
    REQUIRE(sel.select(with_bottles({"macos-arm64"})).is_err());
}
