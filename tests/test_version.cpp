#include <catch2/catch.hpp>
#include <zb/version.hpp>

using namespace zb;

static Version V(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static VersionReq R(const std::string& s) {
    auto r = VersionReq::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("parse simple version", "[version]") {
    auto v = V("3.2.1");
    REQUIRE(v.parts == std::vector<int>{3, 2, 1});
    REQUIRE(v.suffix.empty());
    REQUIRE(v.label.empty());
    REQUIRE(v.revision == 0);
}

TEST_CASE("parse Homebrew version shapes", "[version]") {
    auto openssl = V("1.1.1w");
    REQUIRE(openssl.parts == std::vector<int>{1, 1, 1});
    REQUIRE(openssl.suffix == "w");

    auto rev = V("9.5_1");
    REQUIRE(rev.parts == std::vector<int>{9, 5});
    REQUIRE(rev.revision == 1);

    auto rc = V("2.0.0-rc1");
    REQUIRE(rc.label == "rc1");

    auto prefixed = V("v1.4");
    REQUIRE(prefixed.parts == std::vector<int>{1, 4});

    auto date = V("20240101");
    REQUIRE(date.parts == std::vector<int>{20240101});
}

TEST_CASE("version roundtrip", "[version]") {
    for (auto s : {"1.2.3", "1.1.1w", "9.5_1", "2.0.0-rc1", "3.12.4_2"}) {
        REQUIRE(V(s).to_string() == s);
    }
}

TEST_CASE("version parse errors", "[version]") {
    for (auto s : {"", "1..2", "1.2.", "a.b", "1.2_x", "1.2-", "1.x2.3"}) {
        auto r = Version::parse(s);
        REQUIRE(r.is_err());
        REQUIRE(r.code() == ZbError::Version);
    }
}

TEST_CASE("version ordering", "[version]") {
    REQUIRE(V("1.2.3") < V("1.2.4"));
    REQUIRE(V("1.9") < V("1.10"));
    REQUIRE(V("1.2") == V("1.2.0"));
    REQUIRE(V("1.1.1") < V("1.1.1a"));
    REQUIRE(V("1.1.1a") < V("1.1.1w"));
    REQUIRE(V("1.1.1w") < V("1.1.2"));
    REQUIRE(V("2.0.0-rc1") < V("2.0.0"));
    REQUIRE(V("2.0.0-alpha") < V("2.0.0-beta"));
    REQUIRE(V("9.5") < V("9.5_1"));
    REQUIRE(V("9.5_1") < V("9.6"));
}

TEST_CASE("compare_base ignores the revision", "[version]") {
    REQUIRE(V("9.5_3").compare_base(V("9.5")) == 0);
    REQUIRE(V("9.5_3") != V("9.5"));
}

TEST_CASE("parse partial versions", "[version]") {
    auto p = PartialVersion::parse("1.2");
    REQUIRE(p.is_ok());
    REQUIRE(p.value().parts == std::vector<int>{1, 2});
    REQUIRE(PartialVersion::parse("1.").is_err());
    REQUIRE(PartialVersion::parse("x").is_err());
}

TEST_CASE("bare version pins exactly", "[version]") {
    auto req = R("1.2");
    REQUIRE(req.constraints.size() == 1);
    REQUIRE(req.constraints[0].op == ConstraintOp::Exact);
    REQUIRE(req.matches(V("1.2")));
    REQUIRE(req.matches(V("1.2.0")));
    REQUIRE(req.matches(V("1.2_1")));
    REQUIRE_FALSE(req.matches(V("1.2.1")));
    REQUIRE_FALSE(req.matches(V("1.3")));
}

TEST_CASE("exact constraint ignores a letter suffix", "[version]") {
    REQUIRE(R("=1.1.1").matches(V("1.1.1w")));
    REQUIRE(R("==1.1.1").matches(V("1.1.1")));
}

TEST_CASE("caret constraints", "[version]") {
    REQUIRE(R("^1.2.3").matches(V("1.9.0")));
    REQUIRE_FALSE(R("^1.2.3").matches(V("2.0.0")));
    REQUIRE_FALSE(R("^1.2.3").matches(V("1.2.2")));
    REQUIRE(R("^0.2.3").matches(V("0.2.9")));
    REQUIRE_FALSE(R("^0.2.3").matches(V("0.3.0")));
    REQUIRE(R("^0.0.3").matches(V("0.0.3")));
    REQUIRE_FALSE(R("^0.0.3").matches(V("0.0.4")));
}

TEST_CASE("tilde constraint", "[version]") {
    REQUIRE(R("~1.2.3").matches(V("1.2.9")));
    REQUIRE_FALSE(R("~1.2.3").matches(V("1.3.0")));
}

TEST_CASE("comparison constraints and ranges", "[version]") {
    REQUIRE(R(">=2.0").matches(V("2.0")));
    REQUIRE(R(">=2.0").matches(V("3.1")));
    REQUIRE_FALSE(R(">=2.0").matches(V("1.9.9")));
    REQUIRE_FALSE(R(">2.0").matches(V("2.0.0")));
    REQUIRE(R("<=2.0").matches(V("2.0")));
    REQUIRE(R("<3").matches(V("2.99")));

    auto range = R(">=1.0, <2.0");
    REQUIRE(range.constraints.size() == 2);
    REQUIRE(range.matches(V("1.5")));
    REQUIRE_FALSE(range.matches(V("2.0")));
    REQUIRE_FALSE(range.matches(V("0.9")));
    REQUIRE(range.to_string() == ">=1.0, <2.0");
}

TEST_CASE("any requirement", "[version]") {
    auto any = R("*");
    REQUIRE(any.is_any());
    REQUIRE(any.matches(V("0.0.1")));
    REQUIRE(any.to_string() == "*");
    REQUIRE(VersionReq::any().is_any());
}

TEST_CASE("constraints exclude pre-releases", "[version]") {
    REQUIRE_FALSE(R(">=1.0").matches(V("2.0.0-rc1")));
    REQUIRE(VersionReq::any().matches(V("2.0.0-rc1")));
}

TEST_CASE("empty or malformed requirement", "[version]") {
    REQUIRE(VersionReq::parse("").is_err());
    REQUIRE(VersionReq::parse(">=").is_err());
    REQUIRE(VersionReq::parse(">=1.x").is_err());
}
