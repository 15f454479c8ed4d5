#include <catch2/catch.hpp>
#include <pmat/version.hpp>

using namespace pmat;

TEST_CASE("parse simple version", "[version]") {
    auto r = Version::parse("1.2.3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().major == 1);
    REQUIRE(r.value().minor == 2);
    REQUIRE(r.value().patch == 3);
    REQUIRE(r.value().prerelease.empty());
}

TEST_CASE("parse version with prerelease", "[version]") {
    auto r = Version::parse("2.1.0-rc.1");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().prerelease == "rc.1");
    REQUIRE(r.value().to_string() == "2.1.0-rc.1");
}

TEST_CASE("version parse errors", "[version]") {
    REQUIRE(Version::parse("").is_err());
    REQUIRE(Version::parse("1.2").is_err());
    REQUIRE(Version::parse("abc").is_err());
    REQUIRE(Version::parse("1.2.3-").is_err());
    REQUIRE(Version::parse("01.2.3").is_err());
    auto r = Version::parse("1.x.0");
    REQUIRE(r.error().code == PmatError::BadRequest);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("version ordering", "[version]") {
    auto v = [](const char* s) { return Version::parse(s).value(); };
    REQUIRE(v("1.2.3") == v("1.2.3"));
    REQUIRE(v("1.2.3") < v("1.2.4"));
    REQUIRE(v("1.10.0") > v("1.9.9"));
    REQUIRE(v("2.0.0") > v("1.99.99"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0-beta"));
    REQUIRE(v("1.0.0-alpha") != v("1.0.0"));
}
