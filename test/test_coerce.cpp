#include <catch2/catch_all.hpp>
#include <ucfg/coerce.h>

using namespace ucfg;
using Catch::Approx;

TEST_CASE("boolean aliases are case-insensitive", "[coerce]") {
    for (auto s : {"true", "True", "TRUE", "yes", "Yes", "on", "ON"}) {
        INFO(s);
        auto v = coerce_atom(s);
        REQUIRE(v.isBool());
        REQUIRE(v.asBool());
    }
    for (auto s : {"false", "False", "no", "NO", "off", "Off"}) {
        INFO(s);
        auto v = coerce_atom(s);
        REQUIRE(v.isBool());
        REQUIRE_FALSE(v.asBool());
    }
}

TEST_CASE("null literal", "[coerce]") {
    REQUIRE(coerce_atom("null").isNull());
    REQUIRE(coerce_atom("NULL").isNull());
    REQUIRE(coerce_atom("nil").isString());
}

TEST_CASE("decimal and hex integers", "[coerce]") {
    REQUIRE(coerce_atom("0").asInt() == 0);
    REQUIRE(coerce_atom("42").asInt() == 42);
    REQUIRE(coerce_atom("-17").asInt() == -17);
    REQUIRE(coerce_atom("0x10").asInt() == 16);
    REQUIRE(coerce_atom("0xdeadbeef").asInt() == 3735928559LL);
    REQUIRE(coerce_atom("-0xdeadbeef").asInt() == -3735928559LL);
    REQUIRE(coerce_atom("9223372036854775807").asInt() == INT64_MAX);
    REQUIRE(coerce_atom("-9223372036854775808").asInt() == INT64_MIN);
}

TEST_CASE("malformed integers stay strings", "[coerce]") {
    for (auto s : {"0xdeadbeef.1", "0xreadbeef", "0x", "-", "+5", "12abc", "1 2",
                   "99999999999999999999"}) {
        INFO(s);
        auto v = coerce_atom(s, false);
        REQUIRE(v.isString());
        REQUIRE(v.asString() == s);
    }
}

TEST_CASE("floating point literals", "[coerce]") {
    REQUIRE(coerce_atom("1.5").asDouble() == 1.5);
    REQUIRE(coerce_atom("-0.25").asDouble() == -0.25);
    REQUIRE(coerce_atom("+2.0").asDouble() == 2.0);
    REQUIRE(coerce_atom("1e3").isDouble());
    REQUIRE(coerce_atom("1e3").asDouble() == 1000.0);
    REQUIRE(coerce_atom("-1e-10").asDouble() == -1e-10);
    REQUIRE(coerce_atom("6.02E+23").asDouble() == Approx(6.02e23));
}

TEST_CASE("malformed floats stay strings", "[coerce]") {
    for (auto s : {"1.", ".5", "1.2.3", "1e", "1e+", "1.5x", "1e999"}) {
        INFO(s);
        REQUIRE(coerce_atom(s, false).isString());
    }
}

TEST_CASE("number suffixes", "[coerce][suffix]") {
    SECTION("decimal multipliers keep the type") {
        REQUIRE(coerce_atom("10k").isInt());
        REQUIRE(coerce_atom("10k").asInt() == 10000);
        REQUIRE(coerce_atom("2m").asInt() == 2000000);
        REQUIRE(coerce_atom("3G").asInt() == 3000000000LL);
        REQUIRE(coerce_atom("1.5k").isDouble());
        REQUIRE(coerce_atom("1.5k").asDouble() == 1500.0);
    }
    SECTION("binary multipliers give integers") {
        REQUIRE(coerce_atom("4kb").asInt() == 4096);
        REQUIRE(coerce_atom("1mb").asInt() == 1048576);
        REQUIRE(coerce_atom("2GB").asInt() == 2147483648LL);
        REQUIRE(coerce_atom("1.5kb").isInt());
        REQUIRE(coerce_atom("1.5kb").asInt() == 1536);
    }
    SECTION("time values are seconds") {
        REQUIRE(coerce_atom("30s").isDouble());
        REQUIRE(coerce_atom("30s").asDouble() == 30.0);
        REQUIRE(coerce_atom("500ms").asDouble() == Approx(0.5));
        REQUIRE(coerce_atom("5min").asDouble() == 300.0);
        REQUIRE(coerce_atom("2h").asDouble() == 7200.0);
        REQUIRE(coerce_atom("1d").asDouble() == 86400.0);
        REQUIRE(coerce_atom("1w").asDouble() == 604800.0);
        REQUIRE(coerce_atom("1y").asDouble() == 31536000.0);
    }
    SECTION("unknown suffixes stay strings") {
        REQUIRE(coerce_atom("10q").isString());
        REQUIRE(coerce_atom("10kbs").isString());
        REQUIRE(coerce_atom("k").isString());
    }
    SECTION("disabled") {
        REQUIRE(coerce_atom("10k", false).isString());
        REQUIRE(coerce_atom("10k", false).asString() == "10k");
        REQUIRE(coerce_atom("10", false).asInt() == 10);
    }
}

TEST_CASE("everything else is a string", "[coerce]") {
    REQUIRE(coerce_atom("hello world").asString() == "hello world");
    REQUIRE(coerce_atom("/usr/local/bin").asString() == "/usr/local/bin");
    REQUIRE(coerce_atom("truely").isString());
}

TEST_CASE("rule order puts booleans before numbers", "[coerce]") {
    auto const& rules = coercion_rules();
    REQUIRE(rules.size() == 5);
    REQUIRE(std::string(rules.front().name) == "boolean");
    REQUIRE(std::string(rules.back().name) == "suffixed number");
}
