#include <catch2/catch_all.hpp>
#include <ucfg/parser.h>

TEST_CASE("parser supports # line comments and /* block comments */", "[parse][comments]") {
    using namespace ucfg;

    SECTION("line comment") {
        std::string s = R"(
        # this is a comment
        {"a": 1} # trailing comment
        )";
        auto v = parse(s);
        REQUIRE(v.at("a").isInt());
        REQUIRE(v.at("a").asInt() == 1);
    }

    SECTION("block comment") {
        std::string s = R"(
        /* start comment
           still comment */
        {"b": 2}
        )";
        auto v = parse(s);
        REQUIRE(v.at("b").asInt() == 2);
    }

    SECTION("nested block comment") {
        std::string s = "/* outer /* inner */ outer again */ c = 3";
        auto v = parse(s);
        REQUIRE(v.size() == 1);
        REQUIRE(v.getInt("c") == 3);
    }

    SECTION("inline block comment") {
        auto v = parse(R"({/*c*/"c":3})");
        REQUIRE(v.at("c").asInt() == 3);
        REQUIRE(parse("{/*1*/}") == Value::object());
    }

    SECTION("comment ends a bare value") {
        auto v = parse("port = 80 # default\nhost = local /* for now */\n");
        REQUIRE(v.getInt("port") == 80);
        REQUIRE(v.getString("host") == "local");
    }

    SECTION("comment markers inside quotes are text") {
        auto v = parse(R"(a = "# not /* a comment */")");
        REQUIRE(v.getString("a") == "# not /* a comment */");
    }

    SECTION("comments between key and value") {
        auto v = parse("a /* why not */ = /* here too */ 1");
        REQUIRE(v.getInt("a") == 1);
    }
}
