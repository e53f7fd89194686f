#include <catch2/catch_all.hpp>
#include <ucfg/tokenizer.h>
#include <vector>

using namespace ucfg;
using Ctx = Tokenizer::Context;

TEST_CASE("tokenizer splits a simple pair", "[tokenizer]") {
    std::string text = "a = 1;";
    Tokenizer lex(text);

    auto key = lex.next(Ctx::Key);
    REQUIRE(key.kind == Token::Atom);
    REQUIRE(key.text == "a");
    REQUIRE(key.line == 1);
    REQUIRE(key.column == 1);

    auto sep = lex.next(Ctx::Value);
    REQUIRE(sep.kind == Token::Separator);
    REQUIRE(sep.column == 3);

    auto val = lex.next(Ctx::Value);
    REQUIRE(val.kind == Token::Atom);
    REQUIRE(val.text == "1");

    REQUIRE(lex.next(Ctx::Key).kind == Token::Terminator);
    REQUIRE(lex.next(Ctx::Key).kind == Token::End);
    REQUIRE(lex.atEnd());
}

TEST_CASE("tokenizer reports punctuation", "[tokenizer]") {
    std::string text = "{ } [ ] : = , ;";
    Tokenizer lex(text);
    std::vector<Token::Kind> kinds;
    for (auto t = lex.next(Ctx::Key); t.kind != Token::End; t = lex.next(Ctx::Key))
        kinds.push_back(t.kind);
    std::vector<Token::Kind> expected = {Token::ObjectOpen, Token::ObjectClose, Token::ArrayOpen,
                                         Token::ArrayClose, Token::Separator,   Token::Separator,
                                         Token::Terminator, Token::Terminator};
    REQUIRE(kinds == expected);
}

TEST_CASE("key atoms stop at separators", "[tokenizer]") {
    std::string text = "server.port:80";
    Tokenizer lex(text);
    REQUIRE(lex.next(Ctx::Key).text == "server.port");
    REQUIRE(lex.next(Ctx::Value).kind == Token::Separator);
    REQUIRE(lex.next(Ctx::Value).text == "80");
}

TEST_CASE("value atoms keep inner spaces and trim the rest", "[tokenizer]") {
    std::string text = "   hello big world   \nnext";
    Tokenizer lex(text);
    auto t = lex.next(Ctx::Value);
    REQUIRE(t.kind == Token::Atom);
    REQUIRE(t.text == "hello big world");
    REQUIRE(lex.next(Ctx::Key).text == "next");
}

TEST_CASE("value atoms may contain separators", "[tokenizer]") {
    std::string text = "http://example.com:8080/x;";
    Tokenizer lex(text);
    REQUIRE(lex.next(Ctx::Value).text == "http://example.com:8080/x");
    REQUIRE(lex.next(Ctx::Value).kind == Token::Terminator);
}

TEST_CASE("value atoms skip balanced braces and stop at an unbalanced closer",
          "[tokenizer]") {
    std::string text = "foo{bar}[1]baz}";
    Tokenizer lex(text);
    REQUIRE(lex.next(Ctx::Value).text == "foo{bar}[1]baz");
    REQUIRE(lex.next(Ctx::Value).kind == Token::ObjectClose);
}

TEST_CASE("element atoms end at whitespace", "[tokenizer]") {
    std::string text = "1 two\t3.5 f(x, y) ]";
    Tokenizer lex(text);
    REQUIRE(lex.next(Ctx::Element).text == "1");
    REQUIRE(lex.next(Ctx::Element).text == "two");
    REQUIRE(lex.next(Ctx::Element).text == "3.5");
    REQUIRE(lex.next(Ctx::Element).text == "f(x");
    REQUIRE(lex.next(Ctx::Element).kind == Token::Terminator);
    REQUIRE(lex.next(Ctx::Element).text == "y)");
    REQUIRE(lex.next(Ctx::Element).kind == Token::ArrayClose);

    Tokenizer same("a [b c]");
    REQUIRE(same.next(Ctx::Value).text == "a [b c]");
}

TEST_CASE("comments are skipped", "[tokenizer][comments]") {
    std::string text = "# line comment\n/* outer /* inner */ still outer */ key # trailing";
    Tokenizer lex(text);
    auto t = lex.next(Ctx::Key);
    REQUIRE(t.kind == Token::Atom);
    REQUIRE(t.text == "key");
    REQUIRE(t.line == 2);
    REQUIRE(lex.next(Ctx::Key).kind == Token::End);
}

TEST_CASE("value atoms end at a comment", "[tokenizer][comments]") {
    std::string text = "42 # the answer";
    Tokenizer lex(text);
    REQUIRE(lex.next(Ctx::Value).text == "42");
    REQUIRE(lex.next(Ctx::Key).kind == Token::End);
}

TEST_CASE("unterminated block comment is an invalid token", "[tokenizer][comments]") {
    std::string text = "/* /* */";
    Tokenizer lex(text);
    auto t = lex.next(Ctx::Key);
    REQUIRE(t.kind == Token::Invalid);
    REQUIRE(t.code == ErrorCode::Nested);
    REQUIRE(t.text == "comments nesting is invalid");
}

TEST_CASE("quoted strings decode escapes", "[tokenizer]") {
    std::string text = R"("a\"b\n\t\\ \u00e9 \ud83d\ude00 ;,{")";
    Tokenizer lex(text);
    auto t = lex.next(Ctx::Value);
    REQUIRE(t.kind == Token::QuotedString);
    REQUIRE(t.text == "a\"b\n\t\\ \xC3\xA9 \xF0\x9F\x98\x80 ;,{");
}

TEST_CASE("quoted string errors", "[tokenizer]") {
    SECTION("unterminated") {
        std::string text = R"("abc)";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Key);
        REQUIRE(t.kind == Token::Invalid);
        REQUIRE(t.truncated);
        REQUIRE(t.text == "unterminated string");
    }
    SECTION("bad escape") {
        std::string text = R"("a\qb")";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Value);
        REQUIRE(t.kind == Token::Invalid);
        REQUIRE_FALSE(t.truncated);
        REQUIRE(t.text == "invalid escape character");
    }
}

TEST_CASE("heredoc values", "[tokenizer][heredoc]") {
    SECTION("terminated") {
        std::string text = "<<EOD\nline one\n  line two\nEOD\nnext";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Value);
        REQUIRE(t.kind == Token::Heredoc);
        REQUIRE(t.text == "line one\n  line two");
        REQUIRE(lex.next(Ctx::Key).text == "next");
    }
    SECTION("empty body") {
        std::string text = "<<EOD\nEOD\n";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Value);
        REQUIRE(t.kind == Token::Heredoc);
        REQUIRE(t.text.empty());
    }
    SECTION("unterminated") {
        std::string text = "<<EOD\nline\n";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Value);
        REQUIRE(t.kind == Token::Invalid);
        REQUIRE(t.text == "unterminated multiline value");
    }
    SECTION("not a heredoc") {
        std::string text = "<<eod";
        Tokenizer lex(text);
        auto t = lex.next(Ctx::Value);
        REQUIRE(t.kind == Token::Atom);
        REQUIRE(t.text == "<<eod");
    }
}

TEST_CASE("tokens carry line and column", "[tokenizer]") {
    std::string text = "a = 1\n  b = 2";
    Tokenizer lex(text);
    lex.next(Ctx::Key);
    lex.next(Ctx::Value);
    lex.next(Ctx::Value);
    auto b = lex.next(Ctx::Key);
    REQUIRE(b.text == "b");
    REQUIRE(b.line == 2);
    REQUIRE(b.column == 3);
}
