#pragma once

#include <ucfg/errors.h>
#include <cstddef>
#include <string>

namespace ucfg {

struct Token {
    enum Kind {
        ObjectOpen,    // {
        ObjectClose,   // }
        ArrayOpen,     // [
        ArrayClose,    // ]
        Separator,     // : or =
        Terminator,    // , or ;
        QuotedString,  // "..." with escapes decoded
        Atom,          // bare literal, trimmed
        Heredoc,       // <<TERM ... TERM
        End,
        Invalid        // text holds the reason
    };

    Kind kind = End;
    std::string text;
    size_t line = 1;
    size_t column = 1;

    // Only meaningful for Invalid tokens.
    ErrorCode code = ErrorCode::Syntax;
    bool truncated = false;  // the lexeme ran into the end of input

    bool is(Kind k) const noexcept { return kind == k; }
    bool isCloser() const noexcept { return kind == ObjectClose || kind == ArrayClose; }
    bool isScalar() const noexcept {
        return kind == QuotedString || kind == Atom || kind == Heredoc;
    }
};

const char* token_kind_name(Token::Kind kind);

// Lazy scanner over an in-memory buffer. Whitespace and comments (`#` to end
// of line, nestable `/* */`) are skipped between tokens. The scanner never
// throws; malformed lexemes come back as Token::Invalid.
class Tokenizer {
  public:
    // Bare literals are scanned differently depending on where the parser
    // is: a key ends at whitespace or punctuation, a value runs to the end
    // of the line (or the next terminator, unbalanced closer or comment).
    // An array element is a value that also ends at whitespace.
    enum class Context { Key, Value, Element };

    explicit Tokenizer(const std::string& text);

    Token next(Context ctx);

    bool atEnd() const noexcept { return i >= s.size(); }
    size_t line() const noexcept { return m_line; }
    size_t column() const noexcept { return m_col; }

  private:
    const std::string& s;
    size_t i = 0;
    size_t m_line = 1;
    size_t m_col = 1;

    char peek(size_t ahead = 0) const { return i + ahead < s.size() ? s[i + ahead] : '\0'; }
    char get();

    // Returns false (and fills `err`) on an unterminated block comment.
    bool skip_ws_and_comments(Token& err);

    Token make(Token::Kind kind, size_t line, size_t col, std::string text = {}) const;
    Token invalid(const std::string& reason, size_t line, size_t col, bool truncated,
                  ErrorCode code = ErrorCode::Syntax) const;

    Token scan_quoted(size_t line, size_t col);
    Token scan_key_atom(size_t line, size_t col);
    Token scan_value_atom(size_t line, size_t col, bool stop_at_space);
    bool try_scan_heredoc(size_t line, size_t col, Token& out);
};

}  // namespace ucfg
