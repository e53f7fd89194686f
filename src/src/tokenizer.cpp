#include <ucfg/tokenizer.h>
#include <cctype>
#include <cstdint>
#include <utility>

namespace ucfg {

namespace {
    bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

    // Characters that can never appear in a bare key.
    bool is_key_breaker(char c) {
        switch (c) {
            case '{':
            case '}':
            case '[':
            case ']':
            case ':':
            case '=':
            case ',':
            case ';':
            case '"':
            case '#':
                return true;
            default:
                return is_space(c);
        }
    }

    int hex_val(char c) {
        if ('0' <= c and c <= '9') return c - '0';
        if ('a' <= c and c <= 'f') return 10 + (c - 'a');
        if ('A' <= c and c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    void encode_utf8(uint32_t cp, std::string& out) {
        if (cp <= 0x7F)
            out.push_back(static_cast<char>(cp));
        else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
}

const char* token_kind_name(Token::Kind kind) {
    switch (kind) {
        case Token::ObjectOpen:
            return "'{'";
        case Token::ObjectClose:
            return "'}'";
        case Token::ArrayOpen:
            return "'['";
        case Token::ArrayClose:
            return "']'";
        case Token::Separator:
            return "separator";
        case Token::Terminator:
            return "terminator";
        case Token::QuotedString:
            return "string";
        case Token::Atom:
            return "literal";
        case Token::Heredoc:
            return "multiline string";
        case Token::End:
            return "end of input";
        case Token::Invalid:
            return "invalid token";
    }
    return "unknown";
}

Tokenizer::Tokenizer(const std::string& text) : s(text) {}

char Tokenizer::get() {
    if (i >= s.size()) return '\0';
    char c = s[i++];
    if (c == '\n') {
        ++m_line;
        m_col = 1;
    } else
        ++m_col;
    return c;
}

Token Tokenizer::make(Token::Kind kind, size_t line, size_t col, std::string text) const {
    Token t;
    t.kind = kind;
    t.text = std::move(text);
    t.line = line;
    t.column = col;
    return t;
}

Token Tokenizer::invalid(const std::string& reason, size_t line, size_t col, bool truncated,
                         ErrorCode code) const {
    Token t = make(Token::Invalid, line, col, reason);
    t.truncated = truncated;
    t.code = code;
    return t;
}

bool Tokenizer::skip_ws_and_comments(Token& err) {
    while (i < s.size()) {
        char c = peek();
        if (is_space(c)) {
            get();
            continue;
        }
        if (c == '#') {
            while (i < s.size() and peek() != '\n') get();
            continue;
        }
        if (c == '/' and peek(1) == '*') {
            size_t start_line = m_line, start_col = m_col;
            get();
            get();
            int depth = 1;
            while (i < s.size() and depth > 0) {
                if (peek() == '*' and peek(1) == '/') {
                    get();
                    get();
                    --depth;
                } else if (peek() == '/' and peek(1) == '*') {
                    get();
                    get();
                    ++depth;
                } else
                    get();
            }
            if (depth != 0) {
                err = invalid("comments nesting is invalid", start_line, start_col, true,
                              ErrorCode::Nested);
                return false;
            }
            continue;
        }
        break;
    }
    return true;
}

Token Tokenizer::next(Context ctx) {
    Token err;
    if (not skip_ws_and_comments(err)) return err;

    size_t line = m_line, col = m_col;
    if (i >= s.size()) return make(Token::End, line, col);

    char c = peek();
    switch (c) {
        case '{':
            get();
            return make(Token::ObjectOpen, line, col, "{");
        case '}':
            get();
            return make(Token::ObjectClose, line, col, "}");
        case '[':
            get();
            return make(Token::ArrayOpen, line, col, "[");
        case ']':
            get();
            return make(Token::ArrayClose, line, col, "]");
        case ':':
        case '=':
            get();
            return make(Token::Separator, line, col, std::string(1, c));
        case ',':
        case ';':
            get();
            return make(Token::Terminator, line, col, std::string(1, c));
        case '"':
            return scan_quoted(line, col);
        default:
            break;
    }

    if (ctx == Context::Key) return scan_key_atom(line, col);

    Token heredoc;
    if (c == '<' and peek(1) == '<' and try_scan_heredoc(line, col, heredoc)) return heredoc;
    return scan_value_atom(line, col, ctx == Context::Element);
}

Token Tokenizer::scan_quoted(size_t line, size_t col) {
    get();  // opening quote
    std::string out;
    while (true) {
        if (i >= s.size()) return invalid("unterminated string", line, col, true);
        char c = get();
        if (c == '"') break;
        if (c == '\n') return invalid("unexpected newline", m_line - 1, col, false);
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i >= s.size()) return invalid("unterminated string", line, col, true);
        char e = get();
        switch (e) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                uint32_t cp = 0;
                for (int k = 0; k < 4; ++k) {
                    if (i >= s.size()) return invalid("unterminated string", line, col, true);
                    int hv = hex_val(get());
                    if (hv < 0) return invalid("invalid utf escape", m_line, m_col, false);
                    cp = (cp << 4) | static_cast<uint32_t>(hv);
                }
                // combine a UTF-16 surrogate pair when one follows
                if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and peek(1) == 'u') {
                    uint32_t low = 0;
                    bool ok = true;
                    for (int k = 0; k < 4; ++k) {
                        int hv = hex_val(peek(2 + static_cast<size_t>(k)));
                        if (hv < 0) {
                            ok = false;
                            break;
                        }
                        low = (low << 4) | static_cast<uint32_t>(hv);
                    }
                    if (ok and low >= 0xDC00 and low <= 0xDFFF) {
                        for (int k = 0; k < 6; ++k) get();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                }
                encode_utf8(cp, out);
                break;
            }
            default:
                return invalid("invalid escape character", m_line, m_col - 1, false);
        }
    }
    return make(Token::QuotedString, line, col, std::move(out));
}

Token Tokenizer::scan_key_atom(size_t line, size_t col) {
    size_t start = i;
    while (i < s.size()) {
        char c = peek();
        if (is_key_breaker(c)) break;
        if (c == '/' and peek(1) == '*') break;
        get();
    }
    return make(Token::Atom, line, col, s.substr(start, i - start));
}

Token Tokenizer::scan_value_atom(size_t line, size_t col, bool stop_at_space) {
    size_t start = i;
    int braces = 0;
    int squares = 0;
    while (i < s.size()) {
        char c = peek();
        if (c == '\n' or c == '\r' or c == ',' or c == ';' or c == '#') break;
        if (c == '/' and peek(1) == '*') break;
        if (stop_at_space and braces == 0 and squares == 0 and is_space(c)) break;
        if (c == '{') ++braces;
        if (c == '[') ++squares;
        if (c == '}') {
            if (braces == 0) break;
            --braces;
        }
        if (c == ']') {
            if (squares == 0) break;
            --squares;
        }
        get();
    }
    size_t end = i;
    while (end > start and is_space(s[end - 1])) --end;
    return make(Token::Atom, line, col, s.substr(start, end - start));
}

bool Tokenizer::try_scan_heredoc(size_t line, size_t col, Token& out) {
    // <<TERM followed directly by a newline, TERM being uppercase letters
    size_t j = i + 2;
    while (j < s.size() and s[j] >= 'A' and s[j] <= 'Z') ++j;
    if (j == i + 2 or j >= s.size()) return false;
    size_t nl = j;
    if (s[nl] == '\r' and nl + 1 < s.size() and s[nl + 1] == '\n') ++nl;
    if (s[nl] != '\n') return false;

    std::string term = s.substr(i + 2, j - (i + 2));
    while (i <= nl) get();

    size_t body_start = i;
    while (i < s.size()) {
        size_t line_start = i;
        while (i < s.size() and s[i] != '\n' and s[i] != '\r') get();
        if (s.compare(line_start, i - line_start, term) == 0) {
            size_t body_end = line_start;
            // the newline before the terminator line is not part of the value
            if (body_end > body_start and s[body_end - 1] == '\n') --body_end;
            if (body_end > body_start and s[body_end - 1] == '\r') --body_end;
            out = make(Token::Heredoc, line, col, s.substr(body_start, body_end - body_start));
            return true;
        }
        if (i < s.size() and s[i] == '\r') get();
        if (i < s.size() and s[i] == '\n') get();
    }
    out = invalid("unterminated multiline value", line, col, true);
    return true;
}

}  // namespace ucfg
