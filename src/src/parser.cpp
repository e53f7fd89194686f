#include <ucfg/parser.h>
#include <ucfg/coerce.h>
#include <ucfg/tokenizer.h>
#include <cctype>
#include <utility>
#include <vector>

namespace ucfg {

namespace {
    using Context = Tokenizer::Context;

    struct Parser {
        // One open container. Objects remember the key whose value is being
        // read; the implicit top-level object is the only unbraced frame.
        struct Frame {
            Value value;
            bool braced = true;
            std::string pending_key;
        };

        enum class State {
            Init,       // nothing read yet
            Key,        // object: expecting a key, a terminator or '}'
            AfterKey,   // object: expecting a separator or a container
            Value,      // object: separator seen, expecting the value
            Element,    // array: expecting a value, a terminator or ']'
            Done
        };

        Tokenizer lex;
        const ParserOptions& opts;
        std::vector<Frame> stack;
        State state = State::Init;
        Value root;

        Parser(const std::string& text, const ParserOptions& o) : lex(text), opts(o) {}

        [[noreturn]] void fail(const std::string& reason, const Token& at,
                               ErrorCode code = ErrorCode::Syntax) const {
            throw ParseError(code, reason, at.line, at.column);
        }

        [[noreturn]] void fail_invalid(const Token& tok) const {
            throw ParseError(tok.code, tok.text, tok.line, tok.column);
        }

        std::string make_key(const std::string& text) const {
            if (not opts.lowercase_keys) return text;
            std::string out = text;
            for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return out;
        }

        Value scalar_from(const Token& tok) const {
            if (tok.is(Token::Atom)) return coerce_atom(tok.text, opts.number_suffixes);
            return Value(tok.text);
        }

        State state_for_top() const {
            return stack.back().value.isList() ? State::Element : State::Key;
        }

        void open(const Token& tok) {
            if (stack.size() >= opts.max_depth)
                fail("maximum nesting depth exceeded", tok, ErrorCode::Nested);
            Frame f;
            f.value = tok.is(Token::ArrayOpen) ? Value::array() : Value::object();
            stack.push_back(std::move(f));
            state = state_for_top();
        }

        // Store a finished value into the container on top of the stack.
        void attach(Value v) {
            Frame& top = stack.back();
            if (top.value.isList())
                top.value.push_back(std::move(v));
            else
                top.value.set(top.pending_key, std::move(v));
            state = state_for_top();
        }

        void close() {
            Frame f = std::move(stack.back());
            stack.pop_back();
            if (stack.empty()) {
                root = std::move(f.value);
                // anything after an explicitly closed root is ignored
                state = State::Done;
                return;
            }
            attach(std::move(f.value));
        }

        // End of input: every open container is closed as it stands.
        void close_all() {
            while (not stack.empty()) close();
            state = State::Done;
        }

        void on_init() {
            Token tok = lex.next(Context::Key);
            if (tok.is(Token::ObjectOpen) or tok.is(Token::ArrayOpen)) {
                open(tok);
                return;
            }
            Frame implicit;
            implicit.braced = false;
            stack.push_back(std::move(implicit));
            state = State::Key;
            on_key(tok);
        }

        void on_key(const Token& tok) {
            switch (tok.kind) {
                case Token::End:
                    close_all();
                    return;
                case Token::Terminator:
                case Token::ArrayClose:
                    return;
                case Token::ObjectClose:
                    if (stack.back().braced) close();
                    return;
                case Token::Atom:
                case Token::QuotedString:
                    stack.back().pending_key = make_key(tok.text);
                    state = State::AfterKey;
                    return;
                case Token::Invalid:
                    if (tok.truncated and tok.code == ErrorCode::Syntax)
                        throw UnfinishedKeyError(tok.line, tok.column);
                    fail_invalid(tok);
                default:
                    fail("invalid character in a key", tok);
            }
        }

        void on_after_key(const Token& tok) {
            switch (tok.kind) {
                case Token::Separator:
                    state = State::Value;
                    return;
                case Token::ObjectOpen:
                case Token::ArrayOpen:
                    open(tok);
                    return;
                case Token::End:
                    throw UnfinishedKeyError(tok.line, tok.column);
                case Token::Invalid:
                    fail_invalid(tok);
                default:
                    fail("missing ':' or '=' after key", tok);
            }
        }

        void on_value(const Token& tok) {
            switch (tok.kind) {
                case Token::Separator:
                    fail("unexpected '" + tok.text + "' character", tok);
                case Token::End:
                    throw UnfinishedKeyError(tok.line, tok.column);
                case Token::Terminator:
                case Token::ObjectClose:
                case Token::ArrayClose:
                    fail("empty value", tok);
                case Token::ObjectOpen:
                case Token::ArrayOpen:
                    open(tok);
                    return;
                case Token::Invalid:
                    fail_invalid(tok);
                default:
                    attach(scalar_from(tok));
                    return;
            }
        }

        void on_element(const Token& tok) {
            switch (tok.kind) {
                case Token::End:
                    close_all();
                    return;
                case Token::Terminator:
                case Token::ObjectClose:
                    return;
                case Token::ArrayClose:
                    close();
                    return;
                case Token::Separator:
                    fail("unexpected '" + tok.text + "' character", tok);
                case Token::ObjectOpen:
                case Token::ArrayOpen:
                    open(tok);
                    return;
                case Token::Invalid:
                    fail_invalid(tok);
                default:
                    attach(scalar_from(tok));
                    return;
            }
        }

        Value run() {
            while (state != State::Done) {
                switch (state) {
                    case State::Init:
                        on_init();
                        break;
                    case State::Key:
                        on_key(lex.next(Context::Key));
                        break;
                    case State::AfterKey:
                        on_after_key(lex.next(Context::Value));
                        break;
                    case State::Value:
                        on_value(lex.next(Context::Value));
                        break;
                    case State::Element:
                        on_element(lex.next(Context::Element));
                        break;
                    case State::Done:
                        break;
                }
            }
            return std::move(root);
        }
    };
}

Value parse(const std::string& text, const ParserOptions& options) {
    Parser p(text, options);
    return p.run();
}

}  // namespace ucfg
