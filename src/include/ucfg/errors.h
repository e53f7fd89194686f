#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ucfg {

enum class ErrorCode {
    Syntax,
    UnfinishedKey,
    Nested,
};

// Fatal parse failure. what() is "error on line L at column C: <reason>".
struct ParseError : public std::runtime_error {
    ParseError(ErrorCode code, const std::string& reason, size_t line, size_t column)
        : std::runtime_error(format(reason, line, column)),
          m_code(code),
          m_reason(reason),
          m_line(line),
          m_column(column) {}

    ErrorCode code() const noexcept { return m_code; }
    const std::string& reason() const noexcept { return m_reason; }
    size_t line() const noexcept { return m_line; }
    size_t column() const noexcept { return m_column; }

    static std::string format(const std::string& reason, size_t line, size_t column) {
        return "error on line " + std::to_string(line) + " at column " + std::to_string(column) +
               ": " + reason;
    }

  private:
    ErrorCode m_code;
    std::string m_reason;
    size_t m_line;
    size_t m_column;
};

// A key was opened and the input ended before its value.
struct UnfinishedKeyError : public ParseError {
    UnfinishedKeyError(size_t line, size_t column)
        : ParseError(ErrorCode::UnfinishedKey, "unfinished key", line, column) {}
};

// A tree the printers refuse to write (nested deeper than max_emit_depth).
struct EmitError : public std::runtime_error {
    explicit EmitError(const std::string& what) : std::runtime_error(what) {}
};

// Permanent: raised by features that are deliberately absent.
struct NotImplementedError : public std::logic_error {
    explicit NotImplementedError(const std::string& what) : std::logic_error(what) {}
};

// Caller-side contract violation (bad arguments, unknown option, unknown
// output format). Raised before any parsing happens.
struct UsageError : public std::invalid_argument {
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace ucfg
