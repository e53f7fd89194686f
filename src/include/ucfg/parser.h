#pragma once

#include <ucfg/value.h>
#include <ucfg/errors.h>
#include <cstddef>
#include <string>

namespace ucfg {

struct ParserOptions {
    bool lowercase_keys = false;   // lowercase every key on insert
    bool number_suffixes = true;   // 10k, 4kb, 30s, 1min ...
    size_t max_depth = 128;        // container nesting limit
};

// Parse a configuration buffer into a value tree. The root is always an
// Object or an Array. Throws ParseError (or UnfinishedKeyError) on fatal
// syntax errors; no partial tree is returned.
Value parse(const std::string& text, const ParserOptions& options = {});

}  // namespace ucfg
