#pragma once

#include <ucfg/value.h>
#include <cstddef>
#include <string>

namespace ucfg {

enum class EmitMode { Native, Json, JsonCompact, Yaml };

// "ucl", "native" or "config"; "json"; "compact_json" or "json_compact";
// "yaml". Throws UsageError for anything else.
EmitMode emit_mode_from_string(const std::string& name);
const char* emit_mode_name(EmitMode mode);

// Same limit as ParserOptions::max_depth, so anything parse() accepts can be
// written back. Every dump_* throws EmitError for deeper trees.
constexpr size_t max_emit_depth = 128;

std::string emit(const Value& tree, EmitMode mode = EmitMode::Native);

// Native relaxed syntax: `key = value;`, `key { ... }`, `key [ ... ]`.
std::string dump_config(const Value& tree);

// Pretty JSON with 4 space indent, or a single line when `compact` is set.
// No trailing newline in either form.
std::string dump_json(const Value& tree, bool compact = false);

std::string dump_yaml(const Value& tree);

// Helpers shared by the printers.

// Containers on the deepest path, the root included; 0 for a scalar.
size_t nesting_depth(const Value& tree);
void check_emit_depth(const Value& tree);

// Double quoted, with `"`, `\` and control characters escaped.
std::string quote_string(const std::string& s);

// Six fractional digits (`1.100000`), `1.0` for integral values, or the
// shortest exact form for large magnitudes and when six digits would lose
// precision. Always contains a '.' or an exponent so it reads back as a
// double.
std::string format_double(double x);

}  // namespace ucfg
