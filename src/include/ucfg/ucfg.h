#pragma once

#include <ucfg/value.h>
#include <ucfg/errors.h>
#include <ucfg/parser.h>
#include <ucfg/emit.h>
#include <optional>
#include <string>

namespace ucfg {

// Parse `text`. A missing input (std::nullopt) yields std::nullopt, which is
// distinct from an empty object. Parse errors propagate as ParseError.
std::optional<Value> load(const std::optional<std::string>& text,
                          const ParserOptions& options = {});

std::optional<std::string> dump(const std::optional<Value>& tree,
                                EmitMode mode = EmitMode::Native);

// Schema validation is not supported; always throws NotImplementedError.
[[noreturn]] void validate(const Value& schema, const Value& data);

}  // namespace ucfg
