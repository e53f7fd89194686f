#include <ucfg/ucfg.h>

namespace ucfg {

std::optional<Value> load(const std::optional<std::string>& text, const ParserOptions& options) {
    if (not text.has_value()) return std::nullopt;
    return parse(*text, options);
}

std::optional<std::string> dump(const std::optional<Value>& tree, EmitMode mode) {
    if (not tree.has_value()) return std::nullopt;
    return emit(*tree, mode);
}

void validate(const Value&, const Value&) {
    throw NotImplementedError("schema validation is not implemented");
}

}  // namespace ucfg
