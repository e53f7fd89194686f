#pragma once

#include <ucfg/value.h>
#include <string>
#include <vector>

namespace ucfg {

// One step of bare literal classification. Rules are tried in order and the
// first one whose `matches` accepts the text converts it.
struct CoercionRule {
    const char* name;
    bool (*matches)(const std::string& text);
    Value (*convert)(const std::string& text);
};

// The default chain: boolean, null, integer, float, suffixed number. The
// string fallback is not a rule; it applies when nothing matched.
const std::vector<CoercionRule>& coercion_rules();

// Classify an unquoted literal. With `number_suffixes` off the suffixed
// number rule is skipped, so `10k` stays a string.
Value coerce_atom(const std::string& text, bool number_suffixes = true);

}  // namespace ucfg
