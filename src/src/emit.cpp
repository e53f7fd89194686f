#include <ucfg/emit.h>
#include <ucfg/errors.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

namespace ucfg {

EmitMode emit_mode_from_string(const std::string& name) {
    if (name == "ucl" or name == "native" or name == "config") return EmitMode::Native;
    if (name == "json") return EmitMode::Json;
    if (name == "compact_json" or name == "json_compact") return EmitMode::JsonCompact;
    if (name == "yaml") return EmitMode::Yaml;
    throw UsageError("Unknown output format <" + name +
                     ">, expected one of: ucl, json, compact_json, yaml");
}

const char* emit_mode_name(EmitMode mode) {
    switch (mode) {
        case EmitMode::Native:
            return "ucl";
        case EmitMode::Json:
            return "json";
        case EmitMode::JsonCompact:
            return "compact_json";
        case EmitMode::Yaml:
            return "yaml";
    }
    return "unknown";
}

std::string emit(const Value& tree, EmitMode mode) {
    switch (mode) {
        case EmitMode::Native:
            return dump_config(tree);
        case EmitMode::Json:
            return dump_json(tree, false);
        case EmitMode::JsonCompact:
            return dump_json(tree, true);
        case EmitMode::Yaml:
            return dump_yaml(tree);
    }
    throw std::logic_error("Not a valid emit mode");
}

size_t nesting_depth(const Value& tree) {
    // walked with an explicit stack: the tree may be deeper than the call stack allows
    size_t deepest = 0;
    std::vector<std::pair<const Value*, size_t>> pending{{&tree, 1}};
    while (not pending.empty()) {
        auto [v, depth] = pending.back();
        pending.pop_back();
        if (v->isDict()) {
            deepest = std::max(deepest, depth);
            for (const auto& kv : v->items()) pending.emplace_back(&kv.second, depth + 1);
        } else if (v->isList()) {
            deepest = std::max(deepest, depth);
            for (const auto& e : v->elements()) pending.emplace_back(&e, depth + 1);
        }
    }
    return deepest;
}

void check_emit_depth(const Value& tree) {
    size_t depth = nesting_depth(tree);
    if (depth > max_emit_depth)
        throw EmitError("cannot emit a tree nested " + std::to_string(depth) +
                        " levels deep (limit " + std::to_string(max_emit_depth) + ")");
}

std::string quote_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else
                    result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

std::string format_double(double x) {
    char buf[64];
    if (std::fabs(x) < 1e15) {
        if (std::floor(x) == x) {
            std::snprintf(buf, sizeof(buf), "%.1f", x);
            return buf;
        }
        std::snprintf(buf, sizeof(buf), "%f", x);
        if (std::strtod(buf, nullptr) == x) return buf;
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, x);
        if (std::strtod(buf, nullptr) == x) break;
    }
    std::string out = buf;
    if (out.find_first_of(".eE") == std::string::npos) out += ".0";
    return out;
}

}  // namespace ucfg
