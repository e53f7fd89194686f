#include <ucfg/emit.h>
#include <ucfg/coerce.h>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>

namespace ucfg {

namespace {
    bool needs_quoting(const std::string& s) {
        if (s.empty()) return true;
        if (std::isspace(static_cast<unsigned char>(s.front())) or
            std::isspace(static_cast<unsigned char>(s.back())))
            return true;

        const std::string special = ":#{}[],&*?|-<>=!%@\\\"'`";
        for (char c : s) {
            if (static_cast<unsigned char>(c) < 0x20) return true;
            if (special.find(c) != std::string::npos) return true;
        }

        // would read back as something other than a string
        if (s == "~") return true;
        if (not coerce_atom(s).isString()) return true;
        return false;
    }

    std::string scalar_to_yaml(const Value& d) {
        switch (d.type()) {
            case Value::Null:
                return "null";
            case Value::Boolean:
                return d.asBool() ? "true" : "false";
            case Value::Integer:
                return std::to_string(d.asInt());
            case Value::Double: {
                double x = d.asDouble();
                if (std::isnan(x)) return ".nan";
                if (std::isinf(x)) return x < 0 ? "-.inf" : ".inf";
                return format_double(x);
            }
            case Value::String: {
                const std::string& s = d.asString();
                if (needs_quoting(s)) return quote_string(s);
                return s;
            }
            default:
                break;
        }
        throw std::logic_error("Not a scalar: " + d.typeString());
    }

    // A container that prints on the same line as its key or dash.
    bool is_inline(const Value& d) { return d.isScalar() or d.empty(); }

    std::string inline_text(const Value& d) {
        if (d.isDict()) return "{}";
        if (d.isList()) return "[]";
        return scalar_to_yaml(d);
    }

    struct YamlPrinter {
        std::ostringstream out;

        void indent(int n) { out << std::string(static_cast<size_t>(n), ' '); }

        void block(const Value& d, int level) {
            if (d.isDict()) {
                for (auto const& p : d.items()) {
                    indent(level);
                    out << (needs_quoting(p.first) ? quote_string(p.first) : p.first) << ":";
                    if (is_inline(p.second)) {
                        out << ' ' << inline_text(p.second) << '\n';
                    } else {
                        out << '\n';
                        block(p.second, level + 2);
                    }
                }
                return;
            }
            for (auto const& el : d.elements()) {
                indent(level);
                out << "-";
                if (is_inline(el)) {
                    out << ' ' << inline_text(el) << '\n';
                } else {
                    out << '\n';
                    block(el, level + 2);
                }
            }
        }
    };
}

std::string dump_yaml(const Value& tree) {
    check_emit_depth(tree);
    YamlPrinter p;
    if (is_inline(tree))
        p.out << inline_text(tree) << '\n';
    else
        p.block(tree, 0);
    return p.out.str();
}

}  // namespace ucfg
