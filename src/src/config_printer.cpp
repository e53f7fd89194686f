#include <ucfg/emit.h>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>

namespace ucfg {

namespace {
    bool is_bare_key(const std::string& k) {
        if (k.empty()) return false;
        for (char c : k) {
            if (std::isalnum(static_cast<unsigned char>(c))) continue;
            if (c == '_' or c == '-' or c == '.' or c == '/') continue;
            return false;
        }
        return true;
    }

    std::string key_text(const std::string& k) { return is_bare_key(k) ? k : quote_string(k); }

    std::string scalar_text(const Value& v) {
        switch (v.type()) {
            case Value::Null:
                return "null";
            case Value::Boolean:
                return v.asBool() ? "true" : "false";
            case Value::Integer:
                return std::to_string(v.asInt());
            case Value::Double:
                if (not std::isfinite(v.asDouble())) return "null";
                return format_double(v.asDouble());
            case Value::String:
                return quote_string(v.asString());
            default:
                break;
        }
        throw std::logic_error("Not a scalar: " + v.typeString());
    }

    struct ConfigPrinter {
        std::ostringstream out;

        void indent(int level) { out << std::string(static_cast<size_t>(level) * 4, ' '); }

        void entries(const Value& obj, int level) {
            for (auto const& p : obj.items()) {
                indent(level);
                out << key_text(p.first);
                const Value& v = p.second;
                if (v.isDict()) {
                    out << " {\n";
                    entries(v, level + 1);
                    indent(level);
                    out << "}\n";
                } else if (v.isList()) {
                    out << " [\n";
                    elements(v, level + 1);
                    indent(level);
                    out << "]\n";
                } else {
                    out << " = " << scalar_text(v) << ";\n";
                }
            }
        }

        void elements(const Value& arr, int level) {
            for (auto const& v : arr.elements()) {
                indent(level);
                if (v.isDict()) {
                    out << "{\n";
                    entries(v, level + 1);
                    indent(level);
                    out << "},\n";
                } else if (v.isList()) {
                    out << "[\n";
                    elements(v, level + 1);
                    indent(level);
                    out << "],\n";
                } else {
                    out << scalar_text(v) << ",\n";
                }
            }
        }
    };
}

std::string dump_config(const Value& tree) {
    check_emit_depth(tree);
    ConfigPrinter p;
    if (tree.isDict()) {
        // the top-level object is written without braces
        p.entries(tree, 0);
    } else if (tree.isList()) {
        p.out << "[\n";
        p.elements(tree, 1);
        p.out << "]\n";
    } else {
        p.out << scalar_text(tree) << '\n';
    }
    return p.out.str();
}

}  // namespace ucfg
