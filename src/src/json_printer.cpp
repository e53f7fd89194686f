#include <ucfg/emit.h>
#include <cmath>
#include <sstream>
#include <string>

namespace ucfg {

namespace {
    struct JsonPrinter {
        std::ostringstream out;
        bool compact;

        explicit JsonPrinter(bool c) : compact(c) {}

        void newline(int level) {
            if (compact) return;
            out << '\n' << std::string(static_cast<size_t>(level) * 4, ' ');
        }

        void value(const Value& v, int level) {
            switch (v.type()) {
                case Value::Null:
                    out << "null";
                    return;
                case Value::Boolean:
                    out << (v.asBool() ? "true" : "false");
                    return;
                case Value::Integer:
                    out << v.asInt();
                    return;
                case Value::Double:
                    // JSON has no spelling for inf or nan
                    if (std::isfinite(v.asDouble()))
                        out << format_double(v.asDouble());
                    else
                        out << "null";
                    return;
                case Value::String:
                    out << quote_string(v.asString());
                    return;
                case Value::Array: {
                    auto const& L = v.elements();
                    if (L.empty()) {
                        out << "[]";
                        return;
                    }
                    out << '[';
                    for (size_t i = 0; i < L.size(); ++i) {
                        if (i) out << ',';
                        newline(level + 1);
                        value(L[i], level + 1);
                    }
                    newline(level);
                    out << ']';
                    return;
                }
                case Value::Object: {
                    auto const& items = v.items();
                    if (items.empty()) {
                        out << "{}";
                        return;
                    }
                    out << '{';
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (i) out << ',';
                        newline(level + 1);
                        out << quote_string(items[i].first) << (compact ? ":" : ": ");
                        value(items[i].second, level + 1);
                    }
                    newline(level);
                    out << '}';
                    return;
                }
            }
        }
    };
}

std::string dump_json(const Value& tree, bool compact) {
    check_emit_depth(tree);
    JsonPrinter p(compact);
    p.value(tree, 0);
    return p.out.str();
}

std::string Value::to_string() const { return dump_json(*this, true); }

}  // namespace ucfg
