#include <ucfg/coerce.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace ucfg {

namespace {
    std::string to_lower(const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    bool is_digit(char c) { return c >= '0' and c <= '9'; }

    size_t digit_run(const std::string& s, size_t pos) {
        size_t start = pos;
        while (pos < s.size() and is_digit(s[pos])) ++pos;
        return pos - start;
    }

    // -?(digits | 0x hexdigits), whole text, within int64 range.
    bool parse_int64(const std::string& s, int64_t& out) {
        size_t pos = 0;
        bool negative = false;
        if (pos < s.size() and s[pos] == '-') {
            negative = true;
            ++pos;
        }
        if (pos >= s.size()) return false;

        int base = 10;
        if (s.size() - pos > 1 and s[pos] == '0' and (s[pos + 1] == 'x' or s[pos + 1] == 'X')) {
            base = 16;
            pos += 2;
            if (pos >= s.size()) return false;
            for (size_t k = pos; k < s.size(); ++k)
                if (not std::isxdigit(static_cast<unsigned char>(s[k]))) return false;
        } else {
            if (digit_run(s, pos) != s.size() - pos) return false;
        }

        errno = 0;
        char* end = nullptr;
        unsigned long long magnitude = std::strtoull(s.c_str() + pos, &end, base);
        if (errno == ERANGE or end != s.c_str() + s.size()) return false;

        const auto max = static_cast<unsigned long long>(std::numeric_limits<int64_t>::max());
        if (negative) {
            if (magnitude > max + 1ULL) return false;
            out = magnitude == max + 1ULL ? std::numeric_limits<int64_t>::min()
                                          : -static_cast<int64_t>(magnitude);
        } else {
            if (magnitude > max) return false;
            out = static_cast<int64_t>(magnitude);
        }
        return true;
    }

    // Length of a [+-]?digits(.digits)?([eE][+-]?digits)? prefix, 0 if none.
    // `has_point`/`has_exp` report which optional parts were seen.
    size_t float_prefix(const std::string& s, bool allow_exp, bool& has_point, bool& has_exp) {
        has_point = has_exp = false;
        size_t pos = 0;
        if (pos < s.size() and (s[pos] == '-' or s[pos] == '+')) ++pos;
        size_t n = digit_run(s, pos);
        if (n == 0) return 0;
        pos += n;
        if (pos < s.size() and s[pos] == '.') {
            size_t frac = digit_run(s, pos + 1);
            if (frac == 0) return 0;
            has_point = true;
            pos += 1 + frac;
        }
        if (allow_exp and pos < s.size() and (s[pos] == 'e' or s[pos] == 'E')) {
            size_t e = pos + 1;
            if (e < s.size() and (s[e] == '-' or s[e] == '+')) ++e;
            size_t ed = digit_run(s, e);
            if (ed == 0) return 0;
            has_exp = true;
            pos = e + ed;
        }
        return pos;
    }

    bool to_double(const std::string& s, double& out) {
        errno = 0;
        char* end = nullptr;
        out = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return false;
        return std::isfinite(out);
    }

    struct Suffix {
        const char* text;
        enum { Scale, Bytes, Seconds } kind;
        double factor;
    };

    // Longest first so "min" wins over "m" and "ms" over "m".
    const Suffix suffixes[] = {
        {"min", Suffix::Seconds, 60.0},
        {"ms", Suffix::Seconds, 0.001},
        {"kb", Suffix::Bytes, 1024.0},
        {"mb", Suffix::Bytes, 1024.0 * 1024.0},
        {"gb", Suffix::Bytes, 1024.0 * 1024.0 * 1024.0},
        {"k", Suffix::Scale, 1e3},
        {"m", Suffix::Scale, 1e6},
        {"g", Suffix::Scale, 1e9},
        {"s", Suffix::Seconds, 1.0},
        {"h", Suffix::Seconds, 3600.0},
        {"d", Suffix::Seconds, 86400.0},
        {"w", Suffix::Seconds, 604800.0},
        {"y", Suffix::Seconds, 31536000.0},
    };

    bool in_int64_range(double x) {
        return x >= -9223372036854775808.0 and x < 9223372036854775808.0;
    }

    // Splits "12.5kb" into its number and suffix and computes the result.
    bool apply_suffix(const std::string& text, Value* out) {
        bool has_point = false, has_exp = false;
        size_t n = float_prefix(text, false, has_point, has_exp);
        if (n == 0 or n == text.size()) return false;
        std::string number = text.substr(0, n);
        std::string suffix = to_lower(text.substr(n));

        for (auto const& sfx : suffixes) {
            if (suffix != sfx.text) continue;
            double base = 0.0;
            if (not to_double(number, base)) return false;

            switch (sfx.kind) {
                case Suffix::Scale: {
                    int64_t ival = 0;
                    if (not has_point and parse_int64(number, ival)) {
                        double scaled = static_cast<double>(ival) * sfx.factor;
                        if (not in_int64_range(scaled)) return false;
                        if (out) *out = Value(ival * static_cast<int64_t>(sfx.factor));
                        return true;
                    }
                    if (out) *out = Value(base * sfx.factor);
                    return true;
                }
                case Suffix::Bytes: {
                    double scaled = base * sfx.factor;
                    if (not in_int64_range(scaled)) return false;
                    if (out) *out = Value(static_cast<int64_t>(scaled));
                    return true;
                }
                case Suffix::Seconds:
                    if (out) *out = Value(base * sfx.factor);
                    return true;
            }
        }
        return false;
    }

    bool matches_bool(const std::string& text) {
        auto l = to_lower(text);
        return l == "true" or l == "yes" or l == "on" or l == "false" or l == "no" or l == "off";
    }

    Value convert_bool(const std::string& text) {
        auto l = to_lower(text);
        return Value(l == "true" or l == "yes" or l == "on");
    }

    bool matches_null(const std::string& text) { return to_lower(text) == "null"; }

    Value convert_null(const std::string&) { return Value::null(); }

    bool matches_int(const std::string& text) {
        int64_t v = 0;
        return parse_int64(text, v);
    }

    Value convert_int(const std::string& text) {
        int64_t v = 0;
        parse_int64(text, v);
        return Value(v);
    }

    bool matches_float(const std::string& text) {
        bool has_point = false, has_exp = false;
        size_t n = float_prefix(text, true, has_point, has_exp);
        if (n == 0 or n != text.size()) return false;
        if (not has_point and not has_exp) return false;
        double d = 0.0;
        return to_double(text, d);
    }

    Value convert_float(const std::string& text) { return Value(std::strtod(text.c_str(), nullptr)); }

    bool matches_suffixed(const std::string& text) { return apply_suffix(text, nullptr); }

    Value convert_suffixed(const std::string& text) {
        Value v;
        apply_suffix(text, &v);
        return v;
    }
}

const std::vector<CoercionRule>& coercion_rules() {
    static const std::vector<CoercionRule> rules = {
        {"boolean", matches_bool, convert_bool},
        {"null", matches_null, convert_null},
        {"integer", matches_int, convert_int},
        {"float", matches_float, convert_float},
        {"suffixed number", matches_suffixed, convert_suffixed},
    };
    return rules;
}

Value coerce_atom(const std::string& text, bool number_suffixes) {
    for (auto const& rule : coercion_rules()) {
        if (not number_suffixes and rule.matches == matches_suffixed) continue;
        if (rule.matches(text)) return rule.convert(text);
    }
    return Value(text);
}

}  // namespace ucfg
