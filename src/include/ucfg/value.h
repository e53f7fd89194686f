#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <initializer_list>
#include <map>
#include <vector>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace ucfg {

struct ValueScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
};

// Generic configuration tree. Objects keep their entries in insertion order
// with a key index on the side; assigning to an existing key replaces the
// value in place.
struct Value {
    enum TYPE { Object, Array, Boolean, String, Integer, Double, Null };

    using Entry = std::pair<std::string, Value>;

  private:
    TYPE my_type = Object;
    ValueScalarImpl scalar;

    std::vector<Value> m_array;
    std::vector<Entry> m_object_entries;
    std::map<std::string, size_t> m_object_index;

  public:
    Value() = default;
    ~Value() = default;
    Value(const Value&) = default;
    Value(Value&&) noexcept = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) noexcept = default;

    Value(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Value(std::string&& s) {
        my_type = TYPE::String;
        scalar.m_string = std::move(s);
    }

    Value(const char* s) : Value(std::string(s)) {}

    Value(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Value(int n) : Value(int64_t(n)) {}

    Value(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Value(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Value(std::vector<Value> v) {
        my_type = TYPE::Array;
        m_array = std::move(v);
    }

    // Construct an object from initializer list of (key, value) pairs
    Value(std::initializer_list<Entry> init) {
        my_type = TYPE::Object;
        for (auto const& p : init) set(p.first, p.second);
    }

    static Value null() {
        Value v;
        v.my_type = TYPE::Null;
        return v;
    }

    static Value object() { return Value(); }

    static Value array(std::vector<Value> v = {}) { return Value(std::move(v)); }

    bool operator==(const Value& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::Double:
                return scalar.m_double == rhs.scalar.m_double;
            case TYPE::Integer:
                return scalar.m_int == rhs.scalar.m_int;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object: {
                // entry order is not significant
                if (m_object_entries.size() != rhs.m_object_entries.size()) return false;
                for (auto const& p : m_object_entries) {
                    auto it = rhs.m_object_index.find(p.first);
                    if (it == rhs.m_object_index.end()) return false;
                    if (p.second != rhs.m_object_entries[it->second].second) return false;
                }
                return true;
            }
            case TYPE::Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_index.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object_entries.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept {
        switch (my_type) {
            case TYPE::Object:
                return m_object_entries.empty();
            case TYPE::Array:
                return m_array.empty();
            default:
                return false;
        }
    }

    Value& erase(const std::string& k) {
        if (my_type != TYPE::Object) return *this;
        auto it = m_object_index.find(k);
        if (it == m_object_index.end()) return *this;
        m_object_entries.erase(m_object_entries.begin() + static_cast<std::ptrdiff_t>(it->second));
        reindex();
        return *this;
    }

    void clear() noexcept {
        m_object_entries.clear();
        m_object_index.clear();
        m_array.clear();
        my_type = TYPE::Object;
    }

    TYPE type() const noexcept { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Array:
                return "Array";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Double:
                return "Double";
            case TYPE::Integer:
                return "Integer";
            case TYPE::String:
                return "String";
            case TYPE::Null:
                return "Null";
        }
        throw std::logic_error("Not a valid type");
    }

    // Insert or overwrite `key`. An existing entry keeps its position.
    Value& set(const std::string& key, Value v) {
        if (my_type != TYPE::Object) {
            clear();
        }
        auto it = m_object_index.find(key);
        if (it != m_object_index.end()) {
            m_object_entries[it->second].second = std::move(v);
            return m_object_entries[it->second].second;
        }
        m_object_index.emplace(key, m_object_entries.size());
        m_object_entries.emplace_back(key, std::move(v));
        return m_object_entries.back().second;
    }

    Value& push_back(Value v) {
        if (my_type == TYPE::Object && m_object_entries.empty()) {
            my_type = TYPE::Array;
        }
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
        return m_array.back();
    }

    Value& operator[](int index) {
        // An object that has never held a key may become an array on first
        // integer-index access so that v["arr"][0] = 5 works.
        if (my_type == TYPE::Object && m_object_entries.empty()) {
            my_type = TYPE::Array;
            m_array.clear();
        }
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0) throw std::logic_error("Negative index");
        if (static_cast<size_t>(index) >= m_array.size())
            m_array.resize(static_cast<size_t>(index) + 1);
        return m_array[static_cast<size_t>(index)];
    }

    const Value& operator[](int index) const { return at(index); }

    Value& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            clear();
        }
        auto it = m_object_index.find(k);
        if (it != m_object_index.end()) return m_object_entries[it->second].second;
        return set(k, Value());
    }

    const Value& operator[](const std::string& k) const { return at(k); }

    Value& at(int index) {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Value& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Value& at(const std::string& k) const {
        auto it = m_object_index.find(k);
        if (my_type == TYPE::Object && it != m_object_index.end())
            return m_object_entries[it->second].second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    Value& at(const std::string& k) {
        auto it = m_object_index.find(k);
        if (my_type == TYPE::Object && it != m_object_index.end())
            return m_object_entries[it->second].second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object_entries.size());
        for (auto const& p : m_object_entries) out.push_back(p.first);
        return out;
    }

    const std::vector<Entry>& items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        return m_object_entries;
    }

    const std::vector<Value>& elements() const {
        if (my_type != TYPE::Array) {
            throw std::logic_error("Cannot get elements of non-array type");
        }
        return m_array;
    }

    std::string asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(scalar.m_double);
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    bool getBool(const std::string& key) const { return at(key).asBool(); }
    int64_t getInt(const std::string& key) const { return at(key).asInt(); }
    double getDouble(const std::string& key) const { return at(key).asDouble(); }
    std::string getString(const std::string& key) const { return at(key).asString(); }

    bool isScalar() const {
        return my_type != TYPE::Object && my_type != TYPE::Array;
    }

    bool isDict() const { return my_type == TYPE::Object; }
    bool isList() const { return my_type == TYPE::Array; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }

    // Compact single-line JSON, mostly for diagnostics and test output.
    std::string to_string() const;

  private:
    void reindex() {
        m_object_index.clear();
        for (size_t i = 0; i < m_object_entries.size(); ++i)
            m_object_index.emplace(m_object_entries[i].first, i);
    }

    std::string missingKeyMessage(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object_entries) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        return ss.str();
    }
};

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.to_string();
    return os;
}

}  // namespace ucfg
