#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sg {

struct DictionaryScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
};

// Dynamic JSON-like value. Objects remember the order in which keys were
// first inserted; keys(), items() and dump() all follow that order.
struct Dictionary {
    enum TYPE { Object, Boolean, String, Integer, Double, Array, Null };

  private:
    TYPE my_type = Object;
    DictionaryScalarImpl scalar;

    std::vector<Dictionary> m_array;
    std::map<std::string, Dictionary> m_object_map;
    std::vector<std::string> m_key_order;

  public:
    Dictionary() = default;
    Dictionary(const Dictionary&) = default;
    Dictionary(Dictionary&&) = default;
    Dictionary& operator=(const Dictionary&) = default;
    Dictionary& operator=(Dictionary&&) = default;
    ~Dictionary() = default;

    Dictionary(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Dictionary(const char* s) : Dictionary(std::string(s)) {}

    Dictionary(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Dictionary(int n) : Dictionary(int64_t(n)) {}

    Dictionary(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Dictionary(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Dictionary(const std::vector<Dictionary>& v) {
        my_type = TYPE::Array;
        m_array = v;
    }

    Dictionary(std::vector<Dictionary>&& v) {
        my_type = TYPE::Array;
        m_array = std::move(v);
    }

    Dictionary(const std::vector<std::string>& v) {
        my_type = TYPE::Array;
        m_array.reserve(v.size());
        for (auto const& s : v) m_array.emplace_back(s);
    }

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<std::pair<std::string, Dictionary> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) (*this)[p.first] = p.second;
    }

    static Dictionary null() {
        Dictionary d;
        d.my_type = TYPE::Null;
        return d;
    }

    static Dictionary array() {
        Dictionary d;
        d.my_type = TYPE::Array;
        return d;
    }

    TYPE type() const { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "object";
            case TYPE::Boolean:
                return "boolean";
            case TYPE::String:
                return "string";
            case TYPE::Integer:
                return "integer";
            case TYPE::Double:
                return "number";
            case TYPE::Array:
                return "array";
            case TYPE::Null:
                return "null";
        }
        throw std::logic_error("Not a valid type");
    }

    bool operator==(const Dictionary& rhs) const {
        // integer 1 and number 1.0 compare equal, like JSON numbers do
        if (isNumber() && rhs.isNumber()) {
            if (my_type == TYPE::Integer && rhs.my_type == TYPE::Integer)
                return scalar.m_int == rhs.scalar.m_int;
            return asDouble() == rhs.asDouble();
        }
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Null:
                return true;
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object:
                return m_object_map == rhs.m_object_map;
            default:
                return false;
        }
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object_map.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept { return size() == 0; }

    Dictionary& erase(const std::string& k) {
        if (my_type == TYPE::Object && m_object_map.erase(k) > 0) {
            for (auto it = m_key_order.begin(); it != m_key_order.end(); ++it) {
                if (*it == k) {
                    m_key_order.erase(it);
                    break;
                }
            }
        }
        return *this;
    }

    void push_back(const Dictionary& v) {
        if (my_type == TYPE::Object && m_object_map.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(v);
    }

    Dictionary& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            my_type = TYPE::Object;
            m_array.clear();
            m_object_map.clear();
            m_key_order.clear();
        }
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        m_key_order.push_back(k);
        return m_object_map[k];
    }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    Dictionary& at(int index) {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Dictionary& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Dictionary& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    Dictionary& at(const std::string& k) {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    // Insertion order, not lexical order.
    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        return m_key_order;
    }

    std::vector<std::pair<std::string, Dictionary> > items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        std::vector<std::pair<std::string, Dictionary> > out;
        out.reserve(m_key_order.size());
        for (auto const& k : m_key_order) out.emplace_back(k, m_object_map.at(k));
        return out;
    }

    const std::vector<Dictionary>& elements() const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array;
    }

    const std::string& asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        if (my_type == TYPE::Double) {
            if (!(scalar.m_double >= -9223372036854775808.0 && scalar.m_double < 9223372036854775808.0))
                throw std::runtime_error("number out of int64 range");
            return static_cast<int64_t>(scalar.m_double);
        }
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

    std::vector<std::string> asStrings() const {
        if (my_type == TYPE::String) return {scalar.m_string};
        if (my_type != TYPE::Array) throw std::runtime_error("not a string list");
        std::vector<std::string> out;
        out.reserve(m_array.size());
        for (auto const& e : m_array) out.push_back(e.asString());
        return out;
    }

    bool isMappedObject() const { return my_type == TYPE::Object; }
    bool isArrayObject() const { return my_type == TYPE::Array; }
    bool isNumber() const { return my_type == TYPE::Integer || my_type == TYPE::Double; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }

    std::string dump(int indent = 0) const;

    std::string to_string() const {
        if (my_type == TYPE::String) return scalar.m_string;
        return dump();
    }

  private:
    std::string missingKeyMessage(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& key : m_key_order) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << key << '"';
        }
        return ss.str();
    }
};

// Helper function to escape JSON strings
inline std::string escape_json_string(const std::string& s) {
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
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

inline std::string format_json_number(double x) {
    // shortest of 15 or 17 significant digits that reads back exactly
    std::ostringstream ss;
    ss.precision(15);
    ss << x;
    std::string s = ss.str();
    if (std::strtod(s.c_str(), nullptr) != x) {
        ss.str("");
        ss.precision(17);
        ss << x;
        s = ss.str();
    }
    // keep doubles recognisable as doubles when reparsed
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

// indent == 0 gives compact single-line JSON; indent > 0 pretty prints.
inline std::string Dictionary::dump(int indent) const {
    std::ostringstream out;

    std::function<void(const Dictionary&, int)> dumpValue;
    dumpValue = [&](const Dictionary& val, int level) {
        const std::string pad = indent > 0 ? std::string(static_cast<size_t>(level + indent), ' ') : "";
        const std::string closePad = indent > 0 ? std::string(static_cast<size_t>(level), ' ') : "";
        const char* nl = indent > 0 ? "\n" : "";
        switch (val.my_type) {
            case TYPE::Null:
                out << "null";
                return;
            case TYPE::Boolean:
                out << (val.scalar.m_bool ? "true" : "false");
                return;
            case TYPE::Integer:
                out << val.scalar.m_int;
                return;
            case TYPE::Double:
                out << format_json_number(val.scalar.m_double);
                return;
            case TYPE::String:
                out << escape_json_string(val.scalar.m_string);
                return;
            case TYPE::Array: {
                if (val.m_array.empty()) {
                    out << "[]";
                    return;
                }
                out << '[' << nl;
                for (size_t i = 0; i < val.m_array.size(); ++i) {
                    out << pad;
                    dumpValue(val.m_array[i], level + indent);
                    if (i + 1 < val.m_array.size()) out << ',';
                    out << nl;
                }
                out << closePad << ']';
                return;
            }
            case TYPE::Object: {
                if (val.m_key_order.empty()) {
                    out << "{}";
                    return;
                }
                out << '{' << nl;
                for (size_t i = 0; i < val.m_key_order.size(); ++i) {
                    const std::string& k = val.m_key_order[i];
                    out << pad << escape_json_string(k) << (indent > 0 ? ": " : ":");
                    dumpValue(val.m_object_map.at(k), level + indent);
                    if (i + 1 < val.m_key_order.size()) out << ',';
                    out << nl;
                }
                out << closePad << '}';
                return;
            }
        }
    };

    dumpValue(*this, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace sg
