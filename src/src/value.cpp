#include <jr/value.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace jr {

std::string Value::typeString() const {
    switch (my_type) {
        case TYPE::Object:
            return "Object";
        case TYPE::Array:
            return "Array";
        case TYPE::String:
            return "String";
        case TYPE::Integer:
            return "Integer";
        case TYPE::Double:
            return "Double";
    }
    throw std::logic_error("Not a valid type");
}

const std::string& Value::asString() const {
    if (my_type != TYPE::String) throw std::logic_error("Value is not a string: " + typeString());
    return m_string;
}

int64_t Value::asInt() const {
    if (my_type != TYPE::Integer) throw std::logic_error("Value is not an integer: " + typeString());
    return m_int;
}

double Value::asDouble() const {
    if (my_type == TYPE::Integer) return static_cast<double>(m_int);
    if (my_type != TYPE::Double) throw std::logic_error("Value is not a number: " + typeString());
    return m_double;
}

int Value::size() const noexcept {
    switch (my_type) {
        case TYPE::Object:
            return static_cast<int>(m_keys.size());
        case TYPE::Array:
            return static_cast<int>(m_array.size());
        default:
            return 0;
    }
}

const Value& Value::at(const std::string& key) const {
    auto it = m_object_map.find(key);
    if (it != m_object_map.end()) return it->second;

    // didn't find it, throw a decent error message
    std::ostringstream ss;
    ss << "Could not find key <" << key << "> available options are: ";
    bool first = true;
    for (auto const& k : m_keys) {
        if (not first) ss << ", ";
        first = false;
        ss << k;
    }
    throw std::out_of_range(ss.str());
}

Value& Value::at(const std::string& key) {
    return const_cast<Value&>(static_cast<const Value&>(*this).at(key));
}

const Value& Value::at(int index) const {
    if (my_type != TYPE::Array) throw std::logic_error("Not a list");
    if (index < 0 or index >= static_cast<int>(m_array.size()))
        throw std::out_of_range("Index " + std::to_string(index) + " out of range for array of size " +
                                std::to_string(m_array.size()));
    return m_array[static_cast<size_t>(index)];
}

Value& Value::at(int index) {
    return const_cast<Value&>(static_cast<const Value&>(*this).at(index));
}

Value& Value::operator[](const std::string& key) {
    if (my_type != TYPE::Object) *this = Value::object();
    auto it = m_object_map.find(key);
    if (it != m_object_map.end()) return it->second;
    m_keys.push_back(key);
    return m_object_map[key];
}

Value& Value::set(const std::string& key, Value v) {
    (*this)[key] = std::move(v);
    return *this;
}

Value& Value::push_back(Value v) {
    if (my_type != TYPE::Array) throw std::logic_error("Not a list");
    m_array.push_back(std::move(v));
    return *this;
}

const std::vector<std::string>& Value::keys() const {
    if (my_type != TYPE::Object) throw std::logic_error("Cannot get keys of non-object type");
    return m_keys;
}

std::vector<std::pair<std::string, Value> > Value::items() const {
    if (my_type != TYPE::Object) throw std::logic_error("Cannot get items of non-object type");
    std::vector<std::pair<std::string, Value> > out;
    out.reserve(m_keys.size());
    for (auto const& k : m_keys) out.emplace_back(k, m_object_map.at(k));
    return out;
}

const std::vector<Value>& Value::elements() const {
    if (my_type != TYPE::Array) throw std::logic_error("Not a list");
    return m_array;
}

bool Value::operator==(const Value& rhs) const {
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case TYPE::String:
            return m_string == rhs.m_string;
        case TYPE::Integer:
            return m_int == rhs.m_int;
        case TYPE::Double:
            return m_double == rhs.m_double;
        case TYPE::Array:
            return m_array == rhs.m_array;
        case TYPE::Object:
            // member order does not matter
            return m_object_map == rhs.m_object_map;
    }
    return false;
}

std::string format_double(double x) {
    if (std::isnan(x)) return "NaN";
    if (std::isinf(x)) return x < 0 ? "-Infinity" : "Infinity";

    // fewest significant digits that read back as x
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, x);
        if (std::strtod(buf, nullptr) == x) break;
    }

    std::string s(buf);
    bool negative = s[0] == '-';
    if (negative) s.erase(0, 1);

    size_t e = s.find('e');
    int exponent = std::atoi(s.c_str() + e + 1);
    std::string digits = s.substr(0, e);
    size_t dot = digits.find('.');
    if (dot != std::string::npos) digits.erase(dot, 1);
    while (digits.size() > 1 and digits.back() == '0') digits.pop_back();

    std::string out;
    if (exponent < -4 or exponent >= 16) {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        char exp_buf[8];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
        out += exp_buf;
    } else if (exponent < 0) {
        out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
    } else {
        size_t int_len = static_cast<size_t>(exponent) + 1;
        if (digits.size() <= int_len)
            out = digits + std::string(int_len - digits.size(), '0') + ".0";
        else
            out = digits.substr(0, int_len) + "." + digits.substr(int_len);
    }
    return negative ? "-" + out : out;
}

namespace {
    // two-character escape for `c`, or nullptr when it has none
    const char* short_escape(char c) {
        switch (c) {
            case '"': return "\\\"";
            case '\\': return "\\\\";
            case '\b': return "\\b";
            case '\f': return "\\f";
            case '\n': return "\\n";
            case '\r': return "\\r";
            case '\t': return "\\t";
            default: return nullptr;
        }
    }
}

// Bytes from 0x80 up pass through untouched.
std::string escape_json_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (const char* escape = short_escape(c)) {
            out += escape;
        } else if (static_cast<unsigned char>(c) < 0x20) {
            char code[8];
            std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
            out += code;
        } else {
            out += c;
        }
    }
    return out + "\"";
}

void Value::dumpTo(std::ostream& out, int indent, int level) const {
    const bool pretty = indent > 0;
    auto newline = [&](int depth) {
        if (not pretty) return;
        out << '\n' << std::string(static_cast<size_t>(depth * indent), ' ');
    };

    switch (my_type) {
        case TYPE::String:
            out << escape_json_string(m_string);
            return;
        case TYPE::Integer:
            out << m_int;
            return;
        case TYPE::Double:
            out << format_double(m_double);
            return;
        case TYPE::Array: {
            if (m_array.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < m_array.size(); ++i) {
                if (i) out << ',';
                newline(level + 1);
                m_array[i].dumpTo(out, indent, level + 1);
            }
            newline(level);
            out << ']';
            return;
        }
        case TYPE::Object: {
            if (m_keys.empty()) {
                out << "{}";
                return;
            }
            out << '{';
            for (size_t i = 0; i < m_keys.size(); ++i) {
                if (i) out << ',';
                newline(level + 1);
                out << escape_json_string(m_keys[i]) << (pretty ? ": " : ":");
                m_object_map.at(m_keys[i]).dumpTo(out, indent, level + 1);
            }
            newline(level);
            out << '}';
            return;
        }
    }
}

std::string Value::dump(int indent) const {
    std::ostringstream out;
    dumpTo(out, indent, 0);
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace jr
