#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace jr {

class Value {
  public:
    enum TYPE { Object, Array, String, Integer, Double };

    // empty Object
    Value() = default;
    Value(const std::string& s) : my_type(TYPE::String), m_string(s) {}
    Value(std::string&& s) : my_type(TYPE::String), m_string(std::move(s)) {}
    Value(const char* s) : Value(std::string(s)) {}
    Value(int64_t n) : my_type(TYPE::Integer), m_int(n) {}
    Value(int n) : Value(int64_t(n)) {}
    Value(double x) : my_type(TYPE::Double), m_double(x) {}

    static Value object() { return Value(); }
    static Value array() {
        Value v;
        v.my_type = TYPE::Array;
        return v;
    }

    TYPE type() const { return my_type; }
    std::string typeString() const;

    bool isObject() const { return my_type == TYPE::Object; }
    bool isArray() const { return my_type == TYPE::Array; }
    bool isString() const { return my_type == TYPE::String; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isNumber() const { return isInt() or isDouble(); }

    const std::string& asString() const;
    int64_t asInt() const;
    // Integers widen to double.
    double asDouble() const;

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }
    bool has(const std::string& key) const { return count(key) == 1; }

    // number of members or elements; 0 for scalars
    int size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    const Value& at(const std::string& key) const;
    Value& at(const std::string& key);
    const Value& at(int index) const;
    Value& at(int index);

    // Inserts an empty Object under `key` if missing. A non-object becomes
    // an empty Object first.
    Value& operator[](const std::string& key);

    // Inserts or overwrites. An overwritten key keeps its original position.
    Value& set(const std::string& key, Value v);
    Value& push_back(Value v);

    // keys in insertion order
    const std::vector<std::string>& keys() const;
    std::vector<std::pair<std::string, Value> > items() const;
    const std::vector<Value>& elements() const;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    // indent > 0 gives one member or element per line, indented by
    // `indent` spaces per level; otherwise a compact single line
    std::string dump(int indent = 0) const;

  private:
    void dumpTo(std::ostream& out, int indent, int level) const;

    TYPE my_type = TYPE::Object;
    std::string m_string;
    int64_t m_int = 0;
    double m_double = 0.0;

    std::vector<std::string> m_keys;
    std::map<std::string, Value> m_object_map;
    std::vector<Value> m_array;
};

// Shortest text that reads back as the same double, e.g. "2.5", "1.0", "1e+200".
std::string format_double(double x);

std::string escape_json_string(const std::string& s);

std::ostream& operator<<(std::ostream& os, const Value& v);

}  // namespace jr
