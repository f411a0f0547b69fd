#pragma once

#include <jr/reader.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace jr {

// One lexical unit: punctuation, a quoted string literal or a number.
class Token {
  public:
    enum class Type { Punctuation, StringLiteral, Integer, Float };

    static Token makePunctuation(char c, size_t offset = 0);
    // `literal` keeps its surrounding quotes
    static Token makeString(std::string literal, size_t offset = 0);
    // `text` is the number as written in the source; when empty, to_string()
    // prints the canonical form instead
    static Token makeInteger(int64_t n, size_t offset = 0, std::string text = std::string());
    static Token makeFloat(double x, size_t offset = 0, std::string text = std::string());

    Type type() const { return static_cast<Type>(data_.index()); }

    bool isPunctuation() const { return type() == Type::Punctuation; }
    bool isPunctuation(char c) const { return isPunctuation() and std::get<0>(data_) == c; }
    bool isString() const { return type() == Type::StringLiteral; }
    bool isInteger() const { return type() == Type::Integer; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumber() const { return isInteger() or isFloat(); }

    char asPunctuation() const;
    const std::string& asString() const;
    int64_t asInt() const;
    double asDouble() const;

    // index of the token's first character in the source text
    size_t offset() const { return offset_; }

    std::string kindString() const;
    std::string to_string() const;

    // Compares kind and payload; the source offset is ignored.
    bool operator==(const Token& rhs) const { return data_ == rhs.data_; }
    bool operator!=(const Token& rhs) const { return not(*this == rhs); }

  private:
    using Data = std::variant<char, std::string, int64_t, double>;

    Token(Data data, size_t offset, std::string text = std::string())
        : data_(std::move(data)), offset_(offset), text_(std::move(text)) {}

    Data data_;
    size_t offset_;
    std::string text_;
};

template <>
struct ElementTraits<Token> {
    static std::string describe(const Token& t) { return t.to_string(); }
    static size_t offset(const Token& t, size_t) { return t.offset(); }
};

}  // namespace jr
