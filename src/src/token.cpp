#include <jr/token.h>
#include <jr/value.h>
#include <stdexcept>

namespace jr {

Token Token::makePunctuation(char c, size_t offset) {
    return Token(Data(std::in_place_index<0>, c), offset);
}

Token Token::makeString(std::string literal, size_t offset) {
    return Token(Data(std::in_place_index<1>, std::move(literal)), offset);
}

Token Token::makeInteger(int64_t n, size_t offset, std::string text) {
    return Token(Data(std::in_place_index<2>, n), offset, std::move(text));
}

Token Token::makeFloat(double x, size_t offset, std::string text) {
    return Token(Data(std::in_place_index<3>, x), offset, std::move(text));
}

char Token::asPunctuation() const {
    if (not isPunctuation()) throw std::logic_error("Token is not punctuation: " + to_string());
    return std::get<0>(data_);
}

const std::string& Token::asString() const {
    if (not isString()) throw std::logic_error("Token is not a string literal: " + to_string());
    return std::get<1>(data_);
}

int64_t Token::asInt() const {
    if (not isInteger()) throw std::logic_error("Token is not an integer: " + to_string());
    return std::get<2>(data_);
}

double Token::asDouble() const {
    if (isInteger()) return static_cast<double>(std::get<2>(data_));
    if (not isFloat()) throw std::logic_error("Token is not a number: " + to_string());
    return std::get<3>(data_);
}

std::string Token::kindString() const {
    switch (type()) {
        case Type::Punctuation:
            return "Punctuation";
        case Type::StringLiteral:
            return "StringLiteral";
        case Type::Integer:
            return "Integer";
        case Type::Float:
            return "Float";
    }
    throw std::logic_error("Not a valid token type");
}

std::string Token::to_string() const {
    if (not text_.empty()) return text_;
    switch (type()) {
        case Type::Punctuation:
            return std::string(1, std::get<0>(data_));
        case Type::StringLiteral:
            return std::get<1>(data_);
        case Type::Integer:
            return std::to_string(std::get<2>(data_));
        case Type::Float:
            return format_double(std::get<3>(data_));
    }
    throw std::logic_error("Not a valid token type");
}

}  // namespace jr
