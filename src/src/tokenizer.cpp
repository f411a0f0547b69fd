#include <jr/tokenizer.h>
#include <cctype>
#include <sstream>
#include <string>

namespace jr {

namespace {
    bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    bool is_punctuation(char c) {
        switch (c) {
            case '{':
            case '}':
            case '[':
            case ']':
            case ':':
            case ',':
                return true;
            default:
                return false;
        }
    }

    void skip_whitespace(Reader<char>& chars) {
        while (const char* c = chars.peek()) {
            if (not is_space(*c)) break;
            chars.advance().value();
        }
    }

    // "..." including both quotes; there are no escapes, the first '"' after
    // the opening one ends the literal
    Result<Token> tokenize_string(Reader<char>& chars) {
        size_t start = chars.position();
        if (auto err = consume(chars, '"')) return *err;

        std::string literal(1, '"');
        while (true) {
            Result<char> c = chars.advance();
            if (not c) return c.error();
            literal.push_back(c.value());
            if (c.value() == '"') break;
        }
        return Token::makeString(std::move(literal), start);
    }

    Result<Token> tokenize_number(Reader<char>& chars) {
        size_t start = chars.position();
        std::string text;
        bool is_float = false;

        while (const char* c = chars.peek()) {
            if (is_digit(*c)) {
                text.push_back(chars.advance().value());
            } else if (*c == '.') {
                if (is_float) return ParseError::invalidNumber(chars.position());
                is_float = true;
                text.push_back(chars.advance().value());
            } else {
                break;
            }
        }

        std::istringstream ss(text);
        if (is_float) {
            double d;
            ss >> d;
            if (ss.fail()) return ParseError::invalidNumber(start);
            return Token::makeFloat(d, start, std::move(text));
        }
        int64_t v;
        ss >> v;
        // out of range for int64_t
        if (ss.fail()) return ParseError::invalidNumber(start);
        return Token::makeInteger(v, start, std::move(text));
    }
}

Result<std::vector<Token>> tokenize(Reader<char>& chars) {
    std::vector<Token> tokens;

    while (true) {
        skip_whitespace(chars);
        const char* c = chars.peek();
        if (c == nullptr) break;

        if (is_punctuation(*c)) {
            size_t offset = chars.position();
            tokens.push_back(Token::makePunctuation(chars.advance().value(), offset));
            continue;
        }

        if (*c != '"' and not is_digit(*c)) return ParseError::unexpectedCharacter(*c, chars.position());

        Result<Token> token = *c == '"' ? tokenize_string(chars) : tokenize_number(chars);
        if (not token) return token.error();
        tokens.push_back(std::move(token.value()));
    }

    return std::move(tokens);
}

}  // namespace jr
