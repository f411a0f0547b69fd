#include <jr/error.h>
#include <sstream>

namespace jr {

ParseError ParseError::outOfBounds(size_t position) {
    ParseError e;
    e.kind = Kind::OutOfBounds;
    e.position = position;
    return e;
}

ParseError ParseError::unexpectedCharacter(char c, size_t position) {
    ParseError e;
    e.kind = Kind::UnexpectedCharacter;
    e.character = c;
    e.position = position;
    e.source_offset = position;
    return e;
}

ParseError ParseError::invalidNumber(size_t position) {
    ParseError e;
    e.kind = Kind::InvalidNumber;
    e.position = position;
    e.source_offset = position;
    return e;
}

ParseError ParseError::mismatchedExpectation(std::string expected, std::string actual,
                                             size_t position, size_t source_offset) {
    ParseError e;
    e.kind = Kind::MismatchedExpectation;
    e.expected = std::move(expected);
    e.actual = std::move(actual);
    e.position = position;
    e.source_offset = source_offset;
    return e;
}

ParseError ParseError::unexpectedValue(std::string token, size_t position, size_t source_offset) {
    ParseError e;
    e.kind = Kind::UnexpectedValue;
    e.token = std::move(token);
    e.position = position;
    e.source_offset = source_offset;
    return e;
}

ParseError ParseError::trailingTokens(std::string token, size_t position, size_t source_offset) {
    ParseError e;
    e.kind = Kind::TrailingTokens;
    e.token = std::move(token);
    e.position = position;
    e.source_offset = source_offset;
    return e;
}

ParseError ParseError::invalidTopLevel(std::string token, size_t position, size_t source_offset) {
    ParseError e;
    e.kind = Kind::InvalidTopLevel;
    e.token = std::move(token);
    e.position = position;
    e.source_offset = source_offset;
    return e;
}

ParseError ParseError::nestingTooDeep(size_t max_depth, size_t position, size_t source_offset) {
    ParseError e;
    e.kind = Kind::NestingTooDeep;
    e.max_depth = max_depth;
    e.position = position;
    e.source_offset = source_offset;
    return e;
}

std::string ParseError::kindString() const {
    switch (kind) {
        case Kind::OutOfBounds:
            return "OutOfBounds";
        case Kind::UnexpectedCharacter:
            return "UnexpectedCharacter";
        case Kind::InvalidNumber:
            return "InvalidNumber";
        case Kind::MismatchedExpectation:
            return "MismatchedExpectation";
        case Kind::UnexpectedValue:
            return "UnexpectedValue";
        case Kind::TrailingTokens:
            return "TrailingTokens";
        case Kind::InvalidTopLevel:
            return "InvalidTopLevel";
        case Kind::NestingTooDeep:
            return "NestingTooDeep";
    }
    throw std::logic_error("Not a valid error kind");
}

std::string ParseError::message() const {
    std::ostringstream ss;
    switch (kind) {
        case Kind::OutOfBounds:
            ss << "Unexpected end of input at index " << position;
            break;
        case Kind::UnexpectedCharacter:
            ss << "Unexpected character '" << character << "' at index " << position;
            break;
        case Kind::InvalidNumber:
            ss << "Invalid number at index " << position;
            break;
        case Kind::MismatchedExpectation:
            ss << "Expected '" << expected << "', got '" << actual << "'";
            break;
        case Kind::UnexpectedValue:
            ss << "Unexpected value: '" << token << "'";
            break;
        case Kind::TrailingTokens:
            ss << "Unexpected token at end of input: '" << token << "'";
            break;
        case Kind::InvalidTopLevel:
            if (token.empty())
                ss << "Document must start with '{' or '[', got end of input";
            else
                ss << "Document must start with '{' or '[', got '" << token << "'";
            break;
        case Kind::NestingTooDeep:
            ss << "Containers nested deeper than " << max_depth << " levels at index " << position;
            break;
    }
    return ss.str();
}

std::string format_error(const std::string& text, const ParseError& error) {
    size_t offset = error.source_offset;
    if (offset == ParseError::npos or offset > text.size()) offset = text.size();

    // line/column of the offset, both 1-based
    size_t line = 1;
    size_t line_start = 0;
    for (size_t pos = 0; pos < offset; ++pos) {
        if (text[pos] == '\n') {
            ++line;
            line_start = pos + 1;
        }
    }
    size_t col = offset - line_start + 1;

    size_t line_end = line_start;
    while (line_end < text.size() and text[line_end] != '\n') ++line_end;
    std::string line_text = text.substr(line_start, line_end - line_start);

    std::string caret(col - 1, ' ');
    caret.push_back('^');

    std::ostringstream ss;
    ss << error.message() << " (line " << line << ", column " << col << ")" << "\n";
    ss << line_text << "\n" << caret;
    return ss.str();
}

}  // namespace jr
