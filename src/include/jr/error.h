#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace jr {

struct ParseError {
    enum class Kind {
        OutOfBounds,
        UnexpectedCharacter,
        InvalidNumber,
        MismatchedExpectation,
        UnexpectedValue,
        TrailingTokens,
        InvalidTopLevel,
        NestingTooDeep
    };

    // source_offset value meaning "at the end of the input text"
    static constexpr size_t npos = std::string::npos;

    Kind kind = Kind::OutOfBounds;
    // index into the sequence the failing stage was reading (chars or tokens)
    size_t position = 0;
    // index into the original text, used for line/column diagnostics
    size_t source_offset = npos;
    char character = '\0';
    std::string expected;
    std::string actual;
    std::string token;
    // NestingTooDeep only
    size_t max_depth = 0;

    static ParseError outOfBounds(size_t position);
    static ParseError unexpectedCharacter(char c, size_t position);
    static ParseError invalidNumber(size_t position);
    static ParseError mismatchedExpectation(std::string expected, std::string actual,
                                            size_t position, size_t source_offset);
    static ParseError unexpectedValue(std::string token, size_t position, size_t source_offset);
    static ParseError trailingTokens(std::string token, size_t position, size_t source_offset);
    static ParseError invalidTopLevel(std::string token, size_t position, size_t source_offset);
    static ParseError nestingTooDeep(size_t max_depth, size_t position, size_t source_offset);

    std::string kindString() const;
    std::string message() const;
};

// Either a value produced by a stage or the error that stopped it.
template <typename T>
class Result {
  public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(ParseError error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return m_data.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() {
        if (not ok()) throw std::logic_error("Result holds an error: " + error().message());
        return std::get<0>(m_data);
    }

    const T& value() const {
        if (not ok()) throw std::logic_error("Result holds an error: " + error().message());
        return std::get<0>(m_data);
    }

    const ParseError& error() const {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(m_data);
    }

  private:
    std::variant<T, ParseError> m_data;
};

// Outcome of a step with no payload: empty on success.
using Status = std::optional<ParseError>;

// Formats an error against the text it came from: the message, the line and
// column, the offending source line and a caret under the column.
std::string format_error(const std::string& text, const ParseError& error);

}  // namespace jr
