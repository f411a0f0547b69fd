#pragma once

#include <jr/error.h>
#include <jr/reader.h>
#include <jr/token.h>
#include <jr/value.h>
#include <cstddef>
#include <string>

namespace jr {

struct ParserOptions {
    // When false, `{}` is rejected: the parser reads `}` where the first key
    // should be and fails with MismatchedExpectation.
    bool allow_empty_object = true;
    // Objects and arrays open at once; one more fails with NestingTooDeep.
    size_t max_depth = 1000;
};

// Parses one Object or Array from the tokens. Every token must be used up:
// leftovers after the top-level value fail with TrailingTokens.
Result<Value> parse(Reader<Token>& tokens, const ParserOptions& options = {});

// Tokenizes then parses `text`.
Result<Value> parse_text(const std::string& text, const ParserOptions& options = {});

}  // namespace jr
