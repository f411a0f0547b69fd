#pragma once

#include <jr/error.h>
#include <jr/reader.h>
#include <jr/token.h>
#include <vector>

namespace jr {

// Splits the characters into tokens until the reader is exhausted.
// Whitespace between tokens is skipped. Strings have no escape sequences,
// numbers have no sign or exponent. On failure no tokens are returned.
Result<std::vector<Token>> tokenize(Reader<char>& chars);

}  // namespace jr
