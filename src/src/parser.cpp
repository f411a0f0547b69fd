#include <jr/parser.h>
#include <jr/tokenizer.h>
#include <utility>

namespace jr {

namespace {
    std::string strip_quotes(const std::string& literal) {
        if (literal.size() < 2) return std::string();
        return literal.substr(1, literal.size() - 2);
    }

    // Counts one open container for as long as it lives.
    struct DepthGuard {
        size_t& depth;
        explicit DepthGuard(size_t& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    };

    struct Parser {
        Reader<Token>& tokens;
        const ParserOptions& options;
        size_t depth = 0;

        Parser(Reader<Token>& t, const ParserOptions& o) : tokens(t), options(o) {}

        bool next_is(char punctuation) const {
            const Token* t = tokens.peek();
            return t != nullptr and t->isPunctuation(punctuation);
        }

        Status expect(char punctuation) {
            return consume(tokens, Token::makePunctuation(punctuation));
        }

        ParseError end_of_input() const { return ParseError::outOfBounds(tokens.position()); }

        // the next token opens a container
        Status check_depth() const {
            if (depth < options.max_depth) return std::nullopt;
            const Token* t = tokens.peek();
            return ParseError::nestingTooDeep(options.max_depth, tokens.position(),
                                              t ? t->offset() : ParseError::npos);
        }

        Result<Value> parse_document() {
            const Token* first = tokens.peek();
            if (first == nullptr) return ParseError::invalidTopLevel("", tokens.position(), ParseError::npos);
            if (not first->isPunctuation('{') and not first->isPunctuation('['))
                return ParseError::invalidTopLevel(first->to_string(), tokens.position(), first->offset());

            Result<Value> tree = first->isPunctuation('{') ? parse_object() : parse_array();
            if (not tree) return tree;

            if (const Token* extra = tokens.peek())
                return ParseError::trailingTokens(extra->to_string(), tokens.position(), extra->offset());
            return tree;
        }

        Result<Value> parse_value() {
            const Token* t = tokens.peek();
            if (t == nullptr) return end_of_input();
            if (t->isPunctuation('{')) return parse_object();
            if (t->isPunctuation('[')) return parse_array();
            if (t->isInteger()) return Value(tokens.advance().value().asInt());
            if (t->isFloat()) return Value(tokens.advance().value().asDouble());
            if (t->isString()) return Value(strip_quotes(tokens.advance().value().asString()));
            return ParseError::unexpectedValue(t->to_string(), tokens.position(), t->offset());
        }

        Result<std::string> parse_key() {
            const Token* t = tokens.peek();
            if (t == nullptr) return end_of_input();
            if (not t->isString())
                return ParseError::mismatchedExpectation("string key", t->to_string(), tokens.position(),
                                                         t->offset());
            return strip_quotes(tokens.advance().value().asString());
        }

        Result<Value> parse_object() {
            if (auto err = check_depth()) return *err;
            DepthGuard guard(depth);
            if (auto err = expect('{')) return *err;
            Value object = Value::object();

            if (options.allow_empty_object and next_is('}')) {
                if (auto err = expect('}')) return *err;
                return std::move(object);
            }

            while (true) {
                Result<std::string> key = parse_key();
                if (not key) return key.error();
                if (auto err = expect(':')) return *err;
                Result<Value> value = parse_value();
                if (not value) return value.error();

                object.set(key.value(), std::move(value.value()));

                if (not next_is(',')) break;
                if (auto err = expect(',')) return *err;
            }

            if (auto err = expect('}')) return *err;
            return std::move(object);
        }

        // a comma directly before ']' is accepted
        Result<Value> parse_array() {
            if (auto err = check_depth()) return *err;
            DepthGuard guard(depth);
            if (auto err = expect('[')) return *err;
            Value array = Value::array();

            while (not next_is(']')) {
                Result<Value> value = parse_value();
                if (not value) return value.error();
                array.push_back(std::move(value.value()));

                if (not next_is(',')) break;
                if (auto err = expect(',')) return *err;
            }

            if (auto err = expect(']')) return *err;
            return std::move(array);
        }
    };
}

Result<Value> parse(Reader<Token>& tokens, const ParserOptions& options) {
    Parser p(tokens, options);
    return p.parse_document();
}

Result<Value> parse_text(const std::string& text, const ParserOptions& options) {
    Reader<char> chars(text);
    Result<std::vector<Token>> tokens = tokenize(chars);
    if (not tokens) return tokens.error();

    Reader<Token> reader(tokens.value());
    return parse(reader, options);
}

}  // namespace jr
