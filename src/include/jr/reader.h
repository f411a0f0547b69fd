#pragma once

#include <jr/error.h>
#include <cstddef>
#include <string>

namespace jr {

// Forward-only cursor over a contiguous sequence it does not own. The
// sequence must outlive the reader.
template <typename T>
class Reader {
  public:
    Reader(const T* data, size_t size) : m_data(data), m_size(size) {}

    template <typename Sequence>
    explicit Reader(const Sequence& sequence) : m_data(sequence.data()), m_size(sequence.size()) {}

    template <typename Sequence>
    Reader(const Sequence&&) = delete;

    // nullptr once the reader is exhausted
    const T* peek() const noexcept {
        if (m_position >= m_size) return nullptr;
        return m_data + m_position;
    }

    Result<T> advance() {
        if (m_position >= m_size) return ParseError::outOfBounds(m_position);
        return m_data[m_position++];
    }

    bool exhausted() const noexcept { return m_position >= m_size; }
    size_t position() const noexcept { return m_position; }
    size_t size() const noexcept { return m_size; }

  private:
    const T* m_data;
    size_t m_size;
    size_t m_position = 0;
};

// How elements of a reader show up in error messages.
template <typename T>
struct ElementTraits;

template <>
struct ElementTraits<char> {
    static std::string describe(char c) { return std::string(1, c); }
    static size_t offset(char, size_t position) { return position; }
};

// Advances the reader and checks that the element read equals `expected`.
template <typename T>
Status consume(Reader<T>& reader, const T& expected) {
    size_t position = reader.position();
    Result<T> actual = reader.advance();
    if (not actual) return actual.error();
    if (not(actual.value() == expected)) {
        return ParseError::mismatchedExpectation(ElementTraits<T>::describe(expected),
                                                 ElementTraits<T>::describe(actual.value()),
                                                 position,
                                                 ElementTraits<T>::offset(actual.value(), position));
    }
    return std::nullopt;
}

}  // namespace jr
