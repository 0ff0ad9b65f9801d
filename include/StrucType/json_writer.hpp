#pragma once

#include <cstddef>

#include "io.hpp"
#include "writer_concept.hpp"

namespace StrucType {

enum class JsonIteratorWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW
};

// Compact (or, with Pretty, two-space indented) JSON text writer over any
// char output iterator. Stops with OUTPUT_OVERFLOW when `last` is reached.
template<class It, class Sent, bool Pretty = false>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    struct ArrayFrame {
        std::size_t depth = 0;  // Track depth for indentation
        bool empty = false;
    };
    struct MapFrame {
        std::size_t depth = 0;  // Track depth for indentation
        bool empty = false;
    };

    using error_type = JsonIteratorWriterError;

    constexpr JsonIteratorWriterError getError() {
        return m_error;
    }

    constexpr It current() {
        return m_current;
    }

    constexpr JsonIteratorWriter(It first, Sent last)
        : m_error(JsonIteratorWriterError::NO_ERROR), m_current(first), end_(last) {}

private:
    JsonIteratorWriterError m_error;
    It m_current;
    std::size_t m_bytesWritten = 0;
    Sent end_;
    std::size_t m_indent_level = 0;
    static constexpr std::size_t IndentSize = 2;

    constexpr void setError(JsonIteratorWriterError e) {
        m_error = e;
    }

    constexpr bool put(char c) {
        if(m_current == end_) {
            setError(JsonIteratorWriterError::OUTPUT_OVERFLOW);
            return false;
        }
        *m_current = c;
        ++m_current;
        ++m_bytesWritten;
        return true;
    }

    // Helper to write newline + indentation
    constexpr bool write_indent() {
        if constexpr (Pretty) {
            if (!put('\n')) return false;
            for (std::size_t i = 0; i < m_indent_level * IndentSize; ++i) {
                if (!put(' ')) return false;
            }
        }
        return true;
    }

    template<class Frame>
    constexpr bool open(char c, const std::size_t & size, Frame & frame) {
        if(!put(c)) return false;
        frame.depth = m_indent_level;
        frame.empty = size == 0;
        if constexpr (Pretty) {
            if(!frame.empty) {
                m_indent_level++;
                if (!write_indent()) return false;
            }
        }
        return true;
    }

    template<class Frame>
    constexpr bool close(char c, Frame & frame) {
        if constexpr (Pretty) {
            m_indent_level = frame.depth;
            if(!frame.empty) {
                if (!write_indent()) return false;
            }
        }
        return put(c);
    }

public:

    constexpr bool write_array_begin(const std::size_t & size, ArrayFrame& frame) {
        return open('[', size, frame);
    }
    constexpr bool write_map_begin(const std::size_t & size, MapFrame& frame) {
        return open('{', size, frame);
    }

    constexpr bool advance_after_value(ArrayFrame&) {
        if(!put(',')) return false;
        return write_indent();
    }
    constexpr bool advance_after_value(MapFrame&) {
        if(!put(',')) return false;
        return write_indent();
    }
    constexpr bool move_to_value(MapFrame&) {
        if(!put(':')) return false;
        if constexpr (Pretty) {
            // Add space after colon for readability
            if(!put(' ')) return false;
        }
        return true;
    }

    constexpr bool write_array_end(ArrayFrame& frame) {
        return close(']', frame);
    }
    constexpr bool write_map_end(MapFrame& frame) {
        return close('}', frame);
    }

    constexpr bool write_string(const char* data, std::size_t size) {
        constexpr char hex[] = "0123456789abcdef";

        if(!put('"')) return false;

        const char* p = data;
        const char* e = data + size;
        while (p < e) {
            unsigned char uc = static_cast<unsigned char>(*p++);
            switch (uc) {
            case '"':  if (!put('\\') || !put('"'))  return false; break;
            case '\\': if (!put('\\') || !put('\\')) return false; break;
            case '\b': if (!put('\\') || !put('b'))  return false; break;
            case '\f': if (!put('\\') || !put('f'))  return false; break;
            case '\n': if (!put('\\') || !put('n'))  return false; break;
            case '\r': if (!put('\\') || !put('r'))  return false; break;
            case '\t': if (!put('\\') || !put('t'))  return false; break;
            default:
                if (uc < 0x20) {
                    if (!put('\\') || !put('u') || !put('0') || !put('0')) return false;
                    if (!put(hex[(uc >> 4) & 0xF]) || !put(hex[uc & 0xF])) return false;
                } else {
                    if (!put(static_cast<char>(uc))) return false;
                }
                break;
            }
        }

        return put('"');
    }

    constexpr std::size_t finish() {
        return m_bytesWritten;
    }
};

static_assert(writer::WriterLike<JsonIteratorWriter<char*, char*>>);

} // namespace StrucType
