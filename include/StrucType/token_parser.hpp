#pragma once

#include <cstddef>
#include <string_view>

#include "errors.hpp"

namespace StrucType {

namespace token {

struct KeyValuePair {
    std::string_view key;
    std::string_view value;
};

// Result of parsing one key/value token of N characters.
// Unescaped keys and values live in `storage`; pairs keep first-seen key order.
template<std::size_t N>
struct ParsedToken {
    static constexpr std::size_t MaxPairs = N / 2 + 1;

    struct Span {
        std::size_t keyBegin = 0;
        std::size_t keyLength = 0;
        std::size_t valueBegin = 0;
        std::size_t valueLength = 0;
    };

    char storage[N + 1]{};
    Span spans[MaxPairs]{};
    std::size_t count = 0;
    std::size_t used = 0;
    TokenError m_error = TokenError::NO_ERROR;
    std::size_t m_errorPos = 0;

    constexpr operator bool() const {
        return m_error == TokenError::NO_ERROR;
    }
    constexpr TokenError error() const {
        return m_error;
    }
    constexpr std::size_t errorPos() const {
        return m_errorPos;
    }
    constexpr std::size_t size() const {
        return count;
    }
    constexpr std::string_view key(std::size_t i) const {
        return {storage + spans[i].keyBegin, spans[i].keyLength};
    }
    constexpr std::string_view value(std::size_t i) const {
        return {storage + spans[i].valueBegin, spans[i].valueLength};
    }
    constexpr KeyValuePair pair(std::size_t i) const {
        return {key(i), value(i)};
    }
};

// Offset of the first byte that does not start a well-formed UTF-8 sequence
// (RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF), or npos.
constexpr std::size_t FindInvalidUtf8(std::string_view text) {
    std::size_t i = 0;
    while(i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        std::size_t tail = 0;
        unsigned char lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
        if(lead < 0x80) {
            i ++;
            continue;
        } else if(lead >= 0xC2 && lead <= 0xDF) {
            tail = 1;
        } else if(lead >= 0xE0 && lead <= 0xEF) {
            tail = 2;
            if(lead == 0xE0) lo = 0xA0;
            if(lead == 0xED) hi = 0x9F;
        } else if(lead >= 0xF0 && lead <= 0xF4) {
            tail = 3;
            if(lead == 0xF0) lo = 0x90;
            if(lead == 0xF4) hi = 0x8F;
        } else {
            return i;
        }
        if(text.size() - i <= tail) {
            return i; // truncated sequence
        }
        for(std::size_t k = 1; k <= tail; k ++) {
            const unsigned char c = static_cast<unsigned char>(text[i + k]);
            const unsigned char lowest = k == 1 ? lo : 0x80;
            const unsigned char highest = k == 1 ? hi : 0xBF;
            if(c < lowest || c > highest) {
                return i;
            }
        }
        i += tail + 1;
    }
    return std::string_view::npos;
}

namespace detail {

constexpr bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

template<std::size_t N>
class TokenParser {
    std::string_view m_text;
    std::size_t m_pos = 0;
    ParsedToken<N> & m_out;

    constexpr bool fail(TokenError err, std::size_t pos) {
        m_out.m_error = err;
        m_out.m_errorPos = pos;
        return false;
    }

    constexpr bool atEnd() const {
        return m_pos >= m_text.size();
    }

    constexpr void skipSpaces() {
        while(!atEnd() && is_space(m_text[m_pos])) {
            m_pos ++;
        }
    }

    constexpr void put(char c) {
        m_out.storage[m_out.used ++] = c;
    }

    // "..." with \" and \\ escapes; m_pos is on the opening quote
    constexpr bool readQuoted() {
        const std::size_t opening = m_pos;
        m_pos ++;
        while(true) {
            if(atEnd()) {
                return fail(TokenError::UNTERMINATED_QUOTE, opening);
            }
            char c = m_text[m_pos];
            if(c == '\\') {
                if(m_pos + 1 >= m_text.size()) {
                    return fail(TokenError::UNTERMINATED_QUOTE, opening);
                }
                char escaped = m_text[m_pos + 1];
                if(escaped != '"' && escaped != '\\') {
                    return fail(TokenError::BAD_ESCAPE, m_pos);
                }
                put(escaped);
                m_pos += 2;
            } else if(c == '"') {
                m_pos ++;
                return true;
            } else {
                put(c);
                m_pos ++;
            }
        }
    }

    constexpr bool readKey(std::size_t & begin, std::size_t & length) {
        begin = m_out.used;
        const std::size_t keyPos = m_pos;
        if(m_text[m_pos] == '"') {
            if(!readQuoted()) return false;
        } else {
            while(!atEnd()) {
                char c = m_text[m_pos];
                if(is_space(c) || c == '=' || c == ',') break;
                if(c == '"') {
                    return fail(TokenError::UNEXPECTED_QUOTE, m_pos);
                }
                put(c);
                m_pos ++;
            }
        }
        length = m_out.used - begin;
        skipSpaces();
        if(atEnd() || m_text[m_pos] != '=') {
            return fail(TokenError::MISSING_EQUALS, m_pos);
        }
        if(length == 0) {
            return fail(TokenError::EMPTY_KEY, keyPos);
        }
        m_pos ++;
        return true;
    }

    constexpr bool readValue(std::size_t & begin, std::size_t & length) {
        skipSpaces();
        if(atEnd() || m_text[m_pos] == ',') {
            return fail(TokenError::MISSING_VALUE, m_pos);
        }
        begin = m_out.used;
        if(m_text[m_pos] == '"') {
            if(!readQuoted()) return false;
            length = m_out.used - begin;
            skipSpaces();
            if(!atEnd() && m_text[m_pos] != ',') {
                return fail(TokenError::TRAILING_CHARACTERS, m_pos);
            }
            return true;
        }
        std::size_t significant = 0;
        while(!atEnd() && m_text[m_pos] != ',') {
            char c = m_text[m_pos];
            if(c == '"') {
                return fail(TokenError::UNEXPECTED_QUOTE, m_pos);
            }
            put(c);
            m_pos ++;
            if(!is_space(c)) {
                significant = m_out.used - begin;
            }
        }
        length = significant;
        m_out.used = begin + significant;
        return true;
    }

    // Last write wins; a repeated key keeps the position of its first occurrence
    constexpr void store(std::size_t keyBegin, std::size_t keyLength,
                         std::size_t valueBegin, std::size_t valueLength) {
        std::string_view k{m_out.storage + keyBegin, keyLength};
        for(std::size_t i = 0; i < m_out.count; i ++) {
            if(m_out.key(i) == k) {
                m_out.spans[i].valueBegin = valueBegin;
                m_out.spans[i].valueLength = valueLength;
                return;
            }
        }
        m_out.spans[m_out.count ++] = {keyBegin, keyLength, valueBegin, valueLength};
    }

public:
    constexpr TokenParser(std::string_view text, ParsedToken<N> & out):
        m_text(text), m_out(out)
    {}

    constexpr bool parse() {
        if(const std::size_t bad = FindInvalidUtf8(m_text); bad != std::string_view::npos) {
            return fail(TokenError::INVALID_UTF8, bad);
        }
        skipSpaces();
        if(atEnd()) {
            return true;
        }
        while(true) {
            skipSpaces();
            if(atEnd() || m_text[m_pos] == ',') {
                return fail(TokenError::EMPTY_PAIR, m_pos);
            }
            std::size_t keyBegin = 0, keyLength = 0, valueBegin = 0, valueLength = 0;
            if(!readKey(keyBegin, keyLength)) return false;
            if(!readValue(valueBegin, valueLength)) return false;
            store(keyBegin, keyLength, valueBegin, valueLength);
            if(atEnd()) {
                return true;
            }
            m_pos ++; // ','
        }
    }
};

}

// Parses `key="value", key2=value2` text. Keys and values are trimmed of
// surrounding whitespace and quotes; quoted text may contain ',' and '='.
template<std::size_t N>
constexpr ParsedToken<N> ParseToken(std::string_view text) {
    ParsedToken<N> out;
    detail::TokenParser<N> parser(text, out);
    if(!parser.parse()) {
        out.count = 0;
    }
    return out;
}

} // namespace token

} // namespace StrucType
