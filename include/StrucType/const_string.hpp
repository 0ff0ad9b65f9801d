#pragma once
#include <cstddef>
#include <string_view>

namespace StrucType {

// String literal usable as a template argument: meta<"k=\"v\"">, label<"Id">.
// Length excludes the terminating null.
template <typename CharT, std::size_t N>
struct ConstString {
    static constexpr std::size_t Length = N;

    CharT m_data[N + 1]{};

    constexpr ConstString() = default;
    constexpr ConstString(const CharT (&literal)[N + 1]) {
        for (std::size_t i = 0; i <= N; ++i) {
            m_data[i] = literal[i];
        }
    }

    constexpr std::string_view toStringView() const {
        return std::string_view(m_data, Length);
    }
};

template <typename CharT, std::size_t N>
ConstString(const CharT (&)[N]) -> ConstString<CharT, N - 1>;

// N must equal sv.size()
template <std::size_t N>
constexpr ConstString<char, N> make_const_string(std::string_view sv) {
    ConstString<char, N> out;
    for (std::size_t i = 0; i < N; ++i) {
        out.m_data[i] = sv[i];
    }
    return out;
}

} // namespace StrucType
