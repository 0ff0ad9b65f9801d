#pragma once

#include <iterator>
#include <string>

namespace StrucType {

// Where serialized text goes: anything that accepts `*it = c; ++it;`
template <class It>
concept CharOutputIterator = std::output_iterator<It, char>;

// ... and where it has to stop
template <class Sent, class It>
concept CharSentinelForOut = std::sentinel_for<Sent, It>;

namespace io_details {

// A std::string grows on demand, so its back_inserter never reaches the end
struct limitless_sentinel {};

using string_inserter = std::back_insert_iterator<std::string>;

constexpr bool operator==(const string_inserter &, const limitless_sentinel &) noexcept {
    return false;
}
constexpr bool operator==(const limitless_sentinel & s, const string_inserter & it) noexcept {
    return it == s;
}
constexpr bool operator!=(const string_inserter & it, const limitless_sentinel & s) noexcept {
    return !(it == s);
}
constexpr bool operator!=(const limitless_sentinel & s, const string_inserter & it) noexcept {
    return !(it == s);
}

}

} // namespace StrucType
