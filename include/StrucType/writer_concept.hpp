#pragma once

#include <concepts>
#include <cstddef>

namespace StrucType {

namespace writer {

// What the metadata serializer needs from an output format: nested maps and
// arrays whose leaves are strings. Every operation reports success as bool;
// the reason for a failure is available from getError().
template<typename W>
concept WriterLike = requires(W w,
                              const char * chars,
                              std::size_t length,
                              const std::size_t & expectedSize,
                              typename W::ArrayFrame & arrayFrame,
                              typename W::MapFrame & mapFrame) {
    typename W::iterator_type;
    typename W::error_type;
    typename W::ArrayFrame;
    typename W::MapFrame;

    { w.current() } -> std::same_as<typename W::iterator_type>;
    { w.getError() } -> std::same_as<typename W::error_type>;

    // Containers are opened with their element count
    { w.write_array_begin(expectedSize, arrayFrame) } -> std::same_as<bool>;
    { w.write_map_begin(expectedSize, mapFrame) } -> std::same_as<bool>;

    // Separators: between elements, and between a key and its value
    { w.advance_after_value(arrayFrame) } -> std::same_as<bool>;
    { w.advance_after_value(mapFrame) } -> std::same_as<bool>;
    { w.move_to_value(mapFrame) } -> std::same_as<bool>;

    { w.write_array_end(arrayFrame) } -> std::same_as<bool>;
    { w.write_map_end(mapFrame) } -> std::same_as<bool>;

    { w.write_string(chars, length) } -> std::same_as<bool>;

    // Total bytes produced
    { w.finish() } -> std::same_as<std::size_t>;
};

} // namespace writer

} // namespace StrucType
