#pragma once

#include <concepts>
#include <cstddef>
#include <utility>

namespace StrucType {

template <class... Opts>
struct OptionsPack {};

// Member wrapper carrying field options in its type:
//   A<std::string, meta<R"(override_name="name")">> username;
// Behaves like the wrapped value for reads and assignments.
template <class T, class... Opts>
struct Annotated {
    using value_type = T;

    T value{};

    constexpr Annotated() = default;

    template <class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U && init) : value(std::forward<U>(init)) {}

    template <class U>
        requires std::convertible_to<U, T>
    constexpr Annotated & operator=(U && v) {
        value = std::forward<U>(v);
        return *this;
    }

    constexpr T & get() { return value; }
    constexpr const T & get() const { return value; }

    constexpr operator T &() { return value; }
    constexpr operator const T &() const { return value; }
};

template <class T, class... Opts>
using A = Annotated<T, Opts...>;

// External options for the I-th field of T, for members that cannot be wrapped:
//
//   template<> struct StrucType::AnnotatedField<Point3, 0> {
//       using Options = OptionsPack<meta<R"(unit="m")">>;
//   };
template <class T, std::size_t I>
struct AnnotatedField {};

} // namespace StrucType
