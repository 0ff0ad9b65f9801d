#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace StrucType {

// Explicit field list for types PFR cannot introspect (or whose member names
// should be spelled differently):
//
//   template<> struct StrucType::StructMeta<Account> {
//       using Fields = StructFields<
//           Field<&Account::id_, "id", meta<R"(order="1")">>,
//           Field<&Account::owner_, "owner">
//       >;
//   };
template <class... Described>
struct StructMeta {};

template <auto Member, ConstString Name, class... Opts>
struct Field;

template <class Owner, class Value, Value Owner::*Member, ConstString FieldName, class... Opts>
struct Field<Member, FieldName, Opts...> {
    using owner_type = Owner;
    using value_type = Value;
    using options_pack = OptionsPack<Opts...>;
    static constexpr auto name = FieldName;
};

template <class... Fields>
struct StructFields {
    using list = std::tuple<Fields...>;
};

namespace introspection {

namespace detail {

template<class T>
struct is_struct_fields : std::false_type {};

template<class... Fields>
struct is_struct_fields<StructFields<Fields...>> : std::true_type {};

template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T, std::void_t<typename StructMeta<T>::Fields>>
    : is_struct_fields<typename StructMeta<T>::Fields> {};

template<class T>
inline constexpr bool has_struct_meta_specialization = has_struct_meta_specialization_impl<T>::value;

// StructMeta<T>::Options, if any: options meant for the type itself
template<class T, class = void>
struct struct_meta_options {
    using Options = OptionsPack<>;
};

template<class T>
struct struct_meta_options<T, std::void_t<typename StructMeta<T>::Options>> {
    using Options = typename StructMeta<T>::Options;
};

template <class Value, class Pack> struct wrap_in_annotated;
template <class Value, class... Opts> struct wrap_in_annotated<Value, OptionsPack<Opts...>> {
    using type = Annotated<Value, Opts...>;
};

// Aggregates: everything comes from PFR
template<class T>
struct PfrBackend {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template<std::size_t I>
    using type = pfr::tuple_element_t<I, T>;

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, T>();
};

// StructMeta<T>: Field<> options reappear as Annotated<> member types, so the
// option machinery treats both sources alike
template<class T>
struct StructMetaBackend {
    using list = typename StructMeta<T>::Fields::list;

    static constexpr std::size_t count = std::tuple_size_v<list>;

    template<std::size_t I>
    using type = typename wrap_in_annotated<
        typename std::tuple_element_t<I, list>::value_type,
        typename std::tuple_element_t<I, list>::options_pack>::type;

    template<std::size_t I>
    static constexpr std::string_view name = std::tuple_element_t<I, list>::name.toStringView();
};

template<class T>
using backend_t = std::conditional_t<has_struct_meta_specialization<T>, StructMetaBackend<T>, PfrBackend<T>>;

}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::backend_t<std::remove_cv_t<StructT>>::count;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::backend_t<std::remove_cv_t<StructT>>::template type<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::backend_t<std::remove_cv_t<StructT>>::template name<Index>;

}
}
