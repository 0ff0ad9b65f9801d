#pragma once
#include <cstddef>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"
#include "config.hpp"
#include "struct_introspection.hpp"

namespace StrucType {

namespace options {

namespace detail {

struct label_tag{};
struct meta_tag{};

}

// Legacy single-value form: the field is listed under Text instead of its own name.
template<ConstString Text>
struct label {
    using tag = detail::label_tag;
    using form = StrucType::form::Label;
    static constexpr auto text = Text;
};

// Key/value form: Token is `key="value"` pairs separated by commas,
// e.g. meta<R"(override_name="Primary ID", order="1")">.
template<ConstString Token>
struct meta {
    using tag = detail::meta_tag;
    using form = StrucType::form::KeyValue;
    static constexpr auto token = Token;
};

namespace detail {

// Options without a `tag` (user types) never match
template<class Opt, class Tag, class = void>
inline constexpr bool has_tag_v = false;

template<class Opt, class Tag>
inline constexpr bool has_tag_v<Opt, Tag, std::void_t<typename Opt::tag>> = std::is_same_v<typename Opt::tag, Tag>;

// First option carrying Tag, or void
template<class Tag, class... Opts>
struct first_with_tag {
    using type = void;
};

template<class Tag, class Head, class... Tail>
struct first_with_tag<Tag, Head, Tail...> {
    using type = std::conditional_t<has_tag_v<Head, Tag>, Head, typename first_with_tag<Tag, Tail...>::type>;
};

template<class Form> struct form_tag;
template<> struct form_tag<form::KeyValue> { using type = meta_tag; };
template<> struct form_tag<form::Label>    { using type = label_tag; };

template<class Form> struct other_form;
template<> struct other_form<form::KeyValue> { using type = form::Label; };
template<> struct other_form<form::Label>    { using type = form::KeyValue; };

template<class Pack> struct field_options;

template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    template<class Tag>
    static constexpr std::size_t option_count = (std::size_t{0} + ... + (has_tag_v<Opts, Tag> ? 1 : 0));

    template<class Tag>
    static constexpr bool has_option = option_count<Tag> > 0;

    template<class Tag>
    using get_option = typename first_with_tag<Tag, Opts...>::type;

    // label<> and meta<> together, whichever form is configured
    static constexpr std::size_t recognized_count =
        (std::size_t{0} + ... + ((has_tag_v<Opts, label_tag> || has_tag_v<Opts, meta_tag>) ? 1 : 0));
};

template <class P1, class P2> struct merge_options;
template <class... Opts1, class... Opts2>
struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

template<class T>
inline constexpr bool is_options_pack_v = false;

template<class... Opts>
inline constexpr bool is_options_pack_v<OptionsPack<Opts...>> = true;

// `using Options = OptionsPack<...>` of a user specialization, or an empty pack
template<class Spec, class = void>
struct options_of {
    using type = OptionsPack<>;
};

template<class Spec>
    requires is_options_pack_v<typename Spec::Options>
struct options_of<Spec, std::void_t<typename Spec::Options>> {
    using type = typename Spec::Options;
};

// Options written inline on the member type: Annotated<V, Opts...>
template<class Member>
struct inline_options {
    using type = OptionsPack<>;
};

template<class V, class... Opts>
struct inline_options<Annotated<V, Opts...>> {
    using type = OptionsPack<Opts...>;
};

// Inline options of the I-th member, then external AnnotatedField<T, I> options
template<class Record, std::size_t I>
struct aggregate_field_opts {
    using Member = std::remove_cvref_t<introspection::structureElementTypeByIndex<I, Record>>;
    using OptionsP = typename merge_options<
        typename inline_options<Member>::type,
        typename options_of<AnnotatedField<Record, I>>::type>::type;
    using options = field_options<OptionsP>;
};

template<class Record, std::size_t I>
using aggregate_field_opts_getter = typename aggregate_field_opts<std::remove_cvref_t<Record>, I>::options;

// Options attached to the described type itself rather than to one of its
// fields: an external Annotated<T> specialization or StructMeta<T>::Options
template<class T>
struct type_level_opts {
    using OptionsP = typename merge_options<
        typename options_of<Annotated<T>>::type,
        typename introspection::detail::struct_meta_options<T>::Options>::type;
    using options = field_options<OptionsP>;
};

// Annotated<T, Opts...> handed over as the described type
template<class T, class... Opts>
struct type_level_opts<Annotated<T, Opts...>> {
    using OptionsP = typename merge_options<
        OptionsPack<Opts...>,
        typename type_level_opts<T>::OptionsP>::type;
    using options = field_options<OptionsP>;
};

} // namespace detail

} // namespace options

} // namespace StrucType
