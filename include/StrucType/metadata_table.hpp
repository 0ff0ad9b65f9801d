#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "compiler.hpp"
#include "config.hpp"
#include "options.hpp"
#include "shape.hpp"
#include "struct_introspection.hpp"
#include "token_parser.hpp"

namespace StrucType {

// Ordered key/value metadata of one field (key/value form).
// Views static storage baked at compile time; empty for untagged fields.
class MetadataMap {
    const token::KeyValuePair * m_pairs = nullptr;
    std::size_t m_count = 0;
public:
    using value_type = token::KeyValuePair;
    using const_iterator = const token::KeyValuePair *;

    constexpr MetadataMap() = default;
    constexpr MetadataMap(const token::KeyValuePair * pairs, std::size_t count):
        m_pairs(pairs), m_count(count)
    {}

    constexpr std::size_t size() const {
        return m_count;
    }
    constexpr bool empty() const {
        return m_count == 0;
    }
    constexpr const_iterator begin() const {
        return m_pairs;
    }
    constexpr const_iterator end() const {
        return m_pairs + m_count;
    }
    constexpr const token::KeyValuePair & operator[](std::size_t i) const {
        return m_pairs[i];
    }
    constexpr const_iterator find(std::string_view key) const {
        for(const_iterator it = begin(); it != end(); ++ it) {
            if(it->key == key) {
                return it;
            }
        }
        return end();
    }
    constexpr bool contains(std::string_view key) const {
        return find(key) != end();
    }
};

template<class Form> struct TableRow;

template<> struct TableRow<form::KeyValue> {
    std::string_view fieldName;
    MetadataMap metadata;
};

// Legacy form: the label, or the field name when the field carries none
template<> struct TableRow<form::Label> {
    std::string_view fieldName;
    std::string_view metadata;
};

template<class Form, std::size_t N>
using MetadataTable = std::array<TableRow<Form>, N>;

// Pairs of a meta<> option, in token order
template<class MetaOpt>
inline constexpr auto token_pairs_v = []() consteval {
    std::array<token::KeyValuePair, parsed_token_v<MetaOpt>.size()> pairs{};
    for(std::size_t i = 0; i < pairs.size(); i ++) {
        pairs[i] = parsed_token_v<MetaOpt>.pair(i);
    }
    return pairs;
}();

namespace table_detail {

template<class T, AnnotationForm Form, std::size_t I>
consteval TableRow<Form> BuildRow() {
    using R = record_t<T>;
    using Opts = options::detail::aggregate_field_opts_getter<R, I>;
    constexpr std::string_view name = introspection::structureElementNameByIndex<I, R>;

    if constexpr (std::is_same_v<Form, form::KeyValue>) {
        if constexpr (Opts::template has_option<options::detail::meta_tag>) {
            using MetaOpt = typename Opts::template get_option<options::detail::meta_tag>;
            return TableRow<Form>{name, MetadataMap(token_pairs_v<MetaOpt>.data(), token_pairs_v<MetaOpt>.size())};
        } else {
            return TableRow<Form>{name, MetadataMap{}};
        }
    } else {
        if constexpr (Opts::template has_option<options::detail::label_tag>) {
            using LabelOpt = typename Opts::template get_option<options::detail::label_tag>;
            return TableRow<Form>{name, LabelOpt::text.toStringView()};
        } else {
            return TableRow<Form>{name, name};
        }
    }
}

}

// One row per field, declaration order. Only meaningful for types whose
// Compile<T, Form>() succeeded; use Describe<T, Form>::table from outside.
template<class T, AnnotationForm Form>
inline constexpr auto metadata_table_v = []<std::size_t... I>(std::index_sequence<I...>) consteval {
    return MetadataTable<Form, sizeof...(I)>{ table_detail::BuildRow<T, Form, I>()... };
}(std::make_index_sequence<introspection::structureElementsCount<record_t<T>>>{});

} // namespace StrucType
