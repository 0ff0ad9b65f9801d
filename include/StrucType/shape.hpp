#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>

#include "annotated.hpp"
#include "errors.hpp"
#include "struct_introspection.hpp"

namespace StrucType {

enum class Shape {
    NAMED_FIELDS,
    POSITIONAL_FIELDS,
    NO_FIELDS,
    NOT_A_RECORD
};

namespace shape_detail {

template<class T>
concept TupleLike = requires {
    { std::tuple_size<T>::value } -> std::convertible_to<std::size_t>;
};

template<class T>
struct strip_annotation {
    using type = T;
};

template<class T, class... Opts>
struct strip_annotation<Annotated<T, Opts...>> {
    using type = T;
};

}

// The record a described type refers to: Annotated<T, ...> names T
template<class T>
using record_t = typename shape_detail::strip_annotation<std::remove_cv_t<T>>::type;

// Classification order matters: tuple-likes (std::array included) are
// aggregates too, and PFR must only ever see plain aggregate classes.
// Unions are never records, even with a StructMeta field list.
template<class T>
consteval Shape ClassifyShape() {
    using R = record_t<T>;
    if constexpr (std::is_array_v<R> || shape_detail::TupleLike<R>) {
        return Shape::POSITIONAL_FIELDS;
    } else if constexpr (std::is_union_v<R>) {
        return Shape::NOT_A_RECORD;
    } else if constexpr (introspection::detail::has_struct_meta_specialization<R>) {
        if constexpr (introspection::structureElementsCount<R> == 0) {
            return Shape::NO_FIELDS;
        } else {
            return Shape::NAMED_FIELDS;
        }
    } else if constexpr (std::is_class_v<R> && std::is_aggregate_v<R>) {
        if constexpr (introspection::structureElementsCount<R> == 0) {
            return Shape::NO_FIELDS;
        } else {
            return Shape::NAMED_FIELDS;
        }
    } else {
        return Shape::NOT_A_RECORD;
    }
}

template<class T>
consteval ShapeError ValidateShape() {
    switch(ClassifyShape<T>()) {
    case Shape::NAMED_FIELDS: return ShapeError::NO_ERROR;
    case Shape::POSITIONAL_FIELDS: return ShapeError::POSITIONAL_FIELDS;
    case Shape::NO_FIELDS: return ShapeError::NO_FIELDS;
    case Shape::NOT_A_RECORD: return ShapeError::NOT_A_RECORD;
    }
    return ShapeError::NOT_A_RECORD;
}

template<class T>
concept NamedRecord = (ClassifyShape<T>() == Shape::NAMED_FIELDS);

}
