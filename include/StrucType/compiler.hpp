#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

#include "compile_result.hpp"
#include "config.hpp"
#include "options.hpp"
#include "shape.hpp"
#include "struct_introspection.hpp"
#include "token_parser.hpp"

namespace StrucType {

// Parsed form of a meta<> option, one per distinct token text
template<class MetaOpt>
inline constexpr auto parsed_token_v = token::ParseToken<MetaOpt::token.Length>(MetaOpt::token.toStringView());

namespace compiler_detail {

template<class T, AnnotationForm Form, std::size_t I>
consteval CompileResult CheckField() {
    using R = record_t<T>;
    using Opts = options::detail::aggregate_field_opts_getter<R, I>;
    using OwnTag = typename options::detail::form_tag<Form>::type;
    using OtherTag = typename options::detail::form_tag<typename options::detail::other_form<Form>::type>::type;
    constexpr std::string_view name = introspection::structureElementNameByIndex<I, R>;

    if constexpr (Opts::template option_count<OtherTag> > 0) {
        return CompileResult::configFailure(ConfigError::MIXED_ANNOTATION_FORMS, I, name);
    } else if constexpr (Opts::template option_count<OwnTag> > 1) {
        return CompileResult::placementFailure(PlacementError::DUPLICATE_ANNOTATION, I, name);
    } else if constexpr (std::is_same_v<Form, form::KeyValue> && Opts::template has_option<options::detail::meta_tag>) {
        using MetaOpt = typename Opts::template get_option<options::detail::meta_tag>;
        constexpr auto & parsed = parsed_token_v<MetaOpt>;
        if constexpr (!parsed) {
            return CompileResult::parseFailure(parsed.error(), parsed.errorPos(), I, name);
        } else {
            return CompileResult{};
        }
    } else if constexpr (std::is_same_v<Form, form::Label> && Opts::template has_option<options::detail::label_tag>) {
        // Labels are emitted verbatim, so they must already be valid UTF-8
        using LabelOpt = typename Opts::template get_option<options::detail::label_tag>;
        constexpr std::size_t bad = token::FindInvalidUtf8(LabelOpt::text.toStringView());
        if constexpr (bad != std::string_view::npos) {
            return CompileResult::parseFailure(TokenError::INVALID_UTF8, bad, I, name);
        } else {
            return CompileResult{};
        }
    } else {
        return CompileResult{};
    }
}

template<class T, AnnotationForm Form, std::size_t... I>
consteval CompileResult CheckFields(std::index_sequence<I...>) {
    CompileResult res;
    // first failing field in declaration order wins
    static_cast<void>((... && (res = CheckField<T, Form, I>(), static_cast<bool>(res))));
    return res;
}

}

// Runs the whole pipeline for T: shape, type-level placement, then every
// field's annotation in declaration order. Never fails to evaluate; the
// outcome is reported in the returned CompileResult.
template<class T, AnnotationForm Form = DefaultForm>
consteval CompileResult Compile() {
    constexpr ShapeError shapeError = ValidateShape<T>();
    if constexpr (shapeError != ShapeError::NO_ERROR) {
        return CompileResult::shapeFailure(shapeError);
    } else {
        using TypeOpts = typename options::detail::type_level_opts<std::remove_cv_t<T>>::options;
        if constexpr (TypeOpts::recognized_count > 0) {
            return CompileResult::placementFailure(PlacementError::ANNOTATION_ON_TYPE);
        } else {
            return compiler_detail::CheckFields<T, Form>(
                std::make_index_sequence<introspection::structureElementsCount<record_t<T>>>{});
        }
    }
}

} // namespace StrucType
