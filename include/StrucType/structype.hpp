#pragma once

#include <array>
#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"
#include "compile_result.hpp"
#include "compiler.hpp"
#include "config.hpp"
#include "const_string.hpp"
#include "errors.hpp"
#include "metadata_serializer.hpp"
#include "metadata_table.hpp"
#include "options.hpp"
#include "shape.hpp"
#include "struct_introspection.hpp"

namespace StrucType {

namespace detail {

// Instantiated with the outcome of Compile<T, Form>(); every failure trips
// exactly one static_assert here, so the compiler output names T and the
// offending field in the template arguments of this class.
template<class T, ConstString FieldName,
         ShapeError ShapeErr, PlacementError PlacementErr, ParseError ParseErr,
         TokenError TokenErr, std::size_t TokenPos, ConfigError ConfigErr>
struct CompileDiagnostic {
    static_assert(ShapeErr != ShapeError::POSITIONAL_FIELDS,
                  "[[[ StrucType ]]] ShapeError::POSITIONAL_FIELDS: tuple-like types and arrays have no field names.\n"
                  "Describe a struct with named fields instead.");
    static_assert(ShapeErr != ShapeError::NO_FIELDS,
                  "[[[ StrucType ]]] ShapeError::NO_FIELDS: the described type declares no fields.");
    static_assert(ShapeErr != ShapeError::NOT_A_RECORD,
                  "[[[ StrucType ]]] ShapeError::NOT_A_RECORD: only aggregate structs and types with a StructMeta "
                  "specialization can be described.");
    static_assert(PlacementErr != PlacementError::ANNOTATION_ON_TYPE,
                  "[[[ StrucType ]]] PlacementError::ANNOTATION_ON_TYPE: label<>/meta<> may only be attached to fields, "
                  "not to the described type itself.");
    static_assert(PlacementErr != PlacementError::DUPLICATE_ANNOTATION,
                  "[[[ StrucType ]]] PlacementError::DUPLICATE_ANNOTATION: a field carries more than one annotation "
                  "(inline and AnnotatedField<> options count together). See FieldName.");
    static_assert(ParseErr != ParseError::MALFORMED_ANNOTATION,
                  "[[[ StrucType ]]] ParseError::MALFORMED_ANNOTATION: meta<> text is not a list of key=\"value\" pairs, "
                  "or annotation text is not valid UTF-8. See FieldName, TokenErr and TokenPos.");
    static_assert(ConfigErr != ConfigError::MIXED_ANNOTATION_FORMS,
                  "[[[ StrucType ]]] ConfigError::MIXED_ANNOTATION_FORMS: field uses the annotation form this build "
                  "is not configured for (see STRUCTYPE_USE_LEGACY_LABELS). See FieldName.");

    static constexpr bool value = true;
};

// Name of the first offending field, as a template argument
template<class T, AnnotationForm Form>
inline constexpr auto failing_field_v = make_const_string<Compile<T, Form>().fieldName().size()>(Compile<T, Form>().fieldName());

template<class T, AnnotationForm Form, bool Ok>
consteval auto SafeTable() {
    if constexpr (Ok) {
        return metadata_table_v<T, Form>;
    } else {
        return MetadataTable<Form, 0>{};
    }
}

struct BakeInfo {
    std::size_t length = 0;
    bool ok = false;
};

template<class Table>
consteval BakeInfo MeasureFieldList(const Table & table) {
    BakeInfo info{0, true};
    for(const auto & row : table) {
        info.length += row.fieldName.size() + 1;
    }
    return info;
}

template<bool Pretty, class Table>
consteval BakeInfo MeasureMetadata(const Table & table) {
    std::string out;
    auto res = SerializeTable<Pretty>(table, out);
    return BakeInfo{out.size(), static_cast<bool>(res)};
}

} // namespace detail

// Compile-time description of T: runs the pipeline once, reports failures as
// static_asserts and holds the metadata table the generated operations read.
template<class T, AnnotationForm Form = DefaultForm>
struct Describe {
    using type = record_t<T>;
    using form = Form;

    static constexpr CompileResult result = Compile<T, Form>();

    static constexpr bool ok = detail::CompileDiagnostic<
        T,
        detail::failing_field_v<T, Form>,
        result.shapeError(),
        result.placementError(),
        result.parseError(),
        result.tokenError(),
        result.tokenErrorPos(),
        result.configError()>::value && static_cast<bool>(result);

    static constexpr auto table = detail::SafeTable<T, Form, ok>();
    static constexpr std::size_t fieldCount = table.size();

    static constexpr auto fieldNames = []() consteval {
        std::array<std::string_view, fieldCount> names{};
        for(std::size_t i = 0; i < fieldCount; i ++) {
            names[i] = table[i].fieldName;
        }
        return names;
    }();
};

namespace detail {

template<class T, AnnotationForm Form>
inline constexpr BakeInfo field_list_info_v = MeasureFieldList(Describe<T, Form>::table);

// "name1\nname2\n...": the block ListFields writes
template<class T, AnnotationForm Form>
inline constexpr auto field_list_text_v = []() consteval {
    std::array<char, field_list_info_v<T, Form>.length + 1> buf{};
    std::size_t pos = 0;
    for(const auto & row : Describe<T, Form>::table) {
        for(char c : row.fieldName) {
            buf[pos ++] = c;
        }
        buf[pos ++] = '\n';
    }
    return buf;
}();

template<class T, AnnotationForm Form, bool Pretty>
inline constexpr BakeInfo metadata_info_v = MeasureMetadata<Pretty>(Describe<T, Form>::table);

template<class T, AnnotationForm Form, bool Pretty>
inline constexpr auto metadata_text_v = []() consteval {
    static_assert(metadata_info_v<T, Form, Pretty>.ok,
                  "[[[ StrucType ]]] Metadata table could not be serialized.");
    std::array<char, metadata_info_v<T, Form, Pretty>.length + 1> buf{};
    std::string out;
    auto res = SerializeTable<Pretty>(Describe<T, Form>::table, out);
    if(res) {
        for(std::size_t i = 0; i < out.size(); i ++) {
            buf[i] = out[i];
        }
    }
    return buf;
}();

} // namespace detail

// Compact JSON metadata of T, baked at compile time
template<class T, AnnotationForm Form = DefaultForm>
constexpr std::string_view MetadataStringView() {
    return {detail::metadata_text_v<T, Form, false>.data(), detail::metadata_info_v<T, Form, false>.length};
}

template<class T, AnnotationForm Form = DefaultForm>
constexpr std::string_view PrettyMetadataStringView() {
    return {detail::metadata_text_v<T, Form, true>.data(), detail::metadata_info_v<T, Form, true>.length};
}

/// Key/value form: [{"field":{"key":"value",...}},...]
/// Legacy form:    {"field":"label",...}
template<class T, AnnotationForm Form = DefaultForm>
constexpr std::string ToMetadataString() {
    return std::string(MetadataStringView<T, Form>());
}

/// Same document as ToMetadataString, two-space indented
template<class T, AnnotationForm Form = DefaultForm>
constexpr std::string ToPrettyMetadataString() {
    return std::string(PrettyMetadataStringView<T, Form>());
}

template<class T, AnnotationForm Form = DefaultForm>
constexpr const auto & FieldNames() {
    return Describe<T, Form>::fieldNames;
}

template<class T, AnnotationForm Form = DefaultForm>
inline constexpr std::size_t FieldCount = Describe<T, Form>::fieldCount;

// Writes every field name followed by '\n', in declaration order
template<class T, AnnotationForm Form = DefaultForm>
void ListFields(std::ostream & out = std::cout) {
    const auto & text = detail::field_list_text_v<T, Form>;
    out.write(text.data(), static_cast<std::streamsize>(detail::field_list_info_v<T, Form>.length));
}

} // namespace StrucType

// Installs listFields()/toMetadataString() as static members of Type.
// Place inside the struct body; instantiation is deferred to the first call.
#define STRUCTYPE_OPERATIONS(Type) \
    template<class StrucTypeSelf = Type> \
    static void listFields(std::ostream & out = std::cout) { \
        ::StrucType::ListFields<StrucTypeSelf>(out); \
    } \
    template<class StrucTypeSelf = Type> \
    static std::string toMetadataString() { \
        return ::StrucType::ToMetadataString<StrucTypeSelf>(); \
    }

// Fails the translation unit when Type cannot be described
#define STRUCTYPE_CHECK(Type) \
    static_assert(::StrucType::Describe<Type>::ok, "[[[ StrucType ]]] " #Type " cannot be described")
