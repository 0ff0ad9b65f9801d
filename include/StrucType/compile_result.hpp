#pragma once

#include <cstddef>
#include <string_view>

#include "errors.hpp"

namespace StrucType {

// Outcome of compiling one described type. At most one error group is set;
// field-level errors also carry the index and name of the first offending field.
class CompileResult {
    ShapeError m_shapeError = ShapeError::NO_ERROR;
    PlacementError m_placementError = PlacementError::NO_ERROR;
    ParseError m_parseError = ParseError::NO_ERROR;
    TokenError m_tokenError = TokenError::NO_ERROR;
    ConfigError m_configError = ConfigError::NO_ERROR;
    std::size_t m_tokenPos = 0;
    std::size_t m_fieldIndex = NO_FIELD;
    std::string_view m_fieldName;

public:
    static constexpr std::size_t NO_FIELD = static_cast<std::size_t>(-1);

    constexpr CompileResult() = default;

    static constexpr CompileResult shapeFailure(ShapeError err) {
        CompileResult r;
        r.m_shapeError = err;
        return r;
    }
    static constexpr CompileResult placementFailure(PlacementError err, std::size_t field = NO_FIELD, std::string_view name = {}) {
        CompileResult r;
        r.m_placementError = err;
        r.m_fieldIndex = field;
        r.m_fieldName = name;
        return r;
    }
    static constexpr CompileResult parseFailure(TokenError detail, std::size_t pos, std::size_t field, std::string_view name) {
        CompileResult r;
        r.m_parseError = ParseError::MALFORMED_ANNOTATION;
        r.m_tokenError = detail;
        r.m_tokenPos = pos;
        r.m_fieldIndex = field;
        r.m_fieldName = name;
        return r;
    }
    static constexpr CompileResult configFailure(ConfigError err, std::size_t field, std::string_view name) {
        CompileResult r;
        r.m_configError = err;
        r.m_fieldIndex = field;
        r.m_fieldName = name;
        return r;
    }

    constexpr operator bool() const {
        return m_shapeError == ShapeError::NO_ERROR
            && m_placementError == PlacementError::NO_ERROR
            && m_parseError == ParseError::NO_ERROR
            && m_configError == ConfigError::NO_ERROR;
    }

    constexpr ShapeError shapeError() const {
        return m_shapeError;
    }
    constexpr PlacementError placementError() const {
        return m_placementError;
    }
    constexpr ParseError parseError() const {
        return m_parseError;
    }
    constexpr TokenError tokenError() const {
        return m_tokenError;
    }
    // Byte offset of the token error inside the annotation text
    constexpr std::size_t tokenErrorPos() const {
        return m_tokenPos;
    }
    constexpr ConfigError configError() const {
        return m_configError;
    }

    constexpr bool hasField() const {
        return m_fieldIndex != NO_FIELD;
    }
    constexpr std::size_t fieldIndex() const {
        return m_fieldIndex;
    }
    constexpr std::string_view fieldName() const {
        return m_fieldName;
    }
};

} // namespace StrucType
