#pragma once

#include <format>
#include <string>
#include <string_view>

#include "compile_result.hpp"
#include "errors.hpp"
#include "type_name.hpp"

namespace StrucType {

namespace error_formatting_detail {

inline std::string fieldLocation(const CompileResult & res) {
    if(!res.hasField()) {
        return "";
    }
    return std::format(", field '{}' (#{})", res.fieldName(), res.fieldIndex());
}

}

// One-line description of a compile outcome, naming the type and the
// first offending field. Returns "<type>: OK" for a successful result.
template <class T>
std::string CompileResultToString(const CompileResult & res) {
    const std::string_view typeName = TypeName<T>();
    const std::string where = error_formatting_detail::fieldLocation(res);

    if(res) {
        return std::format("{}: OK", typeName);
    }
    if(res.shapeError() != ShapeError::NO_ERROR) {
        return std::format("When compiling '{}', shape error '{}'", typeName, error_to_string(res.shapeError()));
    }
    if(res.placementError() != PlacementError::NO_ERROR) {
        return std::format("When compiling '{}'{}, placement error '{}'", typeName, where, error_to_string(res.placementError()));
    }
    if(res.configError() != ConfigError::NO_ERROR) {
        return std::format("When compiling '{}'{}, configuration error '{}'", typeName, where, error_to_string(res.configError()));
    }
    return std::format("When compiling '{}'{}, parse error '{}' ({} at offset {})",
                       typeName, where,
                       error_to_string(res.parseError()),
                       error_to_string(res.tokenError()),
                       res.tokenErrorPos());
}

}
