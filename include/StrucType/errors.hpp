#pragma once

#include <string_view>
namespace StrucType {


// ============================================================================
// Shape errors: the described type is not a record with named fields
// ============================================================================

enum class ShapeError {
    NO_ERROR,
    POSITIONAL_FIELDS,
    NO_FIELDS,
    NOT_A_RECORD
};

constexpr std::string_view error_to_string(ShapeError e) {
    switch(e) {
    case ShapeError::NO_ERROR: return "NO_ERROR"; break;
    case ShapeError::POSITIONAL_FIELDS: return "POSITIONAL_FIELDS"; break;
    case ShapeError::NO_FIELDS: return "NO_FIELDS"; break;
    case ShapeError::NOT_A_RECORD: return "NOT_A_RECORD"; break;
    }
    return "N/A";
}


// ============================================================================
// Placement errors: an annotation is attached where it has no meaning
// ============================================================================

enum class PlacementError {
    NO_ERROR,
    ANNOTATION_ON_TYPE,
    DUPLICATE_ANNOTATION
};

constexpr std::string_view error_to_string(PlacementError e) {
    switch(e) {
    case PlacementError::NO_ERROR: return "NO_ERROR"; break;
    case PlacementError::ANNOTATION_ON_TYPE: return "ANNOTATION_ON_TYPE"; break;
    case PlacementError::DUPLICATE_ANNOTATION: return "DUPLICATE_ANNOTATION"; break;
    }
    return "N/A";
}


// ============================================================================
// Parse errors: a field token is not valid key/value text
// ============================================================================

enum class ParseError {
    NO_ERROR,
    MALFORMED_ANNOTATION
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::MALFORMED_ANNOTATION: return "MALFORMED_ANNOTATION"; break;
    }
    return "N/A";
}

// Detail of a MALFORMED_ANNOTATION, reported by the token parser
enum class TokenError {
    NO_ERROR,
    EMPTY_PAIR,
    EMPTY_KEY,
    MISSING_EQUALS,
    MISSING_VALUE,
    UNTERMINATED_QUOTE,
    UNEXPECTED_QUOTE,
    TRAILING_CHARACTERS,
    BAD_ESCAPE,
    INVALID_UTF8
};

constexpr std::string_view error_to_string(TokenError e) {
    switch(e) {
    case TokenError::NO_ERROR: return "NO_ERROR"; break;
    case TokenError::EMPTY_PAIR: return "EMPTY_PAIR"; break;
    case TokenError::EMPTY_KEY: return "EMPTY_KEY"; break;
    case TokenError::MISSING_EQUALS: return "MISSING_EQUALS"; break;
    case TokenError::MISSING_VALUE: return "MISSING_VALUE"; break;
    case TokenError::UNTERMINATED_QUOTE: return "UNTERMINATED_QUOTE"; break;
    case TokenError::UNEXPECTED_QUOTE: return "UNEXPECTED_QUOTE"; break;
    case TokenError::TRAILING_CHARACTERS: return "TRAILING_CHARACTERS"; break;
    case TokenError::BAD_ESCAPE: return "BAD_ESCAPE"; break;
    case TokenError::INVALID_UTF8: return "INVALID_UTF8"; break;
    }
    return "N/A";
}


// ============================================================================
// Config errors: the build mixes annotation forms
// ============================================================================

enum class ConfigError {
    NO_ERROR,
    MIXED_ANNOTATION_FORMS
};

constexpr std::string_view error_to_string(ConfigError e) {
    switch(e) {
    case ConfigError::NO_ERROR: return "NO_ERROR"; break;
    case ConfigError::MIXED_ANNOTATION_FORMS: return "MIXED_ANNOTATION_FORMS"; break;
    }
    return "N/A";
}

} // namespace StrucType
