#include "../test_helpers.hpp"

using namespace StrucType;
using namespace StrucType::options;
using namespace TestHelpers;

// ============================================================================
// Test: malformed key/value tokens name the field
// ============================================================================

struct BadSecond {
    A<int, meta<R"(order="1")">> first;
    A<int, meta<R"(order="2)">> second;
    int third;
};

static_assert(CompileFailsWith<BadSecond>(TokenError::UNTERMINATED_QUOTE));
static_assert(CompileFailsWith<BadSecond>(ParseError::MALFORMED_ANNOTATION));
static_assert(CompileFailsAtField<BadSecond>(1, "second"));
static_assert(Compile<BadSecond>().tokenErrorPos() == 6);

struct TrailingComma {
    A<int, meta<R"(a="1",)">> f;
};

static_assert(CompileFailsWith<TrailingComma>(TokenError::EMPTY_PAIR));
static_assert(Compile<TrailingComma>().tokenErrorPos() == 6);

// In legacy mode the meta<> text is never parsed: it is the wrong form
static_assert(CompileFailsWith<BadSecond, form::Label>(ConfigError::MIXED_ANNOTATION_FORMS));
static_assert(CompileFailsAtField<BadSecond, form::Label>(0, "first"));

// The first failing field in declaration order is reported
struct TwoBad {
    A<int, meta<"x">> a;
    A<int, meta<"=y">> b;
};

static_assert(CompileFailsWith<TwoBad>(TokenError::MISSING_EQUALS));
static_assert(CompileFailsAtField<TwoBad>(0, "a"));

// Malformed text on an external annotation is caught the same way
struct ExternalBad {
    int a;
    int b;
};

template<> struct StrucType::AnnotatedField<ExternalBad, 1> {
    using Options = OptionsPack<meta<"k=">>;
};

static_assert(CompileFailsWith<ExternalBad>(TokenError::MISSING_VALUE));
static_assert(CompileFailsAtField<ExternalBad>(1, "b"));

// ============================================================================
// Test: annotation text that is not UTF-8 is rejected
// ============================================================================

struct RawBytes {
    A<int, meta<"unit=\"\xFF\xFE\"">> a;
    int b;
};

static_assert(CompileFailsWith<RawBytes>(TokenError::INVALID_UTF8));
static_assert(CompileFailsWith<RawBytes>(ParseError::MALFORMED_ANNOTATION));
static_assert(CompileFailsAtField<RawBytes>(0, "a"));
static_assert(Compile<RawBytes>().tokenErrorPos() == 6);

// Same through an explicit field list
struct Gauge {
    int a;
    int b;
};

template<> struct StrucType::StructMeta<Gauge> {
    using Fields = StructFields<
        Field<&Gauge::a, "a", meta<"unit=\"\xFF\xFE\"">>,
        Field<&Gauge::b, "b">
    >;
};

static_assert(CompileFailsWith<Gauge>(TokenError::INVALID_UTF8));
static_assert(CompileFailsAtField<Gauge>(0, "a"));

// Legacy labels are emitted verbatim, so they are checked as well
struct BadLabel {
    int id;
    A<int, label<"caf\xC3">> name;
};

struct GoodLabel {
    A<int, label<"caf\xC3\xA9">> name;
};

static_assert(CompileFailsWith<BadLabel, form::Label>(TokenError::INVALID_UTF8));
static_assert(CompileFailsWith<BadLabel, form::Label>(ParseError::MALFORMED_ANNOTATION));
static_assert(CompileFailsAtField<BadLabel, form::Label>(1, "name"));
static_assert(Compile<BadLabel, form::Label>().tokenErrorPos() == 3);
static_assert(CompilesOk<GoodLabel, form::Label>());

// ============================================================================
// Test: annotation forms may not be mixed
// ============================================================================

struct Mixed {
    A<int, meta<R"(order="1")">> id;
    A<int, label<"Name">> name;
};

static_assert(CompileFailsWith<Mixed>(ConfigError::MIXED_ANNOTATION_FORMS));
static_assert(CompileFailsAtField<Mixed>(1, "name"));
static_assert(CompileFailsWith<Mixed, form::Label>(ConfigError::MIXED_ANNOTATION_FORMS));
static_assert(CompileFailsAtField<Mixed, form::Label>(0, "id"));

struct BothOnOneField {
    A<int, meta<R"(order="1")">, label<"Id">> id;
};

static_assert(CompileFailsWith<BothOnOneField>(ConfigError::MIXED_ANNOTATION_FORMS));
static_assert(CompileFailsWith<BothOnOneField, form::Label>(ConfigError::MIXED_ANNOTATION_FORMS));

// ============================================================================
// Test: one annotation per field
// ============================================================================

struct TwoMetas {
    A<int, meta<R"(a="1")">, meta<R"(b="2")">> f;
};

static_assert(CompileFailsWith<TwoMetas>(PlacementError::DUPLICATE_ANNOTATION));
static_assert(CompileFailsAtField<TwoMetas>(0, "f"));

struct InlineAndExternal {
    int a;
    A<int, label<"B">> b;
};

template<> struct StrucType::AnnotatedField<InlineAndExternal, 1> {
    using Options = OptionsPack<label<"Bee">>;
};

static_assert(CompileFailsWith<InlineAndExternal, form::Label>(PlacementError::DUPLICATE_ANNOTATION));
static_assert(CompileFailsAtField<InlineAndExternal, form::Label>(1, "b"));

// ============================================================================
// Test: successful results are clean
// ============================================================================

struct Fine {
    A<int, meta<R"(a="1")">> a;
};

constexpr bool test_success_has_no_errors() {
    constexpr auto res = Compile<Fine>();
    return res
        && res.shapeError() == ShapeError::NO_ERROR
        && res.placementError() == PlacementError::NO_ERROR
        && res.parseError() == ParseError::NO_ERROR
        && res.tokenError() == TokenError::NO_ERROR
        && res.configError() == ConfigError::NO_ERROR
        && !res.hasField();
}
static_assert(test_success_has_no_errors());
