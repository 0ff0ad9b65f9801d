#include "../test_helpers.hpp"
#include <array>
#include <string>
#include <tuple>
#include <utility>

using namespace StrucType;
using namespace TestHelpers;

// ============================================================================
// Types under test
// ============================================================================

struct Named {
    int a;
    int b;
};

struct Single {
    std::string only;
};

struct Outer {
    Named inner;
    Single single;
    int n;
};

struct Marker {};

// Positional by way of a user tuple protocol
struct Coord {
    int x;
    int y;
};

template<> struct std::tuple_size<Coord> : std::integral_constant<std::size_t, 2> {};

// Described explicitly, but with no fields
class Opaque {
public:
    Opaque() {}
    int hidden = 0;
};

template<> struct StrucType::StructMeta<Opaque> {
    using Fields = StructFields<>;
};

class WithCtor {
public:
    explicit WithCtor(int v): value(v) {}
    int value;
};

enum class Color { Red, Green };

union Bits {
    int i;
    float f;
};

union Tagged {
    int i;
    float f;
};

template<> struct StrucType::StructMeta<Tagged> {
    using Fields = StructFields<
        Field<&Tagged::i, "i">,
        Field<&Tagged::f, "f">
    >;
};

// ============================================================================
// Test: named-field records are accepted
// ============================================================================

static_assert(ClassifyShape<Named>() == Shape::NAMED_FIELDS);
static_assert(ClassifyShape<Single>() == Shape::NAMED_FIELDS);
static_assert(ClassifyShape<const Named>() == Shape::NAMED_FIELDS);
static_assert(ClassifyShape<Annotated<Named>>() == Shape::NAMED_FIELDS);
static_assert(ValidateShape<Named>() == ShapeError::NO_ERROR);
static_assert(NamedRecord<Outer>);
static_assert(!NamedRecord<Marker>);

// Field types are never inspected: nested records compose
static_assert(CompilesOk<Outer>());
static_assert(CompilesOk<Outer, form::Label>());
static_assert(FieldCount<Outer> == 3);

// ============================================================================
// Test: positional types
// ============================================================================

static_assert(ClassifyShape<std::pair<int, int>>() == Shape::POSITIONAL_FIELDS);
static_assert(ClassifyShape<std::tuple<int, double, char>>() == Shape::POSITIONAL_FIELDS);
static_assert(ClassifyShape<std::tuple<>>() == Shape::POSITIONAL_FIELDS);
static_assert(ClassifyShape<std::array<int, 3>>() == Shape::POSITIONAL_FIELDS);
static_assert(ClassifyShape<int[3]>() == Shape::POSITIONAL_FIELDS);
static_assert(ClassifyShape<Coord>() == Shape::POSITIONAL_FIELDS);

static_assert(CompileFailsWith<std::pair<int, int>>(ShapeError::POSITIONAL_FIELDS));
static_assert(CompileFailsWith<std::tuple<int, double, char>>(ShapeError::POSITIONAL_FIELDS));
static_assert(CompileFailsWith<Coord>(ShapeError::POSITIONAL_FIELDS));
static_assert(CompileFailsWith<std::array<int, 3>, form::Label>(ShapeError::POSITIONAL_FIELDS));

// ============================================================================
// Test: zero-field types
// ============================================================================

static_assert(ClassifyShape<Marker>() == Shape::NO_FIELDS);
static_assert(ClassifyShape<Opaque>() == Shape::NO_FIELDS);
static_assert(CompileFailsWith<Marker>(ShapeError::NO_FIELDS));
static_assert(CompileFailsWith<Opaque>(ShapeError::NO_FIELDS));
static_assert(CompileFailsWith<Marker, form::Label>(ShapeError::NO_FIELDS));

// ============================================================================
// Test: things that are not records at all
// ============================================================================

static_assert(ClassifyShape<int>() == Shape::NOT_A_RECORD);
static_assert(ClassifyShape<Named*>() == Shape::NOT_A_RECORD);
static_assert(ClassifyShape<Color>() == Shape::NOT_A_RECORD);
static_assert(ClassifyShape<Bits>() == Shape::NOT_A_RECORD);
static_assert(ClassifyShape<Tagged>() == Shape::NOT_A_RECORD);
static_assert(CompileFailsWith<Tagged>(ShapeError::NOT_A_RECORD));
static_assert(ClassifyShape<WithCtor>() == Shape::NOT_A_RECORD);
static_assert(CompileFailsWith<Color>(ShapeError::NOT_A_RECORD));
static_assert(CompileFailsWith<WithCtor>(ShapeError::NOT_A_RECORD));

// Shape failures carry no field
static_assert(!Compile<Marker>().hasField());
static_assert(Compile<Marker>().placementError() == PlacementError::NO_ERROR);
