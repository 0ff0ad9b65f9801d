// Must not compile: two meta<> tokens on one field (PlacementError::DUPLICATE_ANNOTATION)
#include <StrucType/structype.hpp>

using StrucType::OptionsPack;
using StrucType::options::meta;

struct Reading {
    StrucType::A<int, meta<R"(unit="s")">> value;
};

template<> struct StrucType::AnnotatedField<Reading, 0> {
    using Options = OptionsPack<meta<R"(unit="ms")">>;
};

int main() {
    return static_cast<int>(StrucType::FieldCount<Reading, StrucType::form::KeyValue>);
}
