// Must not compile: label<> in a key/value build (ConfigError::MIXED_ANNOTATION_FORMS)
#include <StrucType/structype.hpp>

using StrucType::A;
using StrucType::options::label;

struct Sensor {
    A<int, label<"Sensor ID">> id;
};

int main() {
    return static_cast<int>(StrucType::ToMetadataString<Sensor, StrucType::form::KeyValue>().size());
}
