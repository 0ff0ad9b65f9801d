// Legacy single-label annotations.
// Build with -DSTRUCTYPE_USE_LEGACY_LABELS=1 to make form::Label the default,
// or name the form explicitly as done here.

#include <StrucType/structype.hpp>
#include <iostream>
#include <string>

using namespace StrucType;
using StrucType::options::label;

struct Sensor {
    A<int, label<"Sensor ID">> id;
    A<float, label<"Temperature, \"C\"">> temperature;
    bool active;
};

int main() {
    ListFields<Sensor, form::Label>();
    /*
    id
    temperature
    active
    */

    std::cout << ToMetadataString<Sensor, form::Label>() << std::endl;
    /* {"id":"Sensor ID","temperature":"Temperature, \"C\"","active":"active"} */

    std::cout << ToPrettyMetadataString<Sensor, form::Label>() << std::endl;
    /*
    {
      "id": "Sensor ID",
      "temperature": "Temperature, \"C\"",
      "active": "active"
    }
    */
    return 0;
}
