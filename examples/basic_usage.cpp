// Basic StrucType usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <StrucType/structype.hpp>
#include <cstdint>
#include <iostream>
#include <string>

using namespace StrucType;
using StrucType::options::meta;

struct Details {
    std::string bio;
    int age;
};

struct UserStruct {
    A<std::int64_t, meta<R"(override_name="Primary ID", order="1")">> id;
    A<std::string, meta<R"(override_name="name", order="0")">> username;
    std::string org;
    Details details;

    STRUCTYPE_OPERATIONS(UserStruct)
};

STRUCTYPE_CHECK(UserStruct);

int main() {
    std::cout << "Fields of UserStruct:" << std::endl;
    UserStruct::listFields();
    /*
    id
    username
    org
    details
    */

    std::cout << UserStruct::toMetadataString() << std::endl;
    /* [{"id":{"override_name":"Primary ID","order":"1"}},{"username":{"override_name":"name","order":"0"}},{"org":{}},{"details":{}}] */

    // Nested records are described independently
    std::cout << ToMetadataString<Details>() << std::endl;
    /* [{"bio":{}},{"age":{}}] */

    std::cout << ToPrettyMetadataString<UserStruct>() << std::endl;

    // The table itself is a constexpr value
    constexpr auto & table = Describe<UserStruct>::table;
    static_assert(table.size() == 4);
    static_assert(table[0].metadata.find("order")->value == "1");
    static_assert(table[2].metadata.empty());

    return 0;
}
