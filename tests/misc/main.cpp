
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <StrucType/structype.hpp>
#include <StrucType/error_formatting.hpp>

using namespace StrucType;
using namespace StrucType::options;

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
STRUCTYPE_CHECK(Details);

struct Sensor {
    A<int, label<"Sensor ID">> id;
    bool active;
};

struct Broken {
    int ok;
    A<int, meta<R"(order="1)">> bad;
};

struct Mixed {
    A<int, label<"x">> x;
};

void list_fields_tests() {
    std::ostringstream out;
    ListFields<UserStruct>(out);
    assert(out.str() == "id\nusername\norg\ndetails\n");

    // no hidden state between calls
    ListFields<UserStruct>(out);
    assert(out.str() == "id\nusername\norg\ndetails\nid\nusername\norg\ndetails\n");

    std::ostringstream viaMember;
    UserStruct::listFields(viaMember);
    assert(viaMember.str() == "id\nusername\norg\ndetails\n");

    std::ostringstream legacy;
    ListFields<Sensor, form::Label>(legacy);
    assert(legacy.str() == "id\nactive\n");

    std::cout << "listFields to stdout:" << std::endl;
    UserStruct::listFields();
}

void metadata_string_tests() {
    const std::string expected =
        R"([{"id":{"override_name":"Primary ID","order":"1"}},{"username":{"override_name":"name","order":"0"}},{"org":{}},{"details":{}}])";

    assert(UserStruct::toMetadataString() == expected);
    assert(ToMetadataString<UserStruct>() == expected);
    assert(UserStruct::toMetadataString() == UserStruct::toMetadataString());
    assert(ToMetadataString<Details>() == R"([{"bio":{}},{"age":{}}])");
    assert(ToMetadataString<Sensor, form::Label>() == R"({"id":"Sensor ID","active":"active"})");

    std::cout << ToPrettyMetadataString<UserStruct>() << std::endl;
}

void concurrent_calls_tests() {
    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&results, i] {
            std::ostringstream out;
            ListFields<UserStruct>(out);
            results[i] = out.str() + ToMetadataString<UserStruct>();
        });
    }
    for (auto & t : threads) {
        t.join();
    }
    for (const auto & r : results) {
        assert(r == results.front());
    }
}

void error_formatting_tests() {
    {
        constexpr auto res = Compile<UserStruct>();
        assert(res);
        std::string s = CompileResultToString<UserStruct>(res);
        assert(s.find("UserStruct") != std::string::npos);
        assert(s.ends_with(": OK"));
    }
    {
        constexpr auto res = Compile<Broken>();
        assert(!res);
        std::string s = CompileResultToString<Broken>(res);
        std::cout << s << std::endl;
        assert(s.find("Broken") != std::string::npos);
        assert(s.find("field 'bad' (#1)") != std::string::npos);
        assert(s.find("MALFORMED_ANNOTATION") != std::string::npos);
        assert(s.find("UNTERMINATED_QUOTE at offset 6") != std::string::npos);
    }
    {
        constexpr auto res = Compile<std::pair<int, int>>();
        std::string s = CompileResultToString<std::pair<int, int>>(res);
        std::cout << s << std::endl;
        assert(s.find("shape error 'POSITIONAL_FIELDS'") != std::string::npos);
        assert(s.find("field") == std::string::npos);
    }
    {
        constexpr auto res = Compile<Mixed>();
        std::string s = CompileResultToString<Mixed>(res);
        std::cout << s << std::endl;
        assert(s.find("field 'x' (#0)") != std::string::npos);
        assert(s.find("MIXED_ANNOTATION_FORMS") != std::string::npos);
    }
    {
        constexpr auto res = Compile<Annotated<Details, meta<R"(order="1")">>>();
        std::string s = CompileResultToString<Details>(res);
        assert(s.find("placement error 'ANNOTATION_ON_TYPE'") != std::string::npos);
    }
}

int main() {
    list_fields_tests();
    metadata_string_tests();
    concurrent_calls_tests();
    error_formatting_tests();
    std::cout << "All runtime tests passed" << std::endl;
    return 0;
}
