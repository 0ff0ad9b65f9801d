#include <StrucType/structype.hpp>
#include <StrucType/error_formatting.hpp>
using StrucType::OptionsPack;
using StrucType::options::meta;
#include <iostream>
#include <string>
using std::cout;
using std::endl;


// Members that cannot be wrapped in Annotated<> get their tags from outside
struct Point3 {
    double x = 0, y = 0, z = 0;
};

template<> struct StrucType::AnnotatedField<Point3, 0> {
    using Options = OptionsPack<
        meta<R"(unit="m", axis="east")">
        >;
};
template<> struct StrucType::AnnotatedField<Point3, 2> {
    using Options = OptionsPack<
        meta<R"(unit="m", axis="up")">
        >;
};


// Not an aggregate: fields are listed explicitly, under names of our choosing
class Account {
public:
    explicit Account(int id): id_(id) {}
    int id_;
    std::string owner_;
};

template<> struct StrucType::StructMeta<Account> {
    using Fields = StructFields<
        Field<&Account::id_, "id", meta<R"(order="1", "display name"="Account #")">>,
        Field<&Account::owner_, "owner">
    >;
};


// A tuple is positional: inspect the outcome without failing the build
using Pair = std::pair<int, int>;

int main() {
    cout << StrucType::ToMetadataString<Point3>() << endl;
    /* [{"x":{"unit":"m","axis":"east"}},{"y":{}},{"z":{"unit":"m","axis":"up"}}] */

    StrucType::ListFields<Account>();
    /*
    id
    owner
    */
    cout << StrucType::ToMetadataString<Account>() << endl;
    /* [{"id":{"order":"1","display name":"Account #"}},{"owner":{}}] */

    constexpr auto res = StrucType::Compile<Pair>();
    cout << StrucType::CompileResultToString<Pair>(res) << endl;
    /* When compiling 'std::pair<int, int>', shape error 'POSITIONAL_FIELDS' */
}
