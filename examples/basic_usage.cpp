// Basic FormFusion usage example
// Decodes the same signup record from a urlencoded body, a JSON body and a
// query string.

#include <FormFusion/formfusion.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace FormFusion;
using namespace FormFusion::options;

struct Signup {
    Annotated<std::string, form<"email,required">, json<"email">> Email;
    Annotated<std::string, json<"display_name">>                  DisplayName;
    int Age = 0;
    std::vector<std::string> Interests;
    bool Newsletter = false;

    void print() const {
        std::cout << "  email: " << Email.value << "\n"
                  << "  display name: " << DisplayName.value << "\n"
                  << "  age: " << Age << "\n"
                  << "  interests:";
        for(const auto & i : Interests) std::cout << " " << i;
        std::cout << "\n  newsletter: " << (Newsletter ? "yes" : "no") << std::endl;
    }
};

int main() {
    Signup fromForm;
    auto result = BodyParser(fromForm, "application/x-www-form-urlencoded",
                             "email=ada%40example.org&display_name=Ada&age=36&interests=math,engines&newsletter=on");
    if (!result) {
        std::cout << DecodeResultToString(result) << std::endl;
        return 1;
    }
    std::cout << "From form:" << std::endl;
    fromForm.print();

    Signup fromJson;
    result = BodyParser(fromJson, "application/json",
                        R"({"email":"grace@example.org","display_name":"Grace","Age":85,"Interests":["compilers"]})");
    if (!result) {
        std::cout << DecodeResultToString(result) << std::endl;
        return 1;
    }
    std::cout << "From JSON:" << std::endl;
    fromJson.print();

    Signup missing;
    result = QueryParser(missing, "age=20");
    std::cout << "From query without email:\n  " << DecodeResultToString(result) << std::endl;
    /* BodyParser error: field="Email" kind=required_field_missing, err=field 'email' is required */

    return 0;
}
