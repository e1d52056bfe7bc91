#include "test_helpers.hpp"
#include <absl/time/civil_time.h>
#include <memory>

using namespace TestHelpers;
using namespace FormFusion;
using namespace FormFusion::options;

namespace json_test {

struct Simple {
    std::string Field1;
    int Field2 = 0;
};

struct Address {
    Annotated<std::string, json<"street">> Street;
    Annotated<std::string, json<"city">>   City;
};

enum class Role : int { guest = 0, admin = 1 };

struct User {
    Annotated<std::string, json<"name">>                 Name;
    Annotated<std::uint8_t, json<"age">>                 Age;
    Annotated<double, json<"score">>                     Score;
    Annotated<bool, json<"active">>                      Active;
    Annotated<std::vector<std::string>, json<"tags">>    Tags;
    Annotated<std::optional<Address>, json<"address">>   Home;
    Annotated<std::unique_ptr<int>, json<"lucky">>       Lucky;
    Annotated<absl::Time, json<"created_at">>            CreatedAt;
    Annotated<Role, json<"role">>                        Role_;
    Annotated<std::string, json<"-">>                    Secret;
    std::vector<Address>                                 Previous;
};

struct Code {
    std::string value;
    ScanResult form_scan(const FormValue & v) {
        const std::string & s = std::get<std::string>(v);
        if(s.size() != 3) {
            return std::unexpected("code must have 3 characters, got \"" + s + "\"");
        }
        value = s;
        return {};
    }
};

struct WithCode {
    Code Airport;
};

struct Grid {
    std::vector<std::vector<int>> Rows;
};

} // namespace json_test

using namespace json_test;

void basic_tests() {
    Simple s;
    Succeeds(DecodeJson(s, R"({"Field1":"test","Field2":123})"));
    Check(s.Field1 == "test" && s.Field2 == 123, "plain record");

    Simple ci;
    Succeeds(DecodeJson(ci, R"({"field1":"lower","FIELD2":7,"unknown":[1,2]})"));
    Check(ci.Field1 == "lower" && ci.Field2 == 7, "case-insensitive keys, unknown keys ignored");

    Simple exact;
    Succeeds(DecodeJson(exact, R"({"field1":"loose","Field1":"exact"})"));
    Check(exact.Field1 == "exact", "exact key preferred");

    Simple viaEntry;
    Succeeds(BodyParser(viaEntry, "application/json; charset=utf-8", R"({"Field1":"x","Field2":1})"));
    Check(viaEntry.Field1 == "x", "JSON through BodyParser");
}

void full_tests() {
    User u;
    u.Secret = "keep";
    Succeeds(DecodeJson(u, R"({
        "name": "Ada",
        "age": 36,
        "score": 9,
        "active": true,
        "tags": ["math", "engines"],
        "address": {"street": "St James's Square", "city": "London"},
        "lucky": 7,
        "created_at": "1843-07-10T12:00:00Z",
        "role": 1,
        "-": "ignored",
        "Secret": "ignored too",
        "Previous": [{"city": "Marylebone"}, {"city": "Ockham"}]
    })"));
    Check(u.Name.value == "Ada" && u.Age.value == 36, "string and small int");
    Check(u.Score.value == 9.0, "integer into double");
    Check(u.Active.value, "bool");
    Check((u.Tags.value == std::vector<std::string>{"math", "engines"}), "array");
    Check(u.Home.value && u.Home.value->City.value == "London", "nested object into optional");
    Check(u.Lucky.value && *u.Lucky.value == 7, "unique_ptr allocated");
    Check(u.CreatedAt.value == absl::FromCivil(absl::CivilSecond(1843, 7, 10, 12, 0, 0), absl::UTCTimeZone()), "RFC 3339 time");
    Check(u.Role_.value == Role::admin, "enum from integer");
    Check(u.Secret.value == "keep", "dash tag skips the field");
    Check(u.Previous.size() == 2 && u.Previous[1].City.value == "Ockham", "array of objects");

    Succeeds(DecodeJson(u, R"({"address": null, "lucky": null, "name": null})"));
    Check(!u.Home.value && !u.Lucky.value, "null resets pointer-like fields");
    Check(u.Name.value == "Ada", "null leaves plain fields alone");
}

void scannable_tests() {
    WithCode w;
    Succeeds(DecodeJson(w, R"({"Airport":"LHR"})"));
    Check(w.Airport.value == "LHR", "scanner fed from JSON string");

    auto r = DecodeJson(w, R"({"Airport":"LOND"})");
    FailsWith(r, DecodeErrorKind::PARSE_FAILURE, "");
    Check(r.cause().code == ValueError::scanner_rejected, "scanner rejection");

    FailsWith(DecodeJson(w, R"({"Airport":123})"), DecodeErrorKind::PARSE_FAILURE, "");

    Grid g;
    Succeeds(DecodeJson(g, R"({"Rows":[[1,2],[3]]})"));
    Check(g.Rows.size() == 2 && g.Rows[0].size() == 2 && g.Rows[1][0] == 3, "nested arrays");
}

void failure_tests() {
    auto mismatch = [](std::string_view doc, ValueError code) {
        User u;
        auto r = DecodeJson(u, doc);
        FailsWith(r, DecodeErrorKind::PARSE_FAILURE, "");
        Check(r.cause().code == code, "cause for " + std::string(doc) + ": " + r.cause().detail);
    };
    mismatch(R"({"name": 5})", ValueError::document_type_mismatch);
    mismatch(R"({"age": "36"})", ValueError::document_type_mismatch);
    mismatch(R"({"age": 1.5})", ValueError::document_type_mismatch);
    mismatch(R"({"age": 256})", ValueError::value_out_of_range);
    mismatch(R"({"age": -1})", ValueError::value_out_of_range);
    mismatch(R"({"active": "true"})", ValueError::document_type_mismatch);
    mismatch(R"({"tags": "a,b"})", ValueError::document_type_mismatch);
    mismatch(R"({"address": []})", ValueError::document_type_mismatch);
    mismatch(R"({"created_at": "yesterday"})", ValueError::invalid_time);
    mismatch(R"({"created_at": "infinite-future"})", ValueError::invalid_time);
    mismatch(R"({"created_at": "1843-7-10T12:00:00Z"})", ValueError::invalid_time);
    mismatch(R"({"created_at": " 1843-07-10T12:00:00Z"})", ValueError::invalid_time);
    mismatch(R"([1, 2])", ValueError::document_type_mismatch);
    mismatch(R"({"name": )", ValueError::malformed_document);
    mismatch("", ValueError::malformed_document);

    User u;
    auto r = DecodeJson(u, R"({"tags": ["ok", 3]})");
    Check(r.cause().detail.find("tags[1]") != std::string::npos, "error names the element path: " + r.cause().detail);

    Simple nullDoc{"kept", 1};
    Succeeds(DecodeJson(nullDoc, "null"));
    Check(nullDoc.Field1 == "kept", "null document is a no-op");
}

int main() {
    basic_tests();
    full_tests();
    scannable_tests();
    failure_tests();
    return Report("json");
}
