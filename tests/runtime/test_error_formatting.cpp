#include "test_helpers.hpp"

using namespace TestHelpers;
using namespace FormFusion;

namespace formatting_test {

struct Person {
    std::string Name;
    int Age = 0;
};

struct Account {
    Annotated<std::string, options::form<"email,required">> Email;
};

} // namespace formatting_test

using namespace formatting_test;

void kind_name_tests() {
    Check(error_to_string(DecodeErrorKind::INVALID_CONTENT_TYPE) == "invalid_content_type", "content type kind");
    Check(error_to_string(DecodeErrorKind::INVALID_TARGET_SHAPE) == "invalid_struct_pointer", "target shape kind");
    Check(error_to_string(DecodeErrorKind::REQUIRED_FIELD_MISSING) == "required_field_missing", "required kind");
    Check(error_to_string(DecodeErrorKind::UNSUPPORTED_FIELD_TYPE) == "unsupported_type", "unsupported kind");
    Check(error_to_string(DecodeErrorKind::PARSE_FAILURE) == "parse_error", "parse kind");
    Check(value_error_to_string(ValueError::scanner_rejected) == "scanner_rejected", "cause name");
}

void message_tests() {
    Person p;
    auto r = BodyParser(p, content_type::ApplicationForm, "age=x");
    Check(DecodeResultToString(r) == R"(BodyParser error: field="Age" kind=parse_error, err=parsing "x": invalid syntax)",
          "parse failure message: " + DecodeResultToString(r));

    Account a;
    auto missing = BodyParser(a, content_type::ApplicationForm, "");
    Check(DecodeResultToString(missing) == R"(BodyParser error: field="Email" kind=required_field_missing, err=field 'email' is required)",
          "required message: " + DecodeResultToString(missing));

    auto ct = BodyParser(p, "text/csv", "a,b");
    Check(DecodeResultToString(ct) == R"(BodyParser error: field="" kind=invalid_content_type, err=unsupported content type: text/csv)",
          "content type message: " + DecodeResultToString(ct));

    Check(DecodeResultToString(DecodeResult::success()) == "BodyParser: no error", "success message");

    DecodeResult bare(DecodeErrorKind::PARSE_FAILURE, "X", ErrorCause{ValueError::invalid_time, ""});
    Check(DecodeResultToString(bare) == R"(BodyParser error: field="X" kind=parse_error, err=invalid_time)",
          "cause code stands in for an empty detail");
}

void result_tests() {
    DecodeResult ok;
    Check(static_cast<bool>(ok) && ok.kind() == DecodeErrorKind::NO_ERROR && ok.field().empty(), "default is success");
    Check(!ok.cause(), "no cause on success");

    DecodeResult failed = withParseFailure("Age", ErrorCause{ValueError::invalid_syntax, "bad"});
    Check(!failed && static_cast<bool>(failed.cause()), "failure carries a cause");
}

int main() {
    kind_name_tests();
    message_tests();
    result_tests();
    return Report("error_formatting");
}
