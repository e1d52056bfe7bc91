#include "test_helpers.hpp"
#include <FormFusion/annotated.hpp>
#include <FormFusion/struct_introspection.hpp>
#include <memory>
#include <optional>
#include <vector>

using namespace TestHelpers;
using namespace FormFusion;
using namespace FormFusion::options;

namespace describe_test {

struct SignupForm {
    Annotated<std::string, form<"email,required">>            Email;
    Annotated<std::string, json<"display_name">>              DisplayName;
    Annotated<int, form<"age">, json<"years">>                Age;
    std::optional<bool>                                       Newsletter;
    Annotated<std::vector<int>, query<"ids">, required<"true">> TagIDs;
};

// Registered explicitly: member names differ from the names decoding sees
struct Point {
    int x_;
    int y_;
};

} // namespace describe_test

template<> struct FormFusion::StructMeta<describe_test::Point> {
    using Fields = StructFields<
        Field<&describe_test::Point::x_, "X">,
        Field<&describe_test::Point::y_, "Y", form<"y_coord">>
    >;
};

using describe_test::SignupForm;
using describe_test::Point;

static_assert(Describe<SignupForm>(kFormTag).fields.size() == 5);

// Declared names and order
static_assert(Describe<SignupForm>(kFormTag).fields[0].name == "Email");
static_assert(Describe<SignupForm>(kFormTag).fields[4].name == "TagIDs");

// Keys under the form tag
static_assert(KeyIs<SignupForm, 0>("email"));
static_assert(KeyIs<SignupForm, 1>("display_name"));
static_assert(KeyIs<SignupForm, 2>("age"));
static_assert(KeyIs<SignupForm, 3>("newsletter"));
static_assert(KeyIs<SignupForm, 4>("tag_i_ds"));

// Keys under the query tag
static_assert(KeyIs<SignupForm, 0>("email", kQueryTag));
static_assert(KeyIs<SignupForm, 2>("years", kQueryTag));
static_assert(KeyIs<SignupForm, 4>("ids", kQueryTag));

static_assert(IsRequired<SignupForm, 0>());
static_assert(!IsRequired<SignupForm, 1>());
static_assert(IsRequired<SignupForm, 4>());

static_assert(Describe<SignupForm>(kFormTag).fields[2].kind == FieldKind::Int);
static_assert(Describe<SignupForm>(kFormTag).fields[3].kind == FieldKind::Bool);
static_assert(Describe<SignupForm>(kFormTag).fields[3].isPointerLike);
static_assert(Describe<SignupForm>(kFormTag).fields[4].kind == FieldKind::Sequence);
static_assert(Describe<SignupForm>(kFormTag).fields[4].elementKind == FieldKind::Int);
static_assert(!Describe<SignupForm>(kFormTag).fields[0].elementKind.has_value());

static_assert(Describe<SignupForm>(kFormTag).find("Age") != nullptr);
static_assert(Describe<SignupForm>(kFormTag).find("Missing") == nullptr);

// StructMeta registration
static_assert(Describe<Point>(kFormTag).fields.size() == 2);
static_assert(KeyIs<Point, 0>("x"));
static_assert(KeyIs<Point, 1>("y_coord"));
static_assert(Describe<Point>(kFormTag).fields[1].name == "Y");
