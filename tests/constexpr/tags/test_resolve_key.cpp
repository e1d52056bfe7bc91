#include "test_helpers.hpp"

using namespace FormFusion;
using namespace TestHelpers;
using options::TagEntry;

namespace resolve_key_test {

constexpr bool Resolves(std::string_view field, std::initializer_list<TagEntry> tags,
                        std::string_view key, bool required,
                        std::string_view active = kFormTag) {
    const ResolvedKey r = ResolveKey(field, std::span<const TagEntry>(tags.begin(), tags.size()), active, kJsonTag);
    return r.key == key && r.required == required;
}

} // namespace resolve_key_test

using resolve_key_test::Resolves;

// No tags: derived name
static_assert(Resolves("FirstName", {}, "first_name", false));

// Active tag beats fallback tag
static_assert(Resolves("Name", {{"json", "json_name"}, {"form", "form_name"}}, "form_name", false));

// Fallback tag when the active one is missing or empty
static_assert(Resolves("Name", {{"json", "json_name"}}, "json_name", false));
static_assert(Resolves("Name", {{"form", ""}, {"json", "json_name"}}, "json_name", false));

// First token is the key, the rest are modifiers
static_assert(Resolves("Email", {{"form", "email,required"}}, "email", true));
static_assert(Resolves("Email", {{"form", "email, required"}}, "email", true));
static_assert(Resolves("Email", {{"form", "email,omitempty"}}, "email", false));

// "required" as the key token names the key, it is not a modifier
static_assert(Resolves("Flag", {{"form", "required"}}, "required", false));

// Marker attribute is OR-ed with the modifier
static_assert(Resolves("Age", {{"form", "age"}, {"required", "true"}}, "age", true));
static_assert(Resolves("Age", {{"form", "age,required"}, {"required", "false"}}, "age", true));
static_assert(Resolves("Age", {{"required", "yes"}}, "age", false));

// Explicit empty key is taken literally
static_assert(Resolves("Hidden", {{"form", ",required"}}, "", true));

// Modifiers on a fallback tag still count
static_assert(Resolves("Token", {{"json", "token,required"}}, "token", true));

// Query decoding switches the active tag
static_assert(Resolves("Page", {{"form", "p"}, {"query", "page"}}, "page", false, kQueryTag));
static_assert(Resolves("Page", {{"form", "p"}}, "page", false, kQueryTag));
