#include "test_helpers.hpp"

using namespace FormFusion;
using options::TagEntry;

namespace document_key_test {

constexpr DocumentKey Resolve(std::string_view field, std::initializer_list<TagEntry> tags, std::string_view format) {
    return ResolveDocumentKey(field, std::span<const TagEntry>(tags.begin(), tags.size()), format);
}

} // namespace document_key_test

using document_key_test::Resolve;

static_assert(Resolve("Field1", {}, kJsonTag).name == "Field1");
static_assert(Resolve("Field1", {{"json", "field_one"}}, kJsonTag).name == "field_one");
static_assert(Resolve("Field1", {{"json", ",omitempty"}}, kJsonTag).name == "Field1");
static_assert(Resolve("Secret", {{"json", "-"}}, kJsonTag).skip);

// Only the document format's own tag applies
static_assert(Resolve("Name", {{"form", "n"}}, kJsonTag).name == "Name");

static_assert(Resolve("Id", {{"xml", "id,attr"}}, kXmlTag).has("attr"));
static_assert(Resolve("Text", {{"xml", ",chardata"}}, kXmlTag).name == "Text");
static_assert(Resolve("Text", {{"xml", ",chardata"}}, kXmlTag).has("chardata"));
static_assert(!Resolve("Text", {{"xml", "text"}}, kXmlTag).has("chardata"));
