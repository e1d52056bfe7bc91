#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "decode_options.hpp"
#include "field_kind.hpp"
#include "struct_introspection.hpp"
#include "tag_resolver.hpp"

namespace FormFusion {

struct FieldDescriptor {
    std::string name;
    FieldKind kind = FieldKind::Unsupported;
    std::string externalKey;
    bool required = false;
    bool isPointerLike = false;
    std::optional<FieldKind> elementKind;
};

struct DestinationDescriptor {
    std::vector<FieldDescriptor> fields;

    constexpr const FieldDescriptor * find(std::string_view name) const {
        for(const FieldDescriptor & f : fields) {
            if(f.name == name) return &f;
        }
        return nullptr;
    }
};

namespace descriptor_detail {

template<class T, std::size_t I>
constexpr FieldDescriptor describeField(std::string_view activeTag, std::string_view fallbackTag) {
    using V = introspection::FieldValueType<T, I>;
    using Tags = introspection::FieldTags<T, I>;

    FieldDescriptor fd;
    fd.name = std::string(introspection::structureElementNameByIndex<I, T>);
    fd.kind = static_schema::kind_of<V>();
    ResolvedKey rk = ResolveKey(fd.name, Tags::entries, activeTag, fallbackTag);
    fd.externalKey = std::move(rk.key);
    fd.required = rk.required;
    fd.isPointerLike = static_schema::is_pointer_like<V>();
    fd.elementKind = static_schema::element_kind_of<V>();
    return fd;
}

} // namespace descriptor_detail

// Fresh on every call; nothing is cached between decodes.
template<class T>
constexpr DestinationDescriptor Describe(std::string_view activeTag, std::string_view fallbackTag = kJsonTag) {
    static_assert(static_schema::FormRecord<T>,
                  "[[[ FormFusion ]]] Describe<T> needs an aggregate or a StructMeta<T> registration");
    DestinationDescriptor d;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        d.fields.reserve(sizeof...(I));
        (d.fields.push_back(descriptor_detail::describeField<T, I>(activeTag, fallbackTag)), ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    return d;
}

template<class T>
DestinationDescriptor Describe(const DecodeOptions & opts = {}) {
    return Describe<T>(opts.tagName, opts.fallbackTagName);
}

} // namespace FormFusion
