#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <yyjson.h>

#include "decode_options.hpp"
#include "decode_result.hpp"
#include "field_kind.hpp"
#include "form_value.hpp"
#include "options.hpp"
#include "scanner.hpp"
#include "struct_introspection.hpp"
#include "tag_resolver.hpp"
#include "time.hpp"

namespace FormFusion {

namespace json_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const {
        yyjson_doc_free(doc);
    }
};
using DocPtr = std::unique_ptr<yyjson_doc, DocDeleter>;

inline ErrorCause mismatch(yyjson_val * v, FieldKind kind, const std::string & path) {
    return ErrorCause{ValueError::document_type_mismatch,
        "json: cannot decode " + std::string(yyjson_get_type_desc(v)) + " into \"" + path
        + "\" of kind " + std::string(kind_to_string(kind))};
}

inline ErrorCause outOfRange(yyjson_val * v, const std::string & path) {
    return ErrorCause{ValueError::value_out_of_range,
        "json: " + std::string(yyjson_get_type_desc(v)) + " value overflows \"" + path + "\""};
}

// Key lookup: exact first, then ASCII case-insensitive.
inline yyjson_val * findMember(yyjson_val * obj, std::string_view key) {
    if(yyjson_val * v = yyjson_obj_getn(obj, key.data(), key.size())) {
        return v;
    }
    std::size_t idx, max;
    yyjson_val * k;
    yyjson_val * v;
    yyjson_obj_foreach(obj, idx, max, k, v) {
        const std::string_view name(yyjson_get_str(k), yyjson_get_len(k));
        if(name.size() != key.size()) continue;
        bool same = true;
        for(std::size_t i = 0; i < name.size() && same; i ++) {
            same = tag_detail::toLowerAscii(name[i]) == tag_detail::toLowerAscii(key[i]);
        }
        if(same) return v;
    }
    return nullptr;
}

template<class I>
ErrorCause readInteger(I & storage, yyjson_val * v, const std::string & path) {
    if(yyjson_is_sint(v)) {
        const std::int64_t x = yyjson_get_sint(v);
        if constexpr (std::is_signed_v<I>) {
            if(x < std::int64_t(std::numeric_limits<I>::lowest()) || x > std::int64_t(std::numeric_limits<I>::max())) {
                return outOfRange(v, path);
            }
        } else {
            if(x < 0 || std::uint64_t(x) > std::uint64_t(std::numeric_limits<I>::max())) {
                return outOfRange(v, path);
            }
        }
        storage = static_cast<I>(x);
    } else {
        const std::uint64_t x = yyjson_get_uint(v);
        if(x > std::uint64_t(std::numeric_limits<I>::max())) {
            return outOfRange(v, path);
        }
        storage = static_cast<I>(x);
    }
    return {};
}

template<class T>
ErrorCause ReadValue(T & target, yyjson_val * v, const std::string & path);

template<class T>
ErrorCause ReadRecord(T & dst, yyjson_val * obj, const std::string & path) {
    ErrorCause err;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (void)(([&] {
            using Tags = introspection::FieldTags<T, I>;
            const DocumentKey key = ResolveDocumentKey(introspection::structureElementNameByIndex<I, T>,
                                                       Tags::entries, kJsonTag);
            if(key.skip) return true;
            yyjson_val * member = findMember(obj, key.name);
            if(!member) return true;
            const std::string childPath = path.empty() ? key.name : path + "." + key.name;
            err = ReadValue(introspection::fieldValueRef<I>(dst), member, childPath);
            return !err;
        }()) && ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    return err;
}

template<class T>
ErrorCause ReadValue(T & target, yyjson_val * v, const std::string & path) {
    using namespace static_schema;
    constexpr FieldKind kind = kind_of<T>();

    if(yyjson_is_null(v)) {
        if constexpr (FormPointerLike<T>) {
            target.reset();
        }
        return {};
    }

    if constexpr (FormScannable<T>) {
        if(!yyjson_is_str(v)) {
            return mismatch(v, kind, path);
        }
        if(ScanResult r = Scan(target, FormValue{std::string(yyjson_get_str(v), yyjson_get_len(v))}); !r) {
            return ErrorCause{ValueError::scanner_rejected, std::move(r.error())};
        }
        return {};
    } else if constexpr (FormPointerLike<T>) {
        if(!target) {
            if constexpr (is_specialization_of_v<T, std::optional>) {
                target.emplace();
            } else {
                target = std::make_unique<pointee_t<T>>();
            }
        }
        return ReadValue(*target, v, path);
    } else if constexpr (kind == FieldKind::Temporal) {
        if(!yyjson_is_str(v)) {
            return mismatch(v, kind, path);
        }
        auto parsed = ParseRFC3339(std::string_view(yyjson_get_str(v), yyjson_get_len(v)));
        if(!parsed) {
            return std::move(parsed.error());
        }
        target = *parsed;
        return {};
    } else if constexpr (kind == FieldKind::String) {
        if(!yyjson_is_str(v)) {
            return mismatch(v, kind, path);
        }
        target.assign(yyjson_get_str(v), yyjson_get_len(v));
        return {};
    } else if constexpr (kind == FieldKind::Bool) {
        if(!yyjson_is_bool(v)) {
            return mismatch(v, kind, path);
        }
        target = yyjson_get_bool(v);
        return {};
    } else if constexpr (kind == FieldKind::Int || kind == FieldKind::Uint) {
        if(!yyjson_is_int(v)) {
            return mismatch(v, kind, path);
        }
        numeric_storage_t<T> storage{};
        if(ErrorCause err = readInteger(storage, v, path)) {
            return err;
        }
        target = static_cast<T>(storage);
        return {};
    } else if constexpr (kind == FieldKind::Float) {
        if(!yyjson_is_num(v)) {
            return mismatch(v, kind, path);
        }
        const double x = yyjson_get_num(v);
        if(x < double(std::numeric_limits<T>::lowest()) || x > double(std::numeric_limits<T>::max())) {
            return outOfRange(v, path);
        }
        target = static_cast<T>(x);
        return {};
    } else if constexpr (kind == FieldKind::Sequence) {
        if(!yyjson_is_arr(v)) {
            return mismatch(v, kind, path);
        }
        T assembled;
        std::size_t idx, max;
        yyjson_val * item;
        yyjson_arr_foreach(v, idx, max, item) {
            typename T::value_type element{};
            if(ErrorCause err = ReadValue(element, item, path + "[" + std::to_string(idx) + "]")) {
                return err;
            }
            assembled.push_back(std::move(element));
        }
        target = std::move(assembled);
        return {};
    } else if constexpr (kind == FieldKind::Record) {
        if(!yyjson_is_obj(v)) {
            return mismatch(v, kind, path);
        }
        return ReadRecord(target, v, path);
    } else {
        return ErrorCause{ValueError::unsupported_type, "json: \"" + path + "\" has no decoding rule"};
    }
}

} // namespace json_detail


// Binds a JSON object straight onto the destination by reflection. Unknown
// members are ignored, and a null member leaves its field untouched.
template<class T>
DecodeResult DecodeJson(T & dst, std::string_view body) {
    static_assert(static_schema::FormRecord<T>,
                  "[[[ FormFusion ]]] DecodeJson<T> needs an aggregate or a StructMeta<T> registration");
    yyjson_read_err err;
    json_detail::DocPtr doc(yyjson_read_opts(const_cast<char*>(body.data()), body.size(), 0, nullptr, &err));
    if(!doc) {
        return withParseFailure("", ErrorCause{ValueError::malformed_document,
            "json: " + std::string(err.msg) + " at byte " + std::to_string(err.pos)});
    }
    yyjson_val * root = yyjson_doc_get_root(doc.get());
    if(yyjson_is_null(root)) {
        return DecodeResult::success();
    }
    if(!yyjson_is_obj(root)) {
        return withParseFailure("", json_detail::mismatch(root, FieldKind::Record, "$"));
    }
    if(ErrorCause cause = json_detail::ReadRecord(dst, root, "")) {
        return withParseFailure("", std::move(cause));
    }
    return DecodeResult::success();
}

} // namespace FormFusion
