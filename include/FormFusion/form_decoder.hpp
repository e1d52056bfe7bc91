#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <absl/time/time.h>

#include "decode_options.hpp"
#include "decode_result.hpp"
#include "descriptor.hpp"
#include "field_kind.hpp"
#include "form_value.hpp"
#include "scalars.hpp"
#include "scanner.hpp"
#include "struct_introspection.hpp"
#include "time.hpp"

namespace FormFusion {

namespace form_detail {

struct FieldContext {
    std::string_view field;
    absl::TimeZone timezone;
};

inline DecodeResult unsupported(const FieldContext & ctx, FieldKind kind) {
    return withError(DecodeErrorKind::UNSUPPORTED_FIELD_TYPE, ctx.field, ValueError::unsupported_type,
                     "unsupported type: " + std::string(kind_to_string(kind))
                     + ", a custom type must provide form_scan() or a FormScanner specialization");
}

// Scalars take exactly one token.
inline const std::string * singleToken(const FormValue & value) {
    if(const std::string * s = std::get_if<std::string>(&value)) {
        return s;
    }
    const auto & list = std::get<std::vector<std::string>>(value);
    return list.size() == 1 ? &list.front() : nullptr;
}

inline DecodeResult notSingle(const FieldContext & ctx, const FormValue & value) {
    const auto & list = std::get<std::vector<std::string>>(value);
    return withParseFailure(ctx.field, ErrorCause{ValueError::invalid_syntax,
        "expected a single value, got " + std::to_string(list.size())});
}

template<class T, class Parsed>
DecodeResult store(T & target, Parsed && parsed, const FieldContext & ctx) {
    if(!parsed) {
        return withParseFailure(ctx.field, std::move(parsed.error()));
    }
    target = static_cast<T>(*parsed);
    return DecodeResult::success();
}

template<class T>
DecodeResult SetValue(T & target, const FormValue & value, const FieldContext & ctx);

// Builds the whole collection aside and assigns it only when every element
// converted, so a failed field never holds a partial sequence.
template<class C>
DecodeResult AssembleSequence(C & target, const FormValue & value, const FieldContext & ctx) {
    using E = typename C::value_type;
    constexpr FieldKind elementKind = static_schema::kind_of<E>();
    if constexpr (!static_schema::is_decodable_element_kind(elementKind)) {
        return unsupported(ctx, elementKind);
    } else {
        std::vector<std::string> split;
        const std::vector<std::string> * tokens = std::get_if<std::vector<std::string>>(&value);
        if(!tokens) {
            split = SplitList(std::get<std::string>(value));
            tokens = &split;
        }
        if(tokens->empty()) {
            return DecodeResult::success();
        }

        C assembled;
        for(const std::string & token : *tokens) {
            E element{};
            if(DecodeResult r = SetValue(element, FormValue{token}, ctx); !r) {
                return r;
            }
            assembled.push_back(std::move(element));
        }
        target = std::move(assembled);
        return DecodeResult::success();
    }
}

template<class T>
DecodeResult SetValue(T & target, const FormValue & value, const FieldContext & ctx) {
    using namespace static_schema;
    constexpr FieldKind kind = kind_of<T>();

    if constexpr (FormScannable<T>) {
        if(ScanResult r = Scan(target, value); !r) {
            return withParseFailure(ctx.field, ErrorCause{ValueError::scanner_rejected, std::move(r.error())});
        }
        return DecodeResult::success();
    } else if constexpr (FormPointerLike<T>) {
        if(!target) {
            if constexpr (is_specialization_of_v<T, std::optional>) {
                target.emplace();
            } else {
                target = std::make_unique<pointee_t<T>>();
            }
        }
        return SetValue(*target, value, ctx);
    } else if constexpr (kind == FieldKind::Sequence) {
        return AssembleSequence(target, value, ctx);
    } else if constexpr (kind == FieldKind::Record || kind == FieldKind::Unsupported) {
        return unsupported(ctx, kind);
    } else {
        const std::string * token = singleToken(value);
        if(!token) {
            return notSingle(ctx, value);
        }
        if constexpr (kind == FieldKind::String) {
            target = *token;
            return DecodeResult::success();
        } else if constexpr (kind == FieldKind::Temporal) {
            return store(target, ParseTime(*token, ctx.timezone), ctx);
        } else if constexpr (kind == FieldKind::Bool) {
            return store(target, ParseBool(*token), ctx);
        } else if constexpr (kind == FieldKind::Int) {
            return store(target, ParseInteger<numeric_storage_t<T>>(*token), ctx);
        } else if constexpr (kind == FieldKind::Uint) {
            return store(target, ParseUnsigned<numeric_storage_t<T>>(*token), ctx);
        } else {
            static_assert(kind == FieldKind::Float);
            return store(target, ParseFloat<T>(*token), ctx);
        }
    }
}

// A required field sent as a lone empty string counts as missing.
inline bool isBlank(const FormValue & value) {
    const std::string * s = std::get_if<std::string>(&value);
    return s && s->empty();
}

template<std::size_t I, class T>
DecodeResult DecodeField(T & dst, const FieldDescriptor & fd, const FormData & data, const DecodeOptions & opts) {
    const auto it = data.find(fd.externalKey);
    if(it == data.end() || isBlank(it->second)) {
        if(fd.required) {
            return withError(DecodeErrorKind::REQUIRED_FIELD_MISSING, fd.name, ValueError::missing_value,
                             "field '" + fd.externalKey + "' is required");
        }
        if(it == data.end()) {
            return DecodeResult::success();
        }
    }
    const FieldContext ctx{fd.name, opts.timezone};
    return SetValue(introspection::fieldValueRef<I>(dst), it->second, ctx);
}

inline DecodeResult notARecord() {
    return withError(DecodeErrorKind::INVALID_TARGET_SHAPE, "", ValueError::target_not_record,
                     "destination must be a mutable record");
}

} // namespace form_detail


// Walks the destination's fields in declaration order and stops at the first
// failure. Fields set before the failing one keep their new values.
template<class T>
DecodeResult DecodeForm(T & dst, const FormData & data, const DecodeOptions & opts = {}) {
    if constexpr (!static_schema::FormRecord<T>) {
        return form_detail::notARecord();
    } else {
        const DestinationDescriptor descriptor = Describe<T>(opts);
        DecodeResult result;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (void)((result = form_detail::DecodeField<I>(dst, descriptor.fields[I], data, opts),
                    static_cast<bool>(result)) && ...);
        }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
        return result;
    }
}

template<class T>
DecodeResult DecodeForm(T * dst, const FormData & data, const DecodeOptions & opts = {}) {
    if(!dst) {
        return form_detail::notARecord();
    }
    return DecodeForm(*dst, data, opts);
}

} // namespace FormFusion
