#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <absl/time/time.h>

#include "scanner.hpp"
#include "struct_introspection.hpp"

namespace FormFusion {

enum class FieldKind : std::uint8_t {
    String,
    Int,
    Uint,
    Float,
    Bool,
    Temporal,
    Sequence,
    Record,
    CustomScannable,
    Unsupported
};

constexpr std::string_view kind_to_string(FieldKind k) {
    switch(k) {
    case FieldKind::String: return "string"; break;
    case FieldKind::Int: return "int"; break;
    case FieldKind::Uint: return "uint"; break;
    case FieldKind::Float: return "float"; break;
    case FieldKind::Bool: return "bool"; break;
    case FieldKind::Temporal: return "temporal"; break;
    case FieldKind::Sequence: return "sequence"; break;
    case FieldKind::Record: return "record"; break;
    case FieldKind::CustomScannable: return "custom_scannable"; break;
    case FieldKind::Unsupported: return "unsupported"; break;
    }
    return "N/A";
}

namespace static_schema {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v = is_specialization_of<std::remove_cv_t<T>, Template>::value;

template<class T>
concept CharacterType = std::same_as<T, char> || std::same_as<T, wchar_t>
                     || std::same_as<T, char8_t> || std::same_as<T, char16_t> || std::same_as<T, char32_t>;

template<class T>
concept FormString = std::same_as<T, std::string>;

template<class T>
concept FormBool = std::same_as<T, bool>;

// Enums decode through their underlying type, like named integer types.
template<class T>
concept FormInteger = (std::signed_integral<T> && !CharacterType<T>)
                   || (std::is_enum_v<T> && std::signed_integral<std::underlying_type_t<T>>);

template<class T>
concept FormUnsigned = (std::unsigned_integral<T> && !FormBool<T> && !CharacterType<T>)
                    || (std::is_enum_v<T> && std::unsigned_integral<std::underlying_type_t<T>> && !std::same_as<std::underlying_type_t<T>, bool>);

template<class T>
concept FormFloat = std::floating_point<T>;

// Matched by identity, never by shape.
template<class T>
concept FormTemporal = std::same_as<T, absl::Time>;

template<class T>
concept FormPointerLike = is_specialization_of_v<T, std::optional>
                       || (is_specialization_of_v<T, std::unique_ptr> && !std::is_array_v<typename T::element_type>);

template<class T> struct pointee;
template<class T> struct pointee<std::optional<T>> { using type = T; };
template<class T, class D> struct pointee<std::unique_ptr<T, D>> { using type = T; };

template<class T>
using pointee_t = typename pointee<std::remove_cv_t<T>>::type;

template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};

template<class T>
concept FormSequence = DynamicContainerTypeConcept<T> && !FormString<T> && !FormPointerLike<T>;

template<class T>
concept FormRecord = std::is_class_v<T>
                  && (std::is_aggregate_v<T> || introspection::has_struct_meta<T>)
                  && !requires { typename T::value_type; };


template<class T>
consteval FieldKind kind_of() {
    using D = std::remove_cv_t<T>;
    if constexpr (FormScannable<D>) {
        return FieldKind::CustomScannable;
    } else if constexpr (FormTemporal<D>) {
        return FieldKind::Temporal;
    } else if constexpr (FormString<D>) {
        return FieldKind::String;
    } else if constexpr (FormBool<D>) {
        return FieldKind::Bool;
    } else if constexpr (FormInteger<D>) {
        return FieldKind::Int;
    } else if constexpr (FormUnsigned<D>) {
        return FieldKind::Uint;
    } else if constexpr (FormFloat<D>) {
        return FieldKind::Float;
    } else if constexpr (FormPointerLike<D>) {
        return kind_of<pointee_t<D>>();
    } else if constexpr (FormSequence<D>) {
        return FieldKind::Sequence;
    } else if constexpr (FormRecord<D>) {
        return FieldKind::Record;
    } else {
        return FieldKind::Unsupported;
    }
}

// Integer type a numeric kind is parsed as: the enum's underlying type, or T.
template<class T>
struct numeric_storage { using type = T; };

template<class T>
    requires std::is_enum_v<T>
struct numeric_storage<T> { using type = std::underlying_type_t<T>; };

template<class T>
using numeric_storage_t = typename numeric_storage<T>::type;

template<class T>
consteval bool is_pointer_like() {
    return FormPointerLike<std::remove_cv_t<T>>;
}

// Value type once optional / unique_ptr wrappers are stripped.
template<class T>
struct unwrapped { using type = std::remove_cv_t<T>; };

template<class T>
    requires FormPointerLike<std::remove_cv_t<T>>
struct unwrapped<T> { using type = typename unwrapped<pointee_t<T>>::type; };

template<class T>
using unwrapped_t = typename unwrapped<T>::type;

template<class T>
consteval std::optional<FieldKind> element_kind_of() {
    using D = unwrapped_t<T>;
    if constexpr (kind_of<D>() == FieldKind::Sequence) {
        return kind_of<typename D::value_type>();
    } else {
        return std::nullopt;
    }
}

// A sequence is decodable when its elements are neither sequences nor plain
// records nor unsupported shapes.
constexpr bool is_decodable_element_kind(FieldKind k) {
    return k != FieldKind::Sequence && k != FieldKind::Record && k != FieldKind::Unsupported;
}

} // namespace static_schema
} // namespace FormFusion
