#pragma once
#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"

namespace FormFusion {

template <typename CharT, std::size_t N> struct ConstString
{
    constexpr bool check()  const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;


namespace options {

namespace detail {
struct tag_tag{};
}

// A named field annotation, the C++ spelling of a struct tag such as
// form:"name,required". The value is a comma separated list: key first,
// modifiers after it.
template<ConstString Name, ConstString Value>
struct tag {
    static_assert(Name.check(), "[[[ FormFusion ]]] tag name contains control characters");
    static_assert(Name.Length > 0, "[[[ FormFusion ]]] tag name must not be empty");
    static_assert(Value.check(), "[[[ FormFusion ]]] tag value contains control characters");
    using option_tag = detail::tag_tag;
    static constexpr std::string_view name  = Name.toStringView();
    static constexpr std::string_view value = Value.toStringView();
};

template<ConstString Value> using form  = tag<"form", Value>;
template<ConstString Value> using query = tag<"query", Value>;
template<ConstString Value> using json  = tag<"json", Value>;
template<ConstString Value> using xml   = tag<"xml", Value>;

// Standalone marker: required<"true"> makes the field mandatory whatever
// tag supplied its key.
template<ConstString Value> using required = tag<"required", Value>;


struct TagEntry {
    std::string_view name;
    std::string_view value;
};

namespace detail {

template<class Opt, class = void>
struct is_tag_option : std::false_type {};

template<class Opt>
struct is_tag_option<Opt, std::void_t<typename Opt::option_tag>>
    : std::bool_constant<std::is_same_v<typename Opt::option_tag, tag_tag>> {};

template<class OptPack> struct tag_table;

template<class... Opts>
struct tag_table<OptionsPack<Opts...>> {
    static_assert((is_tag_option<Opts>::value && ...),
                  "[[[ FormFusion ]]] Annotated<> accepts tag<...> options only (form, query, json, xml, required)");

    static constexpr std::array<TagEntry, sizeof...(Opts)> entries{ TagEntry{Opts::name, Opts::value}... };
};

} // namespace detail

} // namespace options

} // namespace FormFusion
