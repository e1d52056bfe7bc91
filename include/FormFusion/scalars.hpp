#pragma once

#include <charconv>
#include <concepts>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "decode_result.hpp"

namespace FormFusion {

namespace scalars_detail {

constexpr ErrorCause syntaxError(std::string_view token) {
    return ErrorCause{ValueError::invalid_syntax, "parsing \"" + std::string(token) + "\": invalid syntax"};
}

constexpr ErrorCause rangeError(std::string_view token) {
    return ErrorCause{ValueError::value_out_of_range, "parsing \"" + std::string(token) + "\": value out of range"};
}

constexpr bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Accumulates decimal digits into U, refusing anything above limit.
template<class U>
constexpr std::errc accumulateDigits(std::string_view digits, U limit, U & out) {
    if(digits.empty()) return std::errc::invalid_argument;
    U acc = 0;
    for(char c : digits) {
        if(!isDigit(c)) return std::errc::invalid_argument;
        const U d = static_cast<U>(c - '0');
        if(acc > static_cast<U>((limit - d) / 10)) return std::errc::result_out_of_range;
        acc = static_cast<U>(acc * 10 + d);
    }
    out = acc;
    return std::errc{};
}

// True when a decimal literal's magnitude is below one, so a range error
// from from_chars means the value rounded to zero rather than overflowed.
constexpr bool isBelowOne(std::string_view token) {
    std::size_t i = 0;
    if(i < token.size() && (token[i] == '+' || token[i] == '-')) i ++;
    long long lead = 0;
    bool seenNonZero = false;
    bool inFraction = false;
    long long intDigits = 0;
    for(; i < token.size() && token[i] != 'e' && token[i] != 'E'; i ++) {
        const char c = token[i];
        if(c == '.') {
            inFraction = true;
            continue;
        }
        if(!isDigit(c)) return false;
        if(!inFraction) intDigits ++;
        if(!seenNonZero && c != '0') {
            seenNonZero = true;
            lead = inFraction ? lead - 1 : 0;
            if(!inFraction) intDigits = 1;
        } else if(!seenNonZero && inFraction) {
            lead --;
        }
    }
    if(!seenNonZero) return false;
    long long exp = 0;
    bool negativeExp = false;
    if(i < token.size()) {
        i ++;
        if(i < token.size() && (token[i] == '+' || token[i] == '-')) {
            negativeExp = token[i] == '-';
            i ++;
        }
        for(; i < token.size(); i ++) {
            if(!isDigit(token[i])) return false;
            if(exp < 100000) exp = exp * 10 + (token[i] - '0');
        }
    }
    const long long magnitude = (lead < 0 ? lead : intDigits - 1) + (negativeExp ? -exp : exp);
    return magnitude < 0;
}

} // namespace scalars_detail


// Base 10, optional sign, bounded by T.
template<class T>
    requires (std::is_integral_v<T> && std::is_signed_v<T>)
constexpr std::expected<T, ErrorCause> ParseInteger(std::string_view token) {
    using U = std::make_unsigned_t<T>;
    std::string_view digits = token;
    bool negative = false;
    if(!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }
    const U limit = negative ? static_cast<U>(static_cast<U>(std::numeric_limits<T>::max()) + 1)
                             : static_cast<U>(std::numeric_limits<T>::max());
    U magnitude = 0;
    switch(scalars_detail::accumulateDigits<U>(digits, limit, magnitude)) {
    case std::errc{}: break;
    case std::errc::result_out_of_range: return std::unexpected(scalars_detail::rangeError(token));
    default: return std::unexpected(scalars_detail::syntaxError(token));
    }
    if(negative) {
        return static_cast<T>(static_cast<U>(U{0} - magnitude));
    }
    return static_cast<T>(magnitude);
}

// Base 10 digits only; any sign is a syntax error.
template<class T>
    requires (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>)
constexpr std::expected<T, ErrorCause> ParseUnsigned(std::string_view token) {
    T value = 0;
    switch(scalars_detail::accumulateDigits<T>(token, std::numeric_limits<T>::max(), value)) {
    case std::errc{}: return value;
    case std::errc::result_out_of_range: return std::unexpected(scalars_detail::rangeError(token));
    default: return std::unexpected(scalars_detail::syntaxError(token));
    }
}

template<std::floating_point T>
std::expected<T, ErrorCause> ParseFloat(std::string_view token) {
    const char * first = token.data();
    const char * last = token.data() + token.size();
    // from_chars takes '-' but not '+'
    if(first != last && *first == '+' && (last - first) > 1 && first[1] != '-' && first[1] != '+') {
        ++first;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if(ec == std::errc::result_out_of_range && ptr == last && scalars_detail::isBelowOne(token)) {
        return token.front() == '-' ? -T{0} : T{0};
    }
    if(ec == std::errc::result_out_of_range) {
        return std::unexpected(scalars_detail::rangeError(token));
    }
    if(ec != std::errc{} || ptr != last || first == last) {
        return std::unexpected(scalars_detail::syntaxError(token));
    }
    return value;
}

// 1, t, T, TRUE, true, True and their false counterparts.
constexpr std::expected<bool, ErrorCause> ParseCanonicalBool(std::string_view token) {
    if(token == "1" || token == "t" || token == "T" || token == "TRUE" || token == "true" || token == "True") {
        return true;
    }
    if(token == "0" || token == "f" || token == "F" || token == "FALSE" || token == "false" || token == "False") {
        return false;
    }
    return std::unexpected(ErrorCause{ValueError::invalid_bool, "parsing \"" + std::string(token) + "\": invalid syntax"});
}

// Canonical spellings first; "on"/"off" only as a fallback for checkbox
// inputs.
constexpr std::expected<bool, ErrorCause> ParseBool(std::string_view token) {
    if(token == "on") return true;
    if(token == "off") return false;
    return ParseCanonicalBool(token);
}

} // namespace FormFusion
