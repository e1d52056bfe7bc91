#pragma once

#include <array>
#include <expected>
#include <string>
#include <string_view>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "decode_result.hpp"

namespace FormFusion {

// Tried in this order by ParseTime; the first that matches wins.
inline constexpr std::array<std::string_view, 7> kTimeFormats = {
    "%Y-%m-%d%ET%H:%M:%E*S%Ez",   // RFC 3339
    "%Y-%m-%d%ET%H:%M:%E3S%Ez",   // RFC 3339 with milliseconds (JSON)
    "%Y-%m-%dT%H:%M",             // HTML datetime-local, no seconds
    "%Y-%m-%dT%H:%M:%E*S",
    "%Y-%m-%d %H:%M:%E*S",
    "%Y-%m-%d",                   // HTML date
    "%H:%M:%S",                   // HTML time
};

inline constexpr std::size_t kTimeOnlyFormatIndex = 6;

namespace time_detail {

// A bare clock time lands on 0000-01-01 in the given zone rather than on
// Abseil's default date of 1970-01-01.
inline absl::Time anchorTimeOnly(absl::Time t, absl::TimeZone tz) {
    const absl::CivilSecond cs = absl::ToCivilSecond(t, tz);
    return absl::FromCivil(absl::CivilSecond(0, 1, 1, cs.hour(), cs.minute(), cs.second()), tz);
}

inline ErrorCause timeError(std::string_view value, const std::string & err) {
    return ErrorCause{ValueError::invalid_time, "parsing time \"" + std::string(value) + "\": " + err};
}

constexpr bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

constexpr bool takeDigits(std::string_view & s, std::size_t minWidth, std::size_t maxWidth) {
    std::size_t n = 0;
    while(n < maxWidth && n < s.size() && isDigit(s[n])) {
        n ++;
    }
    if(n < minWidth) {
        return false;
    }
    s.remove_prefix(n);
    return true;
}

constexpr bool takeChar(std::string_view & s, char c) {
    if(s.empty() || s.front() != c) {
        return false;
    }
    s.remove_prefix(1);
    return true;
}

// Optional ".ddd..." after the seconds field.
constexpr bool takeFraction(std::string_view & s) {
    if(!takeChar(s, '.')) {
        return true;
    }
    return takeDigits(s, 1, std::string_view::npos);
}

// "Z" or "+hh:mm" / "-hh:mm".
constexpr bool takeOffset(std::string_view & s) {
    if(takeChar(s, 'Z')) {
        return true;
    }
    if(!takeChar(s, '+') && !takeChar(s, '-')) {
        return false;
    }
    return takeDigits(s, 2, 2) && takeChar(s, ':') && takeDigits(s, 2, 2);
}

// Checks field widths and literals for the directives used in kTimeFormats.
// absl::ParseTime alone also takes unpadded fields, surrounding spaces and
// the "infinite-future"/"infinite-past" spellings.
constexpr bool MatchesLayout(std::string_view format, std::string_view value) {
    while(!format.empty()) {
        if(format.front() != '%') {
            if(!takeChar(value, format.front())) {
                return false;
            }
            format.remove_prefix(1);
            continue;
        }
        format.remove_prefix(1);
        bool ok = false;
        if(format.starts_with("E*S") || format.starts_with("E3S")) {
            ok = takeDigits(value, 2, 2) && takeFraction(value);
            format.remove_prefix(3);
        } else if(format.starts_with("Ez")) {
            ok = takeOffset(value);
            format.remove_prefix(2);
        } else if(format.starts_with("ET")) {
            ok = takeChar(value, 'T');
            format.remove_prefix(2);
        } else if(format.starts_with("Y")) {
            ok = takeDigits(value, 4, 4);
            format.remove_prefix(1);
        } else if(format.starts_with("H")) {
            ok = takeDigits(value, 1, 2);
            format.remove_prefix(1);
        } else if(format.starts_with("m") || format.starts_with("d") || format.starts_with("M") || format.starts_with("S")) {
            ok = takeDigits(value, 2, 2);
            format.remove_prefix(1);
        }
        if(!ok) {
            return false;
        }
    }
    return value.empty();
}

inline bool parseLayout(std::string_view format, std::string_view value, absl::TimeZone tz, absl::Time * out, std::string * err) {
    if(!MatchesLayout(format, value)) {
        *err = "cannot parse \"" + std::string(value) + "\" as \"" + std::string(format) + "\"";
        return false;
    }
    if(!absl::ParseTime(absl::string_view(format.data(), format.size()), absl::string_view(value.data(), value.size()), tz, out, err)) {
        return false;
    }
    if(*out == absl::InfiniteFuture() || *out == absl::InfinitePast()) {
        *err = "time out of range";
        return false;
    }
    return true;
}

} // namespace time_detail


// Zone-less inputs are interpreted in `timezone`.
inline std::expected<absl::Time, ErrorCause> ParseTime(std::string_view value, absl::TimeZone timezone = absl::UTCTimeZone()) {
    std::string err;
    for(std::size_t i = 0; i < kTimeFormats.size(); i ++) {
        absl::Time t;
        if(time_detail::parseLayout(kTimeFormats[i], value, timezone, &t, &err)) {
            if(i == kTimeOnlyFormatIndex) {
                return time_detail::anchorTimeOnly(t, timezone);
            }
            return t;
        }
    }
    return std::unexpected(time_detail::timeError(value, err));
}

// RFC 3339 with optional fractional seconds, the layout JSON and XML
// documents carry.
inline std::expected<absl::Time, ErrorCause> ParseRFC3339(std::string_view value) {
    absl::Time t;
    std::string err;
    if(!time_detail::parseLayout(kTimeFormats[0], value, absl::UTCTimeZone(), &t, &err)) {
        return std::unexpected(time_detail::timeError(value, err));
    }
    return t;
}

// One explicit Abseil format string, zone given by IANA name ("" means UTC).
inline std::expected<absl::Time, ErrorCause> ParseTimeFormat(std::string_view value, std::string_view format, std::string_view timezoneName = "UTC") {
    absl::TimeZone tz = absl::UTCTimeZone();
    if(!timezoneName.empty() && !absl::LoadTimeZone(std::string(timezoneName), &tz)) {
        return std::unexpected(ErrorCause{ValueError::unknown_time_zone, "unknown time zone " + std::string(timezoneName)});
    }
    absl::Time t;
    std::string err;
    if(!absl::ParseTime(absl::string_view(format.data(), format.size()), absl::string_view(value.data(), value.size()), tz, &t, &err)) {
        return std::unexpected(time_detail::timeError(value, err));
    }
    if(t == absl::InfiniteFuture() || t == absl::InfinitePast()) {
        return std::unexpected(time_detail::timeError(value, "time out of range"));
    }
    return t;
}

} // namespace FormFusion
