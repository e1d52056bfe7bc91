#pragma once

#include <string_view>

#include <absl/time/time.h>

namespace FormFusion {

inline constexpr std::string_view kFormTag  = "form";
inline constexpr std::string_view kQueryTag = "query";
inline constexpr std::string_view kJsonTag  = "json";
inline constexpr std::string_view kXmlTag   = "xml";

// Per-call settings. A default constructed value gives the stock behaviour:
// "form" keys, "json" as fallback, UTC for zone-less times.
struct DecodeOptions {
    std::string_view tagName = kFormTag;
    std::string_view fallbackTagName = kJsonTag;
    absl::TimeZone timezone = absl::UTCTimeZone();
};

} // namespace FormFusion
