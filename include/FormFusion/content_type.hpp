#pragma once

#include <string>
#include <string_view>

#include "form_value.hpp"

namespace FormFusion {

namespace content_type {

inline constexpr std::string_view ApplicationJSON  = "application/json";
inline constexpr std::string_view ApplicationXML   = "application/xml";
inline constexpr std::string_view ApplicationForm  = "application/x-www-form-urlencoded";
inline constexpr std::string_view MultipartForm    = "multipart/form-data";
inline constexpr std::string_view TextHTML         = "text/html";
inline constexpr std::string_view TextCSV          = "text/csv";
inline constexpr std::string_view TextPlain        = "text/plain";
inline constexpr std::string_view TextEventStream  = "text/event-stream";

} // namespace content_type

// "Application/JSON; charset=utf-8" -> "application/json"
constexpr std::string MediaType(std::string_view header) {
    std::string out(TrimSpace(header.substr(0, header.find(';'))));
    for(char & c : out) {
        if(c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // namespace FormFusion
