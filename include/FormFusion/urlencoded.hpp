#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "decode_result.hpp"
#include "form_value.hpp"

namespace FormFusion {

namespace urlencoded_detail {

constexpr int hexValue(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline ErrorCause encodingError(std::string detail) {
    return ErrorCause{ValueError::invalid_url_encoding, std::move(detail)};
}

// '+' is a space, %XX an escaped byte.
inline std::expected<std::string, ErrorCause> Unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for(std::size_t i = 0; i < s.size(); i ++) {
        const char c = s[i];
        if(c == '+') {
            out.push_back(' ');
        } else if(c == '%') {
            if(i + 2 >= s.size()) {
                return std::unexpected(encodingError("invalid URL escape \"" + std::string(s.substr(i)) + "\""));
            }
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if(hi < 0 || lo < 0) {
                return std::unexpected(encodingError("invalid URL escape \"" + std::string(s.substr(i, 3)) + "\""));
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace urlencoded_detail


// Decodes an application/x-www-form-urlencoded body or a raw query string.
// Values keep their arrival order under each key.
inline std::expected<FormValues, ErrorCause> ParseUrlEncoded(std::string_view body) {
    FormValues values;
    while(!body.empty()) {
        const std::size_t amp = body.find('&');
        std::string_view pair = body.substr(0, amp);
        body = amp == std::string_view::npos ? std::string_view{} : body.substr(amp + 1);

        if(pair.find(';') != std::string_view::npos) {
            return std::unexpected(urlencoded_detail::encodingError("invalid semicolon separator in query"));
        }
        if(pair.empty()) {
            continue;
        }
        const std::size_t eq = pair.find('=');
        auto key = urlencoded_detail::Unescape(pair.substr(0, eq));
        if(!key) {
            return std::unexpected(std::move(key.error()));
        }
        auto value = urlencoded_detail::Unescape(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        if(!value) {
            return std::unexpected(std::move(value.error()));
        }
        values[std::move(*key)].push_back(std::move(*value));
    }
    return values;
}

} // namespace FormFusion
