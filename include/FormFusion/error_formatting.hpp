#pragma once

#include <string>

#include "decode_result.hpp"
#include "errors.hpp"

namespace FormFusion {

// BodyParser error: field="Age" kind=parse_error, err=parsing "x": invalid syntax
inline std::string DecodeResultToString(const DecodeResult & res) {
    if(res) {
        return "BodyParser: no error";
    }
    std::string out = "BodyParser error: field=\"" + res.field() + "\" kind=";
    out += error_to_string(res.kind());
    out += ", err=";
    out += res.cause().detail.empty() ? std::string(value_error_to_string(res.cause().code)) : res.cause().detail;
    return out;
}

} // namespace FormFusion
