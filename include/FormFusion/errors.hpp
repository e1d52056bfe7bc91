#pragma once

#include <string_view>
namespace FormFusion {


enum class DecodeErrorKind {
    NO_ERROR,
    INVALID_CONTENT_TYPE,
    INVALID_TARGET_SHAPE,
    REQUIRED_FIELD_MISSING,
    UNSUPPORTED_FIELD_TYPE,
    PARSE_FAILURE
};

// Machine readable names, stable across releases.
constexpr std::string_view error_to_string(DecodeErrorKind e) {
    switch(e) {
    case DecodeErrorKind::NO_ERROR: return "no_error"; break;
    case DecodeErrorKind::INVALID_CONTENT_TYPE: return "invalid_content_type"; break;
    case DecodeErrorKind::INVALID_TARGET_SHAPE: return "invalid_struct_pointer"; break;
    case DecodeErrorKind::REQUIRED_FIELD_MISSING: return "required_field_missing"; break;
    case DecodeErrorKind::UNSUPPORTED_FIELD_TYPE: return "unsupported_type"; break;
    case DecodeErrorKind::PARSE_FAILURE: return "parse_error"; break;
    }
    return "N/A";
}


// ============================================================================
// Value errors: what went wrong underneath a DecodeErrorKind
// ============================================================================

enum class ValueError {
    none,
    invalid_syntax,
    value_out_of_range,
    invalid_bool,
    invalid_time,
    unknown_time_zone,
    scanner_rejected,
    invalid_url_encoding,
    multipart_not_preparsed,
    malformed_document,
    document_type_mismatch,
    target_not_record,
    unsupported_content_type,
    unsupported_type,
    missing_value
};

constexpr std::string_view value_error_to_string(ValueError e) {
    switch(e) {
    case ValueError::none                    : return "none"; break;
    case ValueError::invalid_syntax          : return "invalid_syntax"; break;
    case ValueError::value_out_of_range      : return "value_out_of_range"; break;
    case ValueError::invalid_bool            : return "invalid_bool"; break;
    case ValueError::invalid_time            : return "invalid_time"; break;
    case ValueError::unknown_time_zone       : return "unknown_time_zone"; break;
    case ValueError::scanner_rejected        : return "scanner_rejected"; break;
    case ValueError::invalid_url_encoding    : return "invalid_url_encoding"; break;
    case ValueError::multipart_not_preparsed : return "multipart_not_preparsed"; break;
    case ValueError::malformed_document      : return "malformed_document"; break;
    case ValueError::document_type_mismatch  : return "document_type_mismatch"; break;
    case ValueError::target_not_record       : return "target_not_record"; break;
    case ValueError::unsupported_content_type: return "unsupported_content_type"; break;
    case ValueError::unsupported_type        : return "unsupported_type"; break;
    case ValueError::missing_value           : return "missing_value"; break;
    }
    return "N/A";
}

} // namespace FormFusion
