#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"

namespace FormFusion {

struct ErrorCause {
    ValueError  code = ValueError::none;
    std::string detail;

    explicit operator bool() const {
        return code != ValueError::none;
    }
};

// Outcome of one decode call. Converts to true on success; on failure it
// names the kind, the declared C++ field (empty when the failure cannot be
// attributed to one) and the underlying cause.
class DecodeResult {
    DecodeErrorKind m_kind = DecodeErrorKind::NO_ERROR;
    std::string m_field;
    ErrorCause m_cause;

public:
    DecodeResult() = default;
    DecodeResult(DecodeErrorKind kind, std::string_view field, ErrorCause cause):
        m_kind(kind), m_field(field), m_cause(std::move(cause))
    {}

    static DecodeResult success() {
        return {};
    }

    explicit operator bool() const {
        return m_kind == DecodeErrorKind::NO_ERROR;
    }
    DecodeErrorKind kind() const {
        return m_kind;
    }
    const std::string & field() const {
        return m_field;
    }
    const ErrorCause & cause() const {
        return m_cause;
    }
};

inline DecodeResult withError(DecodeErrorKind kind, std::string_view field, ValueError code, std::string detail) {
    return DecodeResult(kind, field, ErrorCause{code, std::move(detail)});
}

inline DecodeResult withParseFailure(std::string_view field, ErrorCause cause) {
    return DecodeResult(DecodeErrorKind::PARSE_FAILURE, field, std::move(cause));
}

} // namespace FormFusion
