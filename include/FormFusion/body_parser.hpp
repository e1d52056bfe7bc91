#pragma once

#include <string>
#include <string_view>

#include <absl/time/time.h>

#include "content_type.hpp"
#include "decode_options.hpp"
#include "decode_result.hpp"
#include "field_kind.hpp"
#include "form_decoder.hpp"
#include "form_value.hpp"
#include "json.hpp"
#include "urlencoded.hpp"
#include "xml.hpp"

namespace FormFusion {

namespace body_detail {

inline DecodeResult unsupportedContentType(std::string_view mediaType) {
    return withError(DecodeErrorKind::INVALID_CONTENT_TYPE, "", ValueError::unsupported_content_type,
                     "unsupported content type: " + std::string(mediaType));
}

} // namespace body_detail


// Decodes a raw request body. JSON and XML go straight to their document
// binders; URL-encoded bodies are parsed, normalised and walked field by
// field. Multipart bodies must be split by the caller and passed as
// FormValues instead.
template<class T>
DecodeResult BodyParser(T & dst, std::string_view contentType, std::string_view body, const DecodeOptions & opts = {}) {
    if constexpr (!static_schema::FormRecord<T>) {
        return form_detail::notARecord();
    } else {
        const std::string media = MediaType(contentType);
        if(media == content_type::ApplicationJSON) {
            return DecodeJson(dst, body);
        }
        if(media == content_type::ApplicationXML) {
            return DecodeXml(dst, body);
        }
        if(media == content_type::ApplicationForm) {
            auto values = ParseUrlEncoded(body);
            if(!values) {
                return withParseFailure("", std::move(values.error()));
            }
            return DecodeForm(dst, NormalizeForm(*values), opts);
        }
        if(media == content_type::MultipartForm) {
            return withParseFailure("", ErrorCause{ValueError::multipart_not_preparsed,
                "multipart bodies must be passed as parsed form values"});
        }
        return body_detail::unsupportedContentType(media);
    }
}

// Decodes form fields the caller already extracted from a URL-encoded or
// multipart request.
template<class T>
DecodeResult BodyParser(T & dst, std::string_view contentType, const FormValues & values, const DecodeOptions & opts = {}) {
    if constexpr (!static_schema::FormRecord<T>) {
        return form_detail::notARecord();
    } else {
        const std::string media = MediaType(contentType);
        if(media == content_type::ApplicationForm || media == content_type::MultipartForm) {
            return DecodeForm(dst, NormalizeForm(values), opts);
        }
        return body_detail::unsupportedContentType(media);
    }
}

template<class T>
DecodeResult BodyParser(T * dst, std::string_view contentType, std::string_view body, const DecodeOptions & opts = {}) {
    if(!dst) {
        return form_detail::notARecord();
    }
    return BodyParser(*dst, contentType, body, opts);
}

template<class T>
DecodeResult BodyParser(T * dst, std::string_view contentType, const FormValues & values, const DecodeOptions & opts = {}) {
    if(!dst) {
        return form_detail::notARecord();
    }
    return BodyParser(*dst, contentType, values, opts);
}


// Query strings keep lone empty values, so "?n=" reaches an int field and
// fails there instead of being skipped.
template<class T>
DecodeResult QueryParser(T & dst, const FormValues & values, std::string_view tag = kQueryTag,
                         absl::TimeZone timezone = absl::UTCTimeZone()) {
    DecodeOptions opts;
    opts.tagName = tag;
    opts.timezone = timezone;
    return DecodeForm(dst, NormalizeQuery(values), opts);
}

template<class T>
DecodeResult QueryParser(T & dst, std::string_view rawQuery, std::string_view tag = kQueryTag,
                         absl::TimeZone timezone = absl::UTCTimeZone()) {
    if constexpr (!static_schema::FormRecord<T>) {
        return form_detail::notARecord();
    } else {
        if(!rawQuery.empty() && rawQuery.front() == '?') {
            rawQuery.remove_prefix(1);
        }
        auto values = ParseUrlEncoded(rawQuery);
        if(!values) {
            return withParseFailure("", std::move(values.error()));
        }
        return QueryParser(dst, *values, tag, timezone);
    }
}

template<class T>
DecodeResult QueryParser(T * dst, std::string_view rawQuery, std::string_view tag = kQueryTag,
                         absl::TimeZone timezone = absl::UTCTimeZone()) {
    if(!dst) {
        return form_detail::notARecord();
    }
    return QueryParser(*dst, rawQuery, tag, timezone);
}

} // namespace FormFusion
