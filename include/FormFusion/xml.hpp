#pragma once

#include <climits>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "decode_options.hpp"
#include "decode_result.hpp"
#include "field_kind.hpp"
#include "form_value.hpp"
#include "options.hpp"
#include "scalars.hpp"
#include "scanner.hpp"
#include "struct_introspection.hpp"
#include "time.hpp"
#include "tag_resolver.hpp"

namespace FormFusion {

namespace xml_detail {

struct DocDeleter {
    void operator()(xmlDoc * doc) const {
        xmlFreeDoc(doc);
    }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

// Owns strings handed out by libxml2.
inline std::string takeString(xmlChar * s) {
    if(!s) return {};
    std::string out(reinterpret_cast<const char*>(s));
    xmlFree(s);
    return out;
}

inline bool isElementNamed(const xmlNode * n, std::string_view name) {
    return n->type == XML_ELEMENT_NODE
        && std::string_view(reinterpret_cast<const char*>(n->name)) == name;
}

// Text directly inside the element, children's text excluded.
inline std::string charData(const xmlNode * el) {
    std::string out;
    for(const xmlNode * c = el->children; c; c = c->next) {
        if((c->type == XML_TEXT_NODE || c->type == XML_CDATA_SECTION_NODE) && c->content) {
            out += reinterpret_cast<const char*>(c->content);
        }
    }
    return out;
}

inline ErrorCause unsupported(std::string_view name, FieldKind kind) {
    return ErrorCause{ValueError::unsupported_type,
        "xml: cannot decode into \"" + std::string(name) + "\" of kind " + std::string(kind_to_string(kind))};
}

template<class T, class Parsed>
ErrorCause store(T & target, Parsed && parsed) {
    if(!parsed) {
        return std::move(parsed.error());
    }
    target = static_cast<T>(*parsed);
    return {};
}

template<class T>
void allocate(T & target) {
    if(!target) {
        if constexpr (static_schema::is_specialization_of_v<T, std::optional>) {
            target.emplace();
        } else {
            target = std::make_unique<static_schema::pointee_t<T>>();
        }
    }
}

// Converts text from an attribute, a chardata run or a leaf element.
template<class T>
ErrorCause ReadText(T & target, const std::string & text, std::string_view name) {
    using namespace static_schema;
    constexpr FieldKind kind = kind_of<T>();

    if constexpr (FormScannable<T>) {
        if(ScanResult r = Scan(target, FormValue{text}); !r) {
            return ErrorCause{ValueError::scanner_rejected, std::move(r.error())};
        }
        return {};
    } else if constexpr (FormPointerLike<T>) {
        allocate(target);
        return ReadText(*target, text, name);
    } else if constexpr (kind == FieldKind::String) {
        target = text;
        return {};
    } else if constexpr (kind == FieldKind::Sequence) {
        T grown = target;
        typename T::value_type element{};
        if(ErrorCause err = ReadText(element, text, name)) {
            return err;
        }
        grown.push_back(std::move(element));
        target = std::move(grown);
        return {};
    } else if constexpr (kind == FieldKind::Record || kind == FieldKind::Unsupported) {
        return unsupported(name, kind);
    } else {
        const std::string_view trimmed = TrimSpace(text);
        if constexpr (kind == FieldKind::Temporal) {
            return store(target, ParseRFC3339(trimmed));
        } else {
            if(trimmed.empty()) {
                target = T{};
                return {};
            }
            if constexpr (kind == FieldKind::Bool) {
                return store(target, ParseCanonicalBool(trimmed));
            } else if constexpr (kind == FieldKind::Int) {
                return store(target, ParseInteger<numeric_storage_t<T>>(trimmed));
            } else if constexpr (kind == FieldKind::Uint) {
                return store(target, ParseUnsigned<numeric_storage_t<T>>(trimmed));
            } else {
                return store(target, ParseFloat<T>(trimmed));
            }
        }
    }
}

template<class T>
ErrorCause ReadElement(T & target, const xmlNode * el, std::string_view name);

template<class T>
ErrorCause ReadRecord(T & dst, const xmlNode * el) {
    ErrorCause err;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (void)(([&] {
            using Tags = introspection::FieldTags<T, I>;
            using V = introspection::FieldValueType<T, I>;
            const DocumentKey key = ResolveDocumentKey(introspection::structureElementNameByIndex<I, T>,
                                                       Tags::entries, kXmlTag);
            if(key.skip) return true;
            auto & field = introspection::fieldValueRef<I>(dst);

            if(key.has("attr")) {
                xmlChar * raw = xmlGetProp(el, reinterpret_cast<const xmlChar*>(key.name.c_str()));
                if(raw) {
                    err = ReadText(field, takeString(raw), key.name);
                }
            } else if(key.has("chardata")) {
                err = ReadText(field, charData(el), key.name);
            } else if constexpr (static_schema::kind_of<V>() == FieldKind::Sequence
                                 && !static_schema::FormScannable<static_schema::unwrapped_t<V>>) {
                bool seen = false;
                static_schema::unwrapped_t<V> grown;
                for(const xmlNode * c = el->children; c && !err; c = c->next) {
                    if(!isElementNamed(c, key.name)) continue;
                    if(!seen) {
                        seen = true;
                        if constexpr (static_schema::FormPointerLike<V>) {
                            if(field) grown = *field;
                        } else {
                            grown = field;
                        }
                    }
                    typename static_schema::unwrapped_t<V>::value_type element{};
                    err = ReadElement(element, c, key.name);
                    if(!err) grown.push_back(std::move(element));
                }
                if(seen && !err) {
                    if constexpr (static_schema::FormPointerLike<V>) {
                        allocate(field);
                        *field = std::move(grown);
                    } else {
                        field = std::move(grown);
                    }
                }
            } else {
                for(const xmlNode * c = el->children; c && !err; c = c->next) {
                    if(isElementNamed(c, key.name)) {
                        err = ReadElement(field, c, key.name);
                    }
                }
            }
            return !err;
        }()) && ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    return err;
}

template<class T>
ErrorCause ReadElement(T & target, const xmlNode * el, std::string_view name) {
    using namespace static_schema;
    constexpr FieldKind kind = kind_of<T>();

    if constexpr (FormScannable<T>) {
        return ReadText(target, takeString(xmlNodeGetContent(el)), name);
    } else if constexpr (FormPointerLike<T>) {
        allocate(target);
        return ReadElement(*target, el, name);
    } else if constexpr (kind == FieldKind::Record) {
        return ReadRecord(target, el);
    } else if constexpr (kind == FieldKind::Sequence || kind == FieldKind::Unsupported) {
        return unsupported(name, kind);
    } else {
        return ReadText(target, takeString(xmlNodeGetContent(el)), name);
    }
}

inline std::string lastErrorMessage() {
    const xmlError * e = xmlGetLastError();
    if(!e || !e->message) {
        return "malformed document";
    }
    std::string msg(TrimSpace(e->message));
    return msg + " at line " + std::to_string(e->line);
}

} // namespace xml_detail


// Binds an XML document onto the destination. The root element stands for the
// destination whatever its name; fields map to child elements, or to
// attributes and text of the root through the "attr" and "chardata" xml tag
// modifiers.
template<class T>
DecodeResult DecodeXml(T & dst, std::string_view body) {
    static_assert(static_schema::FormRecord<T>,
                  "[[[ FormFusion ]]] DecodeXml<T> needs an aggregate or a StructMeta<T> registration");
    if(body.size() > static_cast<std::size_t>(INT_MAX)) {
        return withParseFailure("", ErrorCause{ValueError::malformed_document, "xml: document too large"});
    }
    xmlResetLastError();
    xml_detail::DocPtr doc(xmlReadMemory(body.data(), static_cast<int>(body.size()), nullptr, nullptr,
                                         XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if(!doc) {
        return withParseFailure("", ErrorCause{ValueError::malformed_document, "xml: " + xml_detail::lastErrorMessage()});
    }
    const xmlNode * root = xmlDocGetRootElement(doc.get());
    if(!root) {
        return withParseFailure("", ErrorCause{ValueError::malformed_document, "xml: document has no root element"});
    }
    if(ErrorCause cause = xml_detail::ReadRecord(dst, root)) {
        return withParseFailure("", std::move(cause));
    }
    return DecodeResult::success();
}

} // namespace FormFusion
