#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "form_value.hpp"
#include "options.hpp"

namespace FormFusion {

namespace tag_detail {

constexpr char toLowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// A separator goes before every uppercase letter but the first; runs of
// capitals and digits are not grouped.
constexpr std::string splitCamel(std::string_view s, char sep) {
    std::string res;
    res.reserve(s.size() + s.size() / 2);
    for(std::size_t i = 0; i < s.size(); i ++) {
        const char c = s[i];
        if(i > 0 && c >= 'A' && c <= 'Z') {
            res.push_back(sep);
        }
        res.push_back(toLowerAscii(c));
    }
    return res;
}

// Missing and empty tags are the same thing to the resolver.
constexpr const options::TagEntry* findNonEmpty(std::span<const options::TagEntry> tags, std::string_view name) {
    for(const options::TagEntry & t : tags) {
        if(t.name == name) {
            return t.value.empty() ? nullptr : &t;
        }
    }
    return nullptr;
}

} // namespace tag_detail

constexpr std::string SnakeCase(std::string_view s) {
    return tag_detail::splitCamel(s, '_');
}

constexpr std::string KebabCase(std::string_view s) {
    return tag_detail::splitCamel(s, '-');
}

struct ResolvedKey {
    std::string key;
    bool required = false;
};

// Key precedence: active tag, then fallback tag, then SnakeCase(fieldName).
// The first comma separated token is the key, even when empty; a "required"
// modifier or a required<"true"> marker makes the field mandatory.
constexpr ResolvedKey ResolveKey(std::string_view fieldName,
                                 std::span<const options::TagEntry> tags,
                                 std::string_view activeTag,
                                 std::string_view fallbackTag) {
    ResolvedKey resolved;

    const options::TagEntry * chosen = tag_detail::findNonEmpty(tags, activeTag);
    if(!chosen) {
        chosen = tag_detail::findNonEmpty(tags, fallbackTag);
    }
    if(chosen) {
        const std::vector<std::string> tokens = SplitList(chosen->value);
        resolved.key = tokens.front();
        for(std::size_t i = 1; i < tokens.size(); i ++) {
            if(tokens[i] == "required") {
                resolved.required = true;
            }
        }
    } else {
        resolved.key = SnakeCase(fieldName);
    }

    for(const options::TagEntry & t : tags) {
        if(t.name == "required") {
            resolved.required = resolved.required || t.value == "true";
            break;
        }
    }
    return resolved;
}

// Key of a field inside a JSON or XML document. Only the format's own tag is
// consulted; an empty key falls back to the declared field name and "-"
// hides the field from the document.
struct DocumentKey {
    std::string name;
    std::vector<std::string> modifiers;
    bool skip = false;

    constexpr bool has(std::string_view modifier) const {
        for(const std::string & m : modifiers) {
            if(m == modifier) return true;
        }
        return false;
    }
};

constexpr DocumentKey ResolveDocumentKey(std::string_view fieldName,
                                         std::span<const options::TagEntry> tags,
                                         std::string_view formatTag) {
    DocumentKey key;
    const options::TagEntry * t = tag_detail::findNonEmpty(tags, formatTag);
    if(!t) {
        key.name = std::string(fieldName);
        return key;
    }
    if(t->value == "-") {
        key.skip = true;
        return key;
    }
    std::vector<std::string> tokens = SplitList(t->value);
    key.name = tokens.front().empty() ? std::string(fieldName) : tokens.front();
    key.modifiers.assign(tokens.begin() + 1, tokens.end());
    return key;
}

} // namespace FormFusion
