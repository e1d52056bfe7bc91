#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace FormFusion {

// One looked-up entry: a bare token, or every token sent under the key in
// arrival order.
using FormValue = std::variant<std::string, std::vector<std::string>>;

// Raw multi-valued form as produced by URL decoding or by the caller's
// multipart parser.
using FormValues = std::map<std::string, std::vector<std::string>, std::less<>>;

// Normalised input the field walker reads.
using FormData = std::unordered_map<std::string, FormValue>;


constexpr bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr std::string_view TrimSpace(std::string_view s) {
    while(!s.empty() && isAsciiSpace(s.front())) s.remove_prefix(1);
    while(!s.empty() && isAsciiSpace(s.back())) s.remove_suffix(1);
    return s;
}

// "1, 2, 3" -> {"1", "2", "3"}. An empty string still yields one empty
// token, as a plain split would.
constexpr std::vector<std::string> SplitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    while(true) {
        const std::size_t pos = s.find(sep);
        out.emplace_back(TrimSpace(s.substr(0, pos)));
        if(pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return out;
}

// Body forms: keys without values and single empty values are dropped so the
// destination keeps its default.
inline FormData NormalizeForm(const FormValues & values) {
    FormData data;
    data.reserve(values.size());
    for(const auto & [key, list] : values) {
        if(list.empty()) {
            continue;
        }
        if(list.size() == 1) {
            if(list.front().empty()) {
                continue;
            }
            data.emplace(key, list.front());
        } else {
            data.emplace(key, list);
        }
    }
    return data;
}

// Query strings keep single empty values, so "?n=" reaches the field.
inline FormData NormalizeQuery(const FormValues & values) {
    FormData data;
    data.reserve(values.size());
    for(const auto & [key, list] : values) {
        if(list.size() == 1) {
            data.emplace(key, list.front());
        } else {
            data.emplace(key, list);
        }
    }
    return data;
}

} // namespace FormFusion
