#include <tagsmith/html/attribute_names.h>

#include <cctype>
#include <unordered_set>

namespace tagsmith::html {

namespace {

std::string dash_case(std::string_view keyword) {
    std::string result;
    result.reserve(keyword.size() + 4);
    for (char c : keyword) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isupper(uc)) {
            if (!result.empty() && result.back() != '-') {
                result += '-';
            }
            result += static_cast<char>(std::tolower(uc));
        } else if (c == '_') {
            result += '-';
        } else {
            result += c;
        }
    }
    return result;
}

std::string trim_dashes(const std::string& text) {
    size_t begin = text.find_first_not_of('-');
    if (begin == std::string::npos) return std::string();
    size_t end = text.find_last_not_of('-');
    return text.substr(begin, end - begin + 1);
}

const std::unordered_set<std::string>& boolean_attributes() {
    static const std::unordered_set<std::string> names = {
        "async", "autofocus", "autoplay", "checked", "controls", "default",
        "defer", "disabled", "formnovalidate", "hidden", "inert", "ismap",
        "loop", "multiple", "muted", "nomodule", "novalidate", "open",
        "readonly", "required", "reversed", "selected"
    };
    return names;
}

const std::unordered_set<std::string>& token_list_attributes() {
    static const std::unordered_set<std::string> names = {
        "class", "rel", "headers", "accesskey", "sizes", "sandbox"
    };
    return names;
}

} // namespace

std::string normalize_attribute_name(std::string_view keyword) {
    return trim_dashes(dash_case(keyword));
}

std::string normalize_property_name(std::string_view keyword) {
    std::string dashed = dash_case(keyword);
    if (dashed.compare(0, 2, "--") == 0) {
        std::string rest = trim_dashes(dashed);
        return rest.empty() ? std::string() : "--" + rest;
    }
    return trim_dashes(dashed);
}

dom::AttributeKind attribute_kind(std::string_view name) {
    std::string key(name);
    if (key == "style") return dom::AttributeKind::Style;
    if (boolean_attributes().count(key) > 0) return dom::AttributeKind::Boolean;
    if (token_list_attributes().count(key) > 0) return dom::AttributeKind::TokenList;
    return dom::AttributeKind::Value;
}

} // namespace tagsmith::html
