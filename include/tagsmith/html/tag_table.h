#pragma once
#include <string_view>
#include <vector>

namespace tagsmith::html {

struct TagInfo {
    std::string_view identifier;  // lookup key, e.g. "paragraph"
    std::string_view name;        // rendered tag name, e.g. "p"
    bool is_void = false;         // never has children or a closing tag
    bool deprecated = false;      // not part of HTML5
};

// Case-insensitive lookup by identifier; null for unknown tags.
const TagInfo* lookup_tag(std::string_view identifier);

bool is_void_tag(std::string_view identifier);

const std::vector<TagInfo>& all_tags();

} // namespace tagsmith::html
