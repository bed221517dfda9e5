#include <tagsmith/html/tag_table.h>

#include <cctype>
#include <string>
#include <unordered_map>

namespace tagsmith::html {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

const std::unordered_map<std::string, const TagInfo*>& tag_index() {
    static const std::unordered_map<std::string, const TagInfo*> index = [] {
        std::unordered_map<std::string, const TagInfo*> map;
        for (const auto& info : all_tags()) {
            map.emplace(std::string(info.identifier), &info);
        }
        return map;
    }();
    return index;
}

} // namespace

const std::vector<TagInfo>& all_tags() {
    // identifier, rendered name, void, deprecated
    static const std::vector<TagInfo> tags = {
        {"html", "html", false, false},
        {"head", "head", false, false},
        {"title", "title", false, false},
        {"body", "body", false, false},
        {"h1", "h1", false, false},
        {"h2", "h2", false, false},
        {"h3", "h3", false, false},
        {"h4", "h4", false, false},
        {"h5", "h5", false, false},
        {"h6", "h6", false, false},
        {"paragraph", "p", false, false},
        {"p", "p", false, false},
        {"br", "br", true, false},
        {"hr", "hr", true, false},
        {"acronym", "acronym", false, true},
        {"abbr", "abbr", false, false},
        {"address", "address", false, false},
        {"b", "b", false, false},
        {"bdi", "bdi", false, false},
        {"bdo", "bdo", false, false},
        {"big", "big", false, true},
        {"blockquote", "blockquote", false, false},
        {"center", "center", false, true},
        {"cite", "cite", false, false},
        {"code", "code", false, false},
        {"del", "del", false, false},
        {"dfn", "dfn", false, false},
        {"em", "em", false, false},
        {"font", "font", false, true},
        {"i", "i", false, false},
        {"ins", "ins", false, false},
        {"kbd", "kbd", false, false},
        {"mark", "mark", false, false},
        {"meter", "meter", false, false},
        {"pre", "pre", false, false},
        {"progress", "progress", false, false},
        {"q", "q", false, false},
        {"rp", "rp", false, false},
        {"rt", "rt", false, false},
        {"ruby", "ruby", false, false},
        {"s", "s", false, false},
        {"samp", "samp", false, false},
        {"small", "small", false, false},
        {"strike", "strike", false, true},
        {"strong", "strong", false, false},
        {"sub", "sub", false, false},
        {"sup", "sup", false, false},
        {"template", "template", false, false},
        {"time", "time", false, false},
        {"tt", "tt", false, true},
        {"u", "u", false, false},
        {"var", "var", false, false},
        {"wbr", "wbr", true, false},
        {"form", "form", false, false},
        {"input", "input", true, false},
        {"textarea", "textarea", false, false},
        {"button", "button", false, false},
        {"select", "select", false, false},
        {"optgroup", "optgroup", false, false},
        {"option", "option", false, false},
        {"label", "label", false, false},
        {"fieldset", "fieldset", false, false},
        {"legend", "legend", false, false},
        {"datalist", "datalist", false, false},
        {"output", "output", false, false},
        {"frame", "frame", false, true},
        {"frameset", "frameset", false, true},
        {"noframes", "noframes", false, true},
        {"iframe", "iframe", false, false},
        {"img", "img", true, false},
        {"map", "map", false, false},
        {"area", "area", true, false},
        {"canvas", "canvas", false, false},
        {"figcaption", "figcaption", false, false},
        {"figure", "figure", false, false},
        {"picture", "picture", false, false},
        {"svg", "svg", false, false},
        {"audio", "audio", false, false},
        {"source", "source", true, false},
        {"track", "track", true, false},
        {"video", "video", false, false},
        {"a", "a", false, false},
        {"link", "link", true, false},
        {"nav", "nav", false, false},
        {"menu", "menu", false, false},
        {"ul", "ul", false, false},
        {"ol", "ol", false, false},
        {"li", "li", false, false},
        {"dir", "dir", false, true},
        {"dl", "dl", false, false},
        {"dt", "dt", false, false},
        {"dd", "dd", false, false},
        {"caption", "caption", false, false},
        {"td", "td", false, false},
        {"tr", "tr", false, false},
        {"th", "th", false, false},
        {"tfoot", "tfoot", false, false},
        {"tbody", "tbody", false, false},
        {"thead", "thead", false, false},
        {"col", "col", true, false},
        {"colgroup", "colgroup", false, false},
        {"table", "table", false, false},
        {"style", "style", false, false},
        {"div", "div", false, false},
        {"span", "span", false, false},
        {"header", "header", false, false},
        {"hgroup", "hgroup", false, false},
        {"footer", "footer", false, false},
        {"main", "main", false, false},
        {"section", "section", false, false},
        {"search", "search", false, false},
        {"article", "article", false, false},
        {"aside", "aside", false, false},
        {"details", "details", false, false},
        {"dialog", "dialog", false, false},
        {"summary", "summary", false, false},
        {"data", "data", false, false},
        {"meta", "meta", true, false},
        {"base", "base", true, false},
        {"basefont", "basefont", false, true},
        {"script", "script", false, false},
        {"noscript", "noscript", false, false},
        {"applet", "applet", false, true},
        {"embed", "embed", true, false},
        {"object", "object", false, false},
        {"param", "param", true, false},
    };
    return tags;
}

const TagInfo* lookup_tag(std::string_view identifier) {
    const auto& index = tag_index();
    auto it = index.find(lowercase(identifier));
    if (it == index.end()) return nullptr;
    return it->second;
}

bool is_void_tag(std::string_view identifier) {
    const TagInfo* info = lookup_tag(identifier);
    return info != nullptr && info->is_void;
}

} // namespace tagsmith::html
