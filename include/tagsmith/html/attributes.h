#pragma once
#include <tagsmith/dom/attribute.h>
#include <tagsmith/dom/argument.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tagsmith::html {

// Scalar accepted as an attribute value: text or a number.
class AttributeValue {
public:
    AttributeValue(std::string text) : text_(std::move(text)) {}
    AttributeValue(std::string_view text) : text_(text) {}
    AttributeValue(const char* text) : text_(text ? text : "") {}

    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    AttributeValue(T number) : text_(dom::number_to_text(number)) {}

    const std::string& str() const { return text_; }

private:
    std::string text_;
};

// Attribute under a canonical name, enrolled in the active scope.
dom::Attribute make_attribute(std::string name, const AttributeValue& value);
dom::Attribute make_attribute(std::string name, const AttributeValue& value, dom::AttributeKind kind);
dom::Attribute make_boolean_attribute(std::string name);

// Keyword-style construction; the keyword goes through
// normalize_attribute_name: attr("class_", "main"), attr("data_row", 1).
dom::Attribute attr(std::string_view keyword, const AttributeValue& value);
// true gives a boolean attribute, false gives nothing.
std::optional<dom::Attribute> flag(std::string_view keyword, bool present);

template <typename B, std::enable_if_t<std::is_same_v<B, bool>, int> = 0>
std::optional<dom::Attribute> attr(std::string_view keyword, B present) {
    return flag(keyword, present);
}

// Space-separated class list.
template <typename... Values>
dom::Attribute Class(const Values&... values) {
    std::initializer_list<AttributeValue> tokens = {AttributeValue(values)...};
    std::string joined;
    for (const auto& value : tokens) {
        if (!joined.empty()) joined += ' ';
        joined += value.str();
    }
    return make_attribute("class", joined, dom::AttributeKind::TokenList);
}

// Inline style from "property: value;" text or from property/value pairs;
// property names are dash-normalized (font_size -> font-size).
dom::Attribute Style_(std::string_view declarations);
dom::Attribute Style_(std::initializer_list<std::pair<std::string_view, AttributeValue>> properties);

// data-<name>; an empty name gives plain "data".
dom::Attribute Data_(std::string_view name, const AttributeValue& value);
// aria-<name>
dom::Attribute Aria_(std::string_view name, const AttributeValue& value);

#define TAGSMITH_VALUE_ATTRIBUTE(Name, attribute_name)                   \
    inline dom::Attribute Name(const AttributeValue& value) {           \
        return make_attribute(attribute_name, value);                    \
    }

#define TAGSMITH_BOOLEAN_ATTRIBUTE(Name, attribute_name)                 \
    inline dom::Attribute Name() {                                       \
        return make_boolean_attribute(attribute_name);                   \
    }

TAGSMITH_VALUE_ATTRIBUTE(Accept, "accept")
TAGSMITH_VALUE_ATTRIBUTE(AcceptCharset, "accept-charset")
TAGSMITH_VALUE_ATTRIBUTE(Accesskey, "accesskey")
TAGSMITH_VALUE_ATTRIBUTE(Action, "action")
TAGSMITH_VALUE_ATTRIBUTE(Alt, "alt")
TAGSMITH_VALUE_ATTRIBUTE(Autocomplete, "autocomplete")
TAGSMITH_VALUE_ATTRIBUTE(Charset, "charset")
TAGSMITH_VALUE_ATTRIBUTE(Cite_, "cite")
TAGSMITH_VALUE_ATTRIBUTE(Cols, "cols")
TAGSMITH_VALUE_ATTRIBUTE(Colspan, "colspan")
TAGSMITH_VALUE_ATTRIBUTE(Content, "content")
TAGSMITH_VALUE_ATTRIBUTE(Contenteditable, "contenteditable")
TAGSMITH_VALUE_ATTRIBUTE(Coords, "coords")
TAGSMITH_VALUE_ATTRIBUTE(Datetime, "datetime")
TAGSMITH_VALUE_ATTRIBUTE(Dir_, "dir")
TAGSMITH_VALUE_ATTRIBUTE(Dirname, "dirname")
TAGSMITH_VALUE_ATTRIBUTE(Download, "download")
TAGSMITH_VALUE_ATTRIBUTE(Draggable, "draggable")
TAGSMITH_VALUE_ATTRIBUTE(Enctype, "enctype")
TAGSMITH_VALUE_ATTRIBUTE(Enterkeyhint, "enterkeyhint")
TAGSMITH_VALUE_ATTRIBUTE(For, "for")
TAGSMITH_VALUE_ATTRIBUTE(Form_, "form")
TAGSMITH_VALUE_ATTRIBUTE(Formaction, "formaction")
TAGSMITH_VALUE_ATTRIBUTE(Headers, "headers")
TAGSMITH_VALUE_ATTRIBUTE(Height, "height")
TAGSMITH_VALUE_ATTRIBUTE(Hidden, "hidden")
TAGSMITH_VALUE_ATTRIBUTE(High, "high")
TAGSMITH_VALUE_ATTRIBUTE(Href, "href")
TAGSMITH_VALUE_ATTRIBUTE(Hreflang, "hreflang")
TAGSMITH_VALUE_ATTRIBUTE(HttpEquiv, "http-equiv")
TAGSMITH_VALUE_ATTRIBUTE(Id, "id")
TAGSMITH_VALUE_ATTRIBUTE(Inputmode, "inputmode")
TAGSMITH_VALUE_ATTRIBUTE(Kind, "kind")
TAGSMITH_VALUE_ATTRIBUTE(Label_, "label")
TAGSMITH_VALUE_ATTRIBUTE(Lang, "lang")
TAGSMITH_VALUE_ATTRIBUTE(List, "list")
TAGSMITH_VALUE_ATTRIBUTE(Low, "low")
TAGSMITH_VALUE_ATTRIBUTE(Max, "max")
TAGSMITH_VALUE_ATTRIBUTE(Maxlength, "maxlength")
TAGSMITH_VALUE_ATTRIBUTE(Media, "media")
TAGSMITH_VALUE_ATTRIBUTE(Method, "method")
TAGSMITH_VALUE_ATTRIBUTE(Min, "min")
TAGSMITH_VALUE_ATTRIBUTE(Name, "name")
TAGSMITH_VALUE_ATTRIBUTE(Onabort, "onabort")
TAGSMITH_VALUE_ATTRIBUTE(Onafterprint, "onafterprint")
TAGSMITH_VALUE_ATTRIBUTE(Onbeforeprint, "onbeforeprint")
TAGSMITH_VALUE_ATTRIBUTE(Onbeforeunload, "onbeforeunload")
TAGSMITH_VALUE_ATTRIBUTE(Onblur, "onblur")
TAGSMITH_VALUE_ATTRIBUTE(Oncanplay, "oncanplay")
TAGSMITH_VALUE_ATTRIBUTE(Oncanplaythrough, "oncanplaythrough")
TAGSMITH_VALUE_ATTRIBUTE(Onchange, "onchange")
TAGSMITH_VALUE_ATTRIBUTE(Onclick, "onclick")
TAGSMITH_VALUE_ATTRIBUTE(Oncontextmenu, "oncontextmenu")
TAGSMITH_VALUE_ATTRIBUTE(Oncopy, "oncopy")
TAGSMITH_VALUE_ATTRIBUTE(Oncuechange, "oncuechange")
TAGSMITH_VALUE_ATTRIBUTE(Oncut, "oncut")
TAGSMITH_VALUE_ATTRIBUTE(Ondblclick, "ondblclick")
TAGSMITH_VALUE_ATTRIBUTE(Ondrag, "ondrag")
TAGSMITH_VALUE_ATTRIBUTE(Ondragend, "ondragend")
TAGSMITH_VALUE_ATTRIBUTE(Ondragenter, "ondragenter")
TAGSMITH_VALUE_ATTRIBUTE(Ondragleave, "ondragleave")
TAGSMITH_VALUE_ATTRIBUTE(Ondragover, "ondragover")
TAGSMITH_VALUE_ATTRIBUTE(Ondragstart, "ondragstart")
TAGSMITH_VALUE_ATTRIBUTE(Ondrop, "ondrop")
TAGSMITH_VALUE_ATTRIBUTE(Ondurationchange, "ondurationchange")
TAGSMITH_VALUE_ATTRIBUTE(Onemptied, "onemptied")
TAGSMITH_VALUE_ATTRIBUTE(Onended, "onended")
TAGSMITH_VALUE_ATTRIBUTE(Onerror, "onerror")
TAGSMITH_VALUE_ATTRIBUTE(Onfocus, "onfocus")
TAGSMITH_VALUE_ATTRIBUTE(Onhashchange, "onhashchange")
TAGSMITH_VALUE_ATTRIBUTE(Oninput, "oninput")
TAGSMITH_VALUE_ATTRIBUTE(Oninvalid, "oninvalid")
TAGSMITH_VALUE_ATTRIBUTE(Onkeydown, "onkeydown")
TAGSMITH_VALUE_ATTRIBUTE(Onkeypress, "onkeypress")
TAGSMITH_VALUE_ATTRIBUTE(Onkeyup, "onkeyup")
TAGSMITH_VALUE_ATTRIBUTE(Onload, "onload")
TAGSMITH_VALUE_ATTRIBUTE(Onloadeddata, "onloadeddata")
TAGSMITH_VALUE_ATTRIBUTE(Onloadedmetadata, "onloadedmetadata")
TAGSMITH_VALUE_ATTRIBUTE(Onloadstart, "onloadstart")
TAGSMITH_VALUE_ATTRIBUTE(Onmousedown, "onmousedown")
TAGSMITH_VALUE_ATTRIBUTE(Onmousemove, "onmousemove")
TAGSMITH_VALUE_ATTRIBUTE(Onmouseout, "onmouseout")
TAGSMITH_VALUE_ATTRIBUTE(Onmouseover, "onmouseover")
TAGSMITH_VALUE_ATTRIBUTE(Onmouseup, "onmouseup")
TAGSMITH_VALUE_ATTRIBUTE(Onmousewheel, "onmousewheel")
TAGSMITH_VALUE_ATTRIBUTE(Onoffline, "onoffline")
TAGSMITH_VALUE_ATTRIBUTE(Ononline, "ononline")
TAGSMITH_VALUE_ATTRIBUTE(Onpageshow, "onpageshow")
TAGSMITH_VALUE_ATTRIBUTE(Onpaste, "onpaste")
TAGSMITH_VALUE_ATTRIBUTE(Onpause, "onpause")
TAGSMITH_VALUE_ATTRIBUTE(Onplay, "onplay")
TAGSMITH_VALUE_ATTRIBUTE(Onplaying, "onplaying")
TAGSMITH_VALUE_ATTRIBUTE(Onprogress, "onprogress")
TAGSMITH_VALUE_ATTRIBUTE(Onratechange, "onratechange")
TAGSMITH_VALUE_ATTRIBUTE(Onreset, "onreset")
TAGSMITH_VALUE_ATTRIBUTE(Onresize, "onresize")
TAGSMITH_VALUE_ATTRIBUTE(Onscroll, "onscroll")
TAGSMITH_VALUE_ATTRIBUTE(Onsearch, "onsearch")
TAGSMITH_VALUE_ATTRIBUTE(Onseeked, "onseeked")
TAGSMITH_VALUE_ATTRIBUTE(Onseeking, "onseeking")
TAGSMITH_VALUE_ATTRIBUTE(Onselect, "onselect")
TAGSMITH_VALUE_ATTRIBUTE(Onstalled, "onstalled")
TAGSMITH_VALUE_ATTRIBUTE(Onsubmit, "onsubmit")
TAGSMITH_VALUE_ATTRIBUTE(Onsuspend, "onsuspend")
TAGSMITH_VALUE_ATTRIBUTE(Ontimeupdate, "ontimeupdate")
TAGSMITH_VALUE_ATTRIBUTE(Ontoggle, "ontoggle")
TAGSMITH_VALUE_ATTRIBUTE(Onunload, "onunload")
TAGSMITH_VALUE_ATTRIBUTE(Onvolumechange, "onvolumechange")
TAGSMITH_VALUE_ATTRIBUTE(Onwaiting, "onwaiting")
TAGSMITH_VALUE_ATTRIBUTE(Onwheel, "onwheel")
TAGSMITH_VALUE_ATTRIBUTE(Optimum, "optimum")
TAGSMITH_VALUE_ATTRIBUTE(Pattern, "pattern")
TAGSMITH_VALUE_ATTRIBUTE(Placeholder, "placeholder")
TAGSMITH_VALUE_ATTRIBUTE(Popover, "popover")
TAGSMITH_VALUE_ATTRIBUTE(Popovertarget, "popovertarget")
TAGSMITH_VALUE_ATTRIBUTE(Popovertargetaction, "popovertargetaction")
TAGSMITH_VALUE_ATTRIBUTE(Poster, "poster")
TAGSMITH_VALUE_ATTRIBUTE(Preload, "preload")
TAGSMITH_VALUE_ATTRIBUTE(Rel, "rel")
TAGSMITH_VALUE_ATTRIBUTE(Rows, "rows")
TAGSMITH_VALUE_ATTRIBUTE(Rowspan, "rowspan")
TAGSMITH_VALUE_ATTRIBUTE(Sandbox, "sandbox")
TAGSMITH_VALUE_ATTRIBUTE(Scope_, "scope")
TAGSMITH_VALUE_ATTRIBUTE(Shape, "shape")
TAGSMITH_VALUE_ATTRIBUTE(Size, "size")
TAGSMITH_VALUE_ATTRIBUTE(Sizes, "sizes")
TAGSMITH_VALUE_ATTRIBUTE(Span_, "span")
TAGSMITH_VALUE_ATTRIBUTE(Spellcheck, "spellcheck")
TAGSMITH_VALUE_ATTRIBUTE(Src, "src")
TAGSMITH_VALUE_ATTRIBUTE(Srcdoc, "srcdoc")
TAGSMITH_VALUE_ATTRIBUTE(Srclang, "srclang")
TAGSMITH_VALUE_ATTRIBUTE(Srcset, "srcset")
TAGSMITH_VALUE_ATTRIBUTE(Start, "start")
TAGSMITH_VALUE_ATTRIBUTE(Step, "step")
TAGSMITH_VALUE_ATTRIBUTE(Tabindex, "tabindex")
TAGSMITH_VALUE_ATTRIBUTE(Target, "target")
TAGSMITH_VALUE_ATTRIBUTE(Title_, "title")
TAGSMITH_VALUE_ATTRIBUTE(Translate, "translate")
TAGSMITH_VALUE_ATTRIBUTE(Type, "type")
TAGSMITH_VALUE_ATTRIBUTE(Usemap, "usemap")
TAGSMITH_VALUE_ATTRIBUTE(Value, "value")
TAGSMITH_VALUE_ATTRIBUTE(Width, "width")
TAGSMITH_VALUE_ATTRIBUTE(Wrap, "wrap")

TAGSMITH_BOOLEAN_ATTRIBUTE(Async, "async")
TAGSMITH_BOOLEAN_ATTRIBUTE(Autofocus, "autofocus")
TAGSMITH_BOOLEAN_ATTRIBUTE(Autoplay, "autoplay")
TAGSMITH_BOOLEAN_ATTRIBUTE(Checked, "checked")
TAGSMITH_BOOLEAN_ATTRIBUTE(Controls, "controls")
TAGSMITH_BOOLEAN_ATTRIBUTE(Default, "default")
TAGSMITH_BOOLEAN_ATTRIBUTE(Defer, "defer")
TAGSMITH_BOOLEAN_ATTRIBUTE(Disabled, "disabled")
TAGSMITH_BOOLEAN_ATTRIBUTE(Inert, "inert")
TAGSMITH_BOOLEAN_ATTRIBUTE(Ismap, "ismap")
TAGSMITH_BOOLEAN_ATTRIBUTE(Loop, "loop")
TAGSMITH_BOOLEAN_ATTRIBUTE(Multiple, "multiple")
TAGSMITH_BOOLEAN_ATTRIBUTE(Muted, "muted")
TAGSMITH_BOOLEAN_ATTRIBUTE(Novalidate, "novalidate")
TAGSMITH_BOOLEAN_ATTRIBUTE(Open, "open")
TAGSMITH_BOOLEAN_ATTRIBUTE(Readonly, "readonly")
TAGSMITH_BOOLEAN_ATTRIBUTE(Required, "required")
TAGSMITH_BOOLEAN_ATTRIBUTE(Reversed, "reversed")
TAGSMITH_BOOLEAN_ATTRIBUTE(Selected, "selected")

#undef TAGSMITH_VALUE_ATTRIBUTE
#undef TAGSMITH_BOOLEAN_ATTRIBUTE

} // namespace tagsmith::html
