#pragma once
#include <tagsmith/core/config.h>
#include <tagsmith/dom/attribute.h>
#include <tagsmith/dom/node.h>

#include <string>
#include <string_view>

namespace tagsmith::render {

// How a boolean attribute is written.
enum class BooleanStyle {
    Short,     // required
    Empty,     // required=""
    Repeated   // required="required"
};

struct RenderOptions {
    bool pretty = true;
    std::string indent = core::config::kDefaultIndent;
    std::string new_line = core::config::kDefaultNewLine;
    BooleanStyle boolean_style = BooleanStyle::Short;

    static RenderOptions compact() {
        RenderOptions options;
        options.pretty = false;
        return options;
    }
};

// Pretty output puts every tag, comment delimiter and text on its own line,
// indented one unit per depth; compact output adds no whitespace at all.
// Void elements have no closing tag; containers add no markup of their own.
std::string render(const dom::Node& root, const RenderOptions& options = RenderOptions());

// name="value", or the boolean form chosen by `style`.
std::string render_attribute(const dom::Attribute& attribute,
                             BooleanStyle style = BooleanStyle::Short);

// & < > in character data
std::string escape_text(std::string_view text);
// & " in attribute values
std::string escape_attribute(std::string_view value);

} // namespace tagsmith::render
