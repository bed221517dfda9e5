#pragma once
#include <tagsmith/dom/attribute.h>

#include <string>
#include <string_view>

namespace tagsmith::html {

// Keyword form to canonical attribute name: camel humps and underscores
// become dashes, everything is lowercased and leading/trailing dashes are
// dropped. "class_" -> "class", "acceptCharset" -> "accept-charset",
// "data_row" -> "data-row".
std::string normalize_attribute_name(std::string_view keyword);

// Same rules for CSS property names, except that a leading "--" (custom
// property) is kept: "font_size" -> "font-size", "--main_color" stays
// "--main-color".
std::string normalize_property_name(std::string_view keyword);

// Merge kind of a canonical attribute name: Boolean for presence-only
// attributes, TokenList for space-separated lists, Style for "style",
// Value otherwise.
dom::AttributeKind attribute_kind(std::string_view name);

} // namespace tagsmith::html
