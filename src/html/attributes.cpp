#include <tagsmith/html/attributes.h>
#include <tagsmith/html/attribute_names.h>
#include <tagsmith/dom/scope.h>

namespace tagsmith::html {

namespace {

dom::Attribute enrolled(dom::Attribute attribute) {
    dom::ScopeStack::current().enrol(attribute);
    return attribute;
}

std::string prefixed_name(const char* prefix, std::string_view name) {
    std::string suffix = normalize_attribute_name(name);
    if (suffix.empty()) return prefix;
    return std::string(prefix) + "-" + suffix;
}

} // namespace

dom::Attribute make_attribute(std::string name, const AttributeValue& value) {
    dom::AttributeKind kind = attribute_kind(name);
    if (kind == dom::AttributeKind::Boolean) {
        kind = dom::AttributeKind::Value;
    }
    return make_attribute(std::move(name), value, kind);
}

dom::Attribute make_attribute(std::string name, const AttributeValue& value, dom::AttributeKind kind) {
    return enrolled(dom::Attribute(std::move(name), value.str(), kind));
}

dom::Attribute make_boolean_attribute(std::string name) {
    return enrolled(dom::Attribute::boolean(std::move(name)));
}

dom::Attribute attr(std::string_view keyword, const AttributeValue& value) {
    return make_attribute(normalize_attribute_name(keyword), value);
}

std::optional<dom::Attribute> flag(std::string_view keyword, bool present) {
    if (!present) return std::nullopt;
    return make_boolean_attribute(normalize_attribute_name(keyword));
}

dom::Attribute Style_(std::string_view declarations) {
    return make_attribute("style", AttributeValue(declarations), dom::AttributeKind::Style);
}

dom::Attribute Style_(std::initializer_list<std::pair<std::string_view, AttributeValue>> properties) {
    std::string declarations;
    for (const auto& [property, value] : properties) {
        declarations += normalize_property_name(property);
        declarations += ": ";
        declarations += value.str();
        declarations += ';';
    }
    return make_attribute("style", AttributeValue(declarations), dom::AttributeKind::Style);
}

dom::Attribute Data_(std::string_view name, const AttributeValue& value) {
    return make_attribute(prefixed_name("data", name), value, dom::AttributeKind::Value);
}

dom::Attribute Aria_(std::string_view name, const AttributeValue& value) {
    return make_attribute(prefixed_name("aria", name), value, dom::AttributeKind::Value);
}

} // namespace tagsmith::html
