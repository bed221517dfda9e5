#include <tagsmith/dom/element.h>
#include <tagsmith/html/attribute_names.h>
#include <tagsmith/html/tag_table.h>

#include "report.h"

#include <algorithm>

namespace tagsmith::dom {

Element::Element(const std::string& tag)
    : ParentNode(NodeType::Element) {
    if (const auto* info = html::lookup_tag(tag)) {
        tag_name_ = std::string(info->name);
        is_void_ = info->is_void;
    } else {
        tag_name_ = tag;
    }
}

Element::Element(std::string tag, bool is_void)
    : ParentNode(NodeType::Element)
    , tag_name_(std::move(tag))
    , is_void_(is_void) {}

const Attribute& Element::attribute(std::string_view name) const {
    const Attribute* found = find_attribute(name);
    if (!found) {
        fail<core::NotFoundError>("lookup", "attribute '" + html::normalize_attribute_name(name)
            + "' does not exist on " + describe(*this));
    }
    return *found;
}

const Attribute* Element::find_attribute(std::string_view name) const {
    std::string key = html::normalize_attribute_name(name);
    for (auto& attr : attributes_) {
        if (attr.name() == key) {
            return &attr;
        }
    }
    return nullptr;
}

bool Element::has_attribute(std::string_view name) const {
    return find_attribute(name) != nullptr;
}

void Element::set_attribute(std::string_view name, const std::string& value) {
    std::string key = html::normalize_attribute_name(name);
    AttributeKind kind = html::attribute_kind(key);
    if (kind == AttributeKind::Boolean) {
        kind = AttributeKind::Value;
    }
    set_attribute(Attribute(std::move(key), value, kind));
}

void Element::set_attribute(Attribute attribute) {
    ScopeStack::current().withdraw(attribute.scope_token());
    attribute.set_scope_token(0);
    if (Attribute* existing = find_mutable(attribute.name())) {
        *existing = std::move(attribute);
        return;
    }
    attributes_.push_back(std::move(attribute));
}

void Element::toggle_attribute(std::string_view name, bool present) {
    if (present) {
        set_attribute(Attribute::boolean(html::normalize_attribute_name(name)));
    } else {
        remove_attribute(name);
    }
}

void Element::remove_attribute(std::string_view name) {
    std::string key = html::normalize_attribute_name(name);
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
        [&key](const Attribute& attr) { return attr.name() == key; });
    if (it != attributes_.end()) {
        attributes_.erase(it);
    }
}

NodePtr Element::clone() const {
    auto copy = std::make_shared<Element>(tag_name_, is_void_);
    for (const auto& attr : attributes_) {
        copy->set_attribute(attr);
    }
    clone_children_into(*copy);
    return copy;
}

void Element::merge_attribute(const Attribute& attribute) {
    if (Attribute* existing = find_mutable(attribute.name())) {
        existing->merge(attribute);
        return;
    }
    attributes_.push_back(attribute);
    attributes_.back().set_scope_token(0);
}

Attribute* Element::find_mutable(std::string_view normalized_name) {
    for (auto& attr : attributes_) {
        if (attr.name() == normalized_name) {
            return &attr;
        }
    }
    return nullptr;
}

} // namespace tagsmith::dom
