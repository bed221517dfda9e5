#pragma once
#include <tagsmith/dom/attribute.h>
#include <tagsmith/dom/parent_node.h>
#include <tagsmith/dom/scope.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tagsmith::dom {

class Element;
using ElementPtr = std::shared_ptr<Element>;

// Tagged node with an insertion-ordered attribute list and children.
// Void elements (br, img, ...) never hold children.
class Element : public ParentNode {
public:
    // `tag` is looked up in the tag table for its rendered name and void
    // flag; unknown tags render as given and are not void.
    explicit Element(const std::string& tag);
    Element(std::string tag, bool is_void);

    // Builds an element, attaches `args` and enrols it in the active scope.
    template <typename... Args>
    static ElementPtr create(const std::string& tag, Args&&... args) {
        auto element = std::make_shared<Element>(tag);
        element->add_all({Argument(std::forward<Args>(args))...});
        ScopeStack::current().enrol(element);
        return element;
    }

    const std::string& tag_name() const { return tag_name_; }
    bool is_void() const { return is_void_; }

    // Attributes. Names go through html::normalize_attribute_name, so
    // "class_" and "accept_charset" address class and accept-charset.
    const std::vector<Attribute>& attributes() const { return attributes_; }
    const Attribute& attribute(std::string_view name) const;
    const Attribute* find_attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    // Create or replace; never merges.
    void set_attribute(std::string_view name, const std::string& value);
    void set_attribute(Attribute attribute);
    // Sets a boolean attribute when `present`, removes it otherwise.
    void toggle_attribute(std::string_view name, bool present);
    // Absent names are ignored.
    void remove_attribute(std::string_view name);

    using ParentNode::operator[];
    const Attribute& operator[](std::string_view name) const { return attribute(name); }

    NodePtr clone() const override;

    bool accepts_children() const override { return !is_void_; }
    bool accepts_attributes() const override { return true; }

protected:
    void merge_attribute(const Attribute& attribute) override;

private:
    std::string tag_name_;
    bool is_void_ = false;
    std::vector<Attribute> attributes_;

    Attribute* find_mutable(std::string_view normalized_name);
};

} // namespace tagsmith::dom
