#include <tagsmith/dom/parent_node.h>
#include <tagsmith/dom/scope.h>

#include "report.h"

#include <algorithm>
#include <stdexcept>

namespace tagsmith::dom {

namespace {

constexpr size_t kAppend = static_cast<size_t>(-1);

} // namespace

ParentNode::ParentNode(NodeType type) : Node(type) {}

ParentNode::~ParentNode() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
}

void ParentNode::add_all(const std::vector<Argument>& arguments) {
    std::vector<NodePtr> nodes;
    std::vector<Attribute> attributes;
    for (const auto& argument : arguments) {
        argument.collect(nodes, attributes);
    }

    if (!nodes.empty() && !accepts_children()) {
        fail<core::IllegalCompositionError>("add", describe(*this) + " cannot contain child nodes");
    }
    if (!attributes.empty() && !accepts_attributes()) {
        fail<core::IllegalCompositionError>("add", describe(*this) + " cannot carry attributes");
    }
    for (auto& node : nodes) {
        node = prepare_child(std::move(node), "add");
    }

    for (auto& node : nodes) {
        attach_at(std::move(node), kAppend);
    }
    for (const auto& attribute : attributes) {
        merge_attribute(attribute);
        if (attribute.scope_token() != 0) {
            ScopeStack::current().withdraw(attribute.scope_token());
        }
    }
}

const NodePtr& ParentNode::child(size_t index) const {
    if (index >= children_.size()) {
        fail<std::out_of_range>("index", "child index " + std::to_string(index)
            + " out of range for " + describe(*this) + " with "
            + std::to_string(children_.size()) + " children");
    }
    return children_[index];
}

void ParentNode::set_child(size_t index, const Argument& value) {
    const NodePtr& previous_ref = child(index);
    NodePtr node = prepare_child(node_from_argument(value, "set"), "set");
    NodePtr previous = previous_ref;
    if (node == previous) {
        return;
    }

    if (node->parent_ == this) {
        children_.erase(std::find(children_.begin(), children_.end(), node));
    } else if (node->parent_) {
        core::diagnostics().emit(core::Severity::Info, "compose", "reparent",
            "moving " + describe(*node) + " into " + describe(*this));
        node->parent_->take_child(*node);
    }

    auto slot = std::find(children_.begin(), children_.end(), previous);
    previous->parent_ = nullptr;
    node->parent_ = this;
    *slot = node;
    ScopeStack::current().withdraw(*node);
}

void ParentNode::insert_child(size_t index, const Argument& value) {
    if (index > children_.size()) {
        fail<std::out_of_range>("index", "insert position " + std::to_string(index)
            + " out of range for " + describe(*this) + " with "
            + std::to_string(children_.size()) + " children");
    }
    if (!accepts_children()) {
        fail<core::IllegalCompositionError>("insert", describe(*this) + " cannot contain child nodes");
    }
    attach_at(prepare_child(node_from_argument(value, "insert"), "insert"), index);
}

NodePtr ParentNode::remove_child(size_t index) {
    NodePtr removed = child(index);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
    removed->parent_ = nullptr;
    return removed;
}

Node& ParentNode::append_child(NodePtr child) {
    if (!child) {
        fail<core::TypeMismatchError>("append", "cannot append a null node");
    }
    if (!accepts_children()) {
        fail<core::IllegalCompositionError>("append", describe(*this) + " cannot contain child nodes");
    }
    child = prepare_child(std::move(child), "append");
    Node& attached = *child;
    attach_at(std::move(child), kAppend);
    return attached;
}

NodePtr ParentNode::take_child(const Node& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const NodePtr& c) { return c.get() == &child; });
    if (it == children_.end()) {
        return nullptr;
    }
    NodePtr taken = std::move(*it);
    children_.erase(it);
    taken->parent_ = nullptr;
    return taken;
}

void ParentNode::clear_children() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
    children_.clear();
}

std::string ParentNode::text_content() const {
    std::string result;
    for (const auto& child : children_) {
        result += child->text_content();
    }
    return result;
}

void ParentNode::merge_attribute(const Attribute& attribute) {
    fail<core::IllegalCompositionError>("add", describe(*this) + " cannot carry attribute '"
        + attribute.name() + "'");
}

void ParentNode::clone_children_into(ParentNode& target) const {
    for (const auto& child : children_) {
        target.attach_at(child->clone(), kAppend);
    }
}

NodePtr ParentNode::node_from_argument(const Argument& value, const char* stage) const {
    std::vector<NodePtr> nodes;
    std::vector<Attribute> attributes;
    value.collect(nodes, attributes);
    if (!attributes.empty() || nodes.size() != 1) {
        fail<core::TypeMismatchError>(stage, "index assignment into " + describe(*this)
            + " needs exactly one node or text value");
    }
    return nodes.front();
}

NodePtr ParentNode::prepare_child(NodePtr child, const char* stage) const {
    if (child.get() == this) {
        return child->clone();
    }
    if (is_self_or_descendant_of(*child)) {
        fail<core::IllegalCompositionError>(stage, "cannot insert " + describe(*child)
            + " below its own descendant " + describe(*this));
    }
    return child;
}

void ParentNode::attach_at(NodePtr child, size_t index) {
    if (child->parent_ == this) {
        auto it = std::find(children_.begin(), children_.end(), child);
        size_t current = static_cast<size_t>(it - children_.begin());
        children_.erase(it);
        if (index != kAppend && current < index) {
            --index;
        }
    } else if (child->parent_) {
        core::diagnostics().emit(core::Severity::Info, "compose", "reparent",
            "moving " + describe(*child) + " into " + describe(*this));
        child->parent_->take_child(*child);
    }

    child->parent_ = this;
    Node& attached = *child;
    if (index == kAppend || index >= children_.size()) {
        children_.push_back(std::move(child));
    } else {
        children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    }
    ScopeStack::current().withdraw(attached);
}

} // namespace tagsmith::dom
