#include <tagsmith/dom/node.h>
#include <tagsmith/dom/comment.h>
#include <tagsmith/dom/element.h>
#include <tagsmith/dom/parent_node.h>
#include <tagsmith/query/matcher.h>
#include <tagsmith/render/serializer.h>

#include "report.h"

namespace tagsmith::dom {

Node::Node(NodeType type) : type_(type) {}

Node::~Node() = default;

void Node::detach() {
    if (parent_) {
        parent_->take_child(*this);
    }
}

bool Node::is_self_or_descendant_of(const Node& other) const {
    for (const Node* node = this; node != nullptr; node = node->parent_) {
        if (node == &other) {
            return true;
        }
    }
    return false;
}

std::string Node::display(bool pretty) const {
    render::RenderOptions options;
    options.pretty = pretty;
    return render::render(*this, options);
}

std::string Node::display(const render::RenderOptions& options) const {
    return render::render(*this, options);
}

std::vector<NodePtr> Node::find(const query::Query& query) {
    return query::find(shared_from_this(), query);
}

std::string describe(const Node& node) {
    switch (node.node_type()) {
        case NodeType::Element:
            return "<" + static_cast<const Element&>(node).tag_name() + "> element";
        case NodeType::Text:
            return "text node";
        case NodeType::Comment:
            return "comment";
        case NodeType::Container:
            return "container";
    }
    return "node";
}

} // namespace tagsmith::dom
