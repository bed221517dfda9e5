#pragma once
#include <memory>
#include <string>
#include <vector>

namespace tagsmith::render {
struct RenderOptions;
}

namespace tagsmith::query {
class Query;
}

namespace tagsmith::dom {

enum class NodeType {
    Element, Text, Comment, Container
};

class Node;
class ParentNode;
using NodePtr = std::shared_ptr<Node>;

class Node : public std::enable_shared_from_this<Node> {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    // Non-copyable; use clone() for a deep copy
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    ParentNode* parent() const { return parent_; }

    // Deep copy with no parent. Copies never join a scope.
    virtual NodePtr clone() const = 0;

    // Removes this node from its parent's children, if it has a parent.
    void detach();

    // True when `other` is this node or one of its ancestors.
    bool is_self_or_descendant_of(const Node& other) const;

    // Text content (recursive, unescaped)
    virtual std::string text_content() const = 0;

    std::string display(bool pretty = true) const;
    std::string display(const render::RenderOptions& options) const;
    std::string to_string() const { return display(true); }

    // Pre-order search including this node.
    std::vector<NodePtr> find(const query::Query& query);

protected:
    friend class ParentNode;

    NodeType type_;
    ParentNode* parent_ = nullptr;
};

} // namespace tagsmith::dom
