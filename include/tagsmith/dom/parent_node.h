#pragma once
#include <tagsmith/dom/argument.h>
#include <tagsmith/dom/node.h>

#include <cstddef>
#include <utility>
#include <vector>

namespace tagsmith::dom {

// Shared composition behaviour of Element, Comment and Container: ordered
// children with index access, and argument classification for add().
//
// A node has at most one parent. Attaching a node that already has one
// moves it; attaching a node to itself attaches a deep copy; attaching an
// ancestor is an IllegalCompositionError.
class ParentNode : public Node {
public:
    explicit ParentNode(NodeType type);
    ~ParentNode() override;

    // Classifies each argument (node, attribute, text, sequence) and
    // attaches it. Validation happens before any change, so a failing call
    // leaves this node as it was.
    template <typename... Args>
    ParentNode& add(Args&&... args) {
        add_all({Argument(std::forward<Args>(args))...});
        return *this;
    }
    virtual void add_all(const std::vector<Argument>& arguments);

    const std::vector<NodePtr>& children() const { return children_; }
    size_t child_count() const { return children_.size(); }
    bool empty() const { return children_.empty(); }

    // Index access; out-of-range indices throw std::out_of_range.
    const NodePtr& child(size_t index) const;
    const NodePtr& operator[](size_t index) const { return child(index); }

    // Replaces the child at `index`; the previous child loses its parent.
    void set_child(size_t index, const Argument& value);
    void insert_child(size_t index, const Argument& value);
    NodePtr remove_child(size_t index);

    Node& append_child(NodePtr child);

    // Removes `child` from this node; returns it (null if not a child).
    NodePtr take_child(const Node& child);

    void clear_children();

    std::string text_content() const override;

    virtual bool accepts_children() const { return true; }
    virtual bool accepts_attributes() const { return false; }

protected:
    // Only called once accepts_attributes() said yes.
    virtual void merge_attribute(const Attribute& attribute);

    // Deep-copies this node's children into `target`.
    void clone_children_into(ParentNode& target) const;

private:
    // Single node from an index assignment (text is wrapped).
    NodePtr node_from_argument(const Argument& value, const char* stage) const;
    NodePtr prepare_child(NodePtr child, const char* stage) const;
    void attach_at(NodePtr child, size_t index);

    std::vector<NodePtr> children_;
};

} // namespace tagsmith::dom
