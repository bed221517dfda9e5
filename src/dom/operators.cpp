#include <tagsmith/dom/operators.h>
#include <tagsmith/dom/scope.h>

#include "report.h"

#include <stdexcept>

namespace tagsmith::dom {

ContainerPtr operator+(const NodePtr& lhs, const NodePtr& rhs) {
    if (!lhs || !rhs) {
        fail<core::TypeMismatchError>("merge", "cannot merge a null node");
    }
    if (lhs->node_type() == NodeType::Container) {
        auto group = std::static_pointer_cast<Container>(lhs);
        group->append_child(rhs);
        return group;
    }
    if (rhs->node_type() == NodeType::Container) {
        auto group = std::static_pointer_cast<Container>(rhs);
        group->insert_child(0, lhs);
        return group;
    }
    return Container::create(lhs, rhs);
}

ContainerPtr operator*(const NodePtr& node, int count) {
    if (!node) {
        fail<core::TypeMismatchError>("replicate", "cannot replicate a null node");
    }
    if (count <= 0) {
        fail<std::invalid_argument>("replicate", "replication count must be positive, got "
            + std::to_string(count));
    }
    if (!node->parent()) {
        ScopeStack::current().withdraw(*node);
    }
    auto group = Container::create();
    for (int i = 0; i < count; ++i) {
        group->append_child(node->clone());
    }
    return group;
}

ContainerPtr operator*(int count, const NodePtr& node) {
    return node * count;
}

} // namespace tagsmith::dom
