#pragma once
#include <tagsmith/dom/container.h>
#include <tagsmith/dom/node.h>

namespace tagsmith::dom {

// Sibling merge. If either side already is a Container the other side is
// added to it (appended for the left one, prepended for the right one) and
// that Container is returned; otherwise a new Container [lhs, rhs].
ContainerPtr operator+(const NodePtr& lhs, const NodePtr& rhs);

// Container of `count` independent deep copies of `node`. `count` must be
// positive (std::invalid_argument otherwise). The operand itself is left
// where it is and withdrawn from the active scope.
ContainerPtr operator*(const NodePtr& node, int count);
ContainerPtr operator*(int count, const NodePtr& node);

// Replication needs an integral count.
ContainerPtr operator*(const NodePtr& node, double count) = delete;
ContainerPtr operator*(double count, const NodePtr& node) = delete;

} // namespace tagsmith::dom
