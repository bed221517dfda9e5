#include <tagsmith/dom/container.h>

namespace tagsmith::dom {

Container::Container() : ParentNode(NodeType::Container) {}

NodePtr Container::clone() const {
    auto copy = std::make_shared<Container>();
    clone_children_into(*copy);
    return copy;
}

} // namespace tagsmith::dom
