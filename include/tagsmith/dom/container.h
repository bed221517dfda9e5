#pragma once
#include <tagsmith/dom/parent_node.h>
#include <tagsmith/dom/scope.h>

#include <memory>

namespace tagsmith::dom {

class Container;
using ContainerPtr = std::shared_ptr<Container>;

// Untagged group of siblings; renders its children and nothing else.
class Container : public ParentNode {
public:
    Container();

    template <typename... Args>
    static ContainerPtr create(Args&&... args) {
        auto container = std::make_shared<Container>();
        container->add_all({Argument(std::forward<Args>(args))...});
        ScopeStack::current().enrol(container);
        return container;
    }

    NodePtr clone() const override;
};

} // namespace tagsmith::dom
