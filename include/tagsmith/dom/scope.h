#pragma once
#include <tagsmith/dom/attribute.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>

namespace tagsmith::dom {

class Node;
class Element;

// Stack of open elements for scoped construction.
//
// While an element is on top, nodes and attributes made by the factories
// are enrolled in its frame. Attaching an enrolled item anywhere withdraws
// it. When the frame is popped, whatever is still enrolled is added to the
// element in construction order.
//
// Each thread has its own current stack; an Activation makes another stack
// current for its lifetime.
class ScopeStack {
public:
    ScopeStack() = default;
    ~ScopeStack();

    ScopeStack(const ScopeStack&) = delete;
    ScopeStack& operator=(const ScopeStack&) = delete;

    static ScopeStack& current();

    class Activation {
    public:
        explicit Activation(ScopeStack& stack);
        ~Activation();

        Activation(const Activation&) = delete;
        Activation& operator=(const Activation&) = delete;

    private:
        ScopeStack* previous_;
    };

    bool empty() const { return frames_.empty(); }
    size_t depth() const { return frames_.size(); }
    Element* top() const;

    // Pushing a void element is an IllegalCompositionError.
    void push(std::shared_ptr<Element> element);
    // Commits the top frame's enrolled items to its element.
    void pop();

    // No-ops while the stack is empty.
    void enrol(std::shared_ptr<Node> node);
    void enrol(Attribute& attribute);

    void withdraw(const Node& node);
    void withdraw(std::uint64_t attribute_token);

    // Items currently waiting in the top frame.
    size_t pending() const;

private:
    struct Entry {
        std::shared_ptr<Node> node;
        std::optional<Attribute> attribute;
    };

    struct Frame {
        std::shared_ptr<Element> element;
        std::vector<Entry> entries;
    };

    std::vector<Frame> frames_;
    std::uint64_t next_token_ = 1;
};

// Enters one or more elements for the lifetime of the object. Elements
// are pushed left to right; each one after the first is enrolled under its
// predecessor if it has no parent, so Scope{p, span} nests span in p.
// Frames are popped in reverse order on every exit path.
class Scope {
public:
    explicit Scope(std::shared_ptr<Element> element);
    Scope(std::initializer_list<std::shared_ptr<Element>> elements);
    Scope(ScopeStack& stack, std::initializer_list<std::shared_ptr<Element>> elements);
    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

private:
    ScopeStack& stack_;
    size_t pushed_ = 0;
};

} // namespace tagsmith::dom
