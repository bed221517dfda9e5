#include <tagsmith/dom/scope.h>
#include <tagsmith/dom/element.h>

#include "report.h"

#include <algorithm>

namespace tagsmith::dom {

namespace {

thread_local ScopeStack* active_stack = nullptr;

} // namespace

// ---------------------------------------------------------------------------
// ScopeStack
// ---------------------------------------------------------------------------

ScopeStack::~ScopeStack() = default;

ScopeStack& ScopeStack::current() {
    thread_local ScopeStack thread_stack;
    return active_stack ? *active_stack : thread_stack;
}

ScopeStack::Activation::Activation(ScopeStack& stack)
    : previous_(active_stack) {
    active_stack = &stack;
}

ScopeStack::Activation::~Activation() {
    active_stack = previous_;
}

Element* ScopeStack::top() const {
    if (frames_.empty()) return nullptr;
    return frames_.back().element.get();
}

void ScopeStack::push(std::shared_ptr<Element> element) {
    if (!element) {
        fail<core::TypeMismatchError>("scope", "cannot enter a null element");
    }
    if (element->is_void()) {
        fail<core::IllegalCompositionError>("scope", "cannot enter void " + describe(*element));
    }
    core::diagnostics().emit(core::Severity::Info, "scope", "enter", describe(*element));
    frames_.push_back({std::move(element), {}});
}

void ScopeStack::pop() {
    if (frames_.empty()) return;

    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    Element& element = *frame.element;

    for (auto& entry : frame.entries) {
        if (entry.node) {
            if (entry.node->parent()) {
                continue;
            }
            if (element.is_self_or_descendant_of(*entry.node)) {
                core::diagnostics().emit(core::Severity::Warning, "scope", "exit",
                    "skipped " + describe(*entry.node) + ": it contains " + describe(element));
                continue;
            }
            element.append_child(entry.node);
        } else if (entry.attribute) {
            element.add(*entry.attribute);
        }
    }
    core::diagnostics().emit(core::Severity::Info, "scope", "exit", describe(element));
}

void ScopeStack::enrol(std::shared_ptr<Node> node) {
    if (frames_.empty() || !node) return;
    frames_.back().entries.push_back({std::move(node), std::nullopt});
}

void ScopeStack::enrol(Attribute& attribute) {
    if (frames_.empty()) return;
    attribute.set_scope_token(next_token_++);
    frames_.back().entries.push_back({nullptr, attribute});
}

void ScopeStack::withdraw(const Node& node) {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto& entries = frame->entries;
        auto it = std::find_if(entries.begin(), entries.end(),
            [&node](const Entry& e) { return e.node.get() == &node; });
        if (it != entries.end()) {
            entries.erase(it);
            return;
        }
    }
}

void ScopeStack::withdraw(std::uint64_t attribute_token) {
    if (attribute_token == 0) return;
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto& entries = frame->entries;
        auto it = std::find_if(entries.begin(), entries.end(),
            [attribute_token](const Entry& e) {
                return e.attribute && e.attribute->scope_token() == attribute_token;
            });
        if (it != entries.end()) {
            entries.erase(it);
            return;
        }
    }
}

size_t ScopeStack::pending() const {
    if (frames_.empty()) return 0;
    return frames_.back().entries.size();
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

Scope::Scope(std::shared_ptr<Element> element)
    : Scope(ScopeStack::current(), {std::move(element)}) {}

Scope::Scope(std::initializer_list<std::shared_ptr<Element>> elements)
    : Scope(ScopeStack::current(), elements) {}

Scope::Scope(ScopeStack& stack, std::initializer_list<std::shared_ptr<Element>> elements)
    : stack_(stack) {
    try {
        for (const auto& element : elements) {
            if (pushed_ > 0 && element && !element->parent()) {
                stack_.withdraw(*element);
                stack_.enrol(element);
            }
            stack_.push(element);
            ++pushed_;
        }
    } catch (...) {
        for (; pushed_ > 0; --pushed_) {
            stack_.pop();
        }
        throw;
    }
}

Scope::~Scope() {
    for (; pushed_ > 0; --pushed_) {
        stack_.pop();
    }
}

} // namespace tagsmith::dom
