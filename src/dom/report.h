#pragma once
#include <tagsmith/core/diagnostics.h>
#include <tagsmith/core/errors.h>

#include <string>

namespace tagsmith::dom {

class Node;

// Short human-readable name of a node for messages, e.g. "<div> element".
std::string describe(const Node& node);

// Records a composition failure on the thread's emitter, then throws it.
template <typename Error>
[[noreturn]] void fail(const char* stage, const std::string& message) {
    core::diagnostics().emit(core::Severity::Error, "compose", stage, message);
    throw Error(message);
}

} // namespace tagsmith::dom
