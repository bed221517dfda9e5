#pragma once

#include <stdexcept>
#include <string>

namespace tagsmith::core {

// Base of every error raised while composing a tree.
class BuilderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A node or attribute was attached where the tree shape forbids it:
// children under a void element, attributes on a Container or Comment,
// an ancestor inserted below its own descendant.
class IllegalCompositionError : public BuilderError {
public:
    using BuilderError::BuilderError;
};

// A value of the wrong kind was passed (non-text into a Text node, a null
// node through index assignment).
class TypeMismatchError : public BuilderError {
public:
    using BuilderError::BuilderError;
};

// Key lookup of an attribute the element does not carry.
class NotFoundError : public BuilderError {
public:
    using BuilderError::BuilderError;
};

}  // namespace tagsmith::core
