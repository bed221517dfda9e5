#pragma once

#include <cstddef>

namespace tagsmith::core::config {

// Pretty rendering indents one unit per depth level.
inline constexpr const char kDefaultIndent[] = "  ";
inline constexpr const char kDefaultNewLine[] = "\n";

// Placed between a Text node's content and text appended to it with add().
inline constexpr const char kTextJoinSeparator[] = "";

inline constexpr std::size_t kDefaultDiagnosticCapacity = 1024;

}  // namespace tagsmith::core::config
