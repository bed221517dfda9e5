#pragma once
#include <tagsmith/dom/attribute.h>
#include <tagsmith/dom/node.h>

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tagsmith::dom {

// Textual form of a number passed where text is expected.
template <typename T>
std::string number_to_text(T number) {
    static_assert(std::is_arithmetic_v<T>, "number_to_text needs an arithmetic type");
    if constexpr (std::is_integral_v<T>) {
        return std::to_string(number);
    } else {
        std::ostringstream oss;
        oss << number;
        return oss.str();
    }
}

// One entry of a factory or add() argument list, classified by shape.
class Argument {
public:
    enum class Kind {
        Node,
        Attribute,
        Text,
        Sequence,
        Empty
    };

    Argument(NodePtr node);

    // ElementPtr, TextPtr, ... convert in one step.
    template <typename T,
              std::enable_if_t<std::is_base_of_v<Node, T> && !std::is_same_v<T, Node>, int> = 0>
    Argument(std::shared_ptr<T> node) : Argument(NodePtr(std::move(node))) {}

    Argument(Attribute attribute);
    Argument(std::optional<Attribute> attribute);
    Argument(std::string text);
    Argument(std::string_view text);
    Argument(const char* text);

    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Argument(T number) : kind_(Kind::Text), text_(number_to_text(number)) {}

    template <typename T>
    Argument(const std::vector<T>& items) : kind_(Kind::Sequence) {
        items_.reserve(items.size());
        for (const auto& item : items) {
            items_.push_back(Argument(item));
        }
    }

    Argument(bool) = delete;

    Kind kind() const { return kind_; }
    const NodePtr& node() const { return node_; }
    const std::optional<Attribute>& attribute() const { return attribute_; }
    const std::string& text() const { return text_; }
    const std::vector<Argument>& items() const { return items_; }

    // Appends the nodes and attributes this argument stands for, in order.
    // Text becomes a fresh Text node. A null node is a TypeMismatchError.
    void collect(std::vector<NodePtr>& nodes, std::vector<Attribute>& attributes) const;

private:
    Kind kind_;
    NodePtr node_;
    std::optional<Attribute> attribute_;
    std::string text_;
    std::vector<Argument> items_;
};

} // namespace tagsmith::dom
