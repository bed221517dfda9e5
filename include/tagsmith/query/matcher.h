#pragma once
#include <tagsmith/dom/attribute.h>
#include <tagsmith/dom/node.h>

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tagsmith::query {

// What find() looks for. Either a substring of Text content, or a
// structural pattern (variant, tag, attribute subset, exact children).
class Query {
public:
    enum class Kind { Substring, Pattern };

    Query(std::string substring);
    Query(const char* substring);

    // Pattern taken from an existing node; the node is shared, not adopted.
    template <typename T,
              typename = std::enable_if_t<std::is_base_of_v<dom::Node, T>>>
    Query(const std::shared_ptr<T>& pattern)
        : Query(like(std::static_pointer_cast<dom::Node>(pattern))) {}

    static Query substring(std::string text);
    static Query like(const dom::NodePtr& pattern);
    static Query element(std::string tag,
                         std::vector<dom::Attribute> attributes = {},
                         std::vector<dom::NodePtr> children = {});

    Kind kind() const { return kind_; }

    bool matches(const dom::Node& candidate) const;

private:
    Query() = default;

    bool matches_pattern(const dom::Node& candidate) const;

    Kind kind_ = Kind::Substring;
    std::string text_;
    dom::NodeType type_ = dom::NodeType::Element;
    std::string tag_;
    std::vector<dom::Attribute> attributes_;
    std::vector<dom::NodePtr> children_;
    std::optional<std::string> condition_;
};

// Pre-order, document order, `root` included.
std::vector<dom::NodePtr> find(const dom::NodePtr& root, const Query& query);

// Same variant, tag and void flag, same attribute set in any order, same
// comment condition and text, children pairwise equal.
bool structurally_equal(const dom::Node& a, const dom::Node& b);

} // namespace tagsmith::query
