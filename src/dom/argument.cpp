#include <tagsmith/dom/argument.h>
#include <tagsmith/dom/text.h>

#include "report.h"

namespace tagsmith::dom {

Argument::Argument(NodePtr node)
    : kind_(Kind::Node)
    , node_(std::move(node)) {}

Argument::Argument(Attribute attribute)
    : kind_(Kind::Attribute)
    , attribute_(std::move(attribute)) {}

Argument::Argument(std::optional<Attribute> attribute)
    : kind_(attribute ? Kind::Attribute : Kind::Empty)
    , attribute_(std::move(attribute)) {}

Argument::Argument(std::string text)
    : kind_(Kind::Text)
    , text_(std::move(text)) {}

Argument::Argument(std::string_view text)
    : kind_(Kind::Text)
    , text_(text) {}

Argument::Argument(const char* text)
    : kind_(Kind::Text)
    , text_(text ? text : "") {}

void Argument::collect(std::vector<NodePtr>& nodes, std::vector<Attribute>& attributes) const {
    switch (kind_) {
        case Kind::Node:
            if (!node_) {
                fail<core::TypeMismatchError>("classify", "null node in argument list");
            }
            nodes.push_back(node_);
            break;
        case Kind::Attribute:
            attributes.push_back(*attribute_);
            break;
        case Kind::Text:
            nodes.push_back(std::make_shared<Text>(text_));
            break;
        case Kind::Sequence:
            for (const auto& item : items_) {
                item.collect(nodes, attributes);
            }
            break;
        case Kind::Empty:
            break;
    }
}

} // namespace tagsmith::dom
