#include <tagsmith/dom/text.h>
#include <tagsmith/core/config.h>

#include "report.h"

namespace tagsmith::dom {

namespace {

// Text carried by an argument, or a TypeMismatchError for anything else.
// Text nodes whose content was taken are collected in `consumed`.
void append_text_of(const Argument& argument, std::vector<std::string>& out,
                    std::vector<const Node*>& consumed) {
    switch (argument.kind()) {
        case Argument::Kind::Text:
            out.push_back(argument.text());
            return;
        case Argument::Kind::Node:
            if (argument.node() && argument.node()->node_type() == NodeType::Text) {
                out.push_back(static_cast<const Text&>(*argument.node()).content());
                consumed.push_back(argument.node().get());
                return;
            }
            break;
        case Argument::Kind::Sequence:
            for (const auto& item : argument.items()) {
                append_text_of(item, out, consumed);
            }
            return;
        case Argument::Kind::Empty:
            return;
        case Argument::Kind::Attribute:
            break;
    }
    fail<core::TypeMismatchError>("add", "a text node only accepts text");
}

void withdraw_all(const std::vector<const Node*>& consumed) {
    for (const Node* node : consumed) {
        ScopeStack::current().withdraw(*node);
    }
}

} // namespace

Text::Text(std::string content)
    : Node(NodeType::Text)
    , content_(std::move(content)) {}

TextPtr Text::create(const Argument& value) {
    std::vector<std::string> pieces;
    std::vector<const Node*> consumed;
    append_text_of(value, pieces, consumed);
    withdraw_all(consumed);
    auto text = std::make_shared<Text>();
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) text->content_ += core::config::kTextJoinSeparator;
        text->content_ += pieces[i];
    }
    ScopeStack::current().enrol(text);
    return text;
}

void Text::add_all(const std::vector<Argument>& arguments) {
    std::vector<std::string> pieces;
    std::vector<const Node*> consumed;
    for (const auto& argument : arguments) {
        append_text_of(argument, pieces, consumed);
    }
    withdraw_all(consumed);
    for (const auto& piece : pieces) {
        if (!content_.empty()) content_ += core::config::kTextJoinSeparator;
        content_ += piece;
    }
}

NodePtr Text::clone() const {
    return std::make_shared<Text>(content_);
}

} // namespace tagsmith::dom
