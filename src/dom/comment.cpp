#include <tagsmith/dom/comment.h>

namespace tagsmith::dom {

Comment::Comment(std::optional<std::string> condition)
    : ParentNode(NodeType::Comment)
    , condition_(std::move(condition)) {
    if (condition_ && condition_->empty()) {
        condition_.reset();
    }
}

NodePtr Comment::clone() const {
    auto copy = std::make_shared<Comment>(condition_);
    clone_children_into(*copy);
    return copy;
}

} // namespace tagsmith::dom
