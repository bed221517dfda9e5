#pragma once
#include <tagsmith/dom/parent_node.h>
#include <tagsmith/dom/scope.h>

#include <memory>
#include <optional>
#include <string>

namespace tagsmith::dom {

class Comment;
using CommentPtr = std::shared_ptr<Comment>;

// Comment whose body is a sequence of nodes. With a condition it renders
// as an IE conditional comment: <!--[if CONDITION]> ... <![endif]-->.
class Comment : public ParentNode {
public:
    explicit Comment(std::optional<std::string> condition = std::nullopt);

    template <typename... Args>
    static CommentPtr create(std::optional<std::string> condition, Args&&... args) {
        auto comment = std::make_shared<Comment>(std::move(condition));
        comment->add_all({Argument(std::forward<Args>(args))...});
        ScopeStack::current().enrol(comment);
        return comment;
    }

    const std::optional<std::string>& condition() const { return condition_; }
    void set_condition(std::optional<std::string> condition) { condition_ = std::move(condition); }

    NodePtr clone() const override;

private:
    std::optional<std::string> condition_;
};

} // namespace tagsmith::dom
