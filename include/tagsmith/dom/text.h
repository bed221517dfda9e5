#pragma once
#include <tagsmith/dom/argument.h>
#include <tagsmith/dom/node.h>
#include <tagsmith/dom/scope.h>

#include <memory>
#include <string>
#include <vector>

namespace tagsmith::dom {

class Text;
using TextPtr = std::shared_ptr<Text>;

// Leaf holding unescaped character data; escaping happens at render time.
class Text : public Node {
public:
    explicit Text(std::string content = std::string());

    static TextPtr create(const Argument& value);

    const std::string& content() const { return content_; }
    void set_content(std::string content) { content_ = std::move(content); }

    // Appends strings, numbers or other Text nodes' content, joined with
    // config::kTextJoinSeparator. Anything else is a TypeMismatchError and
    // leaves the content unchanged.
    template <typename... Args>
    Text& add(Args&&... args) {
        add_all({Argument(std::forward<Args>(args))...});
        return *this;
    }
    void add_all(const std::vector<Argument>& arguments);

    size_t length() const { return content_.size(); }

    NodePtr clone() const override;
    std::string text_content() const override { return content_; }

private:
    std::string content_;
};

} // namespace tagsmith::dom
