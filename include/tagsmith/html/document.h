#pragma once
#include <tagsmith/dom/container.h>
#include <tagsmith/dom/element.h>
#include <tagsmith/dom/scope.h>

#include <memory>
#include <string>

namespace tagsmith::html {

class Document;
using DocumentPtr = std::shared_ptr<Document>;

// Page skeleton:
//   <!DOCTYPE html>
//   <html><head><meta charset="utf-8"><title>...</title></head><body>...</body></html>
// add() on a document goes into its body.
class Document : public dom::Container {
    struct EmptyTag {};

public:
    explicit Document(const std::string& title = "Title of the page");

    // Bare document with no skeleton. Only members can name the tag.
    explicit Document(EmptyTag);

    template <typename... Args>
    static DocumentPtr create(Args&&... args) {
        auto document = std::make_shared<Document>();
        document->add_all({dom::Argument(std::forward<Args>(args))...});
        dom::ScopeStack::current().enrol(document);
        return document;
    }

    const dom::ElementPtr& head() const { return head_; }
    const dom::ElementPtr& body() const { return body_; }

    void add_all(const std::vector<dom::Argument>& arguments) override;

    // The copy keeps head() and body() pointing into the copied tree, as
    // long as the skeleton still contains them.
    dom::NodePtr clone() const override;

private:
    dom::ElementPtr head_;
    dom::ElementPtr body_;
};

template <typename... Args>
DocumentPtr MakeDocument(Args&&... args) {
    return Document::create(std::forward<Args>(args)...);
}

} // namespace tagsmith::html
