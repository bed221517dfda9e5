#include <tagsmith/html/document.h>
#include <tagsmith/html/tags.h>
#include <tagsmith/query/matcher.h>

namespace tagsmith::html {

namespace {

dom::ElementPtr first_element(const dom::NodePtr& root, const std::string& tag) {
    auto found = query::find(root, query::Query::element(tag));
    if (found.empty()) return nullptr;
    return std::static_pointer_cast<dom::Element>(found.front());
}

} // namespace

Document::Document(const std::string& title)
    : head_(std::make_shared<dom::Element>("head"))
    , body_(std::make_shared<dom::Element>("body")) {
    auto meta = std::make_shared<dom::Element>("meta");
    meta->set_attribute("charset", "utf-8");
    auto title_element = std::make_shared<dom::Element>("title");
    title_element->append_child(std::make_shared<dom::Text>(title));
    head_->append_child(meta);
    head_->append_child(title_element);

    auto root = std::make_shared<dom::Element>("html");
    root->append_child(head_);
    root->append_child(body_);

    append_child(Doctype());
    append_child(root);
}

Document::Document(EmptyTag) {}

void Document::add_all(const std::vector<dom::Argument>& arguments) {
    if (body_) {
        body_->add_all(arguments);
        return;
    }
    Container::add_all(arguments);
}

dom::NodePtr Document::clone() const {
    auto copy = std::make_shared<Document>(EmptyTag{});
    clone_children_into(*copy);
    copy->head_ = first_element(copy, "head");
    copy->body_ = first_element(copy, "body");
    return copy;
}

} // namespace tagsmith::html
