#include <tagsmith/query/matcher.h>
#include <tagsmith/core/diagnostics.h>
#include <tagsmith/dom/comment.h>
#include <tagsmith/dom/element.h>
#include <tagsmith/dom/scope.h>
#include <tagsmith/dom/text.h>
#include <tagsmith/html/tag_table.h>

#include <stdexcept>

namespace tagsmith::query {

namespace {

bool children_equal(const std::vector<dom::NodePtr>& a, const std::vector<dom::NodePtr>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!structurally_equal(*a[i], *b[i])) return false;
    }
    return true;
}

// Every attribute in `wanted` is on `element` with an equal value.
bool has_attributes(const dom::Element& element, const std::vector<dom::Attribute>& wanted) {
    for (const auto& attr : wanted) {
        const dom::Attribute* found = element.find_attribute(attr.name());
        if (!found || *found != attr) return false;
    }
    return true;
}

void collect(const dom::NodePtr& node, const Query& query, std::vector<dom::NodePtr>& out) {
    if (query.matches(*node)) {
        out.push_back(node);
    }
    if (node->node_type() == dom::NodeType::Text) return;
    for (const auto& child : static_cast<const dom::ParentNode&>(*node).children()) {
        collect(child, query, out);
    }
}

} // namespace

Query::Query(std::string substring)
    : kind_(Kind::Substring)
    , text_(std::move(substring)) {}

Query::Query(const char* substring)
    : Query(std::string(substring ? substring : "")) {}

Query Query::substring(std::string text) {
    return Query(std::move(text));
}

Query Query::like(const dom::NodePtr& pattern) {
    Query query;
    query.kind_ = Kind::Pattern;
    if (!pattern) {
        const std::string message = "query pattern is null";
        core::diagnostics().emit(core::Severity::Error, "query", "like", message);
        throw std::invalid_argument(message);
    }
    query.type_ = pattern->node_type();
    switch (pattern->node_type()) {
        case dom::NodeType::Element: {
            const auto& element = static_cast<const dom::Element&>(*pattern);
            query.tag_ = element.tag_name();
            query.attributes_ = element.attributes();
            query.children_ = element.children();
            break;
        }
        case dom::NodeType::Text:
            query.text_ = static_cast<const dom::Text&>(*pattern).content();
            break;
        case dom::NodeType::Comment: {
            const auto& comment = static_cast<const dom::Comment&>(*pattern);
            query.condition_ = comment.condition();
            query.children_ = comment.children();
            break;
        }
        case dom::NodeType::Container:
            query.children_ = static_cast<const dom::ParentNode&>(*pattern).children();
            break;
    }
    return query;
}

Query Query::element(std::string tag,
                     std::vector<dom::Attribute> attributes,
                     std::vector<dom::NodePtr> children) {
    Query query;
    query.kind_ = Kind::Pattern;
    query.type_ = dom::NodeType::Element;
    if (const auto* info = html::lookup_tag(tag)) {
        query.tag_ = info->name;
    } else {
        query.tag_ = std::move(tag);
    }
    query.attributes_ = std::move(attributes);
    query.children_ = std::move(children);

    // Pattern parts are never committed to an open scope.
    auto& scope = dom::ScopeStack::current();
    for (auto& attr : query.attributes_) {
        scope.withdraw(attr.scope_token());
        attr.set_scope_token(0);
    }
    for (const auto& child : query.children_) {
        if (child && !child->parent()) {
            scope.withdraw(*child);
        }
    }
    return query;
}

bool Query::matches(const dom::Node& candidate) const {
    if (kind_ == Kind::Substring) {
        return candidate.node_type() == dom::NodeType::Text
            && static_cast<const dom::Text&>(candidate).content().find(text_) != std::string::npos;
    }
    return matches_pattern(candidate);
}

bool Query::matches_pattern(const dom::Node& candidate) const {
    if (candidate.node_type() != type_) return false;

    switch (type_) {
        case dom::NodeType::Text:
            return static_cast<const dom::Text&>(candidate).content() == text_;
        case dom::NodeType::Element: {
            const auto& element = static_cast<const dom::Element&>(candidate);
            if (element.tag_name() != tag_) return false;
            if (!has_attributes(element, attributes_)) return false;
            break;
        }
        case dom::NodeType::Comment:
            if (condition_ && static_cast<const dom::Comment&>(candidate).condition() != condition_) {
                return false;
            }
            break;
        case dom::NodeType::Container:
            break;
    }

    if (children_.empty()) return true;
    return children_equal(static_cast<const dom::ParentNode&>(candidate).children(), children_);
}

std::vector<dom::NodePtr> find(const dom::NodePtr& root, const Query& query) {
    std::vector<dom::NodePtr> result;
    if (root) {
        collect(root, query, result);
    }
    return result;
}

bool structurally_equal(const dom::Node& a, const dom::Node& b) {
    if (&a == &b) return true;
    if (a.node_type() != b.node_type()) return false;

    switch (a.node_type()) {
        case dom::NodeType::Text:
            return static_cast<const dom::Text&>(a).content()
                == static_cast<const dom::Text&>(b).content();
        case dom::NodeType::Element: {
            const auto& ea = static_cast<const dom::Element&>(a);
            const auto& eb = static_cast<const dom::Element&>(b);
            if (ea.tag_name() != eb.tag_name() || ea.is_void() != eb.is_void()) return false;
            if (ea.attributes().size() != eb.attributes().size()) return false;
            if (!has_attributes(eb, ea.attributes())) return false;
            break;
        }
        case dom::NodeType::Comment:
            if (static_cast<const dom::Comment&>(a).condition()
                != static_cast<const dom::Comment&>(b).condition()) {
                return false;
            }
            break;
        case dom::NodeType::Container:
            break;
    }
    return children_equal(static_cast<const dom::ParentNode&>(a).children(),
                          static_cast<const dom::ParentNode&>(b).children());
}

} // namespace tagsmith::query
