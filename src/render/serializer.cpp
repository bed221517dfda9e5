#include <tagsmith/render/serializer.h>
#include <tagsmith/dom/comment.h>
#include <tagsmith/dom/element.h>
#include <tagsmith/dom/text.h>

namespace tagsmith::render {

namespace {

class Writer {
public:
    explicit Writer(const RenderOptions& options) : options_(options) {}

    void write(const dom::Node& node, size_t depth) {
        switch (node.node_type()) {
            case dom::NodeType::Element:
                write_element(static_cast<const dom::Element&>(node), depth);
                break;
            case dom::NodeType::Text:
                emit(escape_text(static_cast<const dom::Text&>(node).content()), depth);
                break;
            case dom::NodeType::Comment:
                write_comment(static_cast<const dom::Comment&>(node), depth);
                break;
            case dom::NodeType::Container:
                write_children(static_cast<const dom::ParentNode&>(node), depth);
                break;
        }
    }

    std::string take() { return std::move(out_); }

private:
    void write_element(const dom::Element& element, size_t depth) {
        std::string open = "<" + element.tag_name();
        for (const auto& attr : element.attributes()) {
            open += ' ';
            open += render_attribute(attr, options_.boolean_style);
        }
        open += '>';
        emit(open, depth);

        if (element.is_void()) {
            return;
        }
        write_children(element, depth + 1);
        emit("</" + element.tag_name() + ">", depth);
    }

    void write_comment(const dom::Comment& comment, size_t depth) {
        const auto& condition = comment.condition();
        std::string open = condition ? "<!--[if " + *condition + "]>" : "<!--";
        std::string close = condition ? "<![endif]-->" : "-->";

        if (comment.empty()) {
            emit(open + close, depth);
            return;
        }
        emit(open, depth);
        write_children(comment, depth + 1);
        emit(close, depth);
    }

    void write_children(const dom::ParentNode& parent, size_t depth) {
        for (const auto& child : parent.children()) {
            write(*child, depth);
        }
    }

    // One token; in pretty mode each token is a line of its own.
    void emit(const std::string& token, size_t depth) {
        if (options_.pretty) {
            if (!first_) {
                out_ += options_.new_line;
            }
            for (size_t i = 0; i < depth; ++i) {
                out_ += options_.indent;
            }
        }
        out_ += token;
        first_ = false;
    }

    const RenderOptions& options_;
    std::string out_;
    bool first_ = true;
};

} // namespace

std::string render(const dom::Node& root, const RenderOptions& options) {
    Writer writer(options);
    writer.write(root, 0);
    return writer.take();
}

std::string render_attribute(const dom::Attribute& attribute, BooleanStyle style) {
    if (!attribute.is_boolean()) {
        return attribute.name() + "=\"" + escape_attribute(attribute.value()) + "\"";
    }
    switch (style) {
        case BooleanStyle::Short:
            return attribute.name();
        case BooleanStyle::Empty:
            return attribute.name() + "=\"\"";
        case BooleanStyle::Repeated:
            return attribute.name() + "=\"" + attribute.name() + "\"";
    }
    return attribute.name();
}

std::string escape_text(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default:  result += c; break;
        }
    }
    return result;
}

std::string escape_attribute(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            default:  result += c; break;
        }
    }
    return result;
}

} // namespace tagsmith::render
