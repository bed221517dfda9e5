#include <tagsmith/dom/attribute.h>

namespace tagsmith::dom {

Attribute::Attribute(std::string name, std::string value, AttributeKind kind)
    : name_(std::move(name))
    , value_(std::move(value))
    , kind_(kind) {
    if (kind_ == AttributeKind::Boolean) {
        value_.clear();
    }
}

Attribute Attribute::boolean(std::string name) {
    return Attribute(std::move(name), std::string(), AttributeKind::Boolean);
}

void Attribute::merge(const Attribute& other) {
    if (other.is_boolean()) {
        return;
    }
    if (is_boolean()) {
        value_ = other.value_;
        kind_ = other.kind_;
        return;
    }
    if (other.value_.empty()) {
        return;
    }
    if (value_.empty()) {
        value_ = other.value_;
        return;
    }

    switch (kind_) {
        case AttributeKind::Style:
            value_ += other.value_;
            break;
        case AttributeKind::Value:
        case AttributeKind::TokenList:
        case AttributeKind::Boolean:
            value_ += ' ';
            value_ += other.value_;
            break;
    }
}

bool Attribute::operator==(const Attribute& other) const {
    return name_ == other.name_ && is_boolean() == other.is_boolean()
        && value_ == other.value_;
}

} // namespace tagsmith::dom
