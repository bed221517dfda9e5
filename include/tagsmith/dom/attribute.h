#pragma once
#include <cstdint>
#include <string>

namespace tagsmith::dom {

// How a second value under the same name is folded into an existing one.
enum class AttributeKind {
    Value,      // space-joined
    TokenList,  // space-joined (class, rel, ...)
    Style,      // concatenated "property: value;" declarations
    Boolean     // presence only, renders as the bare name
};

class Attribute {
public:
    Attribute(std::string name, std::string value,
              AttributeKind kind = AttributeKind::Value);

    static Attribute boolean(std::string name);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }
    AttributeKind kind() const { return kind_; }
    bool is_boolean() const { return kind_ == AttributeKind::Boolean; }

    // Folds `other` into this attribute following this attribute's kind.
    // A valued attribute merged onto a boolean one takes its place; a
    // boolean merged onto a valued one changes nothing.
    void merge(const Attribute& other);

    // Identifies the scope frame this attribute was enrolled in (0: none).
    std::uint64_t scope_token() const { return scope_token_; }
    void set_scope_token(std::uint64_t token) { scope_token_ = token; }

    // Name, presence and value. The merge kind and scope token are not
    // part of identity.
    bool operator==(const Attribute& other) const;
    bool operator!=(const Attribute& other) const { return !(*this == other); }

private:
    std::string name_;
    std::string value_;
    AttributeKind kind_;
    std::uint64_t scope_token_ = 0;
};

} // namespace tagsmith::dom
