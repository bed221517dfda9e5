#include <tagsmith/core/errors.h>
#include <tagsmith/dom/attribute.h>
#include <tagsmith/html/attributes.h>
#include <tagsmith/html/tags.h>

#include <gtest/gtest.h>
#include <string>

using namespace tagsmith;
using namespace tagsmith::html;
using dom::Attribute;
using dom::AttributeKind;

// ---------------------------------------------------------------------------
// 1. Construction
// ---------------------------------------------------------------------------
TEST(Attribute, ValuedAttribute) {
    Attribute a("id", "main");
    EXPECT_EQ(a.name(), "id");
    EXPECT_EQ(a.value(), "main");
    EXPECT_EQ(a.kind(), AttributeKind::Value);
    EXPECT_FALSE(a.is_boolean());
    EXPECT_EQ(a.scope_token(), 0u);
}

TEST(Attribute, BooleanAttributeHasNoValue) {
    auto a = Attribute::boolean("disabled");
    EXPECT_TRUE(a.is_boolean());
    EXPECT_EQ(a.value(), "");
    EXPECT_EQ(a.kind(), AttributeKind::Boolean);
}

// ---------------------------------------------------------------------------
// 2. Merge per kind
// ---------------------------------------------------------------------------
TEST(AttributeMerge, TokenListIsSpaceJoined) {
    Attribute a("class", "a", AttributeKind::TokenList);
    a.merge(Attribute("class", "b c", AttributeKind::TokenList));
    EXPECT_EQ(a.value(), "a b c");
}

TEST(AttributeMerge, ValueIsSpaceJoined) {
    Attribute a("title", "Hello");
    a.merge(Attribute("title", "World"));
    EXPECT_EQ(a.value(), "Hello World");
}

TEST(AttributeMerge, StyleIsConcatenated) {
    Attribute a("style", "color: red;", AttributeKind::Style);
    a.merge(Attribute("style", "margin: 0;", AttributeKind::Style));
    EXPECT_EQ(a.value(), "color: red;margin: 0;");
}

TEST(AttributeMerge, ValuedOntoBooleanReplaces) {
    auto a = Attribute::boolean("hidden");
    a.merge(Attribute("hidden", "until-found"));
    EXPECT_FALSE(a.is_boolean());
    EXPECT_EQ(a.value(), "until-found");
}

TEST(AttributeMerge, BooleanOntoValuedKeepsValue) {
    Attribute a("hidden", "until-found");
    a.merge(Attribute::boolean("hidden"));
    EXPECT_FALSE(a.is_boolean());
    EXPECT_EQ(a.value(), "until-found");
}

TEST(AttributeMerge, BooleanOntoBooleanStaysPresent) {
    auto a = Attribute::boolean("checked");
    a.merge(Attribute::boolean("checked"));
    EXPECT_TRUE(a.is_boolean());
}

TEST(AttributeMerge, EmptyValuesDoNotAddSeparators) {
    Attribute a("class", "", AttributeKind::TokenList);
    a.merge(Attribute("class", "x", AttributeKind::TokenList));
    EXPECT_EQ(a.value(), "x");
    a.merge(Attribute("class", "", AttributeKind::TokenList));
    EXPECT_EQ(a.value(), "x");
}

// ---------------------------------------------------------------------------
// 3. Equality
// ---------------------------------------------------------------------------
TEST(AttributeEquality, IgnoresMergeKind) {
    EXPECT_EQ(Attribute("rel", "icon", AttributeKind::TokenList), Attribute("rel", "icon"));
}

TEST(AttributeEquality, BooleanDiffersFromEmptyValue) {
    EXPECT_NE(Attribute::boolean("open"), Attribute("open", ""));
}

TEST(AttributeEquality, IgnoresScopeToken) {
    Attribute a("id", "x");
    Attribute b("id", "x");
    b.set_scope_token(7);
    EXPECT_EQ(a, b);
}

// ---------------------------------------------------------------------------
// 4. Attributes on elements
// ---------------------------------------------------------------------------
TEST(ElementAttributes, AddMergesSameName) {
    auto div = Div(Class("a"), Class("b"), Id("x"), Id("y"));
    EXPECT_EQ(div->attribute("class").value(), "a b");
    EXPECT_EQ(div->attribute("id").value(), "x y");
    ASSERT_EQ(div->attributes().size(), 2u);
    EXPECT_EQ(div->attributes()[0].name(), "class");
    EXPECT_EQ(div->attributes()[1].name(), "id");
}

TEST(ElementAttributes, SetAttributeReplaces) {
    auto div = Div(Class("a"));
    div->set_attribute("class", "b");
    EXPECT_EQ(div->attribute("class").value(), "b");
    EXPECT_EQ(div->attributes().size(), 1u);
}

TEST(ElementAttributes, KeysAreNormalized) {
    auto form = Form();
    form->set_attribute("accept_charset", "utf-8");
    EXPECT_TRUE(form->has_attribute("acceptCharset"));
    EXPECT_EQ(form->attribute("accept-charset").value(), "utf-8");
    EXPECT_EQ((*form)["accept_charset"].value(), "utf-8");

    auto label = Label();
    label->set_attribute("for_", "name");
    EXPECT_EQ(label->attributes()[0].name(), "for");
}

TEST(ElementAttributes, MissingAttributeThrowsNotFound) {
    auto div = Div();
    EXPECT_THROW(div->attribute("id"), core::NotFoundError);
    EXPECT_EQ(div->find_attribute("id"), nullptr);
    EXPECT_FALSE(div->has_attribute("id"));
}

TEST(ElementAttributes, RemoveAbsentIsNoOp) {
    auto div = Div(Id("x"));
    div->remove_attribute("class");
    EXPECT_EQ(div->attributes().size(), 1u);
    div->remove_attribute("id");
    EXPECT_TRUE(div->attributes().empty());
}

TEST(ElementAttributes, ToggleAttribute) {
    auto input = Input();
    input->toggle_attribute("required", true);
    ASSERT_TRUE(input->has_attribute("required"));
    EXPECT_TRUE(input->attribute("required").is_boolean());
    input->toggle_attribute("required", false);
    EXPECT_FALSE(input->has_attribute("required"));
}

TEST(ElementAttributes, SetAttributeOnBooleanNameIsValued) {
    auto div = Div(Hidden("until-found"));
    EXPECT_FALSE(div->attribute("hidden").is_boolean());
    div->set_attribute("hidden", "");
    EXPECT_FALSE(div->attribute("hidden").is_boolean());
    EXPECT_EQ(div->display(false), "<div hidden=\"\"></div>");
}

TEST(ElementAttributes, AttributeOnContainerIsRejected) {
    auto group = Container();
    EXPECT_THROW(group->add(Id("x")), core::IllegalCompositionError);
    EXPECT_THROW(Comment(Class("x")), core::IllegalCompositionError);
}
