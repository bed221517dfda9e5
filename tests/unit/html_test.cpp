#include <tagsmith/html/attribute_names.h>
#include <tagsmith/html/attributes.h>
#include <tagsmith/html/document.h>
#include <tagsmith/html/table.h>
#include <tagsmith/html/tag_table.h>
#include <tagsmith/html/tags.h>
#include <tagsmith/query/matcher.h>

#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace tagsmith;
using namespace tagsmith::html;
using dom::AttributeKind;

// ---------------------------------------------------------------------------
// 1. Tag table
// ---------------------------------------------------------------------------
TEST(TagTable, LookupByIdentifier) {
    const TagInfo* info = lookup_tag("div");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->name, "div");
    EXPECT_FALSE(info->is_void);
    EXPECT_FALSE(info->deprecated);
    EXPECT_EQ(lookup_tag("DIV"), info);
    EXPECT_EQ(lookup_tag("no-such-tag"), nullptr);
}

TEST(TagTable, ParagraphAlias) {
    ASSERT_NE(lookup_tag("paragraph"), nullptr);
    EXPECT_EQ(lookup_tag("paragraph")->name, "p");
    EXPECT_EQ(Paragraph("x")->display(false), "<p>x</p>");
}

TEST(TagTable, VoidTags) {
    std::set<std::string> expected = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    std::set<std::string> actual;
    for (const auto& info : all_tags()) {
        if (info.is_void) actual.insert(std::string(info.name));
    }
    EXPECT_EQ(actual, expected);
    EXPECT_TRUE(is_void_tag("BR"));
    EXPECT_FALSE(is_void_tag("span"));
    EXPECT_FALSE(is_void_tag("custom"));
}

TEST(TagTable, DeprecatedTagsAreKnown) {
    for (const char* tag : {"acronym", "center", "font", "frame", "strike", "tt"}) {
        const TagInfo* info = lookup_tag(tag);
        ASSERT_NE(info, nullptr) << tag;
        EXPECT_TRUE(info->deprecated) << tag;
    }
    EXPECT_EQ(Center("x")->display(false), "<center>x</center>");
}

// ---------------------------------------------------------------------------
// 2. Attribute names
// ---------------------------------------------------------------------------
TEST(AttributeNames, Normalize) {
    EXPECT_EQ(normalize_attribute_name("class_"), "class");
    EXPECT_EQ(normalize_attribute_name("for_"), "for");
    EXPECT_EQ(normalize_attribute_name("acceptCharset"), "accept-charset");
    EXPECT_EQ(normalize_attribute_name("accept_charset"), "accept-charset");
    EXPECT_EQ(normalize_attribute_name("data_row_id"), "data-row-id");
    EXPECT_EQ(normalize_attribute_name("_private_"), "private");
    EXPECT_EQ(normalize_attribute_name("id"), "id");
}

TEST(AttributeNames, NormalizeProperty) {
    EXPECT_EQ(normalize_property_name("font_size"), "font-size");
    EXPECT_EQ(normalize_property_name("fontSize"), "font-size");
    EXPECT_EQ(normalize_property_name("--main_color"), "--main-color");
}

TEST(AttributeNames, Kinds) {
    EXPECT_EQ(attribute_kind("style"), AttributeKind::Style);
    EXPECT_EQ(attribute_kind("disabled"), AttributeKind::Boolean);
    EXPECT_EQ(attribute_kind("nomodule"), AttributeKind::Boolean);
    EXPECT_EQ(attribute_kind("class"), AttributeKind::TokenList);
    EXPECT_EQ(attribute_kind("rel"), AttributeKind::TokenList);
    EXPECT_EQ(attribute_kind("href"), AttributeKind::Value);
}

// ---------------------------------------------------------------------------
// 3. Attribute factories
// ---------------------------------------------------------------------------
TEST(AttributeFactories, ClassJoinsTokens) {
    auto cls = Class("a", "b", 3);
    EXPECT_EQ(cls.name(), "class");
    EXPECT_EQ(cls.value(), "a b 3");
    EXPECT_EQ(cls.kind(), AttributeKind::TokenList);
}

TEST(AttributeFactories, KeywordForm) {
    EXPECT_EQ(attr("class_", "x").name(), "class");
    EXPECT_EQ(attr("tabindex", 2).value(), "2");
    auto present = attr("hidden", true);
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(present->is_boolean());
    EXPECT_FALSE(attr("hidden", false).has_value());
    EXPECT_FALSE(flag("open", false).has_value());
}

TEST(AttributeFactories, NamedFactories) {
    EXPECT_EQ(AcceptCharset("utf-8").name(), "accept-charset");
    EXPECT_EQ(HttpEquiv("refresh").name(), "http-equiv");
    EXPECT_FALSE(Hidden("until-found").is_boolean());
    EXPECT_TRUE(Disabled().is_boolean());
    EXPECT_EQ(Colspan(2).value(), "2");
    EXPECT_EQ(Scope_("col").name(), "scope");
    EXPECT_EQ(Th("Name", Scope_("col"))->display(false), "<th scope=\"col\">Name</th>");
}

TEST(AttributeFactories, StyleFromPairs) {
    auto style = Style_({{"font_size", "12px"}, {"color", "red"}});
    EXPECT_EQ(style.name(), "style");
    EXPECT_EQ(style.value(), "font-size: 12px;color: red;");
    EXPECT_EQ(style.kind(), AttributeKind::Style);
}

TEST(AttributeFactories, StylesMergeOnElement) {
    auto div = Div(Style_("color: red;"), Style_({{"margin", 0}}));
    EXPECT_EQ(div->display(false), "<div style=\"color: red;margin: 0;\"></div>");
}

TEST(AttributeFactories, DataAndAria) {
    auto data = Data_("row_id", 3);
    EXPECT_EQ(data.name(), "data-row-id");
    EXPECT_EQ(data.value(), "3");
    EXPECT_EQ(Data_("", "x").name(), "data");
    EXPECT_EQ(Aria_("label", "Close").name(), "aria-label");
    EXPECT_EQ(Button(Aria_("label", "Close"))->display(false),
              "<button aria-label=\"Close\"></button>");
}

// ---------------------------------------------------------------------------
// 4. Table shorthand
// ---------------------------------------------------------------------------
TEST(TableShorthand, HeaderRow) {
    auto table = TableOf({{"Name", "Age"}, {"Ann", 30}}, HeaderOption::Row);
    EXPECT_EQ(table->display(false),
              "<table><tr><th>Name</th><th>Age</th></tr>"
              "<tr><td>Ann</td><td>30</td></tr></table>");
}

TEST(TableShorthand, HeaderColumnAndBoth) {
    auto column = TableOf({{"a", "1"}, {"b", "2"}}, HeaderOption::Column);
    EXPECT_EQ(column->display(false),
              "<table><tr><th>a</th><td>1</td></tr><tr><th>b</th><td>2</td></tr></table>");

    auto both = TableOf({{"", "x"}, {"y", "1"}}, HeaderOption::Both);
    EXPECT_EQ(both->display(false),
              "<table><tr><th></th><th>x</th></tr><tr><th>y</th><td>1</td></tr></table>");
}

TEST(TableShorthand, ElementCellsKept) {
    auto table = TableOf({{Td("x", Colspan(2))}}, HeaderOption::None, Id("t"), Caption("c"));
    EXPECT_EQ(table->display(false),
              "<table id=\"t\"><caption>c</caption><tr><td colspan=\"2\">x</td></tr></table>");
}

TEST(TableShorthand, ElementInHeaderPositionIsWrapped) {
    auto rows = table_rows({{B("bold")}}, HeaderOption::Row);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]->display(false), "<tr><th><b>bold</b></th></tr>");
}

// ---------------------------------------------------------------------------
// 5. Document
// ---------------------------------------------------------------------------
TEST(Document, AddGoesToBody) {
    auto document = MakeDocument();
    document->add(H1("Hi"));
    EXPECT_EQ(document->body()->child_count(), 1u);
    EXPECT_EQ(document->head()->child_count(), 2u);
    EXPECT_EQ(document->child_count(), 2u);
}

TEST(Document, CloneKeepsAccessors) {
    auto document = MakeDocument(P("x"));
    auto copy = std::static_pointer_cast<Document>(document->clone());
    ASSERT_NE(copy->body(), nullptr);
    EXPECT_NE(copy->body(), document->body());
    copy->add(P("y"));
    EXPECT_EQ(copy->body()->child_count(), 2u);
    EXPECT_EQ(document->body()->child_count(), 1u);
    EXPECT_EQ(copy->head()->text_content(), "Title of the page");
}

TEST(Document, Title) {
    auto document = Document::create();
    auto titles = document->find(query::Query::element("title"));
    ASSERT_EQ(titles.size(), 1u);
    EXPECT_EQ(titles[0]->text_content(), "Title of the page");
}
