#include <tagsmith/core/diagnostics.h>
#include <tagsmith/core/errors.h>
#include <tagsmith/dom/operators.h>
#include <tagsmith/dom/scope.h>
#include <tagsmith/html/attributes.h>
#include <tagsmith/html/tags.h>
#include <tagsmith/query/matcher.h>

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>

using namespace tagsmith;
using namespace tagsmith::html;
using dom::ScopeStack;

// ---------------------------------------------------------------------------
// 1. Single scope
// ---------------------------------------------------------------------------
TEST(Scope, CollectsNodesAndAttributes) {
    auto p = P();
    {
        dom::Scope scope(p);
        Class("intro");
        Text("Text");
        Span("span", Id("s"));
    }
    EXPECT_EQ(p->display(false), "<p class=\"intro\">Text<span id=\"s\">span</span></p>");
    EXPECT_TRUE(ScopeStack::current().empty());
}

TEST(Scope, AttachedItemsAreNotAddedTwice) {
    auto ul = Ul();
    {
        dom::Scope scope(ul);
        auto first = Li("a");
        ul->add(first);
        Li("b");
    }
    EXPECT_EQ(ul->display(false), "<ul><li>a</li><li>b</li></ul>");
}

TEST(Scope, NestedFactoryArgumentsStayNested) {
    auto div = Div();
    {
        dom::Scope scope(div);
        Section(P("x"), Class("inner"));
    }
    EXPECT_EQ(div->display(false), "<div><section class=\"inner\"><p>x</p></section></div>");
}

TEST(Scope, EmptyStackEnrolsNothing) {
    auto p = P("free");
    EXPECT_TRUE(ScopeStack::current().empty());
    EXPECT_EQ(ScopeStack::current().pending(), 0u);
    EXPECT_EQ(p->parent(), nullptr);
}

TEST(Scope, PendingAndTop) {
    auto div = Div();
    dom::Scope scope(div);
    EXPECT_EQ(ScopeStack::current().top(), div.get());
    EXPECT_EQ(ScopeStack::current().depth(), 1u);
    auto p = P();
    EXPECT_EQ(ScopeStack::current().pending(), 1u);
    div->add(p);
    EXPECT_EQ(ScopeStack::current().pending(), 0u);
}

// ---------------------------------------------------------------------------
// 2. Nested scopes
// ---------------------------------------------------------------------------
TEST(Scope, NestedBlocks) {
    auto div = Div();
    {
        dom::Scope outer(div);
        auto p = P();
        {
            dom::Scope inner(p);
            Text("inside");
        }
        Hr();
    }
    EXPECT_EQ(div->display(false), "<div><p>inside</p><hr></div>");
}

TEST(Scope, MultipleElementsNestLeftToRight) {
    auto p = P();
    auto span = Span();
    {
        dom::Scope scope{p, span};
        EXPECT_EQ(ScopeStack::current().depth(), 2u);
        Text("deep");
    }
    EXPECT_EQ(p->display(false), "<p><span>deep</span></p>");
    EXPECT_EQ(span->parent(), p.get());
}

TEST(Scope, AlreadyParentedElementIsNotMoved) {
    auto span = Span();
    auto holder = Div(span);
    auto p = P();
    {
        dom::Scope scope{p, span};
        Text("x");
    }
    EXPECT_EQ(span->parent(), holder.get());
    EXPECT_TRUE(p->empty());
    EXPECT_EQ(holder->display(false), "<div><span>x</span></div>");
}

TEST(Scope, ReplicatedOperandIsWithdrawn) {
    auto div = Div();
    {
        dom::Scope scope(div);
        auto item = P("a");
        item * 2;
    }
    EXPECT_EQ(div->display(false), "<div><p>a</p><p>a</p></div>");
}

TEST(Scope, SetAttributeTakesAttributeOutOfScope) {
    auto div = Div();
    auto p = P();
    {
        dom::Scope scope(div);
        p->set_attribute(Id("a"));
    }
    EXPECT_EQ(div->display(false), "<div></div>");
    EXPECT_EQ(p->display(false), "<p id=\"a\"></p>");
}

TEST(Scope, TextNodeArgumentIsConsumed) {
    auto div = Div();
    auto t = Text("a");
    {
        dom::Scope scope(div);
        t->add(Text("b"));
    }
    EXPECT_EQ(div->display(false), "<div></div>");
    EXPECT_EQ(t->content(), "ab");

    {
        dom::Scope scope(div);
        auto joined = Text(Text("c"));
        EXPECT_EQ(joined->content(), "c");
    }
    EXPECT_EQ(div->display(false), "<div>c</div>");
}

TEST(Scope, ElementQueryPartsStayOutOfScope) {
    auto div = Div(P(Class("c"), Span("x")));
    std::size_t hits = 0;
    {
        dom::Scope scope(div);
        hits = div->find(query::Query::element("p", {Class("c")}, {Span("x")})).size();
    }
    EXPECT_EQ(hits, 1u);
    EXPECT_EQ(div->display(false), "<div><p class=\"c\"><span>x</span></p></div>");
}

// ---------------------------------------------------------------------------
// 3. Failure paths
// ---------------------------------------------------------------------------
TEST(Scope, VoidElementCannotBeEntered) {
    auto br = Br();
    EXPECT_THROW(dom::Scope scope(br), core::IllegalCompositionError);
    EXPECT_TRUE(ScopeStack::current().empty());
}

TEST(Scope, FailedMultiEntryPopsWhatWasPushed) {
    auto div = Div();
    auto img = Img();
    EXPECT_THROW((dom::Scope{div, img}), core::IllegalCompositionError);
    EXPECT_TRUE(ScopeStack::current().empty());
    EXPECT_EQ(img->parent(), div.get());
}

TEST(Scope, FramePopsWhenBodyThrows) {
    auto div = Div();
    try {
        dom::Scope scope(div);
        P("before");
        throw std::runtime_error("body failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(ScopeStack::current().empty());
    EXPECT_EQ(div->display(false), "<div><p>before</p></div>");
}

TEST(Scope, CycleIsSkippedWithWarning) {
    core::diagnostics().clear();
    auto div = Div();
    dom::ElementPtr outer;
    {
        dom::Scope scope(div);
        outer = Section();
        outer->add(div);
    }
    EXPECT_TRUE(div->empty());
    EXPECT_EQ(outer->child(0), div);
    auto warnings = core::diagnostics().events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].module, "scope");
    core::diagnostics().clear();
}

// ---------------------------------------------------------------------------
// 4. Stacks per thread
// ---------------------------------------------------------------------------
TEST(Scope, ActivationSwitchesStack) {
    ScopeStack private_stack;
    auto div = Div();
    {
        ScopeStack::Activation activation(private_stack);
        EXPECT_EQ(&ScopeStack::current(), &private_stack);
        dom::Scope scope(div);
        Text("x");
        EXPECT_EQ(private_stack.depth(), 1u);
    }
    EXPECT_NE(&ScopeStack::current(), &private_stack);
    EXPECT_TRUE(private_stack.empty());
    EXPECT_EQ(div->text_content(), "x");
}

TEST(Scope, ThreadsHaveIndependentStacks) {
    auto div = Div();
    dom::Scope scope(div);
    std::string other_output;
    std::thread worker([&other_output] {
        auto p = P();
        {
            dom::Scope inner(p);
            Text("worker");
        }
        other_output = p->display(false);
    });
    worker.join();
    EXPECT_EQ(other_output, "<p>worker</p>");
    EXPECT_EQ(ScopeStack::current().pending(), 0u);
}
