#pragma once
#include <tagsmith/dom/comment.h>
#include <tagsmith/dom/container.h>
#include <tagsmith/dom/element.h>
#include <tagsmith/dom/text.h>

#include <string>
#include <utility>

namespace tagsmith::html {

// Element for any tag identifier, known to the tag table or not.
template <typename... Args>
dom::ElementPtr make_element(const std::string& tag, Args&&... args) {
    return dom::Element::create(tag, std::forward<Args>(args)...);
}

// One factory per tag: Div(H1("Title"), Class("main"), Hr()).
#define TAGSMITH_TAG(Name, identifier)                                   \
    template <typename... Args>                                          \
    dom::ElementPtr Name(Args&&... args) {                               \
        return make_element(identifier, std::forward<Args>(args)...);    \
    }

TAGSMITH_TAG(Html, "html")
TAGSMITH_TAG(Head, "head")
TAGSMITH_TAG(Title, "title")
TAGSMITH_TAG(Body, "body")
TAGSMITH_TAG(H1, "h1")
TAGSMITH_TAG(H2, "h2")
TAGSMITH_TAG(H3, "h3")
TAGSMITH_TAG(H4, "h4")
TAGSMITH_TAG(H5, "h5")
TAGSMITH_TAG(H6, "h6")
TAGSMITH_TAG(Paragraph, "paragraph")
TAGSMITH_TAG(P, "p")
TAGSMITH_TAG(Br, "br")
TAGSMITH_TAG(Hr, "hr")
TAGSMITH_TAG(Acronym, "acronym")
TAGSMITH_TAG(Abbr, "abbr")
TAGSMITH_TAG(Address, "address")
TAGSMITH_TAG(B, "b")
TAGSMITH_TAG(Bdi, "bdi")
TAGSMITH_TAG(Bdo, "bdo")
TAGSMITH_TAG(Big, "big")
TAGSMITH_TAG(Blockquote, "blockquote")
TAGSMITH_TAG(Center, "center")
TAGSMITH_TAG(Cite, "cite")
TAGSMITH_TAG(Code, "code")
TAGSMITH_TAG(Del, "del")
TAGSMITH_TAG(Dfn, "dfn")
TAGSMITH_TAG(Em, "em")
TAGSMITH_TAG(Font, "font")
TAGSMITH_TAG(I, "i")
TAGSMITH_TAG(Ins, "ins")
TAGSMITH_TAG(Kbd, "kbd")
TAGSMITH_TAG(Mark, "mark")
TAGSMITH_TAG(Meter, "meter")
TAGSMITH_TAG(Pre, "pre")
TAGSMITH_TAG(Progress, "progress")
TAGSMITH_TAG(Q, "q")
TAGSMITH_TAG(Rp, "rp")
TAGSMITH_TAG(Rt, "rt")
TAGSMITH_TAG(Ruby, "ruby")
TAGSMITH_TAG(S, "s")
TAGSMITH_TAG(Samp, "samp")
TAGSMITH_TAG(Small, "small")
TAGSMITH_TAG(Strike, "strike")
TAGSMITH_TAG(Strong, "strong")
TAGSMITH_TAG(Sub, "sub")
TAGSMITH_TAG(Sup, "sup")
TAGSMITH_TAG(Template, "template")
TAGSMITH_TAG(Time, "time")
TAGSMITH_TAG(Tt, "tt")
TAGSMITH_TAG(U, "u")
TAGSMITH_TAG(Var, "var")
TAGSMITH_TAG(Wbr, "wbr")
TAGSMITH_TAG(Form, "form")
TAGSMITH_TAG(Input, "input")
TAGSMITH_TAG(Textarea, "textarea")
TAGSMITH_TAG(Button, "button")
TAGSMITH_TAG(Select, "select")
TAGSMITH_TAG(Optgroup, "optgroup")
TAGSMITH_TAG(Option, "option")
TAGSMITH_TAG(Label, "label")
TAGSMITH_TAG(Fieldset, "fieldset")
TAGSMITH_TAG(Legend, "legend")
TAGSMITH_TAG(Datalist, "datalist")
TAGSMITH_TAG(Output, "output")
TAGSMITH_TAG(Frame, "frame")
TAGSMITH_TAG(Frameset, "frameset")
TAGSMITH_TAG(Noframes, "noframes")
TAGSMITH_TAG(Iframe, "iframe")
TAGSMITH_TAG(Img, "img")
TAGSMITH_TAG(Map, "map")
TAGSMITH_TAG(Area, "area")
TAGSMITH_TAG(Canvas, "canvas")
TAGSMITH_TAG(Figcaption, "figcaption")
TAGSMITH_TAG(Figure, "figure")
TAGSMITH_TAG(Picture, "picture")
TAGSMITH_TAG(Svg, "svg")
TAGSMITH_TAG(Audio, "audio")
TAGSMITH_TAG(Source, "source")
TAGSMITH_TAG(Track, "track")
TAGSMITH_TAG(Video, "video")
TAGSMITH_TAG(A, "a")
TAGSMITH_TAG(Link, "link")
TAGSMITH_TAG(Nav, "nav")
TAGSMITH_TAG(Menu, "menu")
TAGSMITH_TAG(Ul, "ul")
TAGSMITH_TAG(Ol, "ol")
TAGSMITH_TAG(Li, "li")
TAGSMITH_TAG(Dir, "dir")
TAGSMITH_TAG(Dl, "dl")
TAGSMITH_TAG(Dt, "dt")
TAGSMITH_TAG(Dd, "dd")
TAGSMITH_TAG(Caption, "caption")
TAGSMITH_TAG(Td, "td")
TAGSMITH_TAG(Tr, "tr")
TAGSMITH_TAG(Th, "th")
TAGSMITH_TAG(Tfoot, "tfoot")
TAGSMITH_TAG(Tbody, "tbody")
TAGSMITH_TAG(Thead, "thead")
TAGSMITH_TAG(Col, "col")
TAGSMITH_TAG(Colgroup, "colgroup")
TAGSMITH_TAG(Table, "table")
TAGSMITH_TAG(Style, "style")
TAGSMITH_TAG(Div, "div")
TAGSMITH_TAG(Span, "span")
TAGSMITH_TAG(Header, "header")
TAGSMITH_TAG(Hgroup, "hgroup")
TAGSMITH_TAG(Footer, "footer")
TAGSMITH_TAG(Main, "main")
TAGSMITH_TAG(Section, "section")
TAGSMITH_TAG(Search, "search")
TAGSMITH_TAG(Article, "article")
TAGSMITH_TAG(Aside, "aside")
TAGSMITH_TAG(Details, "details")
TAGSMITH_TAG(Dialog, "dialog")
TAGSMITH_TAG(Summary, "summary")
TAGSMITH_TAG(Data, "data")
TAGSMITH_TAG(Meta, "meta")
TAGSMITH_TAG(Base, "base")
TAGSMITH_TAG(Basefont, "basefont")
TAGSMITH_TAG(Script, "script")
TAGSMITH_TAG(Noscript, "noscript")
TAGSMITH_TAG(Applet, "applet")
TAGSMITH_TAG(Embed, "embed")
TAGSMITH_TAG(Object, "object")
TAGSMITH_TAG(Param, "param")

#undef TAGSMITH_TAG

enum class DoctypeDeclaration {
    Html5,
    Html401Strict,
    Html401Transitional,
    Html401Frameset,
    Xhtml10Strict,
    Xhtml10Transitional,
    Xhtml10Frameset,
    Xhtml11,
    Xhtml11Basic
};

// Void element rendering as <!DOCTYPE ...>.
dom::ElementPtr Doctype(DoctypeDeclaration declaration = DoctypeDeclaration::Html5);

inline dom::TextPtr Text(const dom::Argument& value = dom::Argument("")) {
    return dom::Text::create(value);
}

template <typename... Args>
dom::CommentPtr Comment(Args&&... args) {
    return dom::Comment::create(std::nullopt, std::forward<Args>(args)...);
}

template <typename... Args>
dom::CommentPtr ConditionalComment(std::string condition, Args&&... args) {
    return dom::Comment::create(std::move(condition), std::forward<Args>(args)...);
}

template <typename... Args>
dom::ContainerPtr Container(Args&&... args) {
    return dom::Container::create(std::forward<Args>(args)...);
}

} // namespace tagsmith::html
