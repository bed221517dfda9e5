#include <tagsmith/html/tags.h>
#include <tagsmith/dom/scope.h>

namespace tagsmith::html {

namespace {

const char* declaration_text(DoctypeDeclaration declaration) {
    switch (declaration) {
        case DoctypeDeclaration::Html5:
            return "!DOCTYPE html";
        case DoctypeDeclaration::Html401Strict:
            return "!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 4.01//EN\"\n"
                   "\"http://www.w3.org/TR/html4/strict.dtd\"";
        case DoctypeDeclaration::Html401Transitional:
            return "!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 4.01 Transitional//EN\"\n"
                   "\"http://www.w3.org/TR/html4/loose.dtd\"";
        case DoctypeDeclaration::Html401Frameset:
            return "!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 4.01 Frameset//EN\"\n"
                   "\"http://www.w3.org/TR/html4/frameset.dtd\"";
        case DoctypeDeclaration::Xhtml10Strict:
            return "!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\"\n"
                   "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\"";
        case DoctypeDeclaration::Xhtml10Transitional:
            return "!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Transitional//EN\"\n"
                   "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-transitional.dtd\"";
        case DoctypeDeclaration::Xhtml10Frameset:
            return "!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Frameset//EN\"\n"
                   "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-frameset.dtd\"";
        case DoctypeDeclaration::Xhtml11:
            return "!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.1//EN\"\n"
                   "\"http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd\"";
        case DoctypeDeclaration::Xhtml11Basic:
            return "!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML Basic 1.1//EN\"\n"
                   "\"http://www.w3.org/TR/xhtml-basic/xhtml-basic11.dtd\"";
    }
    return "!DOCTYPE html";
}

} // namespace

dom::ElementPtr Doctype(DoctypeDeclaration declaration) {
    auto doctype = std::make_shared<dom::Element>(declaration_text(declaration), true);
    dom::ScopeStack::current().enrol(doctype);
    return doctype;
}

} // namespace tagsmith::html
