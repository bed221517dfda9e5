#pragma once
#include <tagsmith/dom/argument.h>
#include <tagsmith/dom/element.h>

#include <utility>
#include <vector>

namespace tagsmith::html {

enum class HeaderOption {
    None,
    Row,     // first row holds header cells
    Column,  // first column holds header cells
    Both
};

using TableRows = std::vector<std::vector<dom::Argument>>;

// One <tr> per row. Text cells become <td>, or <th> in a header position;
// element cells are kept as they are, except in a header position where
// they are wrapped in <th>.
std::vector<dom::ElementPtr> table_rows(const TableRows& rows, HeaderOption header = HeaderOption::None);

// <table> holding `args` (caption, attributes, ...) followed by the rows.
template <typename... Args>
dom::ElementPtr TableOf(const TableRows& rows, HeaderOption header, Args&&... args) {
    auto table = dom::Element::create("table", std::forward<Args>(args)...);
    table->add(table_rows(rows, header));
    return table;
}

} // namespace tagsmith::html
