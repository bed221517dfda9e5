#include <tagsmith/html/table.h>

namespace tagsmith::html {

namespace {

bool is_header_cell(HeaderOption header, size_t row, size_t column) {
    switch (header) {
        case HeaderOption::None:   return false;
        case HeaderOption::Row:    return row == 0;
        case HeaderOption::Column: return column == 0;
        case HeaderOption::Both:   return row == 0 || column == 0;
    }
    return false;
}

} // namespace

std::vector<dom::ElementPtr> table_rows(const TableRows& rows, HeaderOption header) {
    std::vector<dom::ElementPtr> result;
    result.reserve(rows.size());

    for (size_t r = 0; r < rows.size(); ++r) {
        std::vector<dom::NodePtr> cells;
        cells.reserve(rows[r].size());
        for (size_t c = 0; c < rows[r].size(); ++c) {
            const dom::Argument& cell = rows[r][c];
            bool header_cell = is_header_cell(header, r, c);
            bool element_cell = cell.kind() == dom::Argument::Kind::Node && cell.node()
                && cell.node()->node_type() == dom::NodeType::Element;

            if (element_cell && !header_cell) {
                cells.push_back(cell.node());
            } else {
                cells.push_back(dom::Element::create(header_cell ? "th" : "td", cell));
            }
        }
        result.push_back(dom::Element::create("tr", cells));
    }
    return result;
}

} // namespace tagsmith::html
