// grid_loader.cpp
//
// CSV map parsing into hnav::Grid.

#include "hnav/grid_loader.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "hnav/errors.hpp"

namespace {
// Strip leading and trailing blanks (spaces, tabs, CR from Windows line endings).
std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string location(const std::string& source, std::size_t line, std::size_t column) {
    return source + ":" + std::to_string(line) + ": column " + std::to_string(column);
}

// Map file values are written by numeric tools, so "1" and "1.0" are both accepted.
hnav::CellStatus parse_cell(const std::string& field, const std::string& where) {
    const std::string text = trim(field);
    if (text.empty()) throw hnav::GridFormatError(where + ": empty cell");

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value) ||
        std::floor(value) != value) {
        throw hnav::GridFormatError(where + ": '" + text + "' is not an integer cell code");
    }
    if (value < 0.0 || value > 4.0) {
        throw hnav::GridFormatError(where + ": unknown cell code " + text);
    }

    switch (static_cast<int>(value)) {
        case 0:
            return hnav::CellStatus::Free;
        case 1:
            return hnav::CellStatus::Occupied;
        case 2:
            return hnav::CellStatus::Visited;
        case 3:
            return hnav::CellStatus::Start;
        case 4:
            return hnav::CellStatus::Goal;
        default:
            break;
    }
    throw hnav::GridFormatError(where + ": unknown cell code " + text);
}
}  // namespace

namespace hnav {

Grid load_grid_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GridFormatError("cannot open map file " + path);
    }
    return parse_grid_csv(file, path);
}

Grid parse_grid_csv(std::istream& input, const std::string& source) {
    std::vector<std::vector<CellStatus>> rows;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(input, line)) {
        ++line_no;
        const std::string content = trim(line);
        if (content.empty()) continue;

        std::vector<CellStatus> row;
        std::stringstream fields(content);
        std::string field;
        while (std::getline(fields, field, ',')) {
            row.push_back(parse_cell(field, location(source, line_no, row.size() + 1)));
        }
        // getline drops a trailing empty field, e.g. "0,1,".
        if (content.back() == ',') {
            throw GridFormatError(location(source, line_no, row.size() + 1) + ": empty cell");
        }

        if (!rows.empty() && row.size() != rows.front().size()) {
            throw GridFormatError(source + ":" + std::to_string(line_no) + ": row has " +
                                  std::to_string(row.size()) + " cells, expected " +
                                  std::to_string(rows.front().size()));
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty()) throw GridFormatError(source + ": map has no rows");

    Grid grid(static_cast<int>(rows.size()), static_cast<int>(rows.front().size()));
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            grid.set_status({r, c}, rows[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)]);
        }
    }

    if (grid.count(CellStatus::Start) > 1) {
        throw GridFormatError(source + ": map has more than one start cell");
    }
    if (grid.count(CellStatus::Goal) > 1) {
        throw GridFormatError(source + ": map has more than one goal cell");
    }
    return grid;
}

}  // namespace hnav
