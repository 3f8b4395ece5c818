#include "io/TableLoader.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include "Errors.hpp"

namespace Leontief {

RawTable TableLoader::load_icio_csv(const std::string& filepath, int n_sectors) {
    std::ifstream f(filepath);
    if (!f.is_open()) {
        throw IoError("Could not open input-output table: " + filepath);
    }

    std::cout << "[Leontief::IO] Loading table: " << filepath << std::endl;
    RawTable table = parse_icio_csv(f, n_sectors);
    std::cout << "[Leontief::IO] Read " << table.rows() << " sectors x "
              << table.cols() << " columns" << std::endl;
    return table;
}

RawTable TableLoader::parse_icio_csv(std::istream& in, int n_sectors) {
    if (n_sectors < 1) {
        throw ConfigError("n_sectors must be positive, got " + std::to_string(n_sectors));
    }

    std::string line;
    if (!std::getline(in, line)) {
        throw DataIntegrityError("table is empty");
    }

    RawTable table;
    std::vector<std::string> header = split_line(line);
    if (header.size() < 2) {
        throw DataIntegrityError("header has no numeric columns");
    }
    table.column_labels.assign(header.begin() + 1, header.end());
    const int n_cols = static_cast<int>(table.column_labels.size());

    // final demand block and output column must follow the flows
    if (n_cols < n_sectors + 2) {
        throw DataIntegrityError("expected at least " + std::to_string(n_sectors + 2) +
                                 " numeric columns, header has " + std::to_string(n_cols));
    }

    table.values.resize(n_sectors, n_cols);
    table.row_labels.reserve(n_sectors);

    int line_no = 1;
    int row = 0;
    while (row < n_sectors && std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> cells = split_line(line);
        if (static_cast<int>(cells.size()) != n_cols + 1) {
            throw DataIntegrityError("line " + std::to_string(line_no) + " has " +
                                     std::to_string(cells.size()) + " cells, expected " +
                                     std::to_string(n_cols + 1));
        }

        table.row_labels.push_back(cells[0]);
        for (int j = 0; j < n_cols; ++j) {
            table.values(row, j) = parse_cell(cells[j + 1], line_no, j + 1);
        }
        ++row;
    }

    if (row < n_sectors) {
        throw DataIntegrityError("table has " + std::to_string(row) + " data rows, expected " +
                                 std::to_string(n_sectors));
    }

    table.layout = TableLayout::icio(n_sectors, n_cols);
    return table;
}

std::vector<std::string> TableLoader::split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (char ch : line) {
        if (ch == '"') {
            quoted = !quoted;
        } else if (ch == ',' && !quoted) {
            cells.push_back(cell);
            cell.clear();
        } else if (ch != '\r') {
            cell += ch;
        }
    }
    cells.push_back(cell);
    return cells;
}

double TableLoader::parse_cell(const std::string& cell, int line_no, int col) {
    size_t first = cell.find_first_not_of(" \t");
    if (first == std::string::npos) return 0.0;  // empty cell

    size_t consumed = 0;
    double v = 0.0;
    try {
        v = std::stod(cell.substr(first), &consumed);
    } catch (const std::exception&) {
        throw DataIntegrityError("line " + std::to_string(line_no) + ", column " +
                                 std::to_string(col) + ": not a number '" + cell + "'");
    }
    if (cell.find_first_not_of(" \t", first + consumed) != std::string::npos) {
        throw DataIntegrityError("line " + std::to_string(line_no) + ", column " +
                                 std::to_string(col) + ": trailing characters in '" + cell + "'");
    }
    return v;
}

} // namespace Leontief
