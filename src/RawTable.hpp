#pragma once
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace Leontief {

// Column layout of the numeric part of an input-output table.
// Indices exclude the leading label column.
struct TableLayout {
    int n_sectors = 0;
    int final_demand_begin = 0;  // half-open [begin, end)
    int final_demand_end = 0;
    int output_column = 0;

    // ICIO layout: flows [0, n), final demand [n, total - 1), output at total - 1
    static TableLayout icio(int n, int total_columns) {
        TableLayout l;
        l.n_sectors = n;
        l.final_demand_begin = n;
        l.final_demand_end = total_columns - 1;
        l.output_column = total_columns - 1;
        return l;
    }
};

struct RawTable {
    std::vector<std::string> row_labels;     // one per sector-country
    std::vector<std::string> column_labels;  // one per numeric column
    Eigen::MatrixXd values;                  // n_sectors x column_labels.size()
    TableLayout layout;

    int rows() const { return static_cast<int>(values.rows()); }
    int cols() const { return static_cast<int>(values.cols()); }
};

} // namespace Leontief
