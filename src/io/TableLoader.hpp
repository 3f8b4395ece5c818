#pragma once
#include <istream>
#include <string>
#include "../RawTable.hpp"

namespace Leontief {

class TableLoader {
public:
    // Reads an OECD ICIO csv: header row, label column, then the first
    // n_sectors data rows. Trailing rows (taxes, value added, output) are skipped.
    static RawTable load_icio_csv(const std::string& filepath, int n_sectors);

    static RawTable parse_icio_csv(std::istream& in, int n_sectors);

private:
    static std::vector<std::string> split_line(const std::string& line);
    static double parse_cell(const std::string& cell, int line_no, int col);
};

} // namespace Leontief
