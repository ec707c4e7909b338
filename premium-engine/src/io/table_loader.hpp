#ifndef PREMIUM_IO_TABLE_LOADER_HPP
#define PREMIUM_IO_TABLE_LOADER_HPP

#include "../premium_table.hpp"
#include "xlsx_reader.hpp"
#include <istream>
#include <string>

namespace premium {
namespace io {

constexpr const char* DEFAULT_MATRIX_SHEET = "matrix";

enum class TableFormat {
    Xlsx,
    Csv
};

// Format from the file extension (case-insensitive).
// Throws TableLoadError for anything other than .xlsx or .csv.
TableFormat detect_table_format(const std::string& filepath);

// Raw rows of the premium matrix. For .xlsx the named worksheet is read;
// a CSV file holds a single sheet and sheet is ignored.
SheetRows read_matrix_rows(const std::string& filepath,
                           const std::string& sheet = DEFAULT_MATRIX_SHEET);

SheetRows read_csv_rows(std::istream& is);

// Load and validate the premium matrix. Throws TableLoadError.
PremiumTable load_premium_table(const std::string& filepath,
                                const std::string& sheet = DEFAULT_MATRIX_SHEET);

} // namespace io
} // namespace premium

#endif // PREMIUM_IO_TABLE_LOADER_HPP
