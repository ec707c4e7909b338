#include "table_loader.hpp"
#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace premium {
namespace io {

TableFormat detect_table_format(const std::string& filepath) {
    std::string extension = fs::path(filepath).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".xlsx") {
        return TableFormat::Xlsx;
    }
    if (extension == ".csv") {
        return TableFormat::Csv;
    }
    throw TableLoadError("Unsupported premium table format '" + extension +
                         "' (expected .xlsx or .csv): " + filepath);
}

SheetRows read_csv_rows(std::istream& is) {
    SheetRows rows;
    CsvReader reader(is);

    while (reader.has_more()) {
        // Blank lines come back empty and keep row numbers aligned
        rows.push_back(reader.read_row());
    }
    return rows;
}

SheetRows read_matrix_rows(const std::string& filepath, const std::string& sheet) {
    if (!fs::exists(filepath)) {
        throw TableLoadError("Premium table not found: " + filepath);
    }

    if (detect_table_format(filepath) == TableFormat::Csv) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw TableLoadError("Cannot open premium table: " + filepath);
        }
        return read_csv_rows(file);
    }

    XlsxReader reader(filepath);
    return reader.read_sheet(sheet);
}

PremiumTable load_premium_table(const std::string& filepath, const std::string& sheet) {
    SheetRows rows = read_matrix_rows(filepath, sheet);
    try {
        return PremiumTable::from_matrix_rows(rows);
    } catch (const TableLoadError& e) {
        throw TableLoadError(filepath + ": " + e.what());
    }
}

} // namespace io
} // namespace premium
