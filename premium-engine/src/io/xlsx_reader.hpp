#ifndef PREMIUM_IO_XLSX_READER_HPP
#define PREMIUM_IO_XLSX_READER_HPP

#include "zip_archive.hpp"
#include <map>
#include <string>
#include <vector>

namespace premium {
namespace io {

using SheetRows = std::vector<std::vector<std::string>>;

// Reads cell values from an Office Open XML workbook (.xlsx).
//
// Cells are returned as their displayed text source: shared and inline
// strings verbatim, numbers as stored in the sheet XML (e.g. "100000",
// "812.5"), booleans as "TRUE"/"FALSE", and cached results for formula
// cells. Cell references are honoured, so skipped columns and rows come
// back as empty cells and empty rows. Styles and number formats are not
// applied.
//
// Throws TableLoadError for a missing sheet or malformed package.
class XlsxReader {
public:
    explicit XlsxReader(const std::string& filepath);

    // Sheet names in workbook order
    const std::vector<std::string>& sheet_names() const { return sheet_names_; }
    bool has_sheet(const std::string& name) const;

    SheetRows read_sheet(const std::string& name) const;

    // Worksheet limits of the file format (row 1048576, column XFD)
    static constexpr size_t MAX_ROWS = 1048576;
    static constexpr size_t MAX_COLUMNS = 16384;

    // Zero-based column index of a cell reference such as "AB12" (27)
    static size_t column_index(const std::string& cell_reference);

    // One-based row number of a cell reference such as "AB12" (12), or 0.
    // Throws TableLoadError past MAX_ROWS.
    static size_t row_number(const std::string& cell_reference);

private:
    std::string filepath_;
    ZipArchive archive_;
    std::vector<std::string> sheet_names_;
    std::map<std::string, std::string> sheet_paths_;  // sheet name -> part path
    std::vector<std::string> shared_strings_;

    void read_workbook();
    void read_shared_strings();
};

} // namespace io
} // namespace premium

#endif // PREMIUM_IO_XLSX_READER_HPP
