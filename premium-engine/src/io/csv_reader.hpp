#ifndef PREMIUM_IO_CSV_READER_HPP
#define PREMIUM_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace premium {
namespace io {

// Line-oriented CSV reader for spreadsheet exports.
// Handles double-quoted fields (with "" escapes), CRLF line endings and a
// leading UTF-8 byte order mark. Quoted fields may not span lines.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the row most recently returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace premium

#endif // PREMIUM_IO_CSV_READER_HPP
