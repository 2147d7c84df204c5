#ifndef LEDGERCALC_IO_CSV_READER_HPP
#define LEDGERCALC_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace ledgercalc {
namespace io {

// Line-oriented CSV reader. Cells are trimmed; double-quoted cells may contain
// the delimiter and "" escapes a quote. Blank lines and lines starting with
// '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-blank, non-comment row; empty at end of input
    std::vector<std::string> read_row();

    // 1-based line number of the row last returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace ledgercalc

#endif // LEDGERCALC_IO_CSV_READER_HPP
