#ifndef LOANCALC_CSV_READER_HPP
#define LOANCALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace loancalc {

// Line-oriented CSV reader for small hand-maintained tables.
// Cells are trimmed; lines starting with '#' are treated as comments.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-comment row; empty vector for a blank line or end of input
    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the last line returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace loancalc

#endif // LOANCALC_CSV_READER_HPP
