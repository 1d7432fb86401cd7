#ifndef POWERFIN_CSV_READER_HPP
#define POWERFIN_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace powerfin {

// Line-oriented CSV reader. Cells are trimmed; a cell wrapped in double
// quotes may contain the delimiter, and "" inside quotes is a literal quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the last line returned by read_row
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace powerfin

#endif // POWERFIN_CSV_READER_HPP
