#ifndef RETIREPLAN_CSV_READER_HPP
#define RETIREPLAN_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace retireplan {

// Line-oriented reader for the small reference tables the engine consumes.
// Blank lines and lines starting with '#' are skipped so published tables
// can carry their source and edition as comments.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next data row, or an empty vector at end of input
    std::vector<std::string> read_row();
    bool has_more();

    // 1-based line number of the row last returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    void skip_ignorable_lines();
    static bool is_ignorable(const std::string& line);
    static std::string trim(const std::string& s);
};

// Parse helpers that report the offending line in their error message
int parse_int_cell(const std::string& cell, size_t line_number, const std::string& column);
double parse_double_cell(const std::string& cell, size_t line_number, const std::string& column);

} // namespace retireplan

#endif // RETIREPLAN_CSV_READER_HPP
