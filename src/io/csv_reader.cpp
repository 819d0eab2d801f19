#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace retireplan {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    skip_ignorable_lines();

    std::string line;
    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    // Tolerate CRLF files
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    return row;
}

bool CsvReader::has_more() {
    skip_ignorable_lines();
    return is_.good() && is_.peek() != EOF;
}

void CsvReader::skip_ignorable_lines() {
    while (is_.good() && is_.peek() != EOF) {
        const std::streampos pos = is_.tellg();
        std::string line;
        if (!std::getline(is_, line)) {
            return;
        }
        if (!is_ignorable(line)) {
            // Rewind so read_row() sees the data line
            is_.clear();
            is_.seekg(pos);
            return;
        }
        ++line_number_;
    }
}

bool CsvReader::is_ignorable(const std::string& line) {
    const std::string trimmed = trim(line);
    return trimmed.empty() || trimmed[0] == '#';
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

int parse_int_cell(const std::string& cell, size_t line_number, const std::string& column) {
    try {
        size_t consumed = 0;
        int value = std::stoi(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " +
                                 column + " value '" + cell + "'");
    }
}

double parse_double_cell(const std::string& cell, size_t line_number, const std::string& column) {
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " +
                                 column + " value '" + cell + "'");
    }
}

} // namespace retireplan
