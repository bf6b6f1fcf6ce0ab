#include "matrix_io.h"
#include "../io/text_io.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace watsim {

namespace {

std::vector<std::string> split_csv_row(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

std::string strip_eol(std::string line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    return line;
}

double parse_cell(const std::string& cell, const std::string& where) {
    if (cell.empty()) return std::numeric_limits<double>::quiet_NaN();
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(cell.c_str(), &end);
    if (end == cell.c_str() || *end != '\0' || errno == ERANGE) {
        throw std::runtime_error("Invalid matrix value '" + cell + "' at " + where);
    }
    return v;
}

}  // namespace

std::string format_matrix_csv(const SimilarityMatrix& matrix) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto& label : matrix.labels()) out << "," << label;
    out << "\n";

    for (size_t i = 0; i < matrix.size(); ++i) {
        out << matrix.labels()[i];
        for (size_t j = 0; j < matrix.size(); ++j) {
            out << ",";
            double v = matrix(i, j);
            if (!std::isnan(v)) out << v;
        }
        out << "\n";
    }
    return out.str();
}

void write_matrix_csv(const std::string& path, const SimilarityMatrix& matrix) {
    write_text_file(path, format_matrix_csv(matrix));
}

SimilarityMatrix parse_matrix_csv(const std::string& text, const std::string& source) {
    std::vector<std::string> lines;
    for (const auto& raw : split_lines_keepends(text)) {
        std::string line = strip_eol(raw);
        if (!line.empty()) lines.push_back(std::move(line));
    }
    if (lines.empty()) {
        throw std::runtime_error("Empty matrix file: " + source);
    }

    std::vector<std::string> header = split_csv_row(lines[0]);
    std::vector<std::string> labels(header.begin() + 1, header.end());
    const size_t n = labels.size();

    if (lines.size() - 1 != n) {
        throw std::runtime_error("Matrix in " + source + " is not square: " +
                                 std::to_string(lines.size() - 1) + " rows, " +
                                 std::to_string(n) + " columns");
    }

    Eigen::MatrixXd values(n, n);
    for (size_t i = 0; i < n; ++i) {
        std::vector<std::string> fields = split_csv_row(lines[i + 1]);
        const std::string where = source + " line " + std::to_string(i + 2);
        if (fields.size() != n + 1) {
            throw std::runtime_error("Expected " + std::to_string(n + 1) + " fields, got " +
                                     std::to_string(fields.size()) + " at " + where);
        }
        if (fields[0] != labels[i]) {
            throw std::runtime_error("Row label '" + fields[0] + "' does not match column label '" +
                                     labels[i] + "' at " + where);
        }
        for (size_t j = 0; j < n; ++j) {
            values(i, j) = parse_cell(fields[j + 1], where);
        }
    }

    return SimilarityMatrix(std::move(labels), std::move(values));
}

SimilarityMatrix read_matrix_csv(const std::string& path) {
    return parse_matrix_csv(read_text_file(path), path);
}

}  // namespace watsim
