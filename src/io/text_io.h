// WATSIM - text_io.h
// Whole-file text reading (plain or gzip) and line handling for WAT sources

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace watsim {

/**
 * Reads a text file through zlib, so both plain and .gz files work.
 * Throws std::runtime_error if the file cannot be opened or decompressed.
 */
std::string read_text_file(const std::string& path);

// Writes text verbatim; throws std::runtime_error on failure.
// Parent directories are created as needed.
void write_text_file(const std::string& path, const std::string& text);

// Splits text into lines, keeping each line's terminator ("\n" or "\r\n")
// so that concatenating the result reproduces the input byte for byte.
std::vector<std::string> split_lines_keepends(const std::string& text);

std::string join_lines(const std::vector<std::string>& lines);

// Splits on a single-character delimiter, trimming surrounding blanks and
// dropping empty fields ("a, b,,c" -> {a, b, c}).
std::vector<std::string> split_list(const std::string& s, char delim = ',');

// Numeric option values. Both throw std::invalid_argument naming the option
// for signs, stray characters or out-of-range input.
size_t parse_count_arg(const std::string& value, const std::string& option);
int parse_positive_int_arg(const std::string& value, const std::string& option);

}  // namespace watsim
