#pragma once

#include "similarity_matrix.h"
#include <string>

namespace watsim {

// Labeled square matrix as CSV:
//   ,label_1,label_2,...
//   label_1,v11,v12,...
// Values are written with enough digits to round-trip a double.
std::string format_matrix_csv(const SimilarityMatrix& matrix);

// Creates parent directories; throws std::runtime_error on write failure
void write_matrix_csv(const std::string& path, const SimilarityMatrix& matrix);

// Inverse of format_matrix_csv. Empty cells read as NaN.
// Throws std::runtime_error if the table is ragged, not square, a value does
// not parse, or row labels differ from the header labels.
SimilarityMatrix parse_matrix_csv(const std::string& text, const std::string& source = "<memory>");

SimilarityMatrix read_matrix_csv(const std::string& path);

}  // namespace watsim
