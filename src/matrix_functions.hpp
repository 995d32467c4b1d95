#pragma once

#include "matrix.hpp"

namespace bbpssw {

// Truncated power series sum_k A^k / k!, at most kMatrixExpTerms terms,
// stopping once a term changes no entry by more than 1e-12.
inline constexpr int kMatrixExpTerms = 20;
Matrix matrix_exp(const Matrix& a);

// Element-wise principal logarithm log|z| + i arg(z), not the matrix
// logarithm. Zero entries are clamped to magnitude 1e-300 so the result
// stays finite.
Matrix matrix_log(const Matrix& a);

bool is_unitary(const Matrix& u, double tolerance = 1e-10);

}  // namespace bbpssw
