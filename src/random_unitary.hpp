#pragma once

#include "matrix.hpp"
#include "noise.hpp"

namespace bbpssw {

struct QRDecomposition {
    Matrix q;
    Matrix r;
};

// Modified Gram-Schmidt on the columns of `a`, so that a = q * r with r
// upper triangular. Columns whose residual norm is at most 1e-14 are left
// unnormalized.
QRDecomposition qr_decompose(const Matrix& a);

// Haar-distributed k x k unitary: the Q factor of a matrix of independent
// complex Gaussians with variance 1/2 per component.
Matrix random_unitary(int k, RandomStream& rng);

}  // namespace bbpssw
