#include "random_unitary.hpp"

#include "errors.hpp"

#include <cmath>
#include <utility>
#include <vector>

namespace bbpssw {

namespace {

constexpr double kResidualEpsilon = 1e-14;

}  // namespace

QRDecomposition qr_decompose(const Matrix& a) {
    if (!a.is_square()) {
        throw NotSquare("qr_decompose requires a square matrix");
    }
    const std::size_t n = a.rows();
    std::vector<std::vector<Complex>> q_cols(n, std::vector<Complex>(n, kZero));
    std::vector<Complex> r(n * n, kZero);

    for (std::size_t j = 0; j < n; ++j) {
        std::vector<Complex> v(n);
        for (std::size_t row = 0; row < n; ++row) {
            v[row] = a.at(row, j);
        }
        for (std::size_t i = 0; i < j; ++i) {
            Complex projection = kZero;
            for (std::size_t row = 0; row < n; ++row) {
                projection += std::conj(q_cols[i][row]) * v[row];
            }
            r[i * n + j] = projection;
            for (std::size_t row = 0; row < n; ++row) {
                v[row] -= projection * q_cols[i][row];
            }
        }
        double norm = 0.0;
        for (const auto& z : v) {
            norm += squared_magnitude(z);
        }
        norm = std::sqrt(norm);
        r[j * n + j] = complex_real(norm);
        if (norm > kResidualEpsilon) {
            for (auto& z : v) {
                z /= norm;
            }
        }
        q_cols[j] = std::move(v);
    }

    std::vector<Complex> q(n * n);
    for (std::size_t row = 0; row < n; ++row) {
        for (std::size_t col = 0; col < n; ++col) {
            q[row * n + col] = q_cols[col][row];
        }
    }
    return QRDecomposition{Matrix(n, n, std::move(q)), Matrix(n, n, std::move(r))};
}

Matrix random_unitary(int k, RandomStream& rng) {
    if (k < 1) {
        throw InvalidParameter("random unitary size must be at least 1");
    }
    const std::size_t n = static_cast<std::size_t>(k);
    const double scale = 1.0 / std::sqrt(2.0);
    std::vector<Complex> gaussian(n * n);
    for (auto& z : gaussian) {
        const double re = rng.gaussian() * scale;
        const double im = rng.gaussian() * scale;
        z = Complex{re, im};
    }
    return qr_decompose(Matrix(n, n, std::move(gaussian))).q;
}

}  // namespace bbpssw
