#include "matrix_functions.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace bbpssw {

namespace {

constexpr double kExpConvergence = 1e-12;
constexpr double kLogMagnitudeFloor = 1e-300;

}  // namespace

Matrix matrix_exp(const Matrix& a) {
    if (!a.is_square()) {
        throw NotSquare("matrix_exp requires a square matrix");
    }
    Matrix result = Matrix::identity(a.rows());
    Matrix term = Matrix::identity(a.rows());
    for (int k = 1; k <= kMatrixExpTerms; ++k) {
        term = (term * a).scale(complex_real(1.0 / static_cast<double>(k)));
        Matrix next = result + term;
        const bool converged = next.equals(result, kExpConvergence);
        result = std::move(next);
        if (converged) {
            break;
        }
    }
    return result;
}

Matrix matrix_log(const Matrix& a) {
    return a.map([](const Complex& z) {
        const double magnitude = std::max(std::abs(z), kLogMagnitudeFloor);
        return Complex{std::log(magnitude), std::arg(z)};
    });
}

bool is_unitary(const Matrix& u, double tolerance) {
    if (!u.is_square()) {
        return false;
    }
    const Matrix id = Matrix::identity(u.rows());
    return (u * u.dagger()).equals(id, tolerance) && (u.dagger() * u).equals(id, tolerance);
}

}  // namespace bbpssw
