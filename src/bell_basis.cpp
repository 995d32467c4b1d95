#include "bell_basis.hpp"

#include "errors.hpp"

#include <cmath>

namespace bbpssw {

namespace {

void require_two_qubits(const DensityMatrix& rho, const char* operation) {
    if (rho.dimension() != 4) {
        throw DimensionMismatch(
            std::string(operation) + " requires a 4x4 density matrix, got " +
            std::to_string(rho.dimension()) + "x" + std::to_string(rho.dimension()));
    }
}

}  // namespace

std::string to_string(BellState state) {
    switch (state) {
        case BellState::PhiPlus:
            return "phi+";
        case BellState::PhiMinus:
            return "phi-";
        case BellState::PsiPlus:
            return "psi+";
        case BellState::PsiMinus:
            return "psi-";
    }
    return "unknown";
}

const Matrix& bell_basis_matrix() {
    static const Matrix basis = [] {
        const double h = 1.0 / std::sqrt(2.0);
        return Matrix::from_rows({
            {complex_real(h), kZero, kZero, complex_real(h)},
            {complex_real(h), kZero, kZero, complex_real(-h)},
            {kZero, complex_real(h), complex_real(h), kZero},
            {kZero, complex_real(h), complex_real(-h), kZero},
        });
    }();
    return basis;
}

DensityMatrix to_bell_basis(const DensityMatrix& rho) {
    require_two_qubits(rho, "to_bell_basis");
    const Matrix& u = bell_basis_matrix();
    return DensityMatrix(u * rho.matrix() * u.dagger());
}

DensityMatrix to_computational_basis(const DensityMatrix& rho) {
    require_two_qubits(rho, "to_computational_basis");
    const Matrix& u = bell_basis_matrix();
    return DensityMatrix(u.dagger() * rho.matrix() * u);
}

double fidelity_from_bell_basis(const DensityMatrix& rho, BellState state) {
    require_two_qubits(rho, "fidelity_from_bell_basis");
    const auto index = static_cast<std::size_t>(state);
    return rho.at(index, index).real();
}

double fidelity_from_computational_basis(const DensityMatrix& rho, BellState state) {
    return fidelity_from_bell_basis(to_bell_basis(rho), state);
}

}  // namespace bbpssw
