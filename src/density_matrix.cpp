#include "density_matrix.hpp"

#include "errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace bbpssw {

namespace {

constexpr double kTraceEpsilon = 1e-12;

int qubits_for_dimension(std::size_t dim) {
    int n = 0;
    std::size_t size = 1;
    while (size < dim) {
        size <<= 1;
        ++n;
    }
    if (size != dim) {
        throw InvalidParameter(
            "density matrix dimension " + std::to_string(dim) + " is not a power of two");
    }
    return n;
}

DensityMatrix bell_state(const std::vector<Complex>& amplitudes) {
    return DensityMatrix::from_state_vector(amplitudes);
}

}  // namespace

DensityMatrix::DensityMatrix(Matrix matrix)
    : matrix_(std::move(matrix)) {
    if (!matrix_.is_square()) {
        throw NotSquare(
            "density matrix must be square, got " + std::to_string(matrix_.rows()) + "x" +
            std::to_string(matrix_.cols()));
    }
    num_qubits_ = qubits_for_dimension(matrix_.rows());
}

DensityMatrix DensityMatrix::from_state_vector(const std::vector<Complex>& amplitudes) {
    if (amplitudes.empty()) {
        throw InvalidParameter("state vector must not be empty");
    }
    double norm = 0.0;
    for (const auto& a : amplitudes) {
        norm += squared_magnitude(a);
    }
    if (norm < kTraceEpsilon) {
        throw InvalidParameter("state vector has zero norm");
    }
    const Matrix ket = Matrix::column(amplitudes);
    const Matrix outer = ket.multiply(ket.dagger()).scale(complex_real(1.0 / norm));
    return DensityMatrix(outer);
}

DensityMatrix DensityMatrix::basis_state(int n_qubits, std::size_t index) {
    if (n_qubits < 1) {
        throw InvalidParameter("basis state needs at least one qubit");
    }
    const std::size_t dim = static_cast<std::size_t>(1) << n_qubits;
    if (index >= dim) {
        throw InvalidParameter(
            "basis index " + std::to_string(index) + " out of range for " +
            std::to_string(n_qubits) + " qubits");
    }
    std::vector<Complex> amplitudes(dim, kZero);
    amplitudes[index] = kOne;
    return from_state_vector(amplitudes);
}

DensityMatrix DensityMatrix::maximally_mixed(int n_qubits) {
    if (n_qubits < 1) {
        throw InvalidParameter("maximally mixed state needs at least one qubit");
    }
    const std::size_t dim = static_cast<std::size_t>(1) << n_qubits;
    return DensityMatrix(
        Matrix::identity(dim).scale(complex_real(1.0 / static_cast<double>(dim))));
}

DensityMatrix DensityMatrix::bell_phi_plus() {
    return bell_state({kOne, kZero, kZero, kOne});
}

DensityMatrix DensityMatrix::bell_phi_minus() {
    return bell_state({kOne, kZero, kZero, -kOne});
}

DensityMatrix DensityMatrix::bell_psi_plus() {
    return bell_state({kZero, kOne, kOne, kZero});
}

DensityMatrix DensityMatrix::bell_psi_minus() {
    return bell_state({kZero, kOne, -kOne, kZero});
}

DensityMatrix DensityMatrix::normalized() const {
    const Complex tr = trace();
    if (std::abs(tr) < kTraceEpsilon) {
        throw InvalidParameter("cannot normalize a density matrix with zero trace");
    }
    if (std::abs(tr - kOne) < kTraceEpsilon) {
        return *this;
    }
    return DensityMatrix(matrix_.scale(divide(kOne, tr)));
}

bool DensityMatrix::is_hermitian(double epsilon) const {
    return matrix_.equals(matrix_.dagger(), epsilon);
}

bool DensityMatrix::validate(double epsilon) const {
    return std::abs(trace() - kOne) < epsilon && is_hermitian(epsilon);
}

}  // namespace bbpssw
