#pragma once

#include "complex_utils.hpp"
#include "matrix.hpp"

#include <cstddef>
#include <vector>

namespace bbpssw {

// Square 2^n x 2^n matrix describing an n-qubit state. Shape is checked on
// construction; trace and Hermiticity are checked on demand by validate().
class DensityMatrix {
  public:
    explicit DensityMatrix(Matrix matrix);

    // Normalized outer product |v><v|.
    static DensityMatrix from_state_vector(const std::vector<Complex>& amplitudes);
    // |index><index| on n qubits, little-endian (qubit 0 is the lowest bit).
    static DensityMatrix basis_state(int n_qubits, std::size_t index);
    static DensityMatrix maximally_mixed(int n_qubits);

    static DensityMatrix bell_phi_plus();
    static DensityMatrix bell_phi_minus();
    static DensityMatrix bell_psi_plus();
    static DensityMatrix bell_psi_minus();

    const Matrix& matrix() const { return matrix_; }
    std::size_t dimension() const { return matrix_.rows(); }
    int num_qubits() const { return num_qubits_; }

    const Complex& at(std::size_t row, std::size_t col) const {
        return matrix_.at(row, col);
    }
    Complex trace() const { return matrix_.trace(); }

    // Returns a copy rescaled to unit trace.
    DensityMatrix normalized() const;

    bool is_hermitian(double epsilon = 1e-10) const;
    bool validate(double epsilon = 1e-10) const;

    bool equals(const DensityMatrix& other, double tolerance = 1e-10) const {
        return matrix_.equals(other.matrix_, tolerance);
    }

  private:
    Matrix matrix_;
    int num_qubits_ = 0;
};

}  // namespace bbpssw
