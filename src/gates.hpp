#pragma once

#include "density_matrix.hpp"
#include "matrix.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace bbpssw {

// All multi-qubit operators use little-endian ordering: qubit 0 is the
// least significant bit of the basis index.

enum class Pauli {
    I,
    X,
    Y,
    Z,
};

const Matrix& pauli_matrix(Pauli pauli);

// Tensor product acting with paulis[k] on targets[k] and identity elsewhere.
Matrix pauli_operator(
    int n_qubits,
    const std::vector<int>& targets,
    const std::vector<Pauli>& paulis
);

// Lifts a 2x2 operator onto `qubit` of an n-qubit register.
Matrix embed_single_qubit(const Matrix& local, int qubit, int n_qubits);

// exp(-i theta sigma / 2).
Matrix rx(double theta);
Matrix ry(double theta);
Matrix rz(double theta);

// Permutation flipping the `target` bit whenever the `control` bit is set.
Matrix cnot_matrix(int n_qubits, int control, int target);

// U rho U^dagger.
DensityMatrix apply_unitary(const DensityMatrix& rho, const Matrix& unitary);

// Bits of `index` ordered from qubit 0 upward, e.g. 6 on 3 qubits -> "011".
std::string index_to_bitstring(std::size_t index, int n_qubits);
std::size_t bitstring_to_index(const std::string& bits);

void validate_qubit_index(int qubit, int n_qubits);

}  // namespace bbpssw
