#include "gates.hpp"

#include "errors.hpp"

#include <cmath>
#include <set>
#include <utility>

namespace bbpssw {

namespace {

constexpr int kMaxQubits = 16;

void validate_register_size(int n_qubits) {
    if (n_qubits < 1 || n_qubits > kMaxQubits) {
        throw InvalidParameter(
            "qubit count " + std::to_string(n_qubits) + " outside [1," +
            std::to_string(kMaxQubits) + "]");
    }
}

Matrix tensor_from_locals(const std::vector<const Matrix*>& locals) {
    Matrix result = Matrix::identity(1);
    for (int q = static_cast<int>(locals.size()) - 1; q >= 0; --q) {
        result = result.tensor(*locals[static_cast<std::size_t>(q)]);
    }
    return result;
}

}  // namespace

void validate_qubit_index(int qubit, int n_qubits) {
    if (qubit < 0 || qubit >= n_qubits) {
        throw InvalidParameter(
            "qubit index " + std::to_string(qubit) + " outside [0," +
            std::to_string(n_qubits) + ")");
    }
}

const Matrix& pauli_matrix(Pauli pauli) {
    static const Matrix kI = Matrix::identity(2);
    static const Matrix kX = Matrix::from_rows({{kZero, kOne}, {kOne, kZero}});
    static const Matrix kY =
        Matrix::from_rows({{kZero, -kImaginaryUnit}, {kImaginaryUnit, kZero}});
    static const Matrix kZ = Matrix::from_rows({{kOne, kZero}, {kZero, -kOne}});
    switch (pauli) {
        case Pauli::I:
            return kI;
        case Pauli::X:
            return kX;
        case Pauli::Y:
            return kY;
        case Pauli::Z:
            return kZ;
    }
    return kI;
}

Matrix pauli_operator(
    int n_qubits,
    const std::vector<int>& targets,
    const std::vector<Pauli>& paulis
) {
    validate_register_size(n_qubits);
    if (targets.size() != paulis.size()) {
        throw DimensionMismatch("pauli_operator needs one pauli per target");
    }
    std::vector<const Matrix*> locals(
        static_cast<std::size_t>(n_qubits), &pauli_matrix(Pauli::I));
    std::set<int> seen;
    for (std::size_t k = 0; k < targets.size(); ++k) {
        validate_qubit_index(targets[k], n_qubits);
        if (!seen.insert(targets[k]).second) {
            throw InvalidParameter(
                "duplicate pauli target " + std::to_string(targets[k]));
        }
        locals[static_cast<std::size_t>(targets[k])] = &pauli_matrix(paulis[k]);
    }
    return tensor_from_locals(locals);
}

Matrix embed_single_qubit(const Matrix& local, int qubit, int n_qubits) {
    validate_register_size(n_qubits);
    validate_qubit_index(qubit, n_qubits);
    if (local.rows() != 2 || local.cols() != 2) {
        throw DimensionMismatch("single-qubit operator must be 2x2");
    }
    std::vector<const Matrix*> locals(
        static_cast<std::size_t>(n_qubits), &pauli_matrix(Pauli::I));
    locals[static_cast<std::size_t>(qubit)] = &local;
    return tensor_from_locals(locals);
}

Matrix rx(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return Matrix::from_rows({
        {complex_real(c), Complex{0.0, -s}},
        {Complex{0.0, -s}, complex_real(c)},
    });
}

Matrix ry(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return Matrix::from_rows({
        {complex_real(c), complex_real(-s)},
        {complex_real(s), complex_real(c)},
    });
}

Matrix rz(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return Matrix::from_rows({
        {Complex{c, -s}, kZero},
        {kZero, Complex{c, s}},
    });
}

Matrix cnot_matrix(int n_qubits, int control, int target) {
    validate_register_size(n_qubits);
    validate_qubit_index(control, n_qubits);
    validate_qubit_index(target, n_qubits);
    if (control == target) {
        throw InvalidParameter("cnot control and target must differ");
    }
    const std::size_t dim = static_cast<std::size_t>(1) << n_qubits;
    const std::size_t control_mask = static_cast<std::size_t>(1) << control;
    const std::size_t target_mask = static_cast<std::size_t>(1) << target;
    std::vector<Complex> data(dim * dim, kZero);
    for (std::size_t col = 0; col < dim; ++col) {
        const std::size_t row = (col & control_mask) != 0 ? (col ^ target_mask) : col;
        data[row * dim + col] = kOne;
    }
    return Matrix(dim, dim, std::move(data));
}

DensityMatrix apply_unitary(const DensityMatrix& rho, const Matrix& unitary) {
    if (unitary.rows() != rho.dimension() || unitary.cols() != rho.dimension()) {
        throw DimensionMismatch(
            "unitary of size " + std::to_string(unitary.rows()) +
            " does not act on a state of dimension " + std::to_string(rho.dimension()));
    }
    return DensityMatrix(unitary * rho.matrix() * unitary.dagger());
}

std::string index_to_bitstring(std::size_t index, int n_qubits) {
    validate_register_size(n_qubits);
    std::string bits;
    bits.reserve(static_cast<std::size_t>(n_qubits));
    for (int q = 0; q < n_qubits; ++q) {
        bits.push_back(((index >> q) & 1U) != 0 ? '1' : '0');
    }
    return bits;
}

std::size_t bitstring_to_index(const std::string& bits) {
    std::size_t index = 0;
    for (std::size_t q = 0; q < bits.size(); ++q) {
        if (bits[q] == '1') {
            index |= static_cast<std::size_t>(1) << q;
        } else if (bits[q] != '0') {
            throw InvalidParameter("bitstring may only contain '0' and '1'");
        }
    }
    return index;
}

}  // namespace bbpssw
