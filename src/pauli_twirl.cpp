#include "pauli_twirl.hpp"

#include "complex_utils.hpp"
#include "errors.hpp"
#include "gates.hpp"

#include <cmath>

namespace bbpssw {

namespace {

Matrix axis_rotation(char axis) {
    const double angle = kPi / 2.0;
    switch (axis) {
        case 'x':
            return rx(angle);
        case 'y':
            return ry(angle);
        case 'z':
            return rz(angle);
        default:
            break;
    }
    throw InvalidParameter(std::string("unknown twirl rotation axis '") + axis + "'");
}

void require_pair(const DensityMatrix& rho) {
    if (rho.dimension() != 4) {
        throw DimensionMismatch("pauli twirl acts on 2-qubit states only");
    }
}

}  // namespace

const std::array<std::string, kTwirlSequenceCount>& twirl_sequences() {
    static const std::array<std::string, kTwirlSequenceCount> sequences = {
        "", "xx", "yy", "zz",
        "xy", "yz", "zx", "yx",
        "xyxy", "yzyz", "zxzx", "yxyx",
    };
    return sequences;
}

Matrix pauli_twirl_operator(const std::string& sequence) {
    Matrix single = Matrix::identity(2);
    for (char axis : sequence) {
        single = axis_rotation(axis) * single;
    }
    return single.tensor(single);
}

DensityMatrix pauli_twirl(const DensityMatrix& rho, RandomStream& rng) {
    require_pair(rho);
    const auto& sequences = twirl_sequences();
    const std::size_t pick = rng.uniform_index(sequences.size());
    return apply_unitary(rho, pauli_twirl_operator(sequences[pick]));
}

DensityMatrix twirl_average(const DensityMatrix& rho) {
    require_pair(rho);
    Matrix sum = Matrix::zeros(4, 4);
    for (const auto& sequence : twirl_sequences()) {
        sum = sum + apply_unitary(rho, pauli_twirl_operator(sequence)).matrix();
    }
    return DensityMatrix(sum.scale(complex_real(1.0 / static_cast<double>(kTwirlSequenceCount))));
}

}  // namespace bbpssw
