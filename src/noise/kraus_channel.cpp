#include "noise/kraus_channel.hpp"

#include "errors.hpp"
#include "gates.hpp"

namespace bbpssw {

DensityMatrix KrausChannel::apply(
    const DensityMatrix& rho,
    int qubit,
    RandomStream& /*rng*/
) const {
    return apply_kraus(rho, qubit);
}

DensityMatrix KrausChannel::apply_kraus(const DensityMatrix& rho, int qubit) const {
    return apply_kraus_operators(rho, qubit, kraus_operators());
}

Matrix kraus_completeness(const std::vector<Matrix>& operators) {
    if (operators.empty()) {
        throw InvalidParameter("a Kraus set needs at least one operator");
    }
    Matrix sum = Matrix::zeros(operators.front().cols(), operators.front().cols());
    for (const auto& k : operators) {
        sum = sum + k.dagger() * k;
    }
    return sum;
}

DensityMatrix apply_kraus_operators(
    const DensityMatrix& rho,
    int qubit,
    const std::vector<Matrix>& local_operators
) {
    const int n = rho.num_qubits();
    validate_qubit_index(qubit, n);
    Matrix out = Matrix::zeros(rho.dimension(), rho.dimension());
    for (const auto& local : local_operators) {
        const Matrix k = embed_single_qubit(local, qubit, n);
        out = out + k * rho.matrix() * k.dagger();
    }
    return DensityMatrix(out);
}

}  // namespace bbpssw
