#include "noise/uniform_noise_channel.hpp"

#include "gates.hpp"
#include "matrix_functions.hpp"
#include "random_unitary.hpp"

namespace bbpssw {

UniformNoiseChannel::UniformNoiseChannel(double strength) : NoiseChannel(strength) {}

std::shared_ptr<const NoiseChannel> UniformNoiseChannel::clone() const {
    return std::make_shared<UniformNoiseChannel>(parameter());
}

Matrix UniformNoiseChannel::fractional_rotation(const Matrix& u) const {
    return matrix_exp(matrix_log(u).scale(complex_real(parameter())));
}

DensityMatrix UniformNoiseChannel::apply(
    const DensityMatrix& rho,
    int qubit,
    RandomStream& rng
) const {
    validate_qubit_index(qubit, rho.num_qubits());
    if (parameter() == 0.0) {
        return rho;
    }
    const Matrix u = random_unitary(2, rng);
    const Matrix local = fractional_rotation(u);
    const Matrix full = embed_single_qubit(local, qubit, rho.num_qubits());
    return DensityMatrix(full * rho.matrix() * full.dagger()).normalized();
}

}  // namespace bbpssw
