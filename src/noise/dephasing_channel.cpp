#include "noise/dephasing_channel.hpp"

#include "gates.hpp"

#include <cmath>

namespace bbpssw {

DephasingChannel::DephasingChannel(double p) : KrausChannel(p) {}

std::shared_ptr<const NoiseChannel> DephasingChannel::clone() const {
    return std::make_shared<DephasingChannel>(parameter());
}

std::vector<Matrix> DephasingChannel::kraus_operators() const {
    const double p = parameter();
    return {
        pauli_matrix(Pauli::I).scale(complex_real(std::sqrt(1.0 - p / 2.0))),
        pauli_matrix(Pauli::Z).scale(complex_real(std::sqrt(p / 2.0))),
    };
}

}  // namespace bbpssw
