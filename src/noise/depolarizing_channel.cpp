#include "noise/depolarizing_channel.hpp"

#include "gates.hpp"

#include <cmath>

namespace bbpssw {

DepolarizingChannel::DepolarizingChannel(double p) : KrausChannel(p) {}

std::shared_ptr<const NoiseChannel> DepolarizingChannel::clone() const {
    return std::make_shared<DepolarizingChannel>(parameter());
}

std::vector<Matrix> DepolarizingChannel::kraus_operators() const {
    const double p = parameter();
    const Complex keep = complex_real(std::sqrt(1.0 - p));
    const Complex flip = complex_real(std::sqrt(p / 3.0));
    return {
        pauli_matrix(Pauli::I).scale(keep),
        pauli_matrix(Pauli::X).scale(flip),
        pauli_matrix(Pauli::Y).scale(flip),
        pauli_matrix(Pauli::Z).scale(flip),
    };
}

}  // namespace bbpssw
