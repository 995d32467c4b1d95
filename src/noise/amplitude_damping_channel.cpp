#include "noise/amplitude_damping_channel.hpp"

#include <algorithm>
#include <cmath>

namespace bbpssw {

AmplitudeDampingChannel::AmplitudeDampingChannel(double gamma) : KrausChannel(gamma) {}

std::shared_ptr<const NoiseChannel> AmplitudeDampingChannel::clone() const {
    return std::make_shared<AmplitudeDampingChannel>(parameter());
}

std::vector<Matrix> AmplitudeDampingChannel::kraus_operators() const {
    const double gamma = parameter();
    const double sqrt_gamma = std::sqrt(gamma);
    const double sqrt_one_minus = std::sqrt(std::max(0.0, 1.0 - gamma));
    return {
        Matrix::from_rows({{kOne, kZero}, {kZero, complex_real(sqrt_one_minus)}}),
        Matrix::from_rows({{kZero, complex_real(sqrt_gamma)}, {kZero, kZero}}),
    };
}

}  // namespace bbpssw
