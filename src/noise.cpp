#include "noise.hpp"

#include "complex_utils.hpp"
#include "errors.hpp"
#include "noise/amplitude_damping_channel.hpp"
#include "noise/dephasing_channel.hpp"
#include "noise/depolarizing_channel.hpp"
#include "noise/uniform_noise_channel.hpp"

#include <cmath>
#include <sstream>

namespace bbpssw {

double RandomStream::gaussian() {
    if (has_spare_) {
        has_spare_ = false;
        return spare_;
    }
    // 1 - u keeps the logarithm argument in (0, 1].
    const double u1 = 1.0 - uniform(0.0, 1.0);
    const double u2 = uniform(0.0, 1.0);
    const double radius = std::sqrt(-2.0 * std::log(u1));
    const double angle = 2.0 * kPi * u2;
    spare_ = radius * std::sin(angle);
    has_spare_ = true;
    return radius * std::cos(angle);
}

std::size_t RandomStream::uniform_index(std::size_t count) {
    if (count == 0) {
        throw InvalidParameter("cannot draw an index from an empty range");
    }
    const double sample = uniform(0.0, static_cast<double>(count));
    const auto index = static_cast<std::size_t>(std::floor(sample));
    return index < count ? index : count - 1;
}

StdRandomStream::StdRandomStream(std::mt19937_64& rng) : rng_(rng) {}

double StdRandomStream::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

std::string to_string(NoiseChannelKind kind) {
    switch (kind) {
        case NoiseChannelKind::UniformNoise:
            return "uniform";
        case NoiseChannelKind::AmplitudeDamping:
            return "amplitude-damping";
        case NoiseChannelKind::Dephasing:
            return "dephasing";
        case NoiseChannelKind::Depolarizing:
            return "depolarizing";
    }
    return "unknown";
}

NoiseChannelKind parse_noise_channel(const std::string& name) {
    if (name == "uniform") {
        return NoiseChannelKind::UniformNoise;
    }
    if (name == "amplitude-damping") {
        return NoiseChannelKind::AmplitudeDamping;
    }
    if (name == "dephasing") {
        return NoiseChannelKind::Dephasing;
    }
    if (name == "depolarizing") {
        return NoiseChannelKind::Depolarizing;
    }
    throw InvalidConfiguration("Unknown noise channel: " + name);
}

NoiseChannel::NoiseChannel(double parameter) : parameter_(parameter) {
    validate_channel_parameter(parameter_);
}

void validate_channel_parameter(double parameter) {
    if (!(parameter >= 0.0 && parameter <= 1.0)) {
        std::ostringstream oss;
        oss << "noise parameter " << parameter << " must be in [0, 1]";
        throw InvalidParameter(oss.str());
    }
}

std::shared_ptr<const NoiseChannel> make_noise_channel(
    NoiseChannelKind kind,
    double parameter
) {
    switch (kind) {
        case NoiseChannelKind::UniformNoise:
            return std::make_shared<UniformNoiseChannel>(parameter);
        case NoiseChannelKind::AmplitudeDamping:
            return std::make_shared<AmplitudeDampingChannel>(parameter);
        case NoiseChannelKind::Dephasing:
            return std::make_shared<DephasingChannel>(parameter);
        case NoiseChannelKind::Depolarizing:
            return std::make_shared<DepolarizingChannel>(parameter);
    }
    throw InvalidParameter("unsupported noise channel");
}

DensityMatrix apply_depolarizing(const DensityMatrix& rho, int qubit, double p) {
    return DepolarizingChannel(p).apply_kraus(rho, qubit);
}

DensityMatrix apply_dephasing(const DensityMatrix& rho, int qubit, double p) {
    return DephasingChannel(p).apply_kraus(rho, qubit);
}

DensityMatrix apply_amplitude_damping(const DensityMatrix& rho, int qubit, double gamma) {
    return AmplitudeDampingChannel(gamma).apply_kraus(rho, qubit);
}

DensityMatrix apply_uniform_noise(
    const DensityMatrix& rho,
    int qubit,
    double strength,
    RandomStream& rng
) {
    return UniformNoiseChannel(strength).apply(rho, qubit, rng);
}

}  // namespace bbpssw
