#include "engine/simulation_types.hpp"

#include "errors.hpp"

#include <sstream>

namespace bbpssw {

std::string to_string(Basis basis) {
    switch (basis) {
        case Basis::Bell:
            return "bell";
        case Basis::Computational:
            return "computational";
    }
    return "unknown";
}

std::string to_string(EngineType type) {
    switch (type) {
        case EngineType::Average:
            return "average";
        case EngineType::MonteCarlo:
            return "monte-carlo";
    }
    return "unknown";
}

std::string to_string(PurificationStep step) {
    switch (step) {
        case PurificationStep::Initial:
            return "initial";
        case PurificationStep::Twirled:
            return "twirled";
        case PurificationStep::Exchanged:
            return "exchanged";
        case PurificationStep::Cnot:
            return "cnot";
        case PurificationStep::Measured:
            return "measured";
        case PurificationStep::Discard:
            return "discard";
        case PurificationStep::TwirlExchange:
            return "twirlExchange";
        case PurificationStep::Completed:
            return "completed";
    }
    return "unknown";
}

EngineType parse_engine_type(const std::string& name) {
    if (name == "average") {
        return EngineType::Average;
    }
    if (name == "monte-carlo") {
        return EngineType::MonteCarlo;
    }
    throw InvalidConfiguration("Unknown engine type: " + name);
}

void validate_parameters(const SimulationParameters& params) {
    if (params.initial_pairs < 2) {
        throw InvalidConfiguration("initial_pairs must be at least 2");
    }
    if (!(params.target_fidelity > 0.0 && params.target_fidelity <= 1.0)) {
        std::ostringstream oss;
        oss << "target_fidelity " << params.target_fidelity << " must be in (0, 1]";
        throw InvalidConfiguration(oss.str());
    }
    if (!(params.noise_parameter >= 0.0 && params.noise_parameter <= 1.0)) {
        std::ostringstream oss;
        oss << "noise_parameter " << params.noise_parameter << " must be in [0, 1]";
        throw InvalidConfiguration(oss.str());
    }
}

double average_fidelity(const std::vector<QubitPair>& pairs) {
    if (pairs.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& pair : pairs) {
        sum += pair.fidelity;
    }
    return sum / static_cast<double>(pairs.size());
}

double pair_fidelity(const DensityMatrix& rho, Basis basis, BellState target) {
    return basis == Basis::Bell ? fidelity_from_bell_basis(rho, target)
                                : fidelity_from_computational_basis(rho, target);
}

}  // namespace bbpssw
