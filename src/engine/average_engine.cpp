#include "engine/average_engine.hpp"

#include "engine/bbpssw_operations.hpp"
#include "measurement.hpp"

#include <utility>

namespace bbpssw {

AverageSimulationEngine::AverageSimulationEngine(SimulationParameters params, std::uint64_t seed)
    : SimulationEngine(std::move(params), seed) {
    reset();
}

QubitPair AverageSimulationEngine::make_initial_pair(int id) {
    const NoiseChannel& channel = noise_channel();
    const double fidelity = ensemble_fidelity(channel, random_stream());
    return make_coherent_pair(id, fidelity, channel.parameter(), random_stream());
}

QubitPair AverageSimulationEngine::twirl_pair(const QubitPair& pair) {
    DensityMatrix rho = werner_projection(pair.density_matrix);
    const double fidelity = fidelity_from_bell_basis(rho, BellState::PsiMinus);
    return QubitPair{pair.id, std::move(rho), Basis::Bell, fidelity};
}

QubitPair AverageSimulationEngine::exchange_pair(const QubitPair& pair, BellState reference) {
    DensityMatrix rho = bell_exchange(pair.density_matrix);
    const double fidelity = fidelity_from_bell_basis(rho, reference);
    return QubitPair{pair.id, std::move(rho), Basis::Bell, fidelity};
}

MeasurementResult AverageSimulationEngine::measure_pair(
    const QubitPair& control,
    const QubitPair& target,
    const DensityMatrix& /*joint*/
) {
    const PurificationOutcome outcome = purify_bell_diagonal(
        bell_diagonal(control.density_matrix), bell_diagonal(target.density_matrix));
    DensityMatrix rho = from_bell_diagonal(outcome.control);
    const double fidelity = fidelity_from_bell_basis(rho, BellState::PhiPlus);
    return MeasurementResult{
        QubitPair{control.id, std::move(rho), Basis::Bell, fidelity},
        outcome.success_probability >= kMeasurementEpsilon,
        outcome.success_probability,
    };
}

}  // namespace bbpssw
