#include "engine/monte_carlo_engine.hpp"

#include "engine/bbpssw_operations.hpp"
#include "measurement.hpp"
#include "pauli_twirl.hpp"

#include <utility>

namespace bbpssw {

namespace {

constexpr int kTargetAliceQubit = 2;
constexpr int kTargetBobQubit = 3;

}  // namespace

MonteCarloSimulationEngine::MonteCarloSimulationEngine(
    SimulationParameters params,
    std::uint64_t seed
)
    : SimulationEngine(std::move(params), seed) {
    reset();
}

QubitPair MonteCarloSimulationEngine::twirl_pair(const QubitPair& pair) {
    DensityMatrix rho = pauli_twirl(pair.density_matrix, random_stream());
    const double fidelity = fidelity_from_computational_basis(rho, BellState::PsiMinus);
    return QubitPair{pair.id, std::move(rho), Basis::Computational, fidelity};
}

QubitPair MonteCarloSimulationEngine::exchange_pair(const QubitPair& pair, BellState reference) {
    DensityMatrix rho = unilateral_y(pair.density_matrix);
    const double fidelity = fidelity_from_computational_basis(rho, reference);
    return QubitPair{pair.id, std::move(rho), Basis::Computational, fidelity};
}

MeasurementResult MonteCarloSimulationEngine::measure_pair(
    const QubitPair& control,
    const QubitPair& /*target*/,
    const DensityMatrix& joint
) {
    const double agree_probability = post_select_agreeing(joint).probability;
    const MeasurementSample alice = sample_measurement(joint, kTargetAliceQubit, random_stream());
    const MeasurementSample bob =
        sample_measurement(alice.post_state, kTargetBobQubit, random_stream());
    if (alice.outcome != bob.outcome) {
        return MeasurementResult{control, false, agree_probability};
    }
    DensityMatrix rho =
        partial_trace(bob.post_state, {kTargetAliceQubit, kTargetBobQubit}).normalized();
    const double fidelity = fidelity_from_computational_basis(rho, BellState::PhiPlus);
    return MeasurementResult{
        QubitPair{control.id, std::move(rho), Basis::Computational, fidelity},
        true,
        agree_probability,
    };
}

}  // namespace bbpssw
