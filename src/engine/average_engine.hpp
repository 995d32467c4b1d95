#pragma once

#include "engine/simulation_engine.hpp"

namespace bbpssw {

// Tracks pairs in the Bell basis and replaces every random operation after
// the initial noise by its expectation: twirls are exact Werner
// projections and measurement keeps each control pair in its expected
// post-selected state.
class AverageSimulationEngine final : public SimulationEngine {
  public:
    explicit AverageSimulationEngine(
        SimulationParameters params,
        std::uint64_t seed = std::numeric_limits<std::uint64_t>::max()
    );

    EngineType engine_type() const override { return EngineType::Average; }

  protected:
    Basis working_basis() const override { return Basis::Bell; }
    // Every pair shares the Bell-diagonal weights of ensemble_fidelity();
    // only the coherences are drawn per pair.
    QubitPair make_initial_pair(int id) override;
    QubitPair twirl_pair(const QubitPair& pair) override;
    QubitPair exchange_pair(const QubitPair& pair, BellState reference) override;
    MeasurementResult measure_pair(
        const QubitPair& control,
        const QubitPair& target,
        const DensityMatrix& joint
    ) override;
};

}  // namespace bbpssw
