#pragma once

#include "engine/simulation_engine.hpp"

namespace bbpssw {

// Tracks pairs in the computational basis and samples every random
// operation: one twirl sequence per pair and per twirl, and literal
// outcomes for Alice's and Bob's target qubits.
class MonteCarloSimulationEngine final : public SimulationEngine {
  public:
    explicit MonteCarloSimulationEngine(
        SimulationParameters params,
        std::uint64_t seed = std::numeric_limits<std::uint64_t>::max()
    );

    EngineType engine_type() const override { return EngineType::MonteCarlo; }

  protected:
    Basis working_basis() const override { return Basis::Computational; }
    QubitPair twirl_pair(const QubitPair& pair) override;
    QubitPair exchange_pair(const QubitPair& pair, BellState reference) override;
    MeasurementResult measure_pair(
        const QubitPair& control,
        const QubitPair& target,
        const DensityMatrix& joint
    ) override;
};

}  // namespace bbpssw
