#pragma once

#include "engine/simulation_types.hpp"
#include "execution_log.hpp"
#include "noise.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace bbpssw {

class ProgressReporter;

// Drives the purification state machine
//   initial -> twirled -> exchanged -> cnot -> measured -> discard
//           -> twirlExchange -> completed -> initial ...
// Each transition builds a new SimulationState from the current one; the
// engine only stores the latest value. Subclasses supply the per-pair
// operations in the basis they work in.
class SimulationEngine {
  public:
    virtual ~SimulationEngine() = default;

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    virtual EngineType engine_type() const = 0;

    // Advances one protocol step. A complete state is returned unchanged.
    const SimulationState& next_step();
    // Advances until the round is completed or the run is complete.
    const SimulationState& step();
    // Regenerates the noisy ensemble from the current parameters.
    const SimulationState& reset();
    const SimulationState& current_state() const { return state_; }
    // Validates and installs new parameters, then resets.
    void update_params(const SimulationParameters& params);

    const SimulationParameters& parameters() const { return params_; }
    const std::vector<ExecutionLog>& logs() const { return logs_; }

    void set_progress_reporter(ProgressReporter* reporter);
    // Reseeds the stream used for noise, twirl draws and measurements.
    // Takes effect from the next reset or random draw.
    void set_random_seed(std::uint64_t seed);
    void set_trial_index(int trial) { trial_index_ = trial; }

  protected:
    SimulationEngine(
        SimulationParameters params,
        std::uint64_t seed = std::numeric_limits<std::uint64_t>::max()
    );

    RandomStream& random_stream() { return stream_; }
    const NoiseChannel& noise_channel() const { return *channel_; }

    virtual Basis working_basis() const = 0;
    // One pair of a fresh ensemble. Defaults to Psi- with the channel
    // applied to Bob's qubit, in working_basis().
    virtual QubitPair make_initial_pair(int id);
    // Twirl toward Werner form; fidelity is taken against Psi-.
    virtual QubitPair twirl_pair(const QubitPair& pair) = 0;
    // Psi- <-> Phi+ exchange; fidelity is taken against `reference`.
    virtual QubitPair exchange_pair(const QubitPair& pair, BellState reference) = 0;
    virtual MeasurementResult measure_pair(
        const QubitPair& control,
        const QubitPair& target,
        const DensityMatrix& joint
    ) = 0;

  private:
    SimulationState initialize();
    SimulationState advance(const SimulationState& state);
    SimulationState apply_twirl(const SimulationState& state);
    SimulationState apply_exchange(const SimulationState& state);
    SimulationState apply_bilateral_cnot(const SimulationState& state);
    SimulationState apply_measurement(const SimulationState& state);
    SimulationState apply_discard(const SimulationState& state);
    SimulationState apply_twirl_exchange(const SimulationState& state);
    SimulationState apply_completion(const SimulationState& state);

    void log_event(
        const SimulationState& state,
        const std::string& category,
        const std::string& message
    );

    SimulationParameters params_;
    std::shared_ptr<const NoiseChannel> channel_;
    SimulationState state_;
    std::mt19937_64 rng_{};
    StdRandomStream stream_{rng_};
    std::vector<ExecutionLog> logs_;
    ProgressReporter* progress_reporter_ = nullptr;
    int trial_index_ = 0;
};

std::unique_ptr<SimulationEngine> make_engine(
    EngineType type,
    const SimulationParameters& params,
    std::uint64_t seed = std::numeric_limits<std::uint64_t>::max()
);

}  // namespace bbpssw
