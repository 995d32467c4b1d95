#pragma once

#include "bell_basis.hpp"
#include "density_matrix.hpp"
#include "noise.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bbpssw {

enum class Basis {
    Bell,
    Computational,
};

enum class EngineType {
    Average,
    MonteCarlo,
};

enum class PurificationStep {
    Initial,
    Twirled,
    Exchanged,
    Cnot,
    Measured,
    Discard,
    TwirlExchange,
    Completed,
};

struct SimulationParameters {
    int initial_pairs = 32;
    double noise_parameter = 0.3;
    double target_fidelity = 0.95;
    NoiseChannelKind noise_channel = NoiseChannelKind::UniformNoise;
};

// Two-qubit state shared by Alice (qubit 0) and Bob (qubit 1). The id is
// stable across a run; the matrix is expressed in `basis`.
struct QubitPair {
    int id = 0;
    DensityMatrix density_matrix;
    Basis basis = Basis::Computational;
    double fidelity = 0.0;
};

struct MeasurementResult {
    QubitPair control;
    bool successful = false;
    double success_probability = 0.0;
};

// Scratch data for a round in progress. joint_states are 4-qubit states in
// the computational basis: the control pair on qubits 0 (Alice) and 1
// (Bob), the target pair on qubits 2 (Alice) and 3 (Bob).
struct PendingPairs {
    std::vector<QubitPair> control_pairs;
    std::vector<QubitPair> target_pairs;
    std::vector<DensityMatrix> joint_states;
    std::vector<MeasurementResult> results;
};

struct SimulationState {
    std::vector<QubitPair> pairs;
    int round = 0;
    bool complete = false;
    PurificationStep purification_step = PurificationStep::Initial;
    double average_fidelity = 0.0;
    std::optional<PendingPairs> pending_pairs;
};

std::string to_string(Basis basis);
std::string to_string(EngineType type);
std::string to_string(PurificationStep step);

// Accepts "average" and "monte-carlo".
EngineType parse_engine_type(const std::string& name);

// Throws InvalidConfiguration when initial_pairs < 2, target_fidelity is
// outside (0, 1] or noise_parameter is outside [0, 1].
void validate_parameters(const SimulationParameters& params);

double average_fidelity(const std::vector<QubitPair>& pairs);

// Fidelity of a pair's matrix to `target`, honoring the pair's basis tag.
double pair_fidelity(const DensityMatrix& rho, Basis basis, BellState target);

}  // namespace bbpssw
