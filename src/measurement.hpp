#pragma once

#include "density_matrix.hpp"
#include "noise.hpp"

#include <array>
#include <optional>
#include <vector>

namespace bbpssw {

// Branches with probability below this carry no post-measurement state.
inline constexpr double kMeasurementEpsilon = 1e-12;

struct MeasurementBranch {
    int outcome = 0;
    double probability = 0.0;
    // Collapsed and renormalized state, absent for negligible branches.
    std::optional<DensityMatrix> post_state;
};

struct MeasurementSample {
    int outcome = 0;
    double probability = 0.0;
    DensityMatrix post_state;
};

// Projective Z measurement of one qubit. Index 0 holds outcome 0.
std::array<MeasurementBranch, 2> measure_qubit(const DensityMatrix& rho, int qubit);

// Draws r in [0, 1) and reports outcome 0 when r < p0.
MeasurementSample sample_measurement(const DensityMatrix& rho, int qubit, RandomStream& rng);

// Sums out the listed qubits. Remaining qubits keep their relative order,
// so the lowest surviving qubit becomes qubit 0.
DensityMatrix partial_trace(const DensityMatrix& rho, const std::vector<int>& trace_out);

}  // namespace bbpssw
