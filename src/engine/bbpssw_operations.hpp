#pragma once

#include "density_matrix.hpp"
#include "engine/simulation_types.hpp"
#include "matrix.hpp"
#include "noise.hpp"

namespace bbpssw {

// |Psi-><Psi-| with `channel` applied to Bob's qubit, expressed in `basis`.
QubitPair make_noisy_pair(
    int id,
    const NoiseChannel& channel,
    Basis basis,
    RandomStream& rng
);

// Psi- fidelity shared by every pair of an averaged ensemble: the channel's
// fidelity for Kraus channels, 1 - strength for the uniform channel.
double ensemble_fidelity(const NoiseChannel& channel, RandomStream& rng);

// Bell-basis pair with weight `fidelity` on Psi- and (1 - fidelity) / 3 on
// each other Bell state. Coherences are drawn from `rng` with magnitude
// scaled by `noise`; the diagonal never depends on the draws.
QubitPair make_coherent_pair(int id, double fidelity, double noise, RandomStream& rng);

// Bell-basis coefficients of a 2-qubit state, in BellState order.
struct BellDiagonal {
    double phi_plus = 0.0;
    double phi_minus = 0.0;
    double psi_plus = 0.0;
    double psi_minus = 0.0;
};

BellDiagonal bell_diagonal(const DensityMatrix& bell_rho);
DensityMatrix from_bell_diagonal(const BellDiagonal& d);

// Werner form around Psi- for a Bell-basis matrix: keeps F = <Psi-|rho|Psi->,
// spreads 1 - F evenly over the other Bell states and drops coherences.
DensityMatrix werner_projection(const DensityMatrix& bell_rho);

// Bell-basis permutation swapping the Phi+ and Psi- components.
DensityMatrix bell_exchange(const DensityMatrix& bell_rho);

// sigma_y on Alice's qubit of a computational-basis pair. Maps Psi- to Phi+
// and Phi- to Psi+ (up to phase), and back.
DensityMatrix unilateral_y(const DensityMatrix& rho);

// CNOT(0 -> 2) * CNOT(1 -> 3) on the 4-qubit control/target register.
const Matrix& bilateral_cnot();

// Bilateral CNOT applied to target (x) control, both given in the
// computational basis.
DensityMatrix joint_state(const DensityMatrix& control, const DensityMatrix& target);

struct PostSelection {
    // Only meaningful when probability is above kMeasurementEpsilon.
    DensityMatrix control;
    double probability = 0.0;
};

// Projects the target qubits of a joint state onto agreeing outcomes (00
// or 11) and traces them out, returning the normalized control state.
PostSelection post_select_agreeing(const DensityMatrix& joint);

struct PurificationOutcome {
    BellDiagonal control;
    double success_probability = 0.0;
};

// Closed-form BBPSSW recurrence for Bell-diagonal control (A,B,C,D) and
// target (a,b,c,d) pairs after bilateral CNOT and agreeing post-selection:
//   A' = (Aa + Bb) / N, B' = (Ab + Ba) / N,
//   C' = (Cc + Dd) / N, D' = (Cd + Dc) / N,
//   N  = (A + B)(a + b) + (C + D)(c + d).
PurificationOutcome purify_bell_diagonal(const BellDiagonal& control, const BellDiagonal& target);

}  // namespace bbpssw
