#include "engine/bbpssw_operations.hpp"

#include "bell_basis.hpp"
#include "errors.hpp"
#include "gates.hpp"
#include "measurement.hpp"

#include <cmath>
#include <utility>
#include <vector>

namespace bbpssw {

namespace {

constexpr int kAliceQubit = 0;
constexpr int kBobQubit = 1;
constexpr double kCoherenceScale = 0.1;

}  // namespace

QubitPair make_noisy_pair(
    int id,
    const NoiseChannel& channel,
    Basis basis,
    RandomStream& rng
) {
    const DensityMatrix noisy = channel.apply(DensityMatrix::bell_psi_minus(), kBobQubit, rng);
    DensityMatrix rho = basis == Basis::Bell ? to_bell_basis(noisy) : noisy;
    const double fidelity = pair_fidelity(rho, basis, BellState::PsiMinus);
    return QubitPair{id, std::move(rho), basis, fidelity};
}

double ensemble_fidelity(const NoiseChannel& channel, RandomStream& rng) {
    if (channel.kind() == NoiseChannelKind::UniformNoise) {
        return 1.0 - channel.parameter();
    }
    const DensityMatrix noisy = channel.apply(DensityMatrix::bell_psi_minus(), kBobQubit, rng);
    return pair_fidelity(noisy, Basis::Computational, BellState::PsiMinus);
}

QubitPair make_coherent_pair(int id, double fidelity, double noise, RandomStream& rng) {
    if (fidelity < 0.0 || fidelity > 1.0) {
        throw InvalidParameter("pair fidelity must lie in [0, 1]");
    }
    const double rest = (1.0 - fidelity) / 3.0;
    const double weights[4] = {rest, rest, rest, fidelity};
    std::vector<Complex> data(16, kZero);
    for (std::size_t i = 0; i < 4; ++i) {
        data[i * 4 + i] = complex_real(weights[i]);
        for (std::size_t j = i + 1; j < 4; ++j) {
            // sqrt(w_i w_j) scaling keeps rho positive for any weights.
            const double re = rng.uniform(-0.5, 0.5);
            const double im = rng.uniform(-0.5, 0.5);
            const double scale = kCoherenceScale * noise * std::sqrt(weights[i] * weights[j]);
            const Complex c(re * scale, im * scale);
            data[i * 4 + j] = c;
            data[j * 4 + i] = std::conj(c);
        }
    }
    DensityMatrix rho{Matrix(4, 4, std::move(data))};
    const double pair_weight = pair_fidelity(rho, Basis::Bell, BellState::PsiMinus);
    return QubitPair{id, std::move(rho), Basis::Bell, pair_weight};
}

BellDiagonal bell_diagonal(const DensityMatrix& bell_rho) {
    BellDiagonal d;
    d.phi_plus = fidelity_from_bell_basis(bell_rho, BellState::PhiPlus);
    d.phi_minus = fidelity_from_bell_basis(bell_rho, BellState::PhiMinus);
    d.psi_plus = fidelity_from_bell_basis(bell_rho, BellState::PsiPlus);
    d.psi_minus = fidelity_from_bell_basis(bell_rho, BellState::PsiMinus);
    return d;
}

DensityMatrix from_bell_diagonal(const BellDiagonal& d) {
    std::vector<Complex> data(16, kZero);
    data[0] = complex_real(d.phi_plus);
    data[5] = complex_real(d.phi_minus);
    data[10] = complex_real(d.psi_plus);
    data[15] = complex_real(d.psi_minus);
    return DensityMatrix(Matrix(4, 4, std::move(data)));
}

DensityMatrix werner_projection(const DensityMatrix& bell_rho) {
    const double f = fidelity_from_bell_basis(bell_rho, BellState::PsiMinus);
    const double rest = (1.0 - f) / 3.0;
    return from_bell_diagonal(BellDiagonal{rest, rest, rest, f});
}

DensityMatrix bell_exchange(const DensityMatrix& bell_rho) {
    static const Matrix swap = Matrix::from_rows({
        {kZero, kZero, kZero, kOne},
        {kZero, kOne, kZero, kZero},
        {kZero, kZero, kOne, kZero},
        {kOne, kZero, kZero, kZero},
    });
    return apply_unitary(bell_rho, swap);
}

DensityMatrix unilateral_y(const DensityMatrix& rho) {
    return apply_unitary(rho, embed_single_qubit(pauli_matrix(Pauli::Y), kAliceQubit, 2));
}

const Matrix& bilateral_cnot() {
    static const Matrix op = cnot_matrix(4, 0, 2) * cnot_matrix(4, 1, 3);
    return op;
}

DensityMatrix joint_state(const DensityMatrix& control, const DensityMatrix& target) {
    if (control.dimension() != 4 || target.dimension() != 4) {
        throw DimensionMismatch("bilateral CNOT needs two 2-qubit states");
    }
    const DensityMatrix joint(target.matrix().tensor(control.matrix()));
    return apply_unitary(joint, bilateral_cnot());
}

PostSelection post_select_agreeing(const DensityMatrix& joint) {
    if (joint.dimension() != 16) {
        throw DimensionMismatch("post-selection expects a 4-qubit joint state");
    }
    Matrix accepted = Matrix::zeros(16, 16);
    double probability = 0.0;
    const auto alice = measure_qubit(joint, 2);
    for (const auto& a : alice) {
        if (!a.post_state) {
            continue;
        }
        const auto bob = measure_qubit(*a.post_state, 3);
        const auto& agreeing = bob[static_cast<std::size_t>(a.outcome)];
        if (!agreeing.post_state) {
            continue;
        }
        const double p = a.probability * agreeing.probability;
        accepted = accepted + agreeing.post_state->matrix().scale(complex_real(p));
        probability += p;
    }
    if (probability < kMeasurementEpsilon) {
        return PostSelection{DensityMatrix::maximally_mixed(2), 0.0};
    }
    const DensityMatrix selected(accepted.scale(complex_real(1.0 / probability)));
    return PostSelection{partial_trace(selected, {2, 3}).normalized(), probability};
}

PurificationOutcome purify_bell_diagonal(const BellDiagonal& control, const BellDiagonal& target) {
    const double A = control.phi_plus;
    const double B = control.phi_minus;
    const double C = control.psi_plus;
    const double D = control.psi_minus;
    const double a = target.phi_plus;
    const double b = target.phi_minus;
    const double c = target.psi_plus;
    const double d = target.psi_minus;

    PurificationOutcome outcome;
    outcome.success_probability = (A + B) * (a + b) + (C + D) * (c + d);
    if (outcome.success_probability < kMeasurementEpsilon) {
        outcome.control = control;
        return outcome;
    }
    const double n = outcome.success_probability;
    outcome.control.phi_plus = (A * a + B * b) / n;
    outcome.control.phi_minus = (A * b + B * a) / n;
    outcome.control.psi_plus = (C * c + D * d) / n;
    outcome.control.psi_minus = (C * d + D * c) / n;
    return outcome;
}

}  // namespace bbpssw
