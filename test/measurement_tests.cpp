#include "bell_basis.hpp"
#include "density_matrix.hpp"
#include "engine/bbpssw_operations.hpp"
#include "errors.hpp"
#include "gates.hpp"
#include "matrix_functions.hpp"
#include "measurement.hpp"
#include "pauli_twirl.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using bbpssw::Complex;
using bbpssw::DensityMatrix;
using bbpssw::Matrix;
using bbpssw::RandomStream;

namespace {

constexpr double kTol = 1e-10;

class SequenceRandomStream : public RandomStream {
  public:
    explicit SequenceRandomStream(std::vector<double> samples)
        : samples_(std::move(samples)) {}

    double uniform(double lo, double hi) override {
        if (index_ >= samples_.size()) {
            return lo;
        }
        const double raw = samples_[index_++];
        return lo + (hi - lo) * raw;
    }

  private:
    std::vector<double> samples_;
    std::size_t index_ = 0;
};

std::vector<DensityMatrix> bell_states() {
    return {
        DensityMatrix::bell_phi_plus(),
        DensityMatrix::bell_phi_minus(),
        DensityMatrix::bell_psi_plus(),
        DensityMatrix::bell_psi_minus(),
    };
}

DensityMatrix generic_pair() {
    const DensityMatrix a = DensityMatrix::from_state_vector(
        {Complex{0.2, 0.1}, Complex{0.6, 0.0}, Complex{-0.3, 0.5}, Complex{0.1, -0.4}});
    const DensityMatrix b = DensityMatrix::from_state_vector(
        {Complex{0.7, 0.0}, Complex{0.0, 0.2}, Complex{0.1, 0.1}, Complex{0.5, 0.0}});
    return DensityMatrix(a.matrix().scale(Complex{0.4, 0.0}) + b.matrix().scale(Complex{0.6, 0.0}));
}

}  // namespace

TEST(MeasurementTests, BellStateGivesEvenOutcomesAndCollapses) {
    const auto branches = bbpssw::measure_qubit(DensityMatrix::bell_phi_plus(), 0);
    EXPECT_EQ(branches[0].outcome, 0);
    EXPECT_EQ(branches[1].outcome, 1);
    EXPECT_NEAR(branches[0].probability, 0.5, kTol);
    EXPECT_NEAR(branches[1].probability, 0.5, kTol);
    ASSERT_TRUE(branches[0].post_state.has_value());
    ASSERT_TRUE(branches[1].post_state.has_value());
    EXPECT_TRUE(branches[0].post_state->equals(DensityMatrix::basis_state(2, 0), kTol));
    EXPECT_TRUE(branches[1].post_state->equals(DensityMatrix::basis_state(2, 3), kTol));
}

TEST(MeasurementTests, ImpossibleBranchHasNoPostState) {
    const auto branches = bbpssw::measure_qubit(DensityMatrix::basis_state(2, 1), 0);
    EXPECT_NEAR(branches[0].probability, 0.0, kTol);
    EXPECT_FALSE(branches[0].post_state.has_value());
    EXPECT_NEAR(branches[1].probability, 1.0, kTol);
    EXPECT_TRUE(branches[1].post_state.has_value());
    EXPECT_THROW(bbpssw::measure_qubit(DensityMatrix::basis_state(2, 1), 2),
                 bbpssw::InvalidParameter);
}

TEST(MeasurementTests, SampleComparesDrawAgainstZeroProbability) {
    SequenceRandomStream low({0.2});
    const auto zero = bbpssw::sample_measurement(DensityMatrix::bell_phi_plus(), 1, low);
    EXPECT_EQ(zero.outcome, 0);
    EXPECT_NEAR(zero.probability, 0.5, kTol);
    EXPECT_TRUE(zero.post_state.equals(DensityMatrix::basis_state(2, 0), kTol));

    SequenceRandomStream high({0.7});
    const auto one = bbpssw::sample_measurement(DensityMatrix::bell_phi_plus(), 1, high);
    EXPECT_EQ(one.outcome, 1);
    EXPECT_TRUE(one.post_state.equals(DensityMatrix::basis_state(2, 3), kTol));
}

TEST(MeasurementTests, SampleNeverPicksImpossibleOutcome) {
    SequenceRandomStream rng({1.0});
    const auto sample = bbpssw::sample_measurement(DensityMatrix::basis_state(1, 0), 0, rng);
    EXPECT_EQ(sample.outcome, 0);
    EXPECT_NEAR(sample.probability, 1.0, kTol);
}

TEST(PartialTraceTests, BellStateReducesToMaximallyMixed) {
    for (const auto& bell : bell_states()) {
        EXPECT_TRUE(bbpssw::partial_trace(bell, {1}).equals(DensityMatrix::maximally_mixed(1), kTol));
        EXPECT_TRUE(bbpssw::partial_trace(bell, {0}).equals(DensityMatrix::maximally_mixed(1), kTol));
    }
}

TEST(PartialTraceTests, ProductStateKeepsFactors) {
    // Index 2: qubit 0 in |0>, qubit 1 in |1>.
    const DensityMatrix product = DensityMatrix::basis_state(2, 2);
    EXPECT_TRUE(bbpssw::partial_trace(product, {0}).equals(DensityMatrix::basis_state(1, 1), kTol));
    EXPECT_TRUE(bbpssw::partial_trace(product, {1}).equals(DensityMatrix::basis_state(1, 0), kTol));
}

TEST(PartialTraceTests, SurvivingQubitsKeepOrder) {
    // Qubits (0, 1, 2) = (1, 0, 1) -> index 5. Tracing qubit 1 leaves (1, 1).
    const DensityMatrix rho = DensityMatrix::basis_state(3, 5);
    EXPECT_TRUE(bbpssw::partial_trace(rho, {1}).equals(DensityMatrix::basis_state(2, 3), kTol));
    // Tracing qubit 0 leaves (0, 1) -> index 2.
    EXPECT_TRUE(bbpssw::partial_trace(rho, {0}).equals(DensityMatrix::basis_state(2, 2), kTol));
}

TEST(PartialTraceTests, TracingEverythingLeavesTrace) {
    const DensityMatrix scalar = bbpssw::partial_trace(generic_pair(), {0, 1});
    EXPECT_EQ(scalar.dimension(), 1u);
    EXPECT_NEAR(scalar.at(0, 0).real(), 1.0, kTol);
}

TEST(PartialTraceTests, RejectsDuplicateOrInvalidQubits) {
    EXPECT_THROW(bbpssw::partial_trace(generic_pair(), {1, 1}), bbpssw::InvalidParameter);
    EXPECT_THROW(bbpssw::partial_trace(generic_pair(), {3}), bbpssw::InvalidParameter);
}

TEST(PauliTwirlTests, EverySequencePreservesSinglet) {
    const DensityMatrix singlet = DensityMatrix::bell_psi_minus();
    for (const auto& sequence : bbpssw::twirl_sequences()) {
        const Matrix op = bbpssw::pauli_twirl_operator(sequence);
        EXPECT_TRUE(bbpssw::is_unitary(op)) << sequence;
        EXPECT_TRUE(bbpssw::apply_unitary(singlet, op).equals(singlet, kTol))
            << "sequence '" << sequence << "'";
    }
}

TEST(PauliTwirlTests, PauliPairSequencesPreserveAllBellStates) {
    for (const std::string sequence : {"", "xx", "yy", "zz"}) {
        const Matrix op = bbpssw::pauli_twirl_operator(sequence);
        for (const auto& bell : bell_states()) {
            EXPECT_TRUE(bbpssw::apply_unitary(bell, op).equals(bell, kTol))
                << "sequence '" << sequence << "'";
        }
    }
}

TEST(PauliTwirlTests, DrawSelectsSequenceByIndex) {
    const DensityMatrix rho = generic_pair();
    SequenceRandomStream first({0.0});
    EXPECT_TRUE(bbpssw::pauli_twirl(rho, first).equals(rho, kTol));

    // 1.5 / 12 lands on index 1, the "xx" sequence.
    SequenceRandomStream second({1.5 / 12.0});
    const DensityMatrix expected =
        bbpssw::apply_unitary(rho, bbpssw::pauli_twirl_operator("xx"));
    EXPECT_TRUE(bbpssw::pauli_twirl(rho, second).equals(expected, kTol));
}

TEST(PauliTwirlTests, AverageIsWernerFormAroundSinglet) {
    const DensityMatrix rho = generic_pair();
    const DensityMatrix averaged = bbpssw::twirl_average(rho);
    const DensityMatrix werner = bbpssw::to_computational_basis(
        bbpssw::werner_projection(bbpssw::to_bell_basis(rho)));
    EXPECT_TRUE(averaged.equals(werner, kTol));
    EXPECT_NEAR(
        bbpssw::fidelity_from_computational_basis(averaged, bbpssw::BellState::PsiMinus),
        bbpssw::fidelity_from_computational_basis(rho, bbpssw::BellState::PsiMinus),
        kTol);
}

TEST(PauliTwirlTests, RejectsNonPairsAndUnknownAxes) {
    SequenceRandomStream rng({0.0});
    EXPECT_THROW(bbpssw::pauli_twirl(DensityMatrix::maximally_mixed(3), rng),
                 bbpssw::DimensionMismatch);
    EXPECT_THROW(bbpssw::twirl_average(DensityMatrix::maximally_mixed(1)),
                 bbpssw::DimensionMismatch);
    EXPECT_THROW(bbpssw::pauli_twirl_operator("xq"), bbpssw::InvalidParameter);
}
