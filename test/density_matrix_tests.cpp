#include "bell_basis.hpp"
#include "density_matrix.hpp"
#include "errors.hpp"
#include "matrix.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <vector>

using bbpssw::BellState;
using bbpssw::Complex;
using bbpssw::DensityMatrix;
using bbpssw::Matrix;

namespace {

constexpr double kTol = 1e-10;

const std::array<BellState, 4> kBellStates = {
    BellState::PhiPlus, BellState::PhiMinus, BellState::PsiPlus, BellState::PsiMinus};

DensityMatrix bell(BellState state) {
    switch (state) {
        case BellState::PhiPlus:
            return DensityMatrix::bell_phi_plus();
        case BellState::PhiMinus:
            return DensityMatrix::bell_phi_minus();
        case BellState::PsiPlus:
            return DensityMatrix::bell_psi_plus();
        case BellState::PsiMinus:
            return DensityMatrix::bell_psi_minus();
    }
    return DensityMatrix::bell_phi_plus();
}

DensityMatrix werner_phi_plus(double p) {
    const Matrix pure = DensityMatrix::bell_phi_plus().matrix().scale(Complex{p, 0.0});
    const Matrix mixed = Matrix::identity(4).scale(Complex{(1.0 - p) / 4.0, 0.0});
    return DensityMatrix(pure + mixed);
}

// A generic mixed state with coherences in every basis.
DensityMatrix generic_state() {
    const DensityMatrix a = DensityMatrix::from_state_vector(
        {Complex{0.3, 0.1}, Complex{0.5, -0.2}, Complex{-0.1, 0.4}, Complex{0.6, 0.0}});
    const DensityMatrix b = DensityMatrix::from_state_vector(
        {Complex{0.0, 1.0}, Complex{0.2, 0.0}, Complex{0.7, 0.3}, Complex{-0.4, 0.0}});
    return DensityMatrix(a.matrix().scale(Complex{0.65, 0.0}) + b.matrix().scale(Complex{0.35, 0.0}));
}

}  // namespace

TEST(DensityMatrixTests, RejectsNonSquareAndNonPowerOfTwo) {
    EXPECT_THROW(DensityMatrix(Matrix::zeros(2, 4)), bbpssw::NotSquare);
    EXPECT_THROW(DensityMatrix(Matrix::identity(3)), bbpssw::InvalidParameter);
    EXPECT_EQ(DensityMatrix(Matrix::identity(8)).num_qubits(), 3);
}

TEST(DensityMatrixTests, FromStateVectorIsNormalizedOuterProduct) {
    const DensityMatrix rho =
        DensityMatrix::from_state_vector({Complex{1.0, 0.0}, Complex{0.0, 1.0}});
    EXPECT_TRUE(rho.validate());
    EXPECT_NEAR(rho.at(0, 0).real(), 0.5, kTol);
    EXPECT_NEAR(rho.at(0, 1).imag(), -0.5, kTol);
    EXPECT_NEAR(rho.at(1, 0).imag(), 0.5, kTol);
    EXPECT_THROW(DensityMatrix::from_state_vector({bbpssw::kZero, bbpssw::kZero}),
                 bbpssw::InvalidParameter);
}

TEST(DensityMatrixTests, BasisStateUsesLittleEndianIndex) {
    const DensityMatrix rho = DensityMatrix::basis_state(2, 1);
    EXPECT_NEAR(rho.at(1, 1).real(), 1.0, kTol);
    EXPECT_NEAR(rho.trace().real(), 1.0, kTol);
    EXPECT_THROW(DensityMatrix::basis_state(2, 4), bbpssw::InvalidParameter);
}

TEST(DensityMatrixTests, BellFactoriesAreValidStates) {
    for (BellState state : kBellStates) {
        EXPECT_TRUE(bell(state).validate()) << bbpssw::to_string(state);
    }
}

TEST(DensityMatrixTests, NormalizedRescalesTrace) {
    const DensityMatrix scaled(Matrix::identity(2).scale(Complex{3.0, 0.0}));
    EXPECT_FALSE(scaled.validate());
    const DensityMatrix rho = scaled.normalized();
    EXPECT_TRUE(rho.validate());
    EXPECT_NEAR(rho.at(0, 0).real(), 0.5, kTol);
    EXPECT_THROW(DensityMatrix(Matrix::zeros(2, 2)).normalized(), bbpssw::InvalidParameter);
}

TEST(DensityMatrixTests, ValidateDetectsNonHermitian) {
    const DensityMatrix rho(Matrix::from_rows({
        {Complex{0.5, 0.0}, Complex{0.2, 0.0}},
        {Complex{0.1, 0.0}, Complex{0.5, 0.0}},
    }));
    EXPECT_FALSE(rho.validate());
}

TEST(BellBasisTests, BellStatesAreDiagonalInBellBasis) {
    for (std::size_t i = 0; i < kBellStates.size(); ++i) {
        const DensityMatrix in_bell = bbpssw::to_bell_basis(bell(kBellStates[i]));
        for (std::size_t r = 0; r < 4; ++r) {
            for (std::size_t c = 0; c < 4; ++c) {
                const double expected = (r == i && c == i) ? 1.0 : 0.0;
                EXPECT_NEAR(std::abs(in_bell.at(r, c)), expected, kTol);
            }
        }
    }
}

TEST(BellBasisTests, SelfFidelityIsOneAndCrossFidelityZero) {
    for (BellState a : kBellStates) {
        for (BellState b : kBellStates) {
            const double f = bbpssw::fidelity_from_computational_basis(bell(a), b);
            EXPECT_NEAR(f, a == b ? 1.0 : 0.0, kTol)
                << bbpssw::to_string(a) << " vs " << bbpssw::to_string(b);
        }
    }
}

TEST(BellBasisTests, MaximallyMixedHasQuarterFidelity) {
    const DensityMatrix mixed = DensityMatrix::maximally_mixed(2);
    for (BellState state : kBellStates) {
        EXPECT_NEAR(bbpssw::fidelity_from_computational_basis(mixed, state), 0.25, kTol);
    }
}

TEST(BellBasisTests, WernerFidelityMatchesFormula) {
    for (double p : {0.0, 0.25, 0.5, 0.8, 1.0}) {
        const double f =
            bbpssw::fidelity_from_computational_basis(werner_phi_plus(p), BellState::PhiPlus);
        EXPECT_NEAR(f, p + (1.0 - p) / 4.0, kTol) << "p=" << p;
    }
}

TEST(BellBasisTests, RoundTripRecoversState) {
    const DensityMatrix rho = generic_state();
    ASSERT_TRUE(rho.validate());
    const DensityMatrix there_and_back =
        bbpssw::to_computational_basis(bbpssw::to_bell_basis(rho));
    EXPECT_TRUE(there_and_back.equals(rho, kTol));
    const DensityMatrix back_and_there =
        bbpssw::to_bell_basis(bbpssw::to_computational_basis(rho));
    EXPECT_TRUE(back_and_there.equals(rho, kTol));
}

TEST(BellBasisTests, FidelityMatchesOverlapForGenericState) {
    const DensityMatrix rho = generic_state();
    const Matrix& u = bbpssw::bell_basis_matrix();
    for (std::size_t k = 0; k < 4; ++k) {
        Complex overlap = bbpssw::kZero;
        for (std::size_t i = 0; i < 4; ++i) {
            for (std::size_t j = 0; j < 4; ++j) {
                overlap += std::conj(u.at(k, i)) * rho.at(i, j) * u.at(k, j);
            }
        }
        EXPECT_NEAR(
            bbpssw::fidelity_from_computational_basis(rho, static_cast<BellState>(k)),
            overlap.real(), kTol);
    }
}

TEST(BellBasisTests, RejectsNonPairStates) {
    EXPECT_THROW(bbpssw::to_bell_basis(DensityMatrix::maximally_mixed(3)),
                 bbpssw::DimensionMismatch);
    EXPECT_THROW(bbpssw::to_computational_basis(DensityMatrix::maximally_mixed(1)),
                 bbpssw::DimensionMismatch);
}
