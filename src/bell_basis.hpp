#pragma once

#include "density_matrix.hpp"
#include "matrix.hpp"

#include <string>

namespace bbpssw {

// Ordering matches the rows of the change-of-basis matrix and the diagonal
// of a Bell-basis density matrix.
enum class BellState {
    PhiPlus = 0,
    PhiMinus = 1,
    PsiPlus = 2,
    PsiMinus = 3,
};

std::string to_string(BellState state);

// Rows are Phi+, Phi-, Psi+, Psi- written in the computational basis.
const Matrix& bell_basis_matrix();

DensityMatrix to_bell_basis(const DensityMatrix& rho);
DensityMatrix to_computational_basis(const DensityMatrix& rho);

// <state| rho |state> for a 2-qubit rho already expressed in the Bell basis.
double fidelity_from_bell_basis(const DensityMatrix& rho, BellState state);
double fidelity_from_computational_basis(const DensityMatrix& rho, BellState state);

}  // namespace bbpssw
