#pragma once

#include "density_matrix.hpp"
#include "matrix.hpp"
#include "noise.hpp"

#include <array>
#include <cstddef>
#include <string>

namespace bbpssw {

// Bilateral pi/2 rotation sequences applied identically to both qubits of
// a pair. Each character names the rotation axis; rotations are applied in
// reading order. Together they form the 12-element rotation group of the
// tetrahedron, which leaves the singlet invariant.
inline constexpr std::size_t kTwirlSequenceCount = 12;
const std::array<std::string, kTwirlSequenceCount>& twirl_sequences();

// V (x) V, with V the product of the sequence's single-qubit rotations.
Matrix pauli_twirl_operator(const std::string& sequence);

// Applies one uniformly drawn sequence.
DensityMatrix pauli_twirl(const DensityMatrix& rho, RandomStream& rng);

// Exact average over all twelve sequences.
DensityMatrix twirl_average(const DensityMatrix& rho);

}  // namespace bbpssw
