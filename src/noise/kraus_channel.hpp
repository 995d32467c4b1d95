#pragma once

#include "matrix.hpp"
#include "noise.hpp"

#include <vector>

namespace bbpssw {

// Channel described by a fixed set of 2x2 Kraus operators acting on one
// qubit: rho -> sum_k K_k rho K_k^dagger.
class KrausChannel : public NoiseChannel {
  public:
    using NoiseChannel::NoiseChannel;

    virtual std::vector<Matrix> kraus_operators() const = 0;

    DensityMatrix apply(
        const DensityMatrix& rho,
        int qubit,
        RandomStream& /*rng*/
    ) const override;

    DensityMatrix apply_kraus(const DensityMatrix& rho, int qubit) const;
};

// sum_k K_k^dagger K_k, the identity for a trace-preserving set.
Matrix kraus_completeness(const std::vector<Matrix>& operators);

DensityMatrix apply_kraus_operators(
    const DensityMatrix& rho,
    int qubit,
    const std::vector<Matrix>& local_operators
);

}  // namespace bbpssw
