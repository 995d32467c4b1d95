#pragma once

#include "noise.hpp"

#include <memory>

namespace bbpssw {

// Applies a fractional Haar-random rotation U_s = exp(s * log(U)) to one
// qubit, where log is the element-wise logarithm from matrix_functions.hpp.
// U_s is not unitary in general, so the result is renormalized to unit
// trace. A strength of zero returns the input untouched without drawing
// from the stream.
class UniformNoiseChannel : public NoiseChannel {
  public:
    explicit UniformNoiseChannel(double strength);

    std::shared_ptr<const NoiseChannel> clone() const override;
    NoiseChannelKind kind() const override { return NoiseChannelKind::UniformNoise; }

    DensityMatrix apply(
        const DensityMatrix& rho,
        int qubit,
        RandomStream& rng
    ) const override;

    // exp(strength * log(u)) for a 2x2 u.
    Matrix fractional_rotation(const Matrix& u) const;
};

}  // namespace bbpssw
