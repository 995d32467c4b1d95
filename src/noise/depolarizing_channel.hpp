#pragma once

#include "noise/kraus_channel.hpp"

#include <memory>
#include <vector>

namespace bbpssw {

// K0 = sqrt(1-p) I, K1..3 = sqrt(p/3) {X, Y, Z}. The output is maximally
// mixed on the qubit at p = 0.75, not at p = 1.
class DepolarizingChannel : public KrausChannel {
  public:
    explicit DepolarizingChannel(double p);

    std::shared_ptr<const NoiseChannel> clone() const override;
    NoiseChannelKind kind() const override { return NoiseChannelKind::Depolarizing; }
    std::vector<Matrix> kraus_operators() const override;
};

}  // namespace bbpssw
