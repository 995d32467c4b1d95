#pragma once

#include "noise/kraus_channel.hpp"

#include <memory>
#include <vector>

namespace bbpssw {

// K0 = sqrt(1-p/2) I, K1 = sqrt(p/2) Z. Coherences on the qubit shrink by
// a factor 1 - p.
class DephasingChannel : public KrausChannel {
  public:
    explicit DephasingChannel(double p);

    std::shared_ptr<const NoiseChannel> clone() const override;
    NoiseChannelKind kind() const override { return NoiseChannelKind::Dephasing; }
    std::vector<Matrix> kraus_operators() const override;
};

}  // namespace bbpssw
