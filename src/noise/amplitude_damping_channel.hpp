#pragma once

#include "noise/kraus_channel.hpp"

#include <memory>
#include <vector>

namespace bbpssw {

class AmplitudeDampingChannel : public KrausChannel {
  public:
    explicit AmplitudeDampingChannel(double gamma);

    std::shared_ptr<const NoiseChannel> clone() const override;
    NoiseChannelKind kind() const override { return NoiseChannelKind::AmplitudeDamping; }
    std::vector<Matrix> kraus_operators() const override;
};

}  // namespace bbpssw
