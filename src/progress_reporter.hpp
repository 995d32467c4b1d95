#pragma once

#include "execution_log.hpp"

#include <cstddef>

namespace bbpssw {

// Observer for engines and ensemble runs. Trial workers share one reporter,
// so implementations must tolerate concurrent calls.
class ProgressReporter {
  public:
    virtual ~ProgressReporter() = default;

    // Worst-case protocol steps for the whole submission.
    virtual void set_total_steps(std::size_t total_steps) = 0;
    // Called once per next_step() that advanced an engine.
    virtual void increment_completed_steps(std::size_t delta = 1) = 0;
    virtual void record_log(const ExecutionLog& log) = 0;
};

}  // namespace bbpssw
