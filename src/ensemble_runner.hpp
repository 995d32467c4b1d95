#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "engine/simulation_engine.hpp"
#include "engine/simulation_types.hpp"
#include "execution_log.hpp"

// Drives independent purification trials to completion. The round cap is a
// guard for callers that step until complete; engines themselves never
// stop on their own.

namespace bbpssw {

class ProgressReporter;

inline constexpr int kDefaultMaxRounds = 100;
inline constexpr std::size_t kStepsPerRound = 8;

// kDefaultMaxRounds unless BBPSSW_MAX_ROUNDS holds a positive integer.
int default_max_rounds();

struct RoundSummary {
    int round = 0;
    std::size_t pair_count = 0;
    double average_fidelity = 0.0;
};

struct TrialOutcome {
    std::uint64_t seed = 0;
    // Entry 0 describes the freshly prepared ensemble.
    std::vector<RoundSummary> history;
    SimulationState final_state;
    std::vector<ExecutionLog> logs;
    bool hit_round_cap = false;
};

// Calls engine.step() until the run is complete or max_rounds rounds ran.
TrialOutcome run_until_complete(SimulationEngine& engine, int max_rounds);

struct EnsembleProfile {
    EngineType engine_type = EngineType::Average;
    SimulationParameters params;
};

class EnsembleRunner {
  public:
    explicit EnsembleRunner(EnsembleProfile profile);

    void set_progress_reporter(ProgressReporter* reporter);

    const EnsembleProfile& profile() const { return profile_; }

    struct RunResult {
        std::vector<TrialOutcome> trials;
        std::vector<ExecutionLog> logs;
    };

    // Runs `trials` independent engines, each with its own seed, spread
    // over at most max_threads workers (0 selects the hardware
    // concurrency). A max_rounds of 0 selects default_max_rounds(). Throws
    // InvalidConfiguration for trials < 1, a negative round cap or a seed
    // list whose length differs from `trials`. The first worker failure is
    // rethrown after all workers join.
    RunResult run(
        int trials = 1,
        const std::vector<std::uint64_t>& trial_seeds = {},
        int max_rounds = 0,
        std::size_t max_threads = 0
    );

  private:
    TrialOutcome run_trial(int trial, std::uint64_t seed, int max_rounds) const;

    EnsembleProfile profile_;
    ProgressReporter* progress_reporter_ = nullptr;
};

}  // namespace bbpssw
