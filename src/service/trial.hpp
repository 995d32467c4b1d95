#pragma once

#include "ensemble_runner.hpp"
#include "engine/simulation_types.hpp"
#include "execution_log.hpp"
#include "progress_reporter.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bbpssw::service {

enum class TrialStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

struct TrialRequest {
    std::string trial_id;
    EngineType engine_type = EngineType::Average;
    SimulationParameters params;
    int trials = 1;
    // Empty selects random seeds; otherwise one seed per trial.
    std::vector<std::uint64_t> seeds;
    // 0 selects default_max_rounds().
    int max_rounds = 0;
    std::size_t max_threads = 0;
    // Caller-supplied labels, copied unchanged into the result.
    std::map<std::string, std::string> metadata;
};

struct TrialResult {
    std::string trial_id;
    TrialStatus status = TrialStatus::Pending;
    std::vector<TrialOutcome> trials;
    std::vector<ExecutionLog> logs;
    // Mean over trials of the final average fidelity.
    double mean_final_fidelity = 0.0;
    double mean_rounds = 0.0;
    double elapsed_time = 0.0;
    std::string message;
    std::map<std::string, std::string> metadata;
};

std::string status_to_string(TrialStatus status);

// Rejects requests that could not run: invalid parameters, a non-positive
// trial count, seed lists of the wrong length or a negative round cap.
void validate_request(const TrialRequest& request);

class TrialRunner {
  public:
    // Never throws for failing trials; the failure is reported through
    // TrialResult::status and TrialResult::message.
    TrialResult run(
        const TrialRequest& request,
        std::size_t max_threads = 0,
        ProgressReporter* reporter = nullptr
    );
};

}  // namespace bbpssw::service
