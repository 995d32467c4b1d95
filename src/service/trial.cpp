#include "service/trial.hpp"

#include "errors.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace bbpssw::service {

std::string status_to_string(TrialStatus status) {
    switch (status) {
        case TrialStatus::Pending:
            return "pending";
        case TrialStatus::Running:
            return "running";
        case TrialStatus::Completed:
            return "completed";
        case TrialStatus::Failed:
            return "failed";
    }
    return "unknown";
}

void validate_request(const TrialRequest& request) {
    validate_parameters(request.params);
    if (request.trials < 1) {
        throw InvalidConfiguration("trials must be at least 1");
    }
    if (!request.seeds.empty() &&
        request.seeds.size() != static_cast<std::size_t>(request.trials)) {
        throw InvalidConfiguration("trial seeds must match the requested trials");
    }
    if (request.max_rounds < 0) {
        throw InvalidConfiguration("max_rounds must not be negative");
    }
}

TrialResult TrialRunner::run(
    const TrialRequest& request,
    std::size_t max_threads,
    ProgressReporter* reporter
) {
    const auto start = std::chrono::steady_clock::now();
    TrialResult result;
    result.trial_id = request.trial_id;
    result.metadata = request.metadata;
    try {
        validate_request(request);

        EnsembleProfile profile;
        profile.engine_type = request.engine_type;
        profile.params = request.params;
        EnsembleRunner runner(profile);
        if (reporter) {
            runner.set_progress_reporter(reporter);
        }
        const std::size_t threads = max_threads > 0 ? max_threads : request.max_threads;
        auto run_result =
            runner.run(request.trials, request.seeds, request.max_rounds, threads);

        double fidelity_sum = 0.0;
        double round_sum = 0.0;
        for (const auto& trial : run_result.trials) {
            fidelity_sum += trial.final_state.average_fidelity;
            round_sum += static_cast<double>(trial.final_state.round);
        }
        const double count = static_cast<double>(run_result.trials.size());
        result.mean_final_fidelity = fidelity_sum / count;
        result.mean_rounds = round_sum / count;
        result.trials = std::move(run_result.trials);
        result.logs = std::move(run_result.logs);
        result.status = TrialStatus::Completed;
    } catch (const std::exception& ex) {
        result.status = TrialStatus::Failed;
        result.message = ex.what();
    }
    auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    return result;
}

}  // namespace bbpssw::service
