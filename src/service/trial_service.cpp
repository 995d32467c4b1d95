#include "service/trial_service.hpp"

#include "ensemble_runner.hpp"

#include <algorithm>
#include <limits>
#include <thread>
#include <utility>

namespace bbpssw::service {

namespace {

std::size_t worst_case_steps(const TrialRequest& request) {
    const int rounds = request.max_rounds > 0 ? request.max_rounds : default_max_rounds();
    const double steps = static_cast<double>(rounds) * static_cast<double>(kStepsPerRound) *
                         static_cast<double>(std::max(1, request.trials));
    const double ceiling = static_cast<double>(std::numeric_limits<std::size_t>::max());
    return steps >= ceiling ? std::numeric_limits<std::size_t>::max()
                            : static_cast<std::size_t>(steps);
}

bool is_finished(TrialStatus status) {
    return status == TrialStatus::Completed || status == TrialStatus::Failed;
}

}  // namespace

void TrialProgressReporter::set_total_steps(std::size_t total_steps) {
    total_steps_.store(total_steps, std::memory_order_relaxed);
}

void TrialProgressReporter::increment_completed_steps(std::size_t delta) {
    steps_done_.fetch_add(delta, std::memory_order_relaxed);
}

void TrialProgressReporter::record_log(const ExecutionLog& log) {
    // Engines log "Round" twice per cycle; only the completion entry counts.
    if (log.category == "Round" && log.step == "completed") {
        rounds_done_.fetch_add(1, std::memory_order_relaxed);
    }
    std::lock_guard<std::mutex> lock(tail_mutex_);
    tail_.push_back(log);
    while (tail_.size() > kLogTail) {
        tail_.pop_front();
    }
}

double TrialProgressReporter::fraction_complete() const {
    const std::size_t total = total_steps_.load(std::memory_order_relaxed);
    if (total == 0) {
        return 0.0;
    }
    const std::size_t done = steps_done_.load(std::memory_order_relaxed);
    return std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
}

std::size_t TrialProgressReporter::rounds_completed() const {
    return rounds_done_.load(std::memory_order_relaxed);
}

std::vector<ExecutionLog> TrialProgressReporter::log_tail() const {
    std::lock_guard<std::mutex> lock(tail_mutex_);
    return {tail_.begin(), tail_.end()};
}

std::string TrialService::submit(TrialRequest request, std::size_t max_threads) {
    const std::string trial_id =
        "trial-" + std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
    request.trial_id = trial_id;

    auto submission = std::make_shared<Submission>();
    submission->request = std::move(request);
    submission->reporter.set_total_steps(worst_case_steps(submission->request));
    {
        std::lock_guard<std::mutex> lock(submissions_mutex_);
        submissions_[trial_id] = submission;
    }

    // The worker only touches the shared submission, never the service.
    std::thread([submission, max_threads]() {
        submission->status.store(TrialStatus::Running, std::memory_order_relaxed);
        TrialRunner runner;
        TrialResult result = runner.run(submission->request, max_threads, &submission->reporter);
        const TrialStatus final_status = result.status;
        std::lock_guard<std::mutex> lock(submission->result_mutex);
        submission->result = std::move(result);
        submission->status.store(final_status, std::memory_order_release);
    }).detach();

    return trial_id;
}

std::shared_ptr<TrialService::Submission> TrialService::find(const std::string& trial_id) const {
    std::lock_guard<std::mutex> lock(submissions_mutex_);
    const auto it = submissions_.find(trial_id);
    return it == submissions_.end() ? nullptr : it->second;
}

std::optional<TrialResult> TrialService::poll_result(const std::string& trial_id) const {
    const auto submission = find(trial_id);
    if (!submission || !is_finished(submission->status.load(std::memory_order_acquire))) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(submission->result_mutex);
    return submission->result;
}

TrialStatusSnapshot TrialService::status(const std::string& trial_id) const {
    TrialStatusSnapshot snapshot;
    const auto submission = find(trial_id);
    if (!submission) {
        snapshot.status = TrialStatus::Failed;
        snapshot.message = "trial_id not found";
        return snapshot;
    }
    snapshot.status = submission->status.load(std::memory_order_acquire);
    snapshot.percent_complete = snapshot.status == TrialStatus::Completed
        ? 1.0
        : submission->reporter.fraction_complete();
    snapshot.rounds_completed = submission->reporter.rounds_completed();
    snapshot.recent_logs = submission->reporter.log_tail();
    if (is_finished(snapshot.status)) {
        std::lock_guard<std::mutex> lock(submission->result_mutex);
        if (submission->result) {
            snapshot.message = submission->result->message;
        }
    }
    return snapshot;
}

}  // namespace bbpssw::service
