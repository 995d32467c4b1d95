#pragma once

#include "service/trial.hpp"
#include "progress_reporter.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bbpssw::service {

// Collects progress from every trial worker of one submission: a step
// counter, the number of finished purification rounds and a short tail of
// the execution log.
class TrialProgressReporter final : public ProgressReporter {
  public:
    static constexpr std::size_t kLogTail = 16;

    void set_total_steps(std::size_t total_steps) override;
    void increment_completed_steps(std::size_t delta = 1) override;
    void record_log(const ExecutionLog& log) override;

    double fraction_complete() const;
    std::size_t rounds_completed() const;
    std::vector<ExecutionLog> log_tail() const;

  private:
    std::atomic<std::size_t> total_steps_{0};
    std::atomic<std::size_t> steps_done_{0};
    std::atomic<std::size_t> rounds_done_{0};
    mutable std::mutex tail_mutex_;
    std::deque<ExecutionLog> tail_;
};

struct TrialStatusSnapshot {
    TrialStatus status = TrialStatus::Pending;
    // Steps taken against the worst case of every trial hitting the round
    // cap, so runs that finish early jump to 1 on completion.
    double percent_complete = 0.0;
    // Rounds finished so far, summed over trials.
    std::size_t rounds_completed = 0;
    std::string message;
    std::vector<ExecutionLog> recent_logs;
};

// Runs submitted trial requests on detached worker threads and keeps their
// results for polling. IDs have the form "trial-N".
class TrialService {
  public:
    TrialService() = default;
    TrialService(const TrialService&) = delete;
    TrialService& operator=(const TrialService&) = delete;

    std::string submit(TrialRequest request, std::size_t max_threads = 0);

    // Empty until the submission has completed or failed.
    std::optional<TrialResult> poll_result(const std::string& trial_id) const;

    // Unknown IDs report Failed with "trial_id not found".
    TrialStatusSnapshot status(const std::string& trial_id) const;

  private:
    struct Submission {
        TrialRequest request;
        TrialProgressReporter reporter;
        std::atomic<TrialStatus> status{TrialStatus::Pending};
        mutable std::mutex result_mutex;
        std::optional<TrialResult> result;
    };

    std::shared_ptr<Submission> find(const std::string& trial_id) const;

    mutable std::mutex submissions_mutex_;
    std::map<std::string, std::shared_ptr<Submission>> submissions_;
    std::atomic<std::uint64_t> next_id_{0};
};

}  // namespace bbpssw::service
