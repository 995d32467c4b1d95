#include "service/trial.hpp"
#include "service/trial_service.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <thread>

using bbpssw::service::TrialRequest;
using bbpssw::service::TrialResult;
using bbpssw::service::TrialRunner;
using bbpssw::service::TrialService;
using bbpssw::service::TrialStatus;

namespace {

TrialRequest make_simple_request() {
    TrialRequest request;
    request.engine_type = bbpssw::EngineType::Average;
    request.params.initial_pairs = 8;
    request.params.noise_parameter = 0.3;
    request.params.target_fidelity = 0.95;
    request.params.noise_channel = bbpssw::NoiseChannelKind::Depolarizing;
    request.trials = 2;
    request.seeds = {5, 6};
    return request;
}

std::optional<TrialResult> wait_for_result(const TrialService& service, const std::string& id) {
    std::optional<TrialResult> result;
    for (int attempt = 0; attempt < 400 && !result; ++attempt) {
        result = service.poll_result(id);
        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    return result;
}

}  // namespace

TEST(ServiceTrialTests, StatusNames) {
    EXPECT_EQ(bbpssw::service::status_to_string(TrialStatus::Pending), "pending");
    EXPECT_EQ(bbpssw::service::status_to_string(TrialStatus::Failed), "failed");
}

TEST(ServiceTrialTests, ValidateRequestRejectsBadInput) {
    TrialRequest request = make_simple_request();
    EXPECT_NO_THROW(bbpssw::service::validate_request(request));

    request.trials = 0;
    request.seeds.clear();
    EXPECT_THROW(bbpssw::service::validate_request(request), bbpssw::InvalidConfiguration);

    request = make_simple_request();
    request.seeds = {1};
    EXPECT_THROW(bbpssw::service::validate_request(request), bbpssw::InvalidConfiguration);

    request = make_simple_request();
    request.max_rounds = -1;
    EXPECT_THROW(bbpssw::service::validate_request(request), bbpssw::InvalidConfiguration);

    request = make_simple_request();
    request.params.target_fidelity = 1.2;
    EXPECT_THROW(bbpssw::service::validate_request(request), bbpssw::InvalidConfiguration);
}

TEST(ServiceTrialTests, RunnerCompletesAndAggregates) {
    TrialRunner runner;
    const TrialResult result = runner.run(make_simple_request());
    ASSERT_EQ(result.status, TrialStatus::Completed) << result.message;
    ASSERT_EQ(result.trials.size(), 2u);
    EXPECT_EQ(result.trials[0].seed, 5u);
    EXPECT_EQ(result.trials[1].seed, 6u);
    const double expected_fidelity =
        (result.trials[0].final_state.average_fidelity +
         result.trials[1].final_state.average_fidelity) / 2.0;
    EXPECT_NEAR(result.mean_final_fidelity, expected_fidelity, 1e-12);
    // The Average engine with a Kraus channel is deterministic.
    EXPECT_EQ(result.trials[0].final_state.round, result.trials[1].final_state.round);
    EXPECT_DOUBLE_EQ(result.mean_rounds, result.trials[0].final_state.round);
    EXPECT_FALSE(result.logs.empty());
    EXPECT_GE(result.elapsed_time, 0.0);
}

TEST(ServiceTrialTests, RunnerCopiesMetadataIntoResult) {
    TrialRequest request = make_simple_request();
    request.metadata = {{"label", "werner-0.7"}, {"owner", "lab"}};
    TrialRunner runner;
    const TrialResult done = runner.run(request);
    ASSERT_EQ(done.status, TrialStatus::Completed) << done.message;
    EXPECT_EQ(done.metadata, request.metadata);

    request.params.initial_pairs = 1;
    const TrialResult failed = runner.run(request);
    EXPECT_EQ(failed.status, TrialStatus::Failed);
    EXPECT_EQ(failed.metadata.at("label"), "werner-0.7");
}

TEST(ServiceTrialTests, RunnerReportsFailureInsteadOfThrowing) {
    TrialRequest request = make_simple_request();
    request.params.initial_pairs = 1;
    TrialRunner runner;
    TrialResult result;
    EXPECT_NO_THROW(result = runner.run(request));
    EXPECT_EQ(result.status, TrialStatus::Failed);
    EXPECT_FALSE(result.message.empty());
    EXPECT_TRUE(result.trials.empty());
}

TEST(ServiceTrialTests, SubmitsAsyncTrialAndReturnsResult) {
    TrialService service;
    const std::string trial_id = service.submit(make_simple_request(), 1);
    ASSERT_FALSE(trial_id.empty());

    auto snapshot = service.status(trial_id);
    EXPECT_TRUE(snapshot.status == TrialStatus::Pending ||
                snapshot.status == TrialStatus::Running ||
                snapshot.status == TrialStatus::Completed);

    const auto result = wait_for_result(service, trial_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TrialStatus::Completed);
    EXPECT_EQ(result->trial_id, trial_id);
    EXPECT_EQ(result->trials.size(), 2u);

    snapshot = service.status(trial_id);
    EXPECT_EQ(snapshot.status, TrialStatus::Completed);
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 1.0);
    EXPECT_GT(snapshot.rounds_completed, 0u);
    EXPECT_LE(snapshot.recent_logs.size(), bbpssw::service::TrialProgressReporter::kLogTail);
    EXPECT_FALSE(snapshot.recent_logs.empty());
}

TEST(ServiceTrialTests, AsyncFailureIsVisibleThroughStatus) {
    TrialService service;
    TrialRequest request = make_simple_request();
    request.seeds = {1, 2, 3};
    const std::string trial_id = service.submit(request);

    const auto result = wait_for_result(service, trial_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, TrialStatus::Failed);
    EXPECT_EQ(service.status(trial_id).status, TrialStatus::Failed);
    EXPECT_FALSE(service.status(trial_id).message.empty());
}

TEST(ServiceTrialTests, UnknownTrialIdReportsFailure) {
    TrialService service;
    EXPECT_FALSE(service.poll_result("trial-404").has_value());
    const auto snapshot = service.status("trial-404");
    EXPECT_EQ(snapshot.status, TrialStatus::Failed);
    EXPECT_EQ(snapshot.message, "trial_id not found");
}

TEST(ServiceTrialTests, SubmissionsGetDistinctIds) {
    TrialService service;
    const std::string first = service.submit(make_simple_request(), 1);
    const std::string second = service.submit(make_simple_request(), 1);
    EXPECT_NE(first, second);
    ASSERT_TRUE(wait_for_result(service, first).has_value());
    ASSERT_TRUE(wait_for_result(service, second).has_value());
}
