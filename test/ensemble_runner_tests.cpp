#include "ensemble_runner.hpp"

#include "engine/simulation_engine.hpp"
#include "errors.hpp"
#include "progress_reporter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

using bbpssw::EngineType;
using bbpssw::EnsembleProfile;
using bbpssw::EnsembleRunner;
using bbpssw::NoiseChannelKind;
using bbpssw::SimulationParameters;

namespace {

SimulationParameters make_params(int pairs, double noise, double target, NoiseChannelKind channel) {
    SimulationParameters params;
    params.initial_pairs = pairs;
    params.noise_parameter = noise;
    params.target_fidelity = target;
    params.noise_channel = channel;
    return params;
}

EnsembleProfile make_profile(EngineType type, const SimulationParameters& params) {
    EnsembleProfile profile;
    profile.engine_type = type;
    profile.params = params;
    return profile;
}

class RecordingReporter : public bbpssw::ProgressReporter {
  public:
    void set_total_steps(std::size_t) override {}
    void increment_completed_steps(std::size_t delta) override { steps_ += delta; }
    void record_log(const bbpssw::ExecutionLog& log) override {
        std::lock_guard<std::mutex> lock(mutex_);
        trials_seen_.push_back(log.trial);
    }

    std::atomic<std::size_t> steps_{0};
    std::mutex mutex_;
    std::vector<int> trials_seen_;
};

}  // namespace

TEST(EnsembleRunnerTests, RunUntilCompleteRecordsHistory) {
    auto engine = bbpssw::make_engine(
        EngineType::Average, make_params(16, 0.3, 0.99, NoiseChannelKind::Depolarizing), 1);
    const auto outcome = bbpssw::run_until_complete(*engine, 100);
    EXPECT_TRUE(outcome.final_state.complete);
    EXPECT_FALSE(outcome.hit_round_cap);
    ASSERT_GE(outcome.history.size(), 2u);
    EXPECT_EQ(outcome.history.front().round, 0);
    EXPECT_EQ(outcome.history.front().pair_count, 16u);
    EXPECT_NEAR(outcome.history.front().average_fidelity, 0.7, 1e-9);
    for (std::size_t i = 1; i < outcome.history.size(); ++i) {
        EXPECT_EQ(outcome.history[i].round, static_cast<int>(i));
        EXPECT_GE(outcome.history[i].average_fidelity, outcome.history[i - 1].average_fidelity);
    }
    EXPECT_EQ(outcome.history.back().pair_count, outcome.final_state.pairs.size());
    EXPECT_FALSE(outcome.logs.empty());
}

TEST(EnsembleRunnerTests, RoundCapStopsEarly) {
    auto engine = bbpssw::make_engine(
        EngineType::Average, make_params(64, 0.3, 0.999, NoiseChannelKind::Depolarizing), 1);
    const auto outcome = bbpssw::run_until_complete(*engine, 2);
    EXPECT_TRUE(outcome.hit_round_cap);
    EXPECT_FALSE(outcome.final_state.complete);
    EXPECT_EQ(outcome.final_state.round, 2);
    EXPECT_EQ(outcome.history.size(), 3u);
    EXPECT_THROW(bbpssw::run_until_complete(*engine, 0), bbpssw::InvalidConfiguration);
}

TEST(EnsembleRunnerTests, DefaultRoundCapIsPositive) {
    EXPECT_GT(bbpssw::default_max_rounds(), 0);
}

TEST(EnsembleRunnerTests, SeededTrialsAreReproducible) {
    const auto profile = make_profile(
        EngineType::MonteCarlo, make_params(16, 0.3, 0.95, NoiseChannelKind::UniformNoise));
    const std::vector<std::uint64_t> seeds = {11, 12, 13};

    EnsembleRunner first(profile);
    EnsembleRunner second(profile);
    const auto a = first.run(3, seeds, 100, 3);
    const auto b = second.run(3, seeds, 100, 1);
    ASSERT_EQ(a.trials.size(), 3u);
    ASSERT_EQ(b.trials.size(), 3u);
    for (std::size_t t = 0; t < 3; ++t) {
        EXPECT_EQ(a.trials[t].seed, seeds[t]);
        EXPECT_EQ(a.trials[t].history.size(), b.trials[t].history.size());
        EXPECT_EQ(a.trials[t].final_state.pairs.size(), b.trials[t].final_state.pairs.size());
        EXPECT_DOUBLE_EQ(a.trials[t].final_state.average_fidelity,
                         b.trials[t].final_state.average_fidelity);
        EXPECT_TRUE(a.trials[t].final_state.complete);
    }
    EXPECT_EQ(a.logs.size(), b.logs.size());
}

TEST(EnsembleRunnerTests, SeedCountMustMatchTrials) {
    EnsembleRunner runner(make_profile(
        EngineType::Average, make_params(8, 0.3, 0.95, NoiseChannelKind::Depolarizing)));
    EXPECT_THROW(runner.run(3, {1, 2}), bbpssw::InvalidConfiguration);
}

TEST(EnsembleRunnerTests, RejectsNonPositiveTrialsAndNegativeRoundCap) {
    EnsembleRunner runner(make_profile(
        EngineType::Average, make_params(8, 0.3, 0.95, NoiseChannelKind::Depolarizing)));
    EXPECT_THROW(runner.run(0), bbpssw::InvalidConfiguration);
    EXPECT_THROW(runner.run(-2), bbpssw::InvalidConfiguration);
    EXPECT_THROW(runner.run(1, {}, -1), bbpssw::InvalidConfiguration);
    EXPECT_EQ(runner.run(1, {7}).trials.size(), 1u);
}

TEST(EnsembleRunnerTests, RejectsInvalidProfile) {
    const auto profile = make_profile(
        EngineType::Average, make_params(1, 0.3, 0.95, NoiseChannelKind::Depolarizing));
    EXPECT_THROW(EnsembleRunner{profile}, bbpssw::InvalidConfiguration);
}

TEST(EnsembleRunnerTests, LogsCarryTrialIndex) {
    EnsembleRunner runner(make_profile(
        EngineType::Average, make_params(8, 0.3, 0.95, NoiseChannelKind::Depolarizing)));
    RecordingReporter reporter;
    runner.set_progress_reporter(&reporter);
    const auto result = runner.run(4, {}, 100, 2);
    ASSERT_EQ(result.trials.size(), 4u);
    EXPECT_GT(reporter.steps_.load(), 0u);

    std::vector<bool> seen(4, false);
    for (const auto& log : result.logs) {
        ASSERT_GE(log.trial, 0);
        ASSERT_LT(log.trial, 4);
        seen[static_cast<std::size_t>(log.trial)] = true;
    }
    for (bool trial_seen : seen) {
        EXPECT_TRUE(trial_seen);
    }
    // Each trial's setup log reaches the reporter as well.
    EXPECT_EQ(reporter.trials_seen_.size(), result.logs.size());
    EXPECT_EQ(result.logs.front().category, "Initialize");
}
