#include "ensemble_runner.hpp"

#include "errors.hpp"
#include "progress_reporter.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

namespace bbpssw {

namespace {

RoundSummary summarize(const SimulationState& state) {
    return RoundSummary{state.round, state.pairs.size(), state.average_fidelity};
}

}  // namespace

int default_max_rounds() {
    static const int value = [] {
        const char* env = std::getenv("BBPSSW_MAX_ROUNDS");
        if (!env || *env == '\0') {
            return kDefaultMaxRounds;
        }
        try {
            const int parsed = std::stoi(env);
            return parsed > 0 ? parsed : kDefaultMaxRounds;
        } catch (const std::invalid_argument&) {
            return kDefaultMaxRounds;
        } catch (const std::out_of_range&) {
            return kDefaultMaxRounds;
        }
    }();
    return value;
}

TrialOutcome run_until_complete(SimulationEngine& engine, int max_rounds) {
    if (max_rounds < 1) {
        throw InvalidConfiguration("max_rounds must be positive");
    }
    TrialOutcome outcome;
    outcome.history.push_back(summarize(engine.current_state()));
    int rounds = 0;
    while (!engine.current_state().complete && rounds < max_rounds) {
        const SimulationState& state = engine.step();
        ++rounds;
        if (state.round != outcome.history.back().round) {
            outcome.history.push_back(summarize(state));
        }
    }
    outcome.final_state = engine.current_state();
    outcome.logs = engine.logs();
    outcome.hit_round_cap = !outcome.final_state.complete;
    return outcome;
}

EnsembleRunner::EnsembleRunner(EnsembleProfile profile)
    : profile_(std::move(profile)) {
    validate_parameters(profile_.params);
}

void EnsembleRunner::set_progress_reporter(ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

TrialOutcome EnsembleRunner::run_trial(int trial, std::uint64_t seed, int max_rounds) const {
    auto engine = make_engine(profile_.engine_type, profile_.params, seed);
    engine->set_trial_index(trial);
    engine->set_progress_reporter(progress_reporter_);
    // Regenerate so the setup log carries the trial index and reaches the
    // reporter.
    engine->set_random_seed(seed);
    engine->reset();
    TrialOutcome outcome = run_until_complete(*engine, max_rounds);
    outcome.seed = seed;
    return outcome;
}

EnsembleRunner::RunResult EnsembleRunner::run(
    int trials,
    const std::vector<std::uint64_t>& trial_seeds,
    int max_rounds,
    std::size_t max_threads
) {
    if (trials < 1) {
        throw InvalidConfiguration("trials must be at least 1");
    }
    if (max_rounds < 0) {
        throw InvalidConfiguration("max_rounds must not be negative");
    }
    const int num_trials = trials;
    if (!trial_seeds.empty() && static_cast<int>(trial_seeds.size()) != num_trials) {
        throw InvalidConfiguration("trial seeds must match the requested trials");
    }
    const int round_cap = max_rounds > 0 ? max_rounds : default_max_rounds();

    std::vector<std::uint64_t> seeds;
    seeds.reserve(num_trials);
    if (!trial_seeds.empty()) {
        seeds = trial_seeds;
    } else {
        std::mt19937_64 seed_rng(std::random_device{}());
        for (int i = 0; i < num_trials; ++i) {
            seeds.push_back(seed_rng());
        }
    }

    const std::size_t available = std::max(1u, std::thread::hardware_concurrency());
    const std::size_t pool_size = std::min<std::size_t>(
        static_cast<std::size_t>(num_trials), max_threads > 0 ? max_threads : available);

    std::vector<TrialOutcome> outcomes(static_cast<std::size_t>(num_trials));
    std::atomic<std::size_t> next_trial{0};
    std::atomic<bool> aborted{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    // Workers pull trial indices until the queue drains or a trial fails.
    const auto drain = [&]() {
        while (!aborted.load(std::memory_order_relaxed)) {
            const std::size_t trial = next_trial.fetch_add(1, std::memory_order_relaxed);
            if (trial >= outcomes.size()) {
                return;
            }
            try {
                outcomes[trial] = run_trial(static_cast<int>(trial), seeds[trial], round_cap);
            } catch (...) {
                aborted.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(pool_size);
    for (std::size_t i = 0; i < pool_size; ++i) {
        pool.emplace_back(drain);
    }
    for (auto& thread : pool) {
        thread.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    RunResult result;
    for (const auto& outcome : outcomes) {
        result.logs.insert(result.logs.end(), outcome.logs.begin(), outcome.logs.end());
    }
    result.trials = std::move(outcomes);
    return result;
}

}  // namespace bbpssw
