#include "engine/simulation_engine.hpp"

#include "bell_basis.hpp"
#include "engine/average_engine.hpp"
#include "engine/bbpssw_operations.hpp"
#include "engine/monte_carlo_engine.hpp"
#include "errors.hpp"
#include "progress_reporter.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace bbpssw {

namespace {

DensityMatrix in_computational_basis(const QubitPair& pair) {
    return pair.basis == Basis::Bell ? to_computational_basis(pair.density_matrix)
                                     : pair.density_matrix;
}

std::string describe_pairs(const SimulationState& state) {
    std::ostringstream oss;
    oss << "pairs=" << state.pairs.size();
    if (!state.pairs.empty()) {
        double sum = 0.0;
        for (const auto& pair : state.pairs) {
            sum += pair.fidelity;
        }
        oss << " mean_fidelity=" << sum / static_cast<double>(state.pairs.size());
    }
    return oss.str();
}

}  // namespace

SimulationEngine::SimulationEngine(SimulationParameters params, std::uint64_t seed)
    : params_(std::move(params)) {
    validate_parameters(params_);
    channel_ = make_noise_channel(params_.noise_channel, params_.noise_parameter);
    if (seed != std::numeric_limits<std::uint64_t>::max()) {
        rng_.seed(seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

void SimulationEngine::set_progress_reporter(ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

void SimulationEngine::set_random_seed(std::uint64_t seed) {
    rng_.seed(seed);
    stream_.clear_cached_gaussian();
}

void SimulationEngine::log_event(
    const SimulationState& state,
    const std::string& category,
    const std::string& message
) {
    logs_.push_back(ExecutionLog{
        trial_index_, state.round, to_string(state.purification_step), category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(logs_.back());
    }
}

const SimulationState& SimulationEngine::reset() {
    logs_.clear();
    state_ = initialize();
    return state_;
}

void SimulationEngine::update_params(const SimulationParameters& params) {
    validate_parameters(params);
    channel_ = make_noise_channel(params.noise_channel, params.noise_parameter);
    params_ = params;
    reset();
}

const SimulationState& SimulationEngine::next_step() {
    if (state_.complete) {
        return state_;
    }
    state_ = advance(state_);
    if (progress_reporter_) {
        progress_reporter_->increment_completed_steps(1);
    }
    return state_;
}

const SimulationState& SimulationEngine::step() {
    do {
        next_step();
    } while (!state_.complete && state_.purification_step != PurificationStep::Completed);
    return state_;
}

QubitPair SimulationEngine::make_initial_pair(int id) {
    return make_noisy_pair(id, *channel_, working_basis(), stream_);
}

SimulationState SimulationEngine::initialize() {
    SimulationState state;
    state.pairs.reserve(static_cast<std::size_t>(params_.initial_pairs));
    for (int id = 0; id < params_.initial_pairs; ++id) {
        state.pairs.push_back(make_initial_pair(id));
    }
    state.average_fidelity = average_fidelity(state.pairs);

    std::ostringstream oss;
    oss << "engine=" << to_string(engine_type())
        << " channel=" << to_string(params_.noise_channel)
        << " noise=" << params_.noise_parameter
        << " target=" << params_.target_fidelity << " " << describe_pairs(state);
    log_event(state, "Initialize", oss.str());
    return state;
}

SimulationState SimulationEngine::advance(const SimulationState& state) {
    switch (state.purification_step) {
        case PurificationStep::Initial:
            return apply_twirl(state);
        case PurificationStep::Twirled:
            return apply_exchange(state);
        case PurificationStep::Exchanged:
            return apply_bilateral_cnot(state);
        case PurificationStep::Cnot:
            return apply_measurement(state);
        case PurificationStep::Measured:
            return apply_discard(state);
        case PurificationStep::Discard:
            return apply_twirl_exchange(state);
        case PurificationStep::TwirlExchange:
            return apply_completion(state);
        case PurificationStep::Completed: {
            SimulationState next = state;
            next.purification_step = PurificationStep::Initial;
            log_event(next, "Round", "starting round " + std::to_string(next.round + 1));
            return next;
        }
    }
    throw std::runtime_error("Unknown purification step");
}

SimulationState SimulationEngine::apply_twirl(const SimulationState& state) {
    SimulationState next = state;
    for (auto& pair : next.pairs) {
        pair = twirl_pair(pair);
    }
    next.purification_step = PurificationStep::Twirled;
    log_event(next, "Twirl", describe_pairs(next));
    return next;
}

SimulationState SimulationEngine::apply_exchange(const SimulationState& state) {
    SimulationState next = state;
    for (auto& pair : next.pairs) {
        pair = exchange_pair(pair, BellState::PhiPlus);
    }
    next.purification_step = PurificationStep::Exchanged;
    log_event(next, "Exchange", describe_pairs(next));
    return next;
}

SimulationState SimulationEngine::apply_bilateral_cnot(const SimulationState& state) {
    SimulationState next = state;
    if (next.pairs.size() < 2) {
        next.complete = true;
        next.purification_step = PurificationStep::Completed;
        next.average_fidelity = average_fidelity(next.pairs);
        log_event(next, "Complete", "fewer than two pairs left to purify");
        return next;
    }

    PendingPairs pending;
    const std::size_t interacting = (next.pairs.size() / 2) * 2;
    for (std::size_t i = 0; i < interacting; i += 2) {
        pending.control_pairs.push_back(next.pairs[i]);
        pending.target_pairs.push_back(next.pairs[i + 1]);
        pending.joint_states.push_back(joint_state(
            in_computational_basis(next.pairs[i]), in_computational_basis(next.pairs[i + 1])));
    }
    next.pending_pairs = std::move(pending);
    next.purification_step = PurificationStep::Cnot;

    std::ostringstream oss;
    oss << "controls=" << next.pending_pairs->control_pairs.size()
        << " unpaired=" << next.pairs.size() - interacting;
    log_event(next, "BilateralCnot", oss.str());
    return next;
}

SimulationState SimulationEngine::apply_measurement(const SimulationState& state) {
    if (!state.pending_pairs) {
        throw std::runtime_error("Cannot measure before the bilateral CNOT");
    }
    SimulationState next = state;
    PendingPairs& pending = *next.pending_pairs;
    pending.results.clear();
    std::size_t successes = 0;
    for (std::size_t i = 0; i < pending.control_pairs.size(); ++i) {
        pending.results.push_back(measure_pair(
            pending.control_pairs[i], pending.target_pairs[i], pending.joint_states[i]));
        if (pending.results.back().successful) {
            ++successes;
        }
    }
    next.purification_step = PurificationStep::Measured;

    std::ostringstream oss;
    oss << "successful=" << successes << "/" << pending.results.size();
    log_event(next, "Measure", oss.str());
    return next;
}

SimulationState SimulationEngine::apply_discard(const SimulationState& state) {
    if (!state.pending_pairs) {
        throw std::runtime_error("Cannot discard before measurement");
    }
    SimulationState next = state;
    std::vector<QubitPair> survivors;
    for (const auto& result : state.pending_pairs->results) {
        if (result.successful) {
            survivors.push_back(result.control);
        }
    }
    if (state.pairs.size() % 2 != 0) {
        survivors.push_back(state.pairs.back());
    }
    next.pairs = std::move(survivors);
    next.pending_pairs.reset();
    next.purification_step = PurificationStep::Discard;
    log_event(next, "Discard", describe_pairs(next));
    return next;
}

SimulationState SimulationEngine::apply_twirl_exchange(const SimulationState& state) {
    SimulationState next = state;
    for (auto& pair : next.pairs) {
        pair = twirl_pair(exchange_pair(pair, BellState::PsiMinus));
    }
    next.purification_step = PurificationStep::TwirlExchange;
    log_event(next, "TwirlExchange", describe_pairs(next));
    return next;
}

SimulationState SimulationEngine::apply_completion(const SimulationState& state) {
    SimulationState next = state;
    next.round += 1;
    next.average_fidelity = average_fidelity(next.pairs);
    next.purification_step = PurificationStep::Completed;
    const bool reached_target = next.average_fidelity >= params_.target_fidelity;
    next.complete = reached_target || next.pairs.size() < 2;

    std::ostringstream oss;
    oss << "round=" << next.round << " pairs=" << next.pairs.size()
        << " average_fidelity=" << next.average_fidelity;
    log_event(next, "Round", oss.str());
    if (next.complete) {
        log_event(
            next,
            "Complete",
            reached_target ? "target fidelity reached" : "fewer than two pairs left to purify");
    }
    return next;
}

std::unique_ptr<SimulationEngine> make_engine(
    EngineType type,
    const SimulationParameters& params,
    std::uint64_t seed
) {
    switch (type) {
        case EngineType::Average:
            return std::make_unique<AverageSimulationEngine>(params, seed);
        case EngineType::MonteCarlo:
            return std::make_unique<MonteCarloSimulationEngine>(params, seed);
    }
    throw InvalidConfiguration("unsupported engine type");
}

}  // namespace bbpssw
