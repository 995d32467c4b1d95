#include "engine/simulation_types.hpp"
#include "errors.hpp"
#include "service/trial.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(std::ostream& out) {
    out << "usage: bbpssw_cli [--pairs=N] [--noise=P] [--target=F]\n"
        << "                  [--channel=uniform|amplitude-damping|dephasing|depolarizing]\n"
        << "                  [--engine=average|monte-carlo] [--seed=S] [--trials=T]\n"
        << "                  [--max-rounds=R] [--threads=N]\n";
}

bbpssw::service::TrialRequest parse_arguments(int argc, char** argv) {
    bbpssw::service::TrialRequest request;
    bool has_seed = false;
    std::uint64_t seed = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            throw bbpssw::InvalidConfiguration("Unrecognized argument: " + arg);
        }
        const std::string key = arg.substr(2, eq - 2);
        const std::string value = arg.substr(eq + 1);
        try {
            if (key == "pairs") {
                request.params.initial_pairs = std::stoi(value);
            } else if (key == "noise") {
                request.params.noise_parameter = std::stod(value);
            } else if (key == "target") {
                request.params.target_fidelity = std::stod(value);
            } else if (key == "channel") {
                request.params.noise_channel = bbpssw::parse_noise_channel(value);
            } else if (key == "engine") {
                request.engine_type = bbpssw::parse_engine_type(value);
            } else if (key == "seed") {
                seed = std::stoull(value);
                has_seed = true;
            } else if (key == "trials") {
                request.trials = std::stoi(value);
            } else if (key == "max-rounds") {
                request.max_rounds = std::stoi(value);
            } else if (key == "threads") {
                request.max_threads = static_cast<std::size_t>(std::stoul(value));
            } else {
                throw bbpssw::InvalidConfiguration("Unknown option: --" + key);
            }
        } catch (const bbpssw::InvalidConfiguration&) {
            throw;
        } catch (const std::invalid_argument&) {
            throw bbpssw::InvalidConfiguration("Invalid value for --" + key + ": " + value);
        } catch (const std::out_of_range&) {
            throw bbpssw::InvalidConfiguration("Value out of range for --" + key + ": " + value);
        }
    }
    if (has_seed) {
        for (int t = 0; t < request.trials; ++t) {
            request.seeds.push_back(seed + static_cast<std::uint64_t>(t));
        }
    }
    bbpssw::service::validate_request(request);
    return request;
}

}  // namespace

int main(int argc, char** argv) {
    bbpssw::service::TrialRequest request;
    try {
        request = parse_arguments(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        print_usage(std::cerr);
        return 1;
    }

    bbpssw::service::TrialRunner runner;
    const auto result = runner.run(request);
    if (result.status != bbpssw::service::TrialStatus::Completed) {
        std::cerr << "Simulation failed: " << result.message << '\n';
        return 1;
    }

    std::cout << "engine=" << bbpssw::to_string(request.engine_type)
              << " channel=" << bbpssw::to_string(request.params.noise_channel)
              << " pairs=" << request.params.initial_pairs
              << " noise=" << request.params.noise_parameter
              << " target=" << request.params.target_fidelity << '\n';
    std::cout << std::fixed << std::setprecision(6);
    for (std::size_t t = 0; t < result.trials.size(); ++t) {
        const auto& trial = result.trials[t];
        std::cout << "trial " << t << " seed=" << trial.seed << '\n';
        for (const auto& summary : trial.history) {
            std::cout << "  round " << summary.round << ": pairs=" << summary.pair_count
                      << " average_fidelity=" << summary.average_fidelity << '\n';
        }
        if (trial.hit_round_cap) {
            std::cout << "  stopped at the round cap\n";
        }
    }
    if (result.trials.size() > 1) {
        std::cout << "mean_final_fidelity=" << result.mean_final_fidelity
                  << " mean_rounds=" << result.mean_rounds << '\n';
    }
    return 0;
}
