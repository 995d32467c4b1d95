#include "engine/simulation_engine.hpp"
#include "engine/simulation_types.hpp"
#include "errors.hpp"
#include "service/trial.hpp"
#include "service/trial_service.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace py = pybind11;

namespace {

bbpssw::SimulationParameters build_parameters(const py::dict& src) {
    bbpssw::SimulationParameters params;
    if (src.contains("initial_pairs")) {
        params.initial_pairs = py::cast<int>(src["initial_pairs"]);
    }
    if (src.contains("noise_parameter")) {
        params.noise_parameter = py::cast<double>(src["noise_parameter"]);
    }
    if (src.contains("target_fidelity")) {
        params.target_fidelity = py::cast<double>(src["target_fidelity"]);
    }
    if (src.contains("noise_channel")) {
        params.noise_channel =
            bbpssw::parse_noise_channel(py::cast<std::string>(src["noise_channel"]));
    }
    return params;
}

py::list matrix_to_list(const bbpssw::Matrix& m) {
    py::list rows;
    for (std::size_t r = 0; r < m.rows(); ++r) {
        py::list row;
        for (std::size_t c = 0; c < m.cols(); ++c) {
            row.append(m.at(r, c));
        }
        rows.append(row);
    }
    return rows;
}

py::dict pair_to_dict(const bbpssw::QubitPair& pair) {
    py::dict out;
    out["id"] = pair.id;
    out["basis"] = bbpssw::to_string(pair.basis);
    out["fidelity"] = pair.fidelity;
    out["density_matrix"] = matrix_to_list(pair.density_matrix.matrix());
    return out;
}

py::list pairs_to_list(const std::vector<bbpssw::QubitPair>& pairs) {
    py::list out;
    for (const auto& pair : pairs) {
        out.append(pair_to_dict(pair));
    }
    return out;
}

py::dict state_to_dict(const bbpssw::SimulationState& state) {
    py::dict out;
    out["pairs"] = pairs_to_list(state.pairs);
    out["round"] = state.round;
    out["complete"] = state.complete;
    out["purification_step"] = bbpssw::to_string(state.purification_step);
    out["average_fidelity"] = state.average_fidelity;
    if (state.pending_pairs) {
        const auto& pending = *state.pending_pairs;
        py::dict pending_out;
        pending_out["control_pairs"] = pairs_to_list(pending.control_pairs);
        pending_out["target_pairs"] = pairs_to_list(pending.target_pairs);
        py::list joint;
        for (const auto& rho : pending.joint_states) {
            joint.append(matrix_to_list(rho.matrix()));
        }
        pending_out["joint_states"] = joint;
        py::list results;
        for (const auto& result : pending.results) {
            py::dict entry;
            entry["control"] = pair_to_dict(result.control);
            entry["successful"] = result.successful;
            entry["success_probability"] = result.success_probability;
            results.append(entry);
        }
        pending_out["results"] = results;
        out["pending_pairs"] = pending_out;
    } else {
        out["pending_pairs"] = py::none();
    }
    return out;
}

py::dict execution_log_to_dict(const bbpssw::ExecutionLog& entry) {
    py::dict log;
    log["trial"] = entry.trial;
    log["round"] = entry.round;
    log["step"] = entry.step;
    log["category"] = entry.category;
    log["message"] = entry.message;
    return log;
}

bbpssw::service::TrialRequest build_trial_request(const py::dict& src) {
    bbpssw::service::TrialRequest request;
    if (src.contains("params")) {
        request.params = build_parameters(py::cast<py::dict>(src["params"]));
    }
    if (src.contains("engine")) {
        request.engine_type = bbpssw::parse_engine_type(py::cast<std::string>(src["engine"]));
    }
    if (src.contains("trials")) {
        request.trials = py::cast<int>(src["trials"]);
    }
    if (src.contains("seeds")) {
        request.seeds = py::cast<std::vector<std::uint64_t>>(src["seeds"]);
    }
    if (src.contains("max_rounds")) {
        request.max_rounds = py::cast<int>(src["max_rounds"]);
    }
    if (src.contains("max_threads")) {
        request.max_threads = py::cast<std::size_t>(src["max_threads"]);
    }
    if (src.contains("metadata")) {
        request.metadata = py::cast<std::map<std::string, std::string>>(src["metadata"]);
    }
    return request;
}

py::dict trial_result_to_dict(const bbpssw::service::TrialResult& result) {
    py::dict out;
    out["trial_id"] = result.trial_id;
    out["status"] = bbpssw::service::status_to_string(result.status);
    out["message"] = result.message;
    out["elapsed_time"] = result.elapsed_time;
    out["mean_final_fidelity"] = result.mean_final_fidelity;
    out["mean_rounds"] = result.mean_rounds;
    out["metadata"] = result.metadata;
    py::list trials;
    for (const auto& trial : result.trials) {
        py::dict entry;
        entry["seed"] = trial.seed;
        entry["hit_round_cap"] = trial.hit_round_cap;
        py::list history;
        for (const auto& summary : trial.history) {
            py::dict round;
            round["round"] = summary.round;
            round["pair_count"] = summary.pair_count;
            round["average_fidelity"] = summary.average_fidelity;
            history.append(round);
        }
        entry["history"] = history;
        entry["final_state"] = state_to_dict(trial.final_state);
        trials.append(entry);
    }
    out["trials"] = trials;
    py::list logs;
    for (const auto& log : result.logs) {
        logs.append(execution_log_to_dict(log));
    }
    out["logs"] = logs;
    return out;
}

bbpssw::service::TrialService trial_service;

py::dict run_trials(const py::dict& request_obj) {
    bbpssw::service::TrialRunner runner;
    return trial_result_to_dict(runner.run(build_trial_request(request_obj)));
}

py::dict submit_trials_async(const py::dict& request_obj) {
    bbpssw::service::TrialRequest request = build_trial_request(request_obj);
    const std::size_t threads = request.max_threads;
    py::dict out;
    out["trial_id"] = trial_service.submit(std::move(request), threads);
    return out;
}

py::dict trial_status(const std::string& trial_id) {
    const auto snapshot = trial_service.status(trial_id);
    py::dict out;
    out["trial_id"] = trial_id;
    out["status"] = bbpssw::service::status_to_string(snapshot.status);
    out["percent_complete"] = snapshot.percent_complete;
    out["rounds_completed"] = snapshot.rounds_completed;
    out["message"] = snapshot.message;
    py::list logs;
    for (const auto& entry : snapshot.recent_logs) {
        logs.append(execution_log_to_dict(entry));
    }
    out["recent_logs"] = logs;
    return out;
}

py::dict trial_result(const std::string& trial_id) {
    const auto result = trial_service.poll_result(trial_id);
    if (!result) {
        throw std::runtime_error("trial result not available yet");
    }
    return trial_result_to_dict(*result);
}

}  // namespace

PYBIND11_MODULE(_bbpssw, m) {
    m.doc() = "BBPSSW entanglement purification simulator bindings";

    py::register_exception<bbpssw::InvalidConfiguration>(m, "InvalidConfiguration",
                                                         PyExc_ValueError);
    py::register_exception<bbpssw::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);

    py::class_<bbpssw::SimulationEngine, std::unique_ptr<bbpssw::SimulationEngine>>(m, "Engine")
        .def(
            py::init([](const std::string& engine, const py::dict& params,
                        std::optional<std::uint64_t> seed) {
                return bbpssw::make_engine(
                    bbpssw::parse_engine_type(engine),
                    build_parameters(params),
                    seed.value_or(std::numeric_limits<std::uint64_t>::max()));
            }),
            py::arg("engine") = "average",
            py::arg("params") = py::dict(),
            py::arg("seed") = py::none())
        .def("next_step", [](bbpssw::SimulationEngine& e) { return state_to_dict(e.next_step()); })
        .def("step", [](bbpssw::SimulationEngine& e) { return state_to_dict(e.step()); })
        .def("reset", [](bbpssw::SimulationEngine& e) { return state_to_dict(e.reset()); })
        .def("current_state",
             [](const bbpssw::SimulationEngine& e) { return state_to_dict(e.current_state()); })
        .def("update_params",
             [](bbpssw::SimulationEngine& e, const py::dict& params) {
                 e.update_params(build_parameters(params));
             })
        .def_property_readonly("engine_type", [](const bbpssw::SimulationEngine& e) {
            return bbpssw::to_string(e.engine_type());
        })
        .def("logs", [](const bbpssw::SimulationEngine& e) {
            py::list out;
            for (const auto& log : e.logs()) {
                out.append(execution_log_to_dict(log));
            }
            return out;
        });

    m.def(
        "run_trials",
        &run_trials,
        py::arg("request"),
        "Run purification trials to completion. The dict mirrors service::TrialRequest."
    );
    m.def(
        "submit_trials_async",
        &submit_trials_async,
        py::arg("request"),
        "Submit trials asynchronously and receive a trial_id immediately."
    );
    m.def(
        "trial_status",
        &trial_status,
        py::arg("trial_id"),
        "Query the current status snapshot for an async submission."
    );
    m.def(
        "trial_result",
        &trial_result,
        py::arg("trial_id"),
        "Fetch the final result for an async submission (raises if not ready)."
    );
}
