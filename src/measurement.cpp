#include "measurement.hpp"

#include "errors.hpp"
#include "gates.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace bbpssw {

namespace {

DensityMatrix project(const DensityMatrix& rho, std::size_t mask, int outcome, double probability) {
    const std::size_t dim = rho.dimension();
    const std::size_t wanted = outcome == 1 ? mask : 0;
    std::vector<Complex> data(dim * dim, kZero);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & mask) != wanted) {
            continue;
        }
        for (std::size_t j = 0; j < dim; ++j) {
            if ((j & mask) != wanted) {
                continue;
            }
            data[i * dim + j] = rho.at(i, j) / probability;
        }
    }
    return DensityMatrix(Matrix(dim, dim, std::move(data)));
}

}  // namespace

std::array<MeasurementBranch, 2> measure_qubit(const DensityMatrix& rho, int qubit) {
    validate_qubit_index(qubit, rho.num_qubits());
    const std::size_t mask = static_cast<std::size_t>(1) << qubit;
    double p0 = 0.0;
    for (std::size_t i = 0; i < rho.dimension(); ++i) {
        if ((i & mask) == 0) {
            p0 += rho.at(i, i).real();
        }
    }
    p0 = std::clamp(p0, 0.0, 1.0);

    std::array<MeasurementBranch, 2> branches;
    branches[0].outcome = 0;
    branches[0].probability = p0;
    branches[1].outcome = 1;
    branches[1].probability = 1.0 - p0;
    for (auto& branch : branches) {
        if (branch.probability >= kMeasurementEpsilon) {
            branch.post_state = project(rho, mask, branch.outcome, branch.probability);
        }
    }
    return branches;
}

MeasurementSample sample_measurement(const DensityMatrix& rho, int qubit, RandomStream& rng) {
    auto branches = measure_qubit(rho, qubit);
    const double r = rng.uniform(0.0, 1.0);
    std::size_t chosen = r < branches[0].probability ? 0 : 1;
    if (!branches[chosen].post_state) {
        chosen = 1 - chosen;
    }
    return MeasurementSample{
        branches[chosen].outcome,
        branches[chosen].probability,
        std::move(*branches[chosen].post_state),
    };
}

DensityMatrix partial_trace(const DensityMatrix& rho, const std::vector<int>& trace_out) {
    const int n = rho.num_qubits();
    std::set<int> traced;
    for (int q : trace_out) {
        validate_qubit_index(q, n);
        if (!traced.insert(q).second) {
            throw InvalidParameter("qubit " + std::to_string(q) + " traced out twice");
        }
    }
    std::vector<int> kept;
    std::size_t traced_mask = 0;
    for (int q = 0; q < n; ++q) {
        if (traced.count(q) != 0) {
            traced_mask |= static_cast<std::size_t>(1) << q;
        } else {
            kept.push_back(q);
        }
    }

    const auto reduce_index = [&kept](std::size_t full) {
        std::size_t reduced = 0;
        for (std::size_t k = 0; k < kept.size(); ++k) {
            if (((full >> kept[k]) & 1U) != 0) {
                reduced |= static_cast<std::size_t>(1) << k;
            }
        }
        return reduced;
    };

    const std::size_t dim = rho.dimension();
    const std::size_t out_dim = static_cast<std::size_t>(1) << kept.size();
    std::vector<Complex> data(out_dim * out_dim, kZero);
    for (std::size_t i = 0; i < dim; ++i) {
        const std::size_t ri = reduce_index(i);
        for (std::size_t j = 0; j < dim; ++j) {
            if ((i & traced_mask) != (j & traced_mask)) {
                continue;
            }
            data[ri * out_dim + reduce_index(j)] += rho.at(i, j);
        }
    }
    return DensityMatrix(Matrix(out_dim, out_dim, std::move(data)));
}

}  // namespace bbpssw
