#pragma once

#include "density_matrix.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace bbpssw {

class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;

    // Standard normal sample from the Box-Muller transform. Each transform
    // yields two samples; the second is cached on this stream and returned
    // by the next call.
    double gaussian();

    // Uniform index in [0, count).
    std::size_t uniform_index(std::size_t count);

    // Drops a cached Gaussian sample, e.g. after reseeding.
    void clear_cached_gaussian() { has_spare_ = false; }

  private:
    bool has_spare_ = false;
    double spare_ = 0.0;
};

class StdRandomStream : public RandomStream {
  public:
    explicit StdRandomStream(std::mt19937_64& rng);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64& rng_;
};

enum class NoiseChannelKind {
    UniformNoise,
    AmplitudeDamping,
    Dephasing,
    Depolarizing,
};

std::string to_string(NoiseChannelKind kind);
// Accepts "uniform", "amplitude-damping", "dephasing" and "depolarizing".
NoiseChannelKind parse_noise_channel(const std::string& name);

// Single-qubit channel acting on one qubit of a density matrix. The
// strength is fixed at construction and must lie in [0, 1].
class NoiseChannel {
  public:
    explicit NoiseChannel(double parameter);
    virtual ~NoiseChannel() = default;

    virtual std::shared_ptr<const NoiseChannel> clone() const = 0;
    virtual NoiseChannelKind kind() const = 0;

    // Kraus channels ignore `rng`; the uniform channel draws its unitary
    // from it.
    virtual DensityMatrix apply(
        const DensityMatrix& rho,
        int qubit,
        RandomStream& rng
    ) const = 0;

    double parameter() const { return parameter_; }

  private:
    double parameter_;
};

void validate_channel_parameter(double parameter);

std::shared_ptr<const NoiseChannel> make_noise_channel(
    NoiseChannelKind kind,
    double parameter
);

DensityMatrix apply_depolarizing(const DensityMatrix& rho, int qubit, double p);
DensityMatrix apply_dephasing(const DensityMatrix& rho, int qubit, double p);
DensityMatrix apply_amplitude_damping(const DensityMatrix& rho, int qubit, double gamma);
DensityMatrix apply_uniform_noise(
    const DensityMatrix& rho,
    int qubit,
    double strength,
    RandomStream& rng
);

}  // namespace bbpssw
