#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <vector>
#include "../Errors.hpp"
#include "../Params.hpp"
#include "ShockSimulator.hpp"

namespace Leontief {

// shock size -> 99th percentile of each replication, in replication order
using AggregatedResult = std::map<double, std::vector<double>>;

class ReplicationAggregator {
public:
    // (shock size, replication index, result of that replication)
    using ProgressFn = std::function<void(double, int, const ExperimentResult&)>;

    ReplicationAggregator(std::shared_ptr<const LeontiefModel> model, std::uint64_t seed)
        : simulator(std::move(model)), base_seed(seed) {}

    ShockType shock_type = ShockType::Demand;
    int sample_size = 300;
    ProgressFn on_replication;

    AggregatedResult run(const AggregationParams& params) const {
        return replicate(params.shock_sizes, params.replications, params.type, params.sample_size);
    }

    AggregatedResult run(const std::vector<double>& shock_sizes, int replications_per_size) const {
        return replicate(shock_sizes, replications_per_size, shock_type, sample_size);
    }

    const ShockSimulator& shock_simulator() const { return simulator; }

private:
    // Fail-fast: the first failing replication aborts the whole run.
    AggregatedResult replicate(const std::vector<double>& shock_sizes, int replications_per_size,
                               ShockType type, int n_sample) const {
        if (shock_sizes.empty()) {
            throw ConfigError("no shock sizes configured");
        }
        if (replications_per_size < 1) {
            throw ConfigError("replications per shock size must be >= 1, got " +
                              std::to_string(replications_per_size));
        }

        AggregatedResult out;
        for (size_t k = 0; k < shock_sizes.size(); ++k) {
            double shock_size = shock_sizes[k];
            std::vector<double>& series = out[shock_size];

            for (int rep = 0; rep < replications_per_size; ++rep) {
                ShockSimulator::Rng rng = replication_rng(k, rep);
                ExperimentResult res = simulator.run_shock_experiment(type, shock_size, n_sample, rng);
                series.push_back(res.q99);
                if (on_replication) on_replication(shock_size, rep, res);
            }
        }
        return out;
    }

    // Independent stream per (shock size, replication)
    ShockSimulator::Rng replication_rng(size_t size_index, int rep) const {
        std::seed_seq seq{static_cast<std::uint32_t>(base_seed & 0xffffffffu),
                          static_cast<std::uint32_t>(base_seed >> 32),
                          static_cast<std::uint32_t>(size_index),
                          static_cast<std::uint32_t>(rep)};
        return ShockSimulator::Rng(seq);
    }

    ShockSimulator simulator;
    std::uint64_t base_seed;
};

} // namespace Leontief
