#include "sim/ShockSimulator.hpp"
#include <cmath>
#include <numeric>
#include <utility>
#include "Errors.hpp"
#include "stats/SummaryStatistics.hpp"

namespace Leontief {

ShockSimulator::ShockSimulator(std::shared_ptr<const LeontiefModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("ShockSimulator: model cannot be null.");
    }
}

ExperimentResult ShockSimulator::run_shock_experiment(const std::string& type, double shock_size,
                                                      int sample_size, Rng& rng) const {
    return run_shock_experiment(parse_shock_type(type), shock_size, sample_size, rng);
}

ExperimentResult ShockSimulator::run_shock_experiment(ShockType type, double shock_size,
                                                      int sample_size, Rng& rng) const {
    check_inputs(shock_size, sample_size);
    Operands op = select(type);

    ExperimentResult res;
    res.type = type;
    res.shock_size = shock_size;
    res.sectors = sample_sectors(model_->size(), sample_size, rng);
    res.effects.reserve(sample_size);

    for (int sec : res.sectors) {
        res.effects.push_back(effect(op, shock_size, sec));
    }

    res.mean = SummaryStatistics::mean(res.effects);
    res.stddev = SummaryStatistics::stddev(res.effects);
    res.median = SummaryStatistics::quantile(res.effects, 0.5);
    res.q95 = SummaryStatistics::quantile(res.effects, 0.95);
    res.q99 = SummaryStatistics::quantile(res.effects, 0.99);
    return res;
}

double ShockSimulator::sector_effect(ShockType type, double shock_size, int sector) const {
    check_inputs(shock_size, 1);
    if (sector < 0 || sector >= model_->size()) {
        throw std::out_of_range("sector index " + std::to_string(sector) + " out of range");
    }
    return effect(select(type), shock_size, sector);
}

std::vector<int> ShockSimulator::sample_sectors(int n, int k, Rng& rng) {
    if (k < 1 || k > n) {
        throw InvalidSampleSizeError(std::to_string(k) + " not in [1, " + std::to_string(n) + "]");
    }

    // Partial Fisher-Yates: the first k slots end up a uniform k-subset
    std::vector<int> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    for (int i = 0; i < k; ++i) {
        std::uniform_int_distribution<int> pick(i, n - 1);
        std::swap(idx[i], idx[pick(rng)]);
    }
    idx.resize(k);
    return idx;
}

ShockSimulator::Operands ShockSimulator::select(ShockType type) const {
    switch (type) {
        case ShockType::Demand:
            return {model_->leontief_inverse(), model_->demand(), model_->total_output()};
        case ShockType::Supply:
            return {model_->i_minus_a(), model_->output(), model_->total_final_demand()};
    }
    throw InvalidShockTypeError(std::to_string(static_cast<int>(type)));
}

double ShockSimulator::effect(const Operands& op, double shock_size, int sector) {
    Vec mod_vector = op.vector;
    mod_vector[sector] *= (1.0 - shock_size);
    Vec result = op.matrix * mod_vector;
    return 1.0 - result.sum() / op.benchmark;
}

void ShockSimulator::check_inputs(double shock_size, int sample_size) const {
    if (!std::isfinite(shock_size) || shock_size < 0.0 || shock_size > 1.0) {
        throw InvalidShockSizeError(std::to_string(shock_size) + " not in [0, 1]");
    }
    const int n = model_->size();
    if (sample_size < 1 || sample_size > n) {
        throw InvalidSampleSizeError(std::to_string(sample_size) + " not in [1, " + std::to_string(n) + "]");
    }
}

} // namespace Leontief
