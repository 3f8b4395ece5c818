#pragma once
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../Params.hpp"
#include "../model/CoefficientBuilder.hpp"

namespace Leontief {

struct ExperimentResult {
    ShockType type = ShockType::Demand;
    double shock_size = 0.0;

    std::vector<int> sectors;      // sampled sector indices, draw order
    std::vector<double> effects;   // one per sampled sector

    double mean = 0.0;
    double stddev = 0.0;
    double median = 0.0;
    double q95 = 0.0;
    double q99 = 0.0;
};

class ShockSimulator {
public:
    using Rng = std::mt19937_64;
    using Vec = Eigen::VectorXd;

    explicit ShockSimulator(std::shared_ptr<const LeontiefModel> model);

    // Shock sample_size distinct random sectors one at a time and measure the
    // relative drop of the economy-wide aggregate.
    ExperimentResult run_shock_experiment(ShockType type, double shock_size,
                                          int sample_size, Rng& rng) const;

    // String entry point; throws InvalidShockTypeError for anything but
    // "Demand" / "Supply".
    ExperimentResult run_shock_experiment(const std::string& type, double shock_size,
                                          int sample_size, Rng& rng) const;

    ExperimentResult run_shock_experiment(const ShockParams& params, Rng& rng) const {
        return run_shock_experiment(params.type, params.size, params.sample_size, rng);
    }

    // Effect of shocking one sector; no sampling.
    double sector_effect(ShockType type, double shock_size, int sector) const;

    // k distinct indices from [0, n), uniform without replacement
    static std::vector<int> sample_sectors(int n, int k, Rng& rng);

    const LeontiefModel& model() const { return *model_; }

private:
    struct Operands {
        const Eigen::MatrixXd& matrix;
        const Vec& vector;
        double benchmark;
    };

    Operands select(ShockType type) const;
    static double effect(const Operands& op, double shock_size, int sector);
    void check_inputs(double shock_size, int sample_size) const;

    std::shared_ptr<const LeontiefModel> model_;
};

} // namespace Leontief
