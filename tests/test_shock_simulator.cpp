#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "Errors.hpp"
#include "sim/ShockSimulator.hpp"
#include "ToyEconomy.hpp"

using namespace Leontief;

namespace {

std::shared_ptr<const LeontiefModel> toy_model() {
    return CoefficientBuilder::build(fixtures::toy_table());
}

} // namespace

TEST(ShockSimulatorTest, ToyDemandShockMatchesHandComputation) {
    ShockSimulator sim(toy_model());
    ShockSimulator::Rng rng(7);
    ExperimentResult res = sim.run_shock_experiment(ShockType::Demand, 0.5, 3, rng);

    ASSERT_EQ(res.effects.size(), 3u);
    ASSERT_EQ(res.sectors.size(), 3u);

    // effect_s = 0.5 * d_s * colsum(L)_s / 400
    const double expected[3] = {15.0 / 232.0, 65.0 / 232.0, 36.0 / 232.0};
    for (size_t k = 0; k < 3; ++k) {
        EXPECT_NEAR(res.effects[k], expected[res.sectors[k]], 1e-12) << "sector " << res.sectors[k];
    }

    EXPECT_NEAR(res.mean, (15.0 + 65.0 + 36.0) / 3.0 / 232.0, 1e-12);
    EXPECT_NEAR(res.median, 36.0 / 232.0, 1e-12);
    // q99 interpolates between the two largest: 36 + 0.98 * (65 - 36)
    EXPECT_NEAR(res.q99, (36.0 + 0.98 * 29.0) / 232.0, 1e-12);
}

TEST(ShockSimulatorTest, ToySupplyShockMatchesHandComputation) {
    ShockSimulator sim(toy_model());
    // effect_s = 0.5 * x_s * (1 - colsum(A)_s) / 220
    EXPECT_NEAR(sim.sector_effect(ShockType::Supply, 0.5, 0), 30.0 / 220.0, 1e-12);
    EXPECT_NEAR(sim.sector_effect(ShockType::Supply, 0.5, 1), 60.0 / 220.0, 1e-12);
    EXPECT_NEAR(sim.sector_effect(ShockType::Supply, 0.5, 2), 20.0 / 220.0, 1e-12);
}

TEST(ShockSimulatorTest, ZeroShockHasNoEffect) {
    ShockSimulator sim(CoefficientBuilder::build(fixtures::generated_table(40)));
    ShockSimulator::Rng rng(11);
    for (ShockType type : {ShockType::Demand, ShockType::Supply}) {
        ExperimentResult res = sim.run_shock_experiment(type, 0.0, 40, rng);
        for (double e : res.effects) {
            EXPECT_NEAR(e, 0.0, 1e-12);
        }
    }
}

TEST(ShockSimulatorTest, FullShockEffectBetweenZeroAndOne) {
    ShockSimulator sim(CoefficientBuilder::build(fixtures::generated_table(40)));
    ShockSimulator::Rng rng(3);
    for (ShockType type : {ShockType::Demand, ShockType::Supply}) {
        ExperimentResult res = sim.run_shock_experiment(type, 1.0, 40, rng);
        for (double e : res.effects) {
            EXPECT_GE(e, 0.0);
            EXPECT_LE(e, 1.0);
        }
    }
}

TEST(ShockSimulatorTest, SamplingIsWithoutReplacement) {
    ShockSimulator::Rng rng(2024);
    for (int k : {1, 17, 100}) {
        std::vector<int> s = ShockSimulator::sample_sectors(100, k, rng);
        ASSERT_EQ(static_cast<int>(s.size()), k);
        std::set<int> unique(s.begin(), s.end());
        EXPECT_EQ(static_cast<int>(unique.size()), k);
        for (int idx : s) {
            EXPECT_GE(idx, 0);
            EXPECT_LT(idx, 100);
        }
    }
}

TEST(ShockSimulatorTest, SamplingCoversAllSectors) {
    ShockSimulator::Rng rng(5);
    std::vector<int> hits(10, 0);
    for (int round = 0; round < 2000; ++round) {
        for (int idx : ShockSimulator::sample_sectors(10, 3, rng)) hits[idx]++;
    }
    // expected 600 each
    for (int h : hits) {
        EXPECT_GT(h, 450);
        EXPECT_LT(h, 750);
    }
}

TEST(ShockSimulatorTest, PercentileOrdering) {
    ShockSimulator sim(CoefficientBuilder::build(fixtures::generated_table(50)));
    ShockSimulator::Rng rng(99);
    ExperimentResult res = sim.run_shock_experiment(ShockType::Demand, 0.3, 30, rng);

    auto [lo, hi] = std::minmax_element(res.effects.begin(), res.effects.end());
    EXPECT_GE(res.q99, res.q95);
    EXPECT_GE(res.q95, res.median);
    EXPECT_GE(res.median, *lo);
    EXPECT_LE(res.median, *hi);
    EXPECT_LE(res.q99, *hi);
    EXPECT_GE(res.stddev, 0.0);
}

TEST(ShockSimulatorTest, SameSeedSameResult) {
    ShockSimulator sim(toy_model());
    ShockSimulator::Rng a(42), b(42);
    ExperimentResult ra = sim.run_shock_experiment(ShockType::Demand, 0.3, 2, a);
    ExperimentResult rb = sim.run_shock_experiment(ShockType::Demand, 0.3, 2, b);
    EXPECT_EQ(ra.sectors, rb.sectors);
    EXPECT_EQ(ra.effects, rb.effects);
}

TEST(ShockSimulatorTest, ModelIsNotModified) {
    auto model = toy_model();
    Eigen::VectorXd demand = model->demand();
    Eigen::VectorXd output = model->output();

    ShockSimulator sim(model);
    ShockSimulator::Rng rng(1);
    sim.run_shock_experiment(ShockType::Demand, 1.0, 3, rng);
    sim.run_shock_experiment(ShockType::Supply, 1.0, 3, rng);

    EXPECT_EQ(model->demand(), demand);
    EXPECT_EQ(model->output(), output);
}

TEST(ShockSimulatorTest, UnknownShockTypeRejected) {
    ShockSimulator sim(toy_model());
    ShockSimulator::Rng rng(1);
    EXPECT_THROW(sim.run_shock_experiment("Unknown", 0.3, 2, rng), InvalidShockTypeError);
    EXPECT_THROW(parse_shock_type("demand"), InvalidShockTypeError);
    EXPECT_EQ(parse_shock_type("Supply"), ShockType::Supply);
}

TEST(ShockSimulatorTest, SampleSizeBoundsRejected) {
    ShockSimulator sim(toy_model());
    ShockSimulator::Rng rng(1);
    EXPECT_THROW(sim.run_shock_experiment(ShockType::Demand, 0.3, 0, rng), InvalidSampleSizeError);
    EXPECT_THROW(sim.run_shock_experiment(ShockType::Demand, 0.3, 4, rng), InvalidSampleSizeError);
    EXPECT_THROW(sim.run_shock_experiment("Supply", 0.3, -1, rng), InvalidSampleSizeError);
    EXPECT_NO_THROW(sim.run_shock_experiment(ShockType::Demand, 0.3, 3, rng));
}

TEST(ShockSimulatorTest, ShockSizeBoundsRejected) {
    ShockSimulator sim(toy_model());
    ShockSimulator::Rng rng(1);
    EXPECT_THROW(sim.run_shock_experiment(ShockType::Demand, -0.1, 2, rng), InvalidShockSizeError);
    EXPECT_THROW(sim.run_shock_experiment(ShockType::Demand, 1.5, 2, rng), InvalidShockSizeError);
    EXPECT_THROW(sim.sector_effect(ShockType::Demand, 0.5, 3), std::out_of_range);
}

TEST(ShockSimulatorTest, NullModelRejected) {
    EXPECT_THROW(ShockSimulator(nullptr), std::invalid_argument);
}
