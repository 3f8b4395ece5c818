#pragma once
#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include "Errors.hpp"

namespace Leontief {

enum class ShockType { Demand, Supply };

inline ShockType parse_shock_type(const std::string& name) {
    if (name == "Demand") return ShockType::Demand;
    if (name == "Supply") return ShockType::Supply;
    throw InvalidShockTypeError(name);
}

inline std::string to_string(ShockType type) {
    return type == ShockType::Demand ? "Demand" : "Supply";
}

// Single shock experiment
struct ShockParams {
    ShockType type = ShockType::Demand;
    double size = 0.3;       // share of demand/output removed
    int sample_size = 300;   // distinct sectors drawn per experiment
};

// Replication run across shock sizes
struct AggregationParams {
    std::vector<double> shock_sizes = {0.3, 0.7, 1.0};
    int replications = 20;
    ShockType type = ShockType::Demand;
    int sample_size = 300;
};

// Parameter container for one engine run
struct RunConfig {
    std::string table_path = "ICIO2021_2018.csv";
    int n_sectors = 3195;
    std::string mode = "replicate";   // "replicate" or "experiment"

    ShockParams experiment;
    AggregationParams aggregation;

    std::uint64_t seed = 42;
    int histogram_bins = 15;
    std::string output_csv = "shock_quantiles.csv";
    bool diagnostics = true;

    // Free-form numeric settings not covered above
    std::map<std::string, double> scalars;

    double get(const std::string& key, double default_val) const {
        auto it = scalars.find(key);
        if (it != scalars.end()) return it->second;
        return default_val;
    }

    double get_required(const std::string& key) const {
        auto it = scalars.find(key);
        if (it == scalars.end()) throw ConfigError("Missing required parameter: " + key);
        return it->second;
    }
};

} // namespace Leontief
