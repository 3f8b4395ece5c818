#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "../Errors.hpp"
#include "../Params.hpp"

namespace Leontief {

class JsonLoader {
public:
    using json = nlohmann::json;

    static RunConfig load_config(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw IoError("Could not open config file: " + filepath);
        }

        json data;
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            throw ConfigError(filepath + ": " + e.what());
        }

        std::cout << "[Leontief::IO] Loading config: " << filepath << std::endl;
        return from_json(data);
    }

    static RunConfig from_json(const json& data) {
        RunConfig cfg;
        try {
            cfg.table_path = data.value("table_path", cfg.table_path);
            cfg.n_sectors = data.value("n_sectors", cfg.n_sectors);
            cfg.mode = data.value("mode", cfg.mode);
            cfg.seed = data.value("seed", cfg.seed);
            cfg.histogram_bins = data.value("histogram_bins", cfg.histogram_bins);
            cfg.output_csv = data.value("output_csv", cfg.output_csv);
            cfg.diagnostics = data.value("diagnostics", cfg.diagnostics);

            // 1. Single experiment
            if (data.contains("experiment")) {
                const auto& ex = data["experiment"];
                cfg.experiment.type = parse_shock_type(ex.value("shock_type", std::string("Demand")));
                cfg.experiment.size = ex.value("shock_size", cfg.experiment.size);
                cfg.experiment.sample_size = ex.value("sample_size", cfg.experiment.sample_size);
            }

            // 2. Replications
            if (data.contains("aggregation")) {
                const auto& ag = data["aggregation"];
                if (ag.contains("shock_sizes")) {
                    cfg.aggregation.shock_sizes = ag["shock_sizes"].get<std::vector<double>>();
                }
                cfg.aggregation.replications = ag.value("replications", cfg.aggregation.replications);
                cfg.aggregation.type = parse_shock_type(ag.value("shock_type", std::string("Demand")));
                cfg.aggregation.sample_size = ag.value("sample_size", cfg.aggregation.sample_size);
            }

            // 3. Free numeric parameters
            if (data.contains("parameters")) {
                for (auto& [key, val] : data["parameters"].items()) {
                    if (val.is_number()) {
                        cfg.scalars[key] = val.get<double>();
                    }
                }
            }
        } catch (const json::exception& e) {
            throw ConfigError(e.what());
        }

        validate(cfg);
        return cfg;
    }

private:
    static void validate(const RunConfig& cfg) {
        if (cfg.mode != "replicate" && cfg.mode != "experiment") {
            throw ConfigError("unknown mode '" + cfg.mode + "'");
        }
        if (cfg.n_sectors < 1) {
            throw ConfigError("n_sectors must be positive");
        }
        if (cfg.histogram_bins < 1) {
            throw ConfigError("histogram_bins must be positive");
        }
        if (cfg.aggregation.replications < 1) {
            throw ConfigError("aggregation.replications must be >= 1");
        }
        if (cfg.aggregation.shock_sizes.empty()) {
            throw ConfigError("aggregation.shock_sizes is empty");
        }
    }
};

} // namespace Leontief
