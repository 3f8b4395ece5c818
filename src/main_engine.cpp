#include <iostream>
#include <string>
#include <filesystem>
#include <chrono>

// Core Components
#include "Params.hpp"
#include "io/json_loader.hpp"
#include "io/TableLoader.hpp"
#include "io/ReportWriter.hpp"
#include "model/CoefficientBuilder.hpp"
#include "sim/ShockSimulator.hpp"
#include "sim/ReplicationAggregator.hpp"

using namespace Leontief;

static int run_experiment(const RunConfig& cfg, std::shared_ptr<const LeontiefModel> model) {
    std::cout << "\n--- Step 3: Shock Experiment ---" << std::endl;
    ShockSimulator sim(model);
    ShockSimulator::Rng rng(cfg.seed);

    ExperimentResult res = sim.run_shock_experiment(cfg.experiment, rng);
    ReportWriter::print_experiment(std::cout, res);
    ReportWriter::write_csv_experiment(cfg.output_csv, res, *model);
    return 0;
}

static int run_replications(const RunConfig& cfg, std::shared_ptr<const LeontiefModel> model) {
    std::cout << "\n--- Step 3: Replications ("
              << cfg.aggregation.shock_sizes.size() << " shock sizes x "
              << cfg.aggregation.replications << ") ---" << std::endl;

    ReplicationAggregator agg(model, cfg.seed);
    agg.on_replication = [](double size, int rep, const ExperimentResult& res) {
        std::cout << "[Leontief::Sim] shock " << size << " rep " << rep
                  << ": q99 = " << res.q99 << std::endl;
    };

    AggregatedResult result = agg.run(cfg.aggregation);

    std::cout << "\n--- Step 4: Summary ---" << std::endl;
    ReportWriter::print_summary(std::cout, result, cfg.aggregation.type, cfg.histogram_bins);
    ReportWriter::write_csv_aggregated(cfg.output_csv, result);
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        // 1. Setup & Load Config
        std::string config_path = (argc > 1) ? argv[1] : "leontief.json";
        std::cout << "=== Leontief Shock Engine ===" << std::endl;

        RunConfig cfg;
        if (std::filesystem::exists(config_path)) {
            cfg = JsonLoader::load_config(config_path);
        } else {
            std::cout << "[WARN] Config file not found: " << config_path << std::endl;
            std::cout << "[INFO] Using default configuration." << std::endl;
        }

        // 2. Build Model
        std::cout << "\n--- Step 1: Reading Input-Output Table ---" << std::endl;
        RawTable table = TableLoader::load_icio_csv(cfg.table_path, cfg.n_sectors);

        std::cout << "\n--- Step 2: Building Leontief Model ---" << std::endl;
        auto t0 = std::chrono::steady_clock::now();
        auto model = CoefficientBuilder::build(table);
        auto t1 = std::chrono::steady_clock::now();
        std::cout << "[Leontief::Model] Inverted " << model->size() << "x" << model->size()
                  << " system in " << std::chrono::duration<double>(t1 - t0).count() << " s" << std::endl;
        std::cout << "[Leontief::Model] Total output: " << model->total_output()
                  << ", total final demand: " << model->total_final_demand() << std::endl;

        if (cfg.diagnostics) {
            // Output identities hold only approximately in published tables
            IdentityDiagnostics diag = model->diagnose();
            std::cout << "[Leontief::Model] Identity residuals: A*x + d - x = " << diag.coefficient_residual
                      << ", L*d - x = " << diag.inverse_residual << std::endl;
            double tol = cfg.get("identity_warn_threshold", 1.0);
            if (diag.coefficient_residual > tol || diag.inverse_residual > tol) {
                std::cout << "[WARN] Output identity residual above " << tol << std::endl;
            }
        }

        int rc = (cfg.mode == "experiment") ? run_experiment(cfg, model)
                                            : run_replications(cfg, model);

        std::cout << "\n=== Finished Successfully ===" << std::endl;
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
