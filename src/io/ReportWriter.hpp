#pragma once
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>
#include "../Errors.hpp"
#include "../model/CoefficientBuilder.hpp"
#include "../sim/ReplicationAggregator.hpp"
#include "../stats/SummaryStatistics.hpp"

namespace Leontief {

struct SeriesSummary {
    double shock_size = 0.0;
    int replications = 0;
    double mean = 0.0;
    double stddev = 0.0;
};

class ReportWriter {
public:
    // mean +/- population std of the 99th-percentile series per shock size
    static std::vector<SeriesSummary> summarize(const AggregatedResult& agg) {
        std::vector<SeriesSummary> out;
        for (const auto& [size, series] : agg) {
            if (series.empty()) continue;
            SeriesSummary s;
            s.shock_size = size;
            s.replications = static_cast<int>(series.size());
            s.mean = SummaryStatistics::mean(series);
            s.stddev = SummaryStatistics::stddev(series);
            out.push_back(s);
        }
        return out;
    }

    static void print_summary(std::ostream& os, const AggregatedResult& agg, ShockType type, int bins) {
        for (const auto& s : summarize(agg)) {
            os << "Effect of " << to_string(type) << " shocks by " << std::setprecision(3) << s.shock_size * 100.0
               << "% for the upper 1% quantile = " << std::setprecision(6) << s.mean
               << " +/- " << s.stddev << "\n";

            Histogram h = SummaryStatistics::histogram(agg.at(s.shock_size), bins);
            for (size_t b = 0; b < h.counts.size(); ++b) {
                double lo = h.min + b * h.bin_width;
                os << "  [" << std::setw(12) << lo << ", " << std::setw(12) << lo + h.bin_width << ") "
                   << std::string(h.counts[b], '#') << "\n";
            }
            os << "\n";
        }
    }

    static void print_experiment(std::ostream& os, const ExperimentResult& res) {
        os << to_string(res.type) << " shock of " << res.shock_size * 100.0 << "% on "
           << res.effects.size() << " sectors\n"
           << "  Average:            " << res.mean << "\n"
           << "  Standard deviation: " << res.stddev << "\n"
           << "  Median:             " << res.median << "\n"
           << "  Upper 5% quantile:  " << res.q95 << "\n"
           << "  Upper 1% quantile:  " << res.q99 << "\n";
    }

    // Long format: shock_size,replication,q99
    static void write_csv_aggregated(const std::string& filename, const AggregatedResult& agg) {
        std::ofstream f(filename);
        if (!f.is_open()) throw IoError("Could not write " + filename);
        f << "shock_size,replication,q99\n";
        f << std::setprecision(17);
        for (const auto& [size, series] : agg) {
            for (size_t r = 0; r < series.size(); ++r) {
                f << size << "," << r << "," << series[r] << "\n";
            }
        }
        f.close();
        std::cout << "[IO] Wrote " << filename << std::endl;
    }

    // One row per sampled sector
    static void write_csv_experiment(const std::string& filename, const ExperimentResult& res,
                                     const LeontiefModel& model) {
        std::ofstream f(filename);
        if (!f.is_open()) throw IoError("Could not write " + filename);
        f << "sector_index,sector,effect\n";
        f << std::setprecision(17);
        const auto& labels = model.sector_labels();
        for (size_t i = 0; i < res.sectors.size(); ++i) {
            int s = res.sectors[i];
            f << s << "," << labels[s] << "," << res.effects[i] << "\n";
        }
        f.close();
        std::cout << "[IO] Wrote " << filename << std::endl;
    }
};

} // namespace Leontief
