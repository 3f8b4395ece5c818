#pragma once
#include <vector>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace Leontief {

struct Histogram {
    double min = 0.0;
    double max = 0.0;
    double bin_width = 0.0;
    std::vector<int> counts;
};

class SummaryStatistics {
public:
    static double mean(const std::vector<double>& x) {
        if (x.empty()) throw std::invalid_argument("mean of empty sample");
        return std::accumulate(x.begin(), x.end(), 0.0) / x.size();
    }

    // Population standard deviation (divides by n)
    static double stddev(const std::vector<double>& x) {
        double m = mean(x);
        double ss = 0.0;
        for (double v : x) ss += (v - m) * (v - m);
        return std::sqrt(ss / x.size());
    }

    // Linear interpolation between order statistics at pos = q * (n - 1)
    static double quantile(std::vector<double> x, double q) {
        if (x.empty()) throw std::invalid_argument("quantile of empty sample");
        if (!(q >= 0.0 && q <= 1.0)) throw std::invalid_argument("quantile level outside [0, 1]");
        std::sort(x.begin(), x.end());

        double pos = q * (x.size() - 1);
        size_t lo = static_cast<size_t>(std::floor(pos));
        size_t hi = std::min(lo + 1, x.size() - 1);
        double frac = pos - lo;
        return x[lo] + frac * (x[hi] - x[lo]);
    }

    // Equal-width bins over [min, max]; the maximum lands in the last bin.
    static Histogram histogram(const std::vector<double>& x, int bins) {
        if (bins < 1) throw std::invalid_argument("histogram needs at least one bin");
        Histogram h;
        h.counts.assign(bins, 0);
        if (x.empty()) return h;

        auto [lo_it, hi_it] = std::minmax_element(x.begin(), x.end());
        h.min = *lo_it;
        h.max = *hi_it;
        h.bin_width = (h.max - h.min) / bins;

        for (double v : x) {
            int b = 0;
            if (h.bin_width > 0.0) {
                b = static_cast<int>((v - h.min) / h.bin_width);
                if (b >= bins) b = bins - 1;
            }
            h.counts[b]++;
        }
        return h;
    }
};

} // namespace Leontief
