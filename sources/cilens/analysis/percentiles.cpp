//
// Created by gregorian on 05/03/2026.
//

#include "cilens/analysis/percentiles.h"

#include <algorithm>
#include <numeric>

namespace cilens::analysis {

    double percentile_of_sorted(const std::vector<double>& sorted, const int pct) {
        const std::size_t len = sorted.size();
        const std::size_t index = std::min(len * static_cast<std::size_t>(pct) / 100, len - 1);
        return sorted[index];
    }

    Percentiles calculate_percentiles(std::vector<double> values) {
        if (values.empty()) {
            return {};
        }

        if (values.size() == 1) {
            return {values.front(), values.front(), values.front()};
        }

        std::sort(values.begin(), values.end());

        Percentiles result;
        result.p50 = percentile_of_sorted(values, 50);
        result.p95 = percentile_of_sorted(values, 95);
        result.p99 = percentile_of_sorted(values, 99);
        return result;
    }

    double mean(const std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

} // namespace cilens::analysis
