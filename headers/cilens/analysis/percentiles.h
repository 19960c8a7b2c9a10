//
// Created by gregorian on 05/03/2026.
//

#ifndef CILENS_PERCENTILES_H
#define CILENS_PERCENTILES_H

#include <vector>

namespace cilens::analysis {

    /**
     * p50/p95/p99 of a sample. All zero for an empty sample.
     */
    struct Percentiles {
        double p50 = 0.0;
        double p95 = 0.0;
        double p99 = 0.0;
    };

    /**
     * Floor-indexed rank selection on the sorted sample.
     *
     * For each pct in {50, 95, 99} the value at index
     * min(floor(len * pct / 100), len - 1) of the ascending sample is taken, so
     * [1..100] yields (51, 96, 100). The sample is taken by value and sorted in place.
     *
     * @param values Sample values in any order.
     * @return The three percentiles; (0, 0, 0) for an empty sample.
     */
    Percentiles calculate_percentiles(std::vector<double> values);

    /**
     * Single floor-indexed percentile of an already sorted sample.
     *
     * @param sorted Sample in ascending order, non-empty.
     * @param pct Percentile in [0, 100].
     */
    double percentile_of_sorted(const std::vector<double>& sorted, int pct);

    /// Arithmetic mean; 0 for an empty sample.
    double mean(const std::vector<double>& values);

} // namespace cilens::analysis

#endif //CILENS_PERCENTILES_H
