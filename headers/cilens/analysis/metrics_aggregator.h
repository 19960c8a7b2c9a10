//
// Created by gregorian on 07/03/2026.
//

#ifndef CILENS_METRICS_AGGREGATOR_H
#define CILENS_METRICS_AGGREGATOR_H

#include "cilens/analysis/dependency_resolver.h"
#include "cilens/analysis/reliability_classifier.h"
#include "cilens/core/types.h"

#include <map>
#include <string>
#include <vector>

namespace cilens::analysis {

    /**
     * @class MetricsAggregator
     * Builds the TypeMetrics of one pipeline cluster.
     *
     * Pipeline-level duration and time-to-feedback statistics, as well as all
     * job latency statistics, are taken from successful pipelines only, and
     * job latency only from jobs whose status is SUCCESS. Every job still takes
     * part in dependency resolution. Reliability looks at every pipeline of the
     * cluster, and any pipeline that did not succeed counts as failed.
     */
    class MetricsAggregator {
    public:
        MetricsAggregator() = default;

        /**
         * Aggregate metrics for the pipelines of one cluster.
         *
         * A successful pipeline whose `needs` form a cycle is logged and left out
         * of the job-level samples; it still counts everywhere else.
         *
         * @param pipelines Members of the cluster.
         * @param percentage Share of the cluster among all analysed pipelines.
         * @return Metrics with jobs ordered by time_to_feedback_p95, slowest first.
         */
        static core::TypeMetrics aggregate(
            const std::vector<const core::Pipeline*>& pipelines,
            double percentage
        );

        /**
         * Per-job metrics from resolved successful pipelines and cluster reliability.
         *
         * Jobs that did not succeed are left out. Each remaining job gets its
         * duration and finish-time percentiles, and the union of
         * the names on its critical paths as predecessors (ordered by their own
         * duration_p50, largest first).
         */
        static std::vector<core::JobMetrics> aggregate_jobs(
            const std::vector<ResolvedPipeline>& resolved,
            const std::map<std::string, JobReliability>& reliability
        );
    };

} // namespace cilens::analysis

#endif //CILENS_METRICS_AGGREGATOR_H
