//
// Created by gregorian on 08/03/2026.
//

#ifndef CILENS_ANALYSIS_ENGINE_H
#define CILENS_ANALYSIS_ENGINE_H

#include "cilens/analysis/metrics_aggregator.h"
#include "cilens/analysis/pipeline_clustering.h"
#include "cilens/core/types.h"
#include "cilens/core/result.h"

#include <string>
#include <vector>

namespace cilens::analysis {

    /**
     * Main entry point of the analytics engine.
     *
     * Turns a materialized pipeline collection into pipeline types:
     * - Clustering by job-name signature, with a minimum share threshold
     * - Per-cluster aggregation of pipeline and job metrics
     *   (dependency resolution, percentiles, reliability)
     *
     * The engine is synchronous and keeps no state between calls; identical
     * input gives identical output.
     */
    class InsightsEngine {
    public:
        struct Options {
            int min_type_percentage = 1;   ///< Pipeline types below this share (0 to 100) are dropped.
        };

        InsightsEngine() = default;

        /**
         * Cluster the pipelines and aggregate metrics for each retained type.
         *
         * @param pipelines Pipelines with status success or failed.
         * @param options Engine parameters.
         * @return Pipeline types ordered by pipeline count, largest first, or
         *         INVALID_ARGUMENT when min_type_percentage is outside [0, 100].
         */
        static core::Result<std::vector<core::PipelineType>> analyze(
            const std::vector<core::Pipeline>& pipelines,
            const Options& options
        );

        /**
         * Run analyze() and wrap the result with collection metadata.
         *
         * @param provider Name of the CI provider the data came from.
         * @param project Project identifier.
         * @param pipelines Pipelines to analyse.
         * @param options Engine parameters.
         * @return Insights stamped with the current time.
         */
        static core::Result<core::CIInsights> collect_insights(
            const std::string& provider,
            const std::string& project,
            const std::vector<core::Pipeline>& pipelines,
            const Options& options
        );

    private:
        static core::PipelineType build_pipeline_type(const PipelineCluster& cluster);
    };

} // namespace cilens::analysis

#endif //CILENS_ANALYSIS_ENGINE_H
