//
// Created by gregorian on 06/03/2026.
//

#ifndef CILENS_PIPELINE_CLUSTERING_H
#define CILENS_PIPELINE_CLUSTERING_H

#include "cilens/core/types.h"

#include <string>
#include <vector>

namespace cilens::analysis {

    /**
     * @struct PipelineCluster
     * Pipelines sharing the same set of job names.
     *
     * Holds non-owning pointers into the collection passed to
     * PipelineClustering::cluster(); the cluster must not outlive it.
     */
    struct PipelineCluster {
        std::vector<std::string> signature;          ///< Sorted, deduplicated job names.
        std::vector<const core::Pipeline*> pipelines;
        double percentage = 0.0;                     ///< Share of all input pipelines, 0 to 100.
        std::string label;
        std::vector<std::string> stages;             ///< Distinct job stages, first appearance order.
        std::vector<std::string> ref_patterns;       ///< Distinct refs, first appearance order.
        std::vector<std::string> sources;            ///< Distinct sources, first appearance order.
    };

    /**
     * @class PipelineClustering
     * Groups pipelines into types by their job-name signature.
     */
    class PipelineClustering {
    public:
        PipelineClustering() = default;

        /**
         * Job names of a pipeline, sorted and deduplicated. Retries of the same
         * job do not change the signature.
         */
        static std::vector<std::string> signature(const core::Pipeline& pipeline);

        /**
         * Group pipelines by signature and drop small groups.
         *
         * Clusters whose percentage is below `min_type_percentage` are discarded.
         * The rest are ordered by pipeline count, largest first, then by signature.
         *
         * @param pipelines All pipelines under analysis.
         * @param min_type_percentage Threshold in percent, 0 to 100.
         * @return Labelled clusters with their characteristics.
         */
        static std::vector<PipelineCluster> cluster(
            const std::vector<core::Pipeline>& pipelines,
            int min_type_percentage
        );

        /**
         * Heuristic label from job names, case-insensitive, first match wins:
         * "prod" gives "Production"; "staging", "dev", "test" or "qa" give
         * "Development"; anything else "Unknown".
         */
        static std::string label_for(const std::vector<std::string>& job_names);

        /// Fill stages, ref_patterns and sources of a cluster from its pipelines.
        static void extract_characteristics(PipelineCluster& cluster);
    };

} // namespace cilens::analysis

#endif //CILENS_PIPELINE_CLUSTERING_H
