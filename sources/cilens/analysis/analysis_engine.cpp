//
// Created by gregorian on 08/03/2026.
//

#include "cilens/analysis/analysis_engine.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace cilens::analysis {

    core::Result<std::vector<core::PipelineType>> InsightsEngine::analyze(
        const std::vector<core::Pipeline>& pipelines,
        const Options& options
    ) {
        if (options.min_type_percentage < 0 || options.min_type_percentage > 100) {
            return core::Result<std::vector<core::PipelineType>>::failure(
                core::ErrorCode::INVALID_ARGUMENT,
                "min_type_percentage must be between 0 and 100, got " +
                std::to_string(options.min_type_percentage));
        }

        const auto clusters = PipelineClustering::cluster(pipelines, options.min_type_percentage);

        std::vector<core::PipelineType> types;
        types.reserve(clusters.size());

        for (const auto& cluster : clusters) {
            spdlog::debug("Aggregating pipeline type '{}' with {} pipeline(s) and {} job name(s)",
                          cluster.label, cluster.pipelines.size(), cluster.signature.size());
            types.push_back(build_pipeline_type(cluster));
        }

        spdlog::info("Analysed {} pipeline(s) into {} pipeline type(s)", pipelines.size(), types.size());

        return core::Result<std::vector<core::PipelineType>>::success(std::move(types));
    }

    core::Result<core::CIInsights> InsightsEngine::collect_insights(
        const std::string& provider,
        const std::string& project,
        const std::vector<core::Pipeline>& pipelines,
        const Options& options
    ) {
        return analyze(pipelines, options).map([&](const std::vector<core::PipelineType>& types) {
            core::CIInsights insights;
            insights.provider = provider;
            insights.project = project;
            insights.collected_at = std::chrono::system_clock::now();
            insights.total_pipelines = pipelines.size();
            insights.total_pipeline_types = types.size();
            insights.pipeline_types = types;
            return insights;
        });
    }

    core::PipelineType InsightsEngine::build_pipeline_type(const PipelineCluster& cluster) {
        core::PipelineType type;
        type.label = cluster.label;
        type.job_names = cluster.signature;
        type.stages = cluster.stages;
        type.ref_patterns = cluster.ref_patterns;
        type.sources = cluster.sources;

        type.ids.reserve(cluster.pipelines.size());
        for (const auto* pipeline : cluster.pipelines) {
            type.ids.push_back(pipeline->id);
        }

        type.metrics = MetricsAggregator::aggregate(cluster.pipelines, cluster.percentage);
        return type;
    }

} // namespace cilens::analysis
