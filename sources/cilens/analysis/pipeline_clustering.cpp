//
// Created by gregorian on 06/03/2026.
//

#include "cilens/analysis/pipeline_clustering.h"
#include "cilens/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <map>
#include <string_view>
#include <unordered_set>

namespace cilens::analysis {

    namespace {

        void append_unique(std::vector<std::string>& values,
                           std::unordered_set<std::string>& seen,
                           const std::string& value) {
            if (seen.insert(value).second) {
                values.push_back(value);
            }
        }

        bool any_name_contains(const std::vector<std::string>& job_names, const std::string_view needle) {
            return std::ranges::any_of(job_names, [needle](const std::string& name) {
                return utils::contains_ignore_case(name, needle);
            });
        }

    } // namespace

    std::vector<std::string> PipelineClustering::signature(const core::Pipeline& pipeline) {
        std::vector<std::string> names;
        names.reserve(pipeline.jobs.size());
        for (const auto& job : pipeline.jobs) {
            names.push_back(job.name);
        }

        std::sort(names.begin(), names.end());
        names.erase(std::unique(names.begin(), names.end()), names.end());
        return names;
    }

    std::vector<PipelineCluster> PipelineClustering::cluster(
        const std::vector<core::Pipeline>& pipelines,
        const int min_type_percentage
    ) {
        std::map<std::vector<std::string>, std::vector<const core::Pipeline*>> groups;
        for (const auto& pipeline : pipelines) {
            groups[signature(pipeline)].push_back(&pipeline);
        }

        const double total = static_cast<double>(std::max<std::size_t>(pipelines.size(), 1));

        std::vector<PipelineCluster> clusters;
        for (auto& [sig, members] : groups) {
            const double percentage = static_cast<double>(members.size()) * 100.0 / total;
            if (percentage < static_cast<double>(min_type_percentage)) {
                spdlog::debug("Dropping pipeline type with {} pipeline(s) ({:.2f}% < {}%)",
                              members.size(), percentage, min_type_percentage);
                continue;
            }

            PipelineCluster cluster;
            cluster.signature = sig;
            cluster.pipelines = std::move(members);
            cluster.percentage = percentage;
            cluster.label = label_for(cluster.signature);
            extract_characteristics(cluster);
            clusters.push_back(std::move(cluster));
        }

        std::stable_sort(clusters.begin(), clusters.end(), [](const PipelineCluster& a, const PipelineCluster& b) {
            if (a.pipelines.size() != b.pipelines.size()) {
                return a.pipelines.size() > b.pipelines.size();
            }
            return a.signature < b.signature;
        });

        return clusters;
    }

    std::string PipelineClustering::label_for(const std::vector<std::string>& job_names) {
        if (any_name_contains(job_names, "prod")) {
            return "Production";
        }

        static constexpr std::array<std::string_view, 4> development_markers = {"staging", "dev", "test", "qa"};
        for (const auto marker : development_markers) {
            if (any_name_contains(job_names, marker)) {
                return "Development";
            }
        }

        return "Unknown";
    }

    void PipelineClustering::extract_characteristics(PipelineCluster& cluster) {
        std::unordered_set<std::string> seen_stages;
        std::unordered_set<std::string> seen_refs;
        std::unordered_set<std::string> seen_sources;

        cluster.stages.clear();
        cluster.ref_patterns.clear();
        cluster.sources.clear();

        for (const auto* pipeline : cluster.pipelines) {
            for (const auto& job : pipeline->jobs) {
                append_unique(cluster.stages, seen_stages, job.stage);
            }
            append_unique(cluster.ref_patterns, seen_refs, pipeline->ref);
            append_unique(cluster.sources, seen_sources, pipeline->source);
        }
    }

} // namespace cilens::analysis
