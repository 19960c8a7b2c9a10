//
// Created by gregorian on 07/03/2026.
//

#include "cilens/analysis/metrics_aggregator.h"
#include "cilens/analysis/percentiles.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace cilens::analysis {

    namespace {

        struct JobSamples {
            std::vector<double> durations;
            std::vector<double> finish_times;
            std::set<std::string> predecessor_names;
        };

    } // namespace

    core::TypeMetrics MetricsAggregator::aggregate(
        const std::vector<const core::Pipeline*>& pipelines,
        const double percentage
    ) {
        core::TypeMetrics metrics;
        metrics.percentage = percentage;
        metrics.total_pipelines = pipelines.size();

        std::vector<const core::Pipeline*> successful;
        for (const auto* pipeline : pipelines) {
            if (pipeline->status == core::PipelineStatus::SUCCESS) {
                successful.push_back(pipeline);
                metrics.successful_pipelines.links.push_back(pipeline->id);
            } else {
                metrics.failed_pipelines.links.push_back(pipeline->id);
            }
        }
        metrics.successful_pipelines.count = metrics.successful_pipelines.links.size();
        metrics.failed_pipelines.count = metrics.failed_pipelines.links.size();

        metrics.success_rate = static_cast<double>(metrics.successful_pipelines.count) * 100.0 /
                               static_cast<double>(std::max<std::size_t>(metrics.total_pipelines, 1));

        std::vector<double> durations;
        durations.reserve(successful.size());
        for (const auto* pipeline : successful) {
            durations.push_back(static_cast<double>(pipeline->duration_seconds));
        }
        metrics.average_duration_seconds = mean(durations);

        const auto duration_percentiles = calculate_percentiles(std::move(durations));
        metrics.duration_p50 = duration_percentiles.p50;
        metrics.duration_p95 = duration_percentiles.p95;
        metrics.duration_p99 = duration_percentiles.p99;

        std::vector<ResolvedPipeline> resolved;
        resolved.reserve(successful.size());
        for (const auto* pipeline : successful) {
            auto result = DependencyResolver::resolve(*pipeline);
            if (result.is_failure()) {
                spdlog::warn("Skipping job metrics: {} ({})", result.error().message, result.error().context);
                continue;
            }
            resolved.push_back(std::move(result).value());
        }

        std::vector<double> feedback_times;
        for (const auto& pipeline : resolved) {
            if (const auto first = pipeline.first_feedback_time()) {
                feedback_times.push_back(*first);
            }
        }

        const auto feedback_percentiles = calculate_percentiles(std::move(feedback_times));
        metrics.time_to_feedback_p50 = feedback_percentiles.p50;
        metrics.time_to_feedback_p95 = feedback_percentiles.p95;
        metrics.time_to_feedback_p99 = feedback_percentiles.p99;

        const auto reliability = ReliabilityClassifier::calculate(pipelines);
        metrics.jobs = aggregate_jobs(resolved, reliability);

        return metrics;
    }

    std::vector<core::JobMetrics> MetricsAggregator::aggregate_jobs(
        const std::vector<ResolvedPipeline>& resolved,
        const std::map<std::string, JobReliability>& reliability
    ) {
        std::map<std::string, JobSamples> samples;
        for (const auto& pipeline : resolved) {
            for (const auto& job : pipeline.jobs) {
                if (!job.succeeded) {
                    continue;
                }
                auto& entry = samples[job.name];
                entry.durations.push_back(job.duration);
                entry.finish_times.push_back(job.finish_time);
                entry.predecessor_names.insert(job.predecessors.begin(), job.predecessors.end());
            }
        }

        std::map<std::string, Percentiles> duration_by_name;
        for (const auto& [name, entry] : samples) {
            duration_by_name.emplace(name, calculate_percentiles(entry.durations));
        }

        std::vector<core::JobMetrics> jobs;
        jobs.reserve(samples.size());

        for (const auto& [name, entry] : samples) {
            core::JobMetrics job;
            job.name = name;

            const auto& duration = duration_by_name.at(name);
            job.duration_p50 = duration.p50;
            job.duration_p95 = duration.p95;
            job.duration_p99 = duration.p99;

            const auto feedback = calculate_percentiles(entry.finish_times);
            job.time_to_feedback_p50 = feedback.p50;
            job.time_to_feedback_p95 = feedback.p95;
            job.time_to_feedback_p99 = feedback.p99;

            for (const auto& predecessor : entry.predecessor_names) {
                if (auto it = duration_by_name.find(predecessor); it != duration_by_name.end()) {
                    job.predecessors.push_back({predecessor, it->second.p50});
                }
            }
            std::stable_sort(job.predecessors.begin(), job.predecessors.end(),
                             [](const core::PredecessorJob& a, const core::PredecessorJob& b) {
                                 return a.duration_p50 > b.duration_p50;
                             });

            if (auto it = reliability.find(name); it != reliability.end()) {
                const auto& rel = it->second;
                job.total_executions = rel.total_executions;
                job.flaky_retries = rel.flaky_retries;
                job.flakiness_rate = rel.flakiness_rate;
                job.failed_executions = rel.failed_executions;
                job.failure_rate = rel.failure_rate;
            }

            jobs.push_back(std::move(job));
        }

        std::stable_sort(jobs.begin(), jobs.end(), [](const core::JobMetrics& a, const core::JobMetrics& b) {
            return a.time_to_feedback_p95 > b.time_to_feedback_p95;
        });

        return jobs;
    }

} // namespace cilens::analysis
