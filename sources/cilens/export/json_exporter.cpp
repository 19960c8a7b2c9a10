//
// Created by gregorian on 10/03/2026.
//

#include "cilens/export/json_exporter.h"
#include "cilens/utils/file_utils.h"
#include "cilens/utils/links.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cilens::export_module {

    JsonExporter::JsonExporter(Options options)
        : options_(std::move(options)) {}

    std::string JsonExporter::format_timestamp(const core::timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::ostringstream ss;

#ifdef _WIN32
        std::tm time_info{};
        gmtime_s(&time_info, &time_t_val);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#else
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#endif

        return ss.str();
    }

    bool JsonExporter::renders_urls() const {
        return !options_.base_url.empty() && !options_.project_path.empty();
    }

    std::vector<std::string> JsonExporter::pipeline_links(const std::vector<std::string>& ids) const {
        if (!renders_urls()) {
            return ids;
        }

        std::vector<std::string> links;
        links.reserve(ids.size());
        for (const auto& id : ids) {
            links.push_back(utils::pipeline_id_to_url(options_.base_url, options_.project_path, id));
        }
        return links;
    }

    std::vector<std::string> JsonExporter::job_links(const std::vector<std::string>& ids) const {
        if (!renders_urls()) {
            return ids;
        }

        std::vector<std::string> links;
        links.reserve(ids.size());
        for (const auto& id : ids) {
            links.push_back(utils::job_id_to_url(options_.base_url, options_.project_path, id));
        }
        return links;
    }

    nlohmann::json JsonExporter::to_json(const core::CIInsights& insights) const {
        nlohmann::json doc;

        doc["provider"] = insights.provider;
        doc["project"] = insights.project;
        doc["collected_at"] = format_timestamp(insights.collected_at);
        doc["total_pipelines"] = insights.total_pipelines;
        doc["total_pipeline_types"] = insights.total_pipeline_types;

        doc["pipeline_types"] = nlohmann::json::array();
        for (const auto& type : insights.pipeline_types) {
            doc["pipeline_types"].push_back(type_to_json(type));
        }

        return doc;
    }

    nlohmann::json JsonExporter::type_to_json(const core::PipelineType& type) const {
        return {
            {"label", type.label},
            {"job_names", type.job_names},
            {"ids", type.ids},
            {"stages", type.stages},
            {"ref_patterns", type.ref_patterns},
            {"sources", type.sources},
            {"metrics", metrics_to_json(type.metrics)}
        };
    }

    nlohmann::json JsonExporter::metrics_to_json(const core::TypeMetrics& metrics) const {
        nlohmann::json result = {
            {"percentage", metrics.percentage},
            {"total_pipelines", metrics.total_pipelines},
            {"successful_pipelines", {
                {"count", metrics.successful_pipelines.count},
                {"links", pipeline_links(metrics.successful_pipelines.links)}
            }},
            {"failed_pipelines", {
                {"count", metrics.failed_pipelines.count},
                {"links", pipeline_links(metrics.failed_pipelines.links)}
            }},
            {"success_rate", metrics.success_rate},
            {"average_duration_seconds", metrics.average_duration_seconds},
            {"duration_p50", metrics.duration_p50},
            {"duration_p95", metrics.duration_p95},
            {"duration_p99", metrics.duration_p99},
            {"time_to_feedback_p50", metrics.time_to_feedback_p50},
            {"time_to_feedback_p95", metrics.time_to_feedback_p95},
            {"time_to_feedback_p99", metrics.time_to_feedback_p99}
        };

        result["jobs"] = nlohmann::json::array();
        for (const auto& job : metrics.jobs) {
            result["jobs"].push_back(job_to_json(job));
        }

        return result;
    }

    nlohmann::json JsonExporter::job_to_json(const core::JobMetrics& job) const {
        nlohmann::json predecessors = nlohmann::json::array();
        for (const auto& predecessor : job.predecessors) {
            predecessors.push_back({
                {"name", predecessor.name},
                {"duration_p50", predecessor.duration_p50}
            });
        }

        return {
            {"name", job.name},
            {"duration_p50", job.duration_p50},
            {"duration_p95", job.duration_p95},
            {"duration_p99", job.duration_p99},
            {"time_to_feedback_p50", job.time_to_feedback_p50},
            {"time_to_feedback_p95", job.time_to_feedback_p95},
            {"time_to_feedback_p99", job.time_to_feedback_p99},
            {"predecessors", predecessors},
            {"flakiness_rate", job.flakiness_rate},
            {"flaky_retries", {
                {"count", job.flaky_retries.count},
                {"links", job_links(job.flaky_retries.links)}
            }},
            {"failure_rate", job.failure_rate},
            {"failed_executions", {
                {"count", job.failed_executions.count},
                {"links", job_links(job.failed_executions.links)}
            }},
            {"total_executions", job.total_executions}
        };
    }

    std::string JsonExporter::export_to_string(const core::CIInsights& insights) const {
        const auto doc = to_json(insights);
        if (options_.pretty_print) {
            return doc.dump(options_.indent_size);
        }
        return doc.dump();
    }

    core::Result<void> JsonExporter::export_to_file(
        const core::CIInsights& insights,
        const std::string& output_path
    ) const {
        if (!utils::write_file(output_path, export_to_string(insights))) {
            return core::Result<void>::failure(core::Error{
                core::ErrorCode::FILE_WRITE_ERROR,
                "Failed to write JSON to: " + output_path
            });
        }

        return core::Result<void>::success();
    }

} // namespace cilens::export_module
