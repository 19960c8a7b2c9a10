//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_CORE_TYPES_H
#define CILENS_CORE_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cilens::core {

    using timestamp = std::chrono::system_clock::time_point;

    enum class PipelineStatus {
        SUCCESS,
        FAILED,
        OTHER
    };

    enum class JobStatus {
        SUCCESS,
        FAILED,
        CANCELED,
        SKIPPED,
        MANUAL,
        RUNNING,
        PENDING,
        CREATED,
        UNKNOWN
    };

    /**
     * One execution record of a job inside a pipeline.
     *
     * A name may appear several times in the same pipeline when the job was
     * retried; the records are told apart by id and only the final one has
     * `retried == false`.
     */
    struct Job {
        std::string id;
        std::string name;
        std::string stage;
        double duration_seconds{};
        JobStatus status = JobStatus::UNKNOWN;
        bool retried{};

        /// nullopt: wait for all earlier stages. Empty: start immediately. Otherwise exactly these names.
        std::optional<std::vector<std::string>> needs;
    };

    struct Pipeline {
        std::string id;
        std::string ref;
        std::string source;
        PipelineStatus status = PipelineStatus::OTHER;
        std::uint64_t duration_seconds{};
        std::vector<std::string> stages;
        std::vector<Job> jobs;
    };

    /// A count together with evidence references (pipeline or job ids).
    struct CountWithLinks {
        std::size_t count{};
        std::vector<std::string> links;
    };

    struct PredecessorJob {
        std::string name;
        double duration_p50{};
    };

    struct JobMetrics {
        std::string name;

        double duration_p50{};
        double duration_p95{};
        double duration_p99{};

        double time_to_feedback_p50{};
        double time_to_feedback_p95{};
        double time_to_feedback_p99{};

        std::vector<PredecessorJob> predecessors;

        double flakiness_rate{};
        CountWithLinks flaky_retries;
        double failure_rate{};
        CountWithLinks failed_executions;
        std::size_t total_executions{};
    };

    struct TypeMetrics {
        double percentage{};
        std::size_t total_pipelines{};
        CountWithLinks successful_pipelines;
        CountWithLinks failed_pipelines;
        double success_rate{};
        double average_duration_seconds{};

        double duration_p50{};
        double duration_p95{};
        double duration_p99{};

        double time_to_feedback_p50{};
        double time_to_feedback_p95{};
        double time_to_feedback_p99{};

        std::vector<JobMetrics> jobs;
    };

    struct PipelineType {
        std::string label;
        std::vector<std::string> job_names;
        std::vector<std::string> ids;
        std::vector<std::string> stages;
        std::vector<std::string> ref_patterns;
        std::vector<std::string> sources;
        TypeMetrics metrics;
    };

    struct CIInsights {
        std::string provider;
        std::string project;
        timestamp collected_at;
        std::size_t total_pipelines{};
        std::size_t total_pipeline_types{};
        std::vector<PipelineType> pipeline_types;
    };

    std::string to_string(PipelineStatus status);
    std::string to_string(JobStatus status);

    /// Case-insensitive; anything but "success" / "failed" maps to OTHER.
    PipelineStatus pipeline_status_from_string(const std::string& str);

    /// Case-insensitive; unrecognized values map to UNKNOWN.
    JobStatus job_status_from_string(const std::string& str);

}

#endif //CILENS_CORE_TYPES_H
