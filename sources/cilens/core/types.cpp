//
// Created by gregorian on 02/03/2026.
//

#include "cilens/core/types.h"
#include "cilens/utils/string_utils.h"

namespace cilens::core {

    std::string to_string(const PipelineStatus status) {
        switch (status) {
            case PipelineStatus::SUCCESS: return "success";
            case PipelineStatus::FAILED: return "failed";
            case PipelineStatus::OTHER: return "other";
            default: return "unknown";
        }
    }

    std::string to_string(const JobStatus status) {
        switch (status) {
            case JobStatus::SUCCESS: return "SUCCESS";
            case JobStatus::FAILED: return "FAILED";
            case JobStatus::CANCELED: return "CANCELED";
            case JobStatus::SKIPPED: return "SKIPPED";
            case JobStatus::MANUAL: return "MANUAL";
            case JobStatus::RUNNING: return "RUNNING";
            case JobStatus::PENDING: return "PENDING";
            case JobStatus::CREATED: return "CREATED";
            case JobStatus::UNKNOWN: return "UNKNOWN";
            default: return "UNKNOWN";
        }
    }

    PipelineStatus pipeline_status_from_string(const std::string& str) {
        const std::string lower = utils::to_lower(str);
        if (lower == "success") return PipelineStatus::SUCCESS;
        if (lower == "failed") return PipelineStatus::FAILED;
        return PipelineStatus::OTHER;
    }

    JobStatus job_status_from_string(const std::string& str) {
        const std::string upper = utils::to_upper(str);
        if (upper == "SUCCESS") return JobStatus::SUCCESS;
        if (upper == "FAILED") return JobStatus::FAILED;
        if (upper == "CANCELED" || upper == "CANCELLED") return JobStatus::CANCELED;
        if (upper == "SKIPPED") return JobStatus::SKIPPED;
        if (upper == "MANUAL") return JobStatus::MANUAL;
        if (upper == "RUNNING") return JobStatus::RUNNING;
        if (upper == "PENDING") return JobStatus::PENDING;
        if (upper == "CREATED") return JobStatus::CREATED;
        return JobStatus::UNKNOWN;
    }

} // namespace cilens::core
