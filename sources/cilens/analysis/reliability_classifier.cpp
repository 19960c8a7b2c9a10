//
// Created by gregorian on 06/03/2026.
//

#include "cilens/analysis/reliability_classifier.h"

#include <algorithm>

namespace cilens::analysis {

    namespace {

        const core::Job* final_record(const std::vector<const core::Job*>& records) {
            const auto it = std::ranges::find_if(records, [](const core::Job* job) { return !job->retried; });
            return it != records.end() ? *it : nullptr;
        }

    } // namespace

    ExecutionOutcome ReliabilityClassifier::classify(const std::vector<const core::Job*>& records) {
        const bool was_retried = std::ranges::any_of(records, [](const core::Job* job) { return job->retried; });
        const core::Job* final_job = final_record(records);
        const bool final_succeeded = final_job != nullptr && final_job->status == core::JobStatus::SUCCESS;

        if (was_retried && final_succeeded) {
            return ExecutionOutcome::FLAKY;
        }
        if (!final_succeeded) {
            return ExecutionOutcome::FAILED;
        }
        return ExecutionOutcome::SUCCESS;
    }

    std::map<std::string, JobReliability> ReliabilityClassifier::calculate(
        const std::vector<const core::Pipeline*>& pipelines
    ) {
        std::map<std::string, JobReliability> reliability;

        for (const auto* pipeline : pipelines) {
            std::map<std::string, std::vector<const core::Job*>> records_by_name;
            for (const auto& job : pipeline->jobs) {
                records_by_name[job.name].push_back(&job);
            }

            for (const auto& [name, records] : records_by_name) {
                auto& entry = reliability[name];
                entry.total_executions += records.size();

                switch (classify(records)) {
                    case ExecutionOutcome::FLAKY:
                        for (const auto* job : records) {
                            if (job->retried) {
                                ++entry.flaky_retries.count;
                                entry.flaky_retries.links.push_back(job->id);
                            }
                        }
                        break;
                    case ExecutionOutcome::FAILED:
                        ++entry.failed_executions.count;
                        if (const auto* final_job = final_record(records)) {
                            entry.failed_executions.links.push_back(final_job->id);
                        }
                        break;
                    case ExecutionOutcome::SUCCESS:
                        break;
                }
            }
        }

        for (auto& [name, entry] : reliability) {
            entry.flakiness_rate = calculate_rate(entry.flaky_retries.count, entry.total_executions);
            entry.failure_rate = calculate_rate(entry.failed_executions.count, entry.total_executions);
        }

        return reliability;
    }

    double ReliabilityClassifier::calculate_rate(const std::size_t count, const std::size_t total) {
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(count) * 100.0 / static_cast<double>(total);
    }

    std::string to_string(const ExecutionOutcome outcome) {
        switch (outcome) {
            case ExecutionOutcome::SUCCESS: return "success";
            case ExecutionOutcome::FLAKY:   return "flaky";
            case ExecutionOutcome::FAILED:  return "failed";
        }
        return "unknown";
    }

} // namespace cilens::analysis
