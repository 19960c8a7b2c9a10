//
// Created by gregorian on 06/03/2026.
//

#ifndef CILENS_RELIABILITY_CLASSIFIER_H
#define CILENS_RELIABILITY_CLASSIFIER_H

#include "cilens/core/types.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cilens::analysis {

    /**
     * Outcome of all records of one job name within one pipeline.
     */
    enum class ExecutionOutcome {
        SUCCESS,  ///< Never retried and the final record succeeded.
        FLAKY,    ///< Retried at least once and the final record succeeded.
        FAILED    ///< No final record, or the final record did not succeed.
    };

    /**
     * Reliability of one job name across a group of pipelines.
     *
     * `flaky_retries.links` holds the ids of the retried records of flaky groups;
     * `failed_executions.links` the id of the final record of each failed group.
     */
    struct JobReliability {
        std::size_t total_executions = 0;
        core::CountWithLinks flaky_retries;
        core::CountWithLinks failed_executions;
        double flakiness_rate = 0.0;
        double failure_rate = 0.0;
    };

    /**
     * @class ReliabilityClassifier
     * Classifies job executions as success, flaky or failed and aggregates rates per job name.
     */
    class ReliabilityClassifier {
    public:
        ReliabilityClassifier() = default;

        /**
         * Classify the records that share a name within one pipeline, in pipeline order.
         *
         * The final record is the first one with `retried == false`.
         */
        static ExecutionOutcome classify(const std::vector<const core::Job*>& records);

        /**
         * Aggregate reliability per job name over the given pipelines.
         *
         * Every record counts as one execution. A flaky group adds one retry per
         * retried record; a failed group adds one failed execution.
         *
         * @param pipelines Pipelines to scan; all statuses are considered.
         * @return Reliability keyed by job name.
         */
        static std::map<std::string, JobReliability> calculate(
            const std::vector<const core::Pipeline*>& pipelines
        );

        /// 100 * count / total, or 0 when total is 0.
        static double calculate_rate(std::size_t count, std::size_t total);
    };

    std::string to_string(ExecutionOutcome outcome);

} // namespace cilens::analysis

#endif //CILENS_RELIABILITY_CLASSIFIER_H
