//
// Created by gregorian on 05/03/2026.
//

#ifndef CILENS_DEPENDENCY_RESOLVER_H
#define CILENS_DEPENDENCY_RESOLVER_H

#include "cilens/core/types.h"
#include "cilens/core/result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cilens::analysis {

    /**
     * @class JobGraph
     * Index over the jobs of one pipeline.
     *
     * Holds one record per distinct job name, addressed by index. When a name
     * repeats (retries), the final record (`retried == false`) is used; if every
     * record was retried, the last one. Indices follow ascending name order.
     */
    class JobGraph {
    public:
        explicit JobGraph(const core::Pipeline& pipeline);

        [[nodiscard]] std::size_t size() const { return jobs_.size(); }
        [[nodiscard]] const core::Job& job(const std::size_t index) const { return *jobs_[index]; }
        [[nodiscard]] std::optional<std::size_t> find(std::string_view name) const;

        /**
         * Names the job at `index` waits for.
         *
         * `needs` present: exactly those names (possibly empty, possibly unknown).
         * `needs` absent: every job whose stage comes before this job's stage.
         */
        [[nodiscard]] std::vector<std::string> dependencies(std::size_t index) const;

        /// Position of the job's stage in the pipeline's stage order; 0 for an unknown stage.
        [[nodiscard]] std::size_t stage_index(const std::size_t index) const { return stage_of_[index]; }

    private:
        std::vector<const core::Job*> jobs_;
        std::vector<std::size_t> stage_of_;
        std::unordered_map<std::string, std::size_t> index_by_name_;
    };

    struct ResolvedJob {
        std::string name;
        double duration = 0.0;
        double finish_time = 0.0;                  ///< Time-to-feedback from pipeline start.
        std::optional<std::string> predecessor;    ///< Dependency that finished last, if it finished after 0.
        std::vector<std::string> predecessors;     ///< Critical path before this job, earliest first.
        bool succeeded = false;                    ///< The chosen record has status SUCCESS.
    };

    struct ResolvedPipeline {
        std::string pipeline_id;
        std::vector<ResolvedJob> jobs;             ///< Sorted by name.

        [[nodiscard]] const ResolvedJob* find(std::string_view name) const;

        /**
         * Earliest finish time among succeeded jobs, i.e. when the first passing
         * signal arrives. Skipped, manual or failed jobs are ignored.
         *
         * @return nullopt when no job succeeded.
         */
        [[nodiscard]] std::optional<double> first_feedback_time() const;
    };

    /**
     * @class DependencyResolver
     * Computes per-job time-to-feedback and critical predecessor chains for a pipeline.
     *
     * finish(job) = duration(job) + max(finish(dep)) over its dependencies, or just
     * duration(job) without dependencies. Each job is evaluated once per pipeline;
     * the memo table lives for a single call.
     */
    class DependencyResolver {
    public:
        DependencyResolver() = default;

        /**
         * Resolve finish times and predecessors for every distinct job of a pipeline.
         *
         * Unknown dependency names count as finishing at 0. Among dependencies that
         * tie for the latest finish time, the smallest name becomes the predecessor.
         *
         * @param pipeline The pipeline to resolve.
         * @return The resolved jobs, or CIRCULAR_DEPENDENCY if `needs` form a cycle.
         */
        static core::Result<ResolvedPipeline> resolve(const core::Pipeline& pipeline);

        /**
         * Reconstruct the chain of predecessors leading to `job_name`.
         *
         * Follows recorded predecessors backward until a job has none, then
         * reverses. The job itself is not part of the chain.
         *
         * @param predecessor_of Immediate predecessor per job name.
         * @param job_name Target job.
         * @return Predecessor names in chronological order.
         */
        static std::vector<std::string> critical_path(
            const std::unordered_map<std::string, std::string>& predecessor_of,
            const std::string& job_name
        );
    };

} // namespace cilens::analysis

#endif //CILENS_DEPENDENCY_RESOLVER_H
