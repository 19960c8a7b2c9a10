//
// Created by gregorian on 05/03/2026.
//

#include "cilens/analysis/dependency_resolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace cilens::analysis {

    namespace {

        enum class VisitState { UNVISITED, VISITING, DONE };

        struct ResolutionState {
            const JobGraph& graph;
            std::vector<VisitState> visit;
            std::vector<double> finish;
            std::unordered_map<std::string, std::string> predecessor_of;
        };

        core::Result<double> finish_time(const std::size_t index, ResolutionState& state) {
            if (state.visit[index] == VisitState::DONE) {
                return core::Result<double>::success(state.finish[index]);
            }

            const auto& job = state.graph.job(index);
            if (state.visit[index] == VisitState::VISITING) {
                return core::Result<double>::failure(
                    core::ErrorCode::CIRCULAR_DEPENDENCY,
                    "Dependency cycle through job '" + job.name + "'");
            }
            state.visit[index] = VisitState::VISITING;

            double slowest_time = 0.0;
            std::optional<std::string> slowest_dep;

            for (const auto& dep : state.graph.dependencies(index)) {
                double dep_time = 0.0;
                if (const auto dep_index = state.graph.find(dep)) {
                    auto dep_result = finish_time(*dep_index, state);
                    if (dep_result.is_failure()) {
                        return dep_result;
                    }
                    dep_time = dep_result.value();
                }

                if (!slowest_dep || dep_time > slowest_time ||
                    (dep_time == slowest_time && dep < *slowest_dep)) {
                    slowest_time = dep_time;
                    slowest_dep = dep;
                }
            }

            const double total = job.duration_seconds + slowest_time;
            state.finish[index] = total;
            state.visit[index] = VisitState::DONE;

            if (slowest_dep && slowest_time > 0.0) {
                state.predecessor_of[job.name] = *slowest_dep;
            }

            return core::Result<double>::success(total);
        }

    } // namespace

    JobGraph::JobGraph(const core::Pipeline& pipeline) {
        std::unordered_map<std::string, std::size_t> stage_position;
        for (std::size_t i = 0; i < pipeline.stages.size(); ++i) {
            stage_position.emplace(pipeline.stages[i], i);
        }

        std::unordered_map<std::string, const core::Job*> chosen;
        for (const auto& job : pipeline.jobs) {
            auto it = chosen.find(job.name);
            if (it == chosen.end()) {
                chosen.emplace(job.name, &job);
            } else if (!job.retried || it->second->retried) {
                it->second = &job;
            }
        }

        jobs_.reserve(chosen.size());
        for (const auto& [name, job] : chosen) {
            jobs_.push_back(job);
        }
        std::sort(jobs_.begin(), jobs_.end(), [](const core::Job* a, const core::Job* b) {
            return a->name < b->name;
        });

        stage_of_.reserve(jobs_.size());
        for (std::size_t i = 0; i < jobs_.size(); ++i) {
            index_by_name_.emplace(jobs_[i]->name, i);

            if (auto it = stage_position.find(jobs_[i]->stage); it != stage_position.end()) {
                stage_of_.push_back(it->second);
            } else {
                spdlog::warn("Job '{}' in pipeline {} has stage '{}' not listed in pipeline stages; treating it as the first stage",
                             jobs_[i]->name, pipeline.id, jobs_[i]->stage);
                stage_of_.push_back(0);
            }
        }
    }

    std::optional<std::size_t> JobGraph::find(const std::string_view name) const {
        if (const auto it = index_by_name_.find(std::string(name)); it != index_by_name_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<std::string> JobGraph::dependencies(const std::size_t index) const {
        const auto& job = *jobs_[index];
        if (job.needs) {
            return *job.needs;
        }

        std::vector<std::string> deps;
        const std::size_t current_stage = stage_of_[index];
        for (std::size_t i = 0; i < jobs_.size(); ++i) {
            if (stage_of_[i] < current_stage) {
                deps.push_back(jobs_[i]->name);
            }
        }
        return deps;
    }

    const ResolvedJob* ResolvedPipeline::find(const std::string_view name) const {
        const auto it = std::lower_bound(jobs.begin(), jobs.end(), name,
                                         [](const ResolvedJob& job, const std::string_view n) {
                                             return job.name < n;
                                         });
        if (it != jobs.end() && it->name == name) {
            return &*it;
        }
        return nullptr;
    }

    std::optional<double> ResolvedPipeline::first_feedback_time() const {
        std::optional<double> earliest;
        for (const auto& job : jobs) {
            if (job.succeeded && (!earliest || job.finish_time < *earliest)) {
                earliest = job.finish_time;
            }
        }
        return earliest;
    }

    core::Result<ResolvedPipeline> DependencyResolver::resolve(const core::Pipeline& pipeline) {
        const JobGraph graph(pipeline);

        ResolutionState state{
            graph,
            std::vector(graph.size(), VisitState::UNVISITED),
            std::vector(graph.size(), 0.0),
            {}
        };

        for (std::size_t i = 0; i < graph.size(); ++i) {
            if (auto result = finish_time(i, state); result.is_failure()) {
                return core::Result<ResolvedPipeline>::failure(result.error().with_context("pipeline " + pipeline.id));
            }
        }

        ResolvedPipeline resolved;
        resolved.pipeline_id = pipeline.id;
        resolved.jobs.reserve(graph.size());

        for (std::size_t i = 0; i < graph.size(); ++i) {
            const auto& job = graph.job(i);

            ResolvedJob entry;
            entry.name = job.name;
            entry.duration = job.duration_seconds;
            entry.finish_time = state.finish[i];
            entry.succeeded = job.status == core::JobStatus::SUCCESS;
            if (auto it = state.predecessor_of.find(job.name); it != state.predecessor_of.end()) {
                entry.predecessor = it->second;
            }
            entry.predecessors = critical_path(state.predecessor_of, job.name);

            resolved.jobs.push_back(std::move(entry));
        }

        return core::Result<ResolvedPipeline>::success(std::move(resolved));
    }

    std::vector<std::string> DependencyResolver::critical_path(
        const std::unordered_map<std::string, std::string>& predecessor_of,
        const std::string& job_name
    ) {
        std::vector<std::string> path;
        std::unordered_set<std::string> seen{job_name};

        auto it = predecessor_of.find(job_name);
        while (it != predecessor_of.end() && seen.insert(it->second).second) {
            path.push_back(it->second);
            it = predecessor_of.find(it->second);
        }

        std::ranges::reverse(path);
        return path;
    }

} // namespace cilens::analysis
