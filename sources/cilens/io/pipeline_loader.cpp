//
// Created by gregorian on 09/03/2026.
//

#include "cilens/io/pipeline_loader.h"
#include "cilens/utils/file_utils.h"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>

namespace cilens::io {

    namespace {

        using simdjson::dom::element;

        /// String or integer field as text; nullopt when missing, null or of another type.
        std::optional<std::string> read_text(const element& obj, const std::string_view key) {
            element value;
            if (obj[key].get(value)) {
                return std::nullopt;
            }
            if (auto v = value.get<std::string_view>(); !v.error()) {
                return std::string(v.value_unsafe());
            }
            if (auto v = value.get<int64_t>(); !v.error()) {
                return std::to_string(v.value_unsafe());
            }
            if (auto v = value.get<uint64_t>(); !v.error()) {
                return std::to_string(v.value_unsafe());
            }
            return std::nullopt;
        }

        std::optional<double> read_number(const element& obj, const std::string_view key) {
            if (auto v = obj[key].get<double>(); !v.error()) {
                return v.value_unsafe();
            }
            return std::nullopt;
        }

        core::Result<std::optional<std::vector<std::string>>> read_needs(const element& job) {
            using NeedsResult = core::Result<std::optional<std::vector<std::string>>>;

            element needs;
            if (job["needs"].get(needs) || needs.is_null()) {
                return NeedsResult::success(std::nullopt);
            }

            simdjson::dom::array entries;
            if (needs.get_array().get(entries)) {
                return NeedsResult::failure(core::ErrorCode::MALFORMED_DATA, "'needs' must be an array or null");
            }

            std::vector<std::string> names;
            for (element entry : entries) {
                if (auto v = entry.get<std::string_view>(); !v.error()) {
                    names.emplace_back(v.value_unsafe());
                } else if (auto name = read_text(entry, "name")) {
                    names.push_back(std::move(*name));
                } else {
                    return NeedsResult::failure(core::ErrorCode::MALFORMED_DATA,
                                                "'needs' entries must be job names or objects with a 'name'");
                }
            }
            return NeedsResult::success(std::optional(std::move(names)));
        }

        core::Result<core::Job> parse_job(const element& value, const std::string& pipeline_id) {
            if (!value.is_object()) {
                return core::Result<core::Job>::failure(core::ErrorCode::MALFORMED_DATA,
                                                        "Job entry in pipeline " + pipeline_id + " is not an object");
            }

            core::Job job;

            auto name = read_text(value, "name");
            if (!name) {
                return core::Result<core::Job>::failure(core::ErrorCode::MALFORMED_DATA,
                                                        "Job without a name in pipeline " + pipeline_id);
            }
            job.name = std::move(*name);
            job.id = read_text(value, "id").value_or(job.name);
            job.stage = read_text(value, "stage").value_or("");
            job.status = core::job_status_from_string(read_text(value, "status").value_or(""));

            if (auto duration = read_number(value, "duration")) {
                job.duration_seconds = *duration < 0.0 ? 0.0 : *duration;
            }

            if (auto v = value["retried"].get<bool>(); !v.error()) {
                job.retried = v.value_unsafe();
            }

            auto needs = read_needs(value);
            if (needs.is_failure()) {
                return core::Result<core::Job>::failure(core::ErrorCode::MALFORMED_DATA,
                                                        needs.error().message + " (job '" + job.name +
                                                        "' in pipeline " + pipeline_id + ")");
            }
            job.needs = std::move(needs).value();

            return core::Result<core::Job>::success(std::move(job));
        }

        /// Parses one pipeline; nullopt when it is filtered out.
        core::Result<std::optional<core::Pipeline>> parse_pipeline(const element& value) {
            using PipelineResult = core::Result<std::optional<core::Pipeline>>;

            if (!value.is_object()) {
                return PipelineResult::failure(core::ErrorCode::MALFORMED_DATA,
                                               "Pipeline entry is not an object");
            }

            core::Pipeline pipeline;
            auto id = read_text(value, "id");
            if (!id) {
                return PipelineResult::failure(core::ErrorCode::MALFORMED_DATA,
                                               "Pipeline has no id");
            }
            pipeline.id = std::move(*id);

            pipeline.status = core::pipeline_status_from_string(read_text(value, "status").value_or(""));
            if (pipeline.status == core::PipelineStatus::OTHER) {
                spdlog::debug("Skipping pipeline {}: status is neither success nor failed", pipeline.id);
                return PipelineResult::success(std::nullopt);
            }

            const auto duration = read_number(value, "duration");
            if (!duration) {
                spdlog::debug("Skipping pipeline {}: no duration", pipeline.id);
                return PipelineResult::success(std::nullopt);
            }
            pipeline.duration_seconds = *duration < 0.0 ? 0 : static_cast<std::uint64_t>(*duration);

            pipeline.ref = read_text(value, "ref").value_or("");
            pipeline.source = read_text(value, "source").value_or("");

            if (element stages; !value["stages"].get(stages) && !stages.is_null()) {
                simdjson::dom::array stage_array;
                if (stages.get_array().get(stage_array)) {
                    return PipelineResult::failure(core::ErrorCode::MALFORMED_DATA,
                                                   "'stages' of pipeline " + pipeline.id + " is not an array");
                }
                for (element stage : stage_array) {
                    if (auto v = stage.get<std::string_view>(); !v.error()) {
                        pipeline.stages.emplace_back(v.value_unsafe());
                    }
                }
            }

            if (element jobs; !value["jobs"].get(jobs) && !jobs.is_null()) {
                simdjson::dom::array job_array;
                if (jobs.get_array().get(job_array)) {
                    return PipelineResult::failure(core::ErrorCode::MALFORMED_DATA,
                                                   "'jobs' of pipeline " + pipeline.id + " is not an array");
                }
                for (element job_value : job_array) {
                    auto job = parse_job(job_value, pipeline.id);
                    if (job.is_failure()) {
                        return PipelineResult::failure(job.error());
                    }
                    pipeline.jobs.push_back(std::move(job).value());
                }
            }

            return PipelineResult::success(std::optional(std::move(pipeline)));
        }

    } // namespace

    core::Result<PipelineDataset> PipelineLoader::load_from_string(const std::string_view json) {
        using namespace simdjson;

        dom::parser parser;
        padded_string padded = padded_string(json);
        dom::element doc;
        if (const auto error = parser.parse(padded).get(doc)) {
            return core::Result<PipelineDataset>::failure(
                core::ErrorCode::JSON_PARSE_ERROR,
                std::string("Failed to parse pipeline JSON: ") + error_message(error)
            );
        }

        PipelineDataset dataset;
        dom::array entries;

        if (doc.is_array()) {
            entries = doc.get_array().value_unsafe();
        } else if (doc.is_object()) {
            dataset.provider = read_text(doc, "provider").value_or("");
            dataset.project = read_text(doc, "project").value_or("");

            if (doc["pipelines"].get_array().get(entries)) {
                return core::Result<PipelineDataset>::failure(
                    core::ErrorCode::MALFORMED_DATA,
                    "Pipeline document has no 'pipelines' array"
                );
            }
        } else {
            return core::Result<PipelineDataset>::failure(
                core::ErrorCode::MALFORMED_DATA,
                "Pipeline document must be an object or an array"
            );
        }

        std::size_t position = 0;
        for (dom::element entry : entries) {
            auto pipeline = parse_pipeline(entry);
            if (pipeline.is_failure()) {
                return core::Result<PipelineDataset>::failure(
                    pipeline.error().with_context("pipeline entry " + std::to_string(position)));
            }
            ++position;
            if (auto parsed = std::move(pipeline).value()) {
                dataset.pipelines.push_back(std::move(*parsed));
            } else {
                ++dataset.skipped_pipelines;
            }
        }

        spdlog::debug("Loaded {} pipeline(s), skipped {}", dataset.pipelines.size(), dataset.skipped_pipelines);

        return core::Result<PipelineDataset>::success(std::move(dataset));
    }

    core::Result<PipelineDataset> PipelineLoader::load_from_file(const std::string& file_path) {
        if (!utils::file_exists(file_path)) {
            return core::Result<PipelineDataset>::failure(
                core::ErrorCode::FILE_NOT_FOUND,
                "Pipeline file not found: " + file_path
            );
        }

        const auto content = utils::read_file(file_path);
        if (!content) {
            return core::Result<PipelineDataset>::failure(
                core::ErrorCode::FILE_READ_ERROR,
                "Failed to read pipeline file: " + file_path
            );
        }

        return load_from_string(*content).map_error([&](const core::Error& error) {
            return error.with_context(file_path);
        });
    }

} // namespace cilens::io
