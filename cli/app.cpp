//
// Created by gregorian on 11/03/2026.
//

#include "app.hpp"
#include "cilens/analysis/analysis_engine.h"
#include "cilens/core/logging.h"
#include "cilens/export/json_exporter.h"
#include "cilens/io/pipeline_loader.h"
#include "cilens/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <utility>

namespace cilens::cli {

    App::App(Options options)
        : options_(std::move(options))
    {
    }

    int App::run() {
        if (auto validation = validate_inputs(); !validation.is_success()) {
            std::cerr << "Error: " << validation.error().message << "\n";
            return 1;
        }

        switch (options_.command) {
            case Command::ANALYZE:
                return run_analyze();
            default:
                std::cerr << "Unknown command\n";
                return 1;
        }
    }

    core::Result<void> App::validate_inputs() const {
        if (!options_.errors.empty()) {
            return core::Result<void>::failure(core::ErrorCode::INVALID_ARGUMENT,
                                               utils::join(options_.errors, "\n       "));
        }

        if (options_.command == Command::ANALYZE && options_.input_file.empty()) {
            return core::Result<void>::failure(core::ErrorCode::INVALID_ARGUMENT,
                                               "No input file specified (use --input <file>)");
        }

        return core::Result<void>::success();
    }

    core::Result<core::Config> App::resolve_config() const {
        auto config_result = options_.config_file
            ? core::Config::load_from_file(*options_.config_file)
            : core::Result<core::Config>::success(core::Config::default_config());

        if (config_result.is_failure()) {
            return config_result;
        }

        core::Config config = std::move(config_result).value();

        if (options_.min_type_percentage) config.analysis.min_type_percentage = *options_.min_type_percentage;
        if (options_.provider) config.general.provider = *options_.provider;
        if (options_.project) config.general.project = *options_.project;
        if (options_.verbose) config.logging.level = "debug";

        if (auto validation = config.validate(); validation.is_failure()) {
            return core::Result<core::Config>::failure(validation.error());
        }

        return core::Result<core::Config>::success(std::move(config));
    }

    int App::run_analyze() const {
        auto config_result = resolve_config();
        if (config_result.is_failure()) {
            std::cerr << "Error: " << config_result.error().to_string() << "\n";
            return 1;
        }
        const auto& config = config_result.value();

        if (auto logging = core::init_logging(config.logging); logging.is_failure()) {
            std::cerr << "Error: " << logging.error().message << "\n";
            return 1;
        }
        const core::LoggingGuard logging_guard;

        auto dataset_result = io::PipelineLoader::load_from_file(options_.input_file);
        if (dataset_result.is_failure()) {
            spdlog::error("{}", dataset_result.error().to_string());
            return 1;
        }
        const auto& dataset = dataset_result.value();

        // The command line wins, then the document's own metadata, then the configuration.
        const std::string provider = options_.provider ? *options_.provider
            : !dataset.provider.empty() ? dataset.provider : config.general.provider;
        const std::string project = options_.project ? *options_.project
            : !dataset.project.empty() ? dataset.project : config.general.project;

        spdlog::info("Analysing {} pipeline(s) from {}", dataset.pipelines.size(), options_.input_file);

        const analysis::InsightsEngine::Options engine_options{
            .min_type_percentage = config.analysis.min_type_percentage
        };
        auto insights = analysis::InsightsEngine::collect_insights(provider, project, dataset.pipelines, engine_options);
        if (insights.is_failure()) {
            spdlog::error("{}", insights.error().to_string());
            return 1;
        }

        const export_module::JsonExporter exporter({
            .pretty_print = config.output.pretty,
            .indent_size = config.output.indent,
            .base_url = config.links.base_url,
            .project_path = config.links.project_path.empty() ? project : config.links.project_path
        });

        if (options_.output_file.empty()) {
            std::cout << exporter.export_to_string(insights.value()) << "\n";
        } else {
            if (auto written = exporter.export_to_file(insights.value(), options_.output_file); written.is_failure()) {
                spdlog::error("{}", written.error().to_string());
                return 1;
            }
            spdlog::info("Wrote {} pipeline type(s) to {}", insights.value().total_pipeline_types, options_.output_file);
        }

        return 0;
    }

} // namespace cilens::cli
