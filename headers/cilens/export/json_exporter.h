//
// Created by gregorian on 10/03/2026.
//

#ifndef CILENS_JSON_EXPORTER_H
#define CILENS_JSON_EXPORTER_H

#include "cilens/core/types.h"
#include "cilens/core/result.h"
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cilens::export_module {

    /**
     * JSON exporter for collected CI insights.
     *
     * Field names follow the insight types in snake_case. Evidence links are
     * rendered as web URLs when both `base_url` and `project_path` are set,
     * otherwise the recorded ids are written as they are.
     */
    class JsonExporter {
    public:
        /**
         * Configuration options for JSON export behavior.
         */
        struct Options {
            bool pretty_print = true;   ///< Enable pretty-printed JSON output.
            int indent_size = 2;        ///< Indentation level for pretty printing.
            std::string base_url;       ///< Instance URL used for evidence links.
            std::string project_path;   ///< Project path used for evidence links.
        };

        explicit JsonExporter(Options options);

        JsonExporter() : JsonExporter(Options{}) {}

        /**
         * Build the JSON document for a set of insights.
         */
        [[nodiscard]] nlohmann::json to_json(const core::CIInsights& insights) const;

        /**
         * Serialize insights to text, honouring the pretty-print options.
         */
        [[nodiscard]] std::string export_to_string(const core::CIInsights& insights) const;

        /**
         * Write insights to a file, creating parent directories as needed.
         *
         * @param insights The insights to export.
         * @param output_path Destination file path.
         * @return FILE_WRITE_ERROR if the file cannot be written.
         */
        [[nodiscard]] core::Result<void> export_to_file(
            const core::CIInsights& insights,
            const std::string& output_path
        ) const;

        /// ISO-8601 UTC with second precision, e.g. 2026-03-10T08:15:00Z.
        static std::string format_timestamp(core::timestamp ts);

    private:
        Options options_;

        [[nodiscard]] bool renders_urls() const;
        [[nodiscard]] std::vector<std::string> pipeline_links(const std::vector<std::string>& ids) const;
        [[nodiscard]] std::vector<std::string> job_links(const std::vector<std::string>& ids) const;

        [[nodiscard]] nlohmann::json type_to_json(const core::PipelineType& type) const;
        [[nodiscard]] nlohmann::json metrics_to_json(const core::TypeMetrics& metrics) const;
        [[nodiscard]] nlohmann::json job_to_json(const core::JobMetrics& job) const;
    };

} // namespace cilens::export_module

#endif //CILENS_JSON_EXPORTER_H
