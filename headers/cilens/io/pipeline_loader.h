//
// Created by gregorian on 09/03/2026.
//

#ifndef CILENS_PIPELINE_LOADER_H
#define CILENS_PIPELINE_LOADER_H

#include "cilens/core/types.h"
#include "cilens/core/result.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cilens::io {

    /**
     * Pipelines handed over by the fetch layer, with their origin.
     */
    struct PipelineDataset {
        std::string provider;
        std::string project;
        std::vector<core::Pipeline> pipelines;
        std::size_t skipped_pipelines = 0;   ///< Entries dropped for status or missing duration.
    };

    /**
     * @class PipelineLoader
     * Reads pipeline and job records from the JSON hand-off document.
     *
     * Accepted shapes are an object with `provider`, `project` and a
     * `pipelines` array, or a bare array of pipelines. Pipeline ids, refs and
     * job ids may be strings or integers. `needs` may list names or
     * `{"name": ...}` objects; null or missing means implicit stage ordering.
     */
    class PipelineLoader {
    public:
        PipelineLoader() = default;

        /**
         * Parse a JSON document.
         *
         * Pipelines whose status is neither success nor failed, or without a
         * duration, are skipped.
         *
         * @param json The document text.
         * @return The dataset, JSON_PARSE_ERROR for invalid JSON, or
         *         MALFORMED_DATA for entries with the wrong shape.
         */
        static core::Result<PipelineDataset> load_from_string(std::string_view json);

        /**
         * Read and parse a JSON file.
         *
         * @param file_path Path to the document.
         * @return The dataset, or FILE_NOT_FOUND / FILE_READ_ERROR and the parse errors above.
         */
        static core::Result<PipelineDataset> load_from_file(const std::string& file_path);
    };

} // namespace cilens::io

#endif //CILENS_PIPELINE_LOADER_H
