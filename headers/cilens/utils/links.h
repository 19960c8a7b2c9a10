//
// Created by gregorian on 04/03/2026.
//

#ifndef CILENS_LINKS_H
#define CILENS_LINKS_H

#include <string>
#include <string_view>

namespace cilens::utils {
    /**
     * Extract the numeric id from a GitLab GraphQL global id.
     *
     * "gid://gitlab/Ci::Pipeline/123" yields "123". A value without a '/' is
     * returned unchanged.
     */
    std::string_view extract_numeric_id(std::string_view gid);

    /**
     * Build the web URL of a pipeline, e.g.
     * https://gitlab.com/group/project/-/pipelines/123
     *
     * @param base_url Instance base URL; a trailing '/' is ignored.
     * @param project_path Project path such as "group/project".
     * @param gid Pipeline global id or plain numeric id.
     */
    std::string pipeline_id_to_url(std::string_view base_url, std::string_view project_path, std::string_view gid);

    /**
     * Build the web URL of a job, e.g. https://gitlab.com/group/project/-/jobs/456
     */
    std::string job_id_to_url(std::string_view base_url, std::string_view project_path, std::string_view gid);
} // namespace cilens::utils

#endif //CILENS_LINKS_H
