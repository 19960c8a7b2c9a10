//
// Created by gregorian on 04/03/2026.
//

#include "cilens/utils/links.h"
#include "cilens/utils/string_utils.h"

namespace cilens::utils {

namespace {

    std::string project_root(std::string_view base_url, const std::string_view project_path) {
        while (!base_url.empty() && base_url.back() == '/') {
            base_url.remove_suffix(1);
        }
        std::string root(base_url);
        root += '/';
        root += project_path;
        return root;
    }

} // namespace

std::string_view extract_numeric_id(const std::string_view gid) {
    return last_segment(gid, '/');
}

std::string pipeline_id_to_url(const std::string_view base_url,
                               const std::string_view project_path,
                               const std::string_view gid) {
    return project_root(base_url, project_path) + "/-/pipelines/" + std::string(extract_numeric_id(gid));
}

std::string job_id_to_url(const std::string_view base_url,
                          const std::string_view project_path,
                          const std::string_view gid) {
    return project_root(base_url, project_path) + "/-/jobs/" + std::string(extract_numeric_id(gid));
}

} // namespace cilens::utils
