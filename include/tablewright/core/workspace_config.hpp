// include/tablewright/core/workspace_config.hpp
#pragma once

#include <string>
#include "tablewright/core/config_base.hpp"

namespace tablewright {

/**
 * @brief Directories collaborators read raw tables from and write results to
 *
 * Only values that differ from the defaults are written on save, and a
 * missing file loads as all defaults.
 */
struct WorkspaceConfig : public ConfigBase {
    static constexpr const char* DEFAULT_SOURCES_DIR = "../../datasources";
    static constexpr const char* DEFAULT_STAGING_DIR = "../../datastaging";
    static constexpr const char* DEFAULT_OUTPUT_DIR = "../../dataoutput";

    std::string sources_dir{DEFAULT_SOURCES_DIR};
    std::string staging_dir{DEFAULT_STAGING_DIR};
    std::string output_dir{DEFAULT_OUTPUT_DIR};

    // Paths with a leading "~" expanded against $HOME
    std::string resolved_sources_dir() const;
    std::string resolved_staging_dir() const;
    std::string resolved_output_dir() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    Result<void> load_from_file(const std::string& filepath) override;
    Result<void> validate() const override;

    static std::string expand_user(const std::string& path);
};

}  // namespace tablewright
