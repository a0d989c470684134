#include "tablewright/core/workspace_config.hpp"
#include <cstdlib>
#include <filesystem>

namespace tablewright {

std::string WorkspaceConfig::expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    // "~user" forms are left alone
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string WorkspaceConfig::resolved_sources_dir() const {
    return expand_user(sources_dir);
}

std::string WorkspaceConfig::resolved_staging_dir() const {
    return expand_user(staging_dir);
}

std::string WorkspaceConfig::resolved_output_dir() const {
    return expand_user(output_dir);
}

nlohmann::json WorkspaceConfig::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (sources_dir != DEFAULT_SOURCES_DIR)
        j["sources_dir"] = sources_dir;
    if (staging_dir != DEFAULT_STAGING_DIR)
        j["staging_dir"] = staging_dir;
    if (output_dir != DEFAULT_OUTPUT_DIR)
        j["output_dir"] = output_dir;
    return j;
}

void WorkspaceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("sources_dir"))
        sources_dir = j.at("sources_dir").get<std::string>();
    if (j.contains("staging_dir"))
        staging_dir = j.at("staging_dir").get<std::string>();
    if (j.contains("output_dir"))
        output_dir = j.at("output_dir").get<std::string>();
}

Result<void> WorkspaceConfig::load_from_file(const std::string& filepath) {
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        *this = WorkspaceConfig{};
        return Result<void>();
    }
    return ConfigBase::load_from_file(filepath);
}

Result<void> WorkspaceConfig::validate() const {
    if (sources_dir.empty() || staging_dir.empty() || output_dir.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Workspace directories must not be empty", "WorkspaceConfig");
    }
    return Result<void>();
}

}  // namespace tablewright
