#include "tablewright/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace tablewright {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(2) << j << std::endl;
        if (!file) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write config: " + filepath,
                                    "ConfigBase");
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Malformed config JSON: ") + e.what(), "ConfigBase");
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                std::string("Invalid config field: ") + e.what(), "ConfigBase");
    }

    return validate();
}

}  // namespace tablewright
