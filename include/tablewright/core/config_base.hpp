// include/tablewright/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "tablewright/core/error.hpp"

namespace tablewright {

/**
 * @brief Base class for all configuration values
 *
 * Configuration is always passed explicitly to the component that needs it;
 * nothing in the library caches a process-wide copy.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to a JSON file
     * @param filepath Path to save the file
     * @return FILE_IO_ERROR when the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from a JSON file
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND, FILE_IO_ERROR, JSON_PARSE_ERROR or the validation error
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check field ranges after loading
     * @return CONFIGURATION_ERROR describing the first invalid field
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace tablewright
