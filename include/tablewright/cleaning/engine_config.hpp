// include/tablewright/cleaning/engine_config.hpp
#pragma once

#include <string>
#include <vector>
#include "tablewright/cleaning/value_parsers.hpp"
#include "tablewright/core/config_base.hpp"

namespace tablewright {

/**
 * @brief Tunables of the normalization and type inference pipeline
 */
struct EngineConfig : public ConfigBase {
    // Cell strings replaced by null after whitespace stripping
    std::vector<std::string> null_markers{parsing::default_null_markers()};

    // A TEXT column becomes CATEGORICAL when distinct / rows is strictly below this ratio
    double categorical_max_ratio{0.5};

    // Optional absolute cap on distinct values for CATEGORICAL, 0 disables the cap
    size_t categorical_max_distinct{0};

    // Narrow INTEGER/DECIMAL storage as the final pass
    bool shrink_numeric_widths{true};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["null_markers"] = null_markers;
        j["categorical_max_ratio"] = categorical_max_ratio;
        j["categorical_max_distinct"] = categorical_max_distinct;
        j["shrink_numeric_widths"] = shrink_numeric_widths;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("null_markers"))
            null_markers = j.at("null_markers").get<std::vector<std::string>>();
        if (j.contains("categorical_max_ratio"))
            categorical_max_ratio = j.at("categorical_max_ratio").get<double>();
        if (j.contains("categorical_max_distinct"))
            categorical_max_distinct = j.at("categorical_max_distinct").get<size_t>();
        if (j.contains("shrink_numeric_widths"))
            shrink_numeric_widths = j.at("shrink_numeric_widths").get<bool>();
    }

    Result<void> validate() const override {
        if (!(categorical_max_ratio > 0.0 && categorical_max_ratio <= 1.0)) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "categorical_max_ratio must be in (0, 1], got " +
                                        std::to_string(categorical_max_ratio),
                                    "EngineConfig");
        }
        return Result<void>();
    }
};

}  // namespace tablewright
