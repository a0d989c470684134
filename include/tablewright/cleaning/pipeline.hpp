// include/tablewright/cleaning/pipeline.hpp
#pragma once

#include "tablewright/cleaning/engine_config.hpp"
#include "tablewright/cleaning/type_inference.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Sanitize names, normalize contents and infer types, in that order
 *
 * Idempotent: running it on its own output returns an equal table.
 */
Table normalize_and_infer(const Table& table);

/**
 * @brief Same as above with explicit tunables
 * @param report Optional sink for the type changes made by inference
 * @return CONFIGURATION_ERROR when the config does not validate
 */
Result<Table> normalize_and_infer(const Table& table, const EngineConfig& config,
                                  InferenceReport* report = nullptr);

}  // namespace tablewright
