// include/tablewright/cleaning/type_inference.hpp
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "tablewright/cleaning/engine_config.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Heuristic retyping passes, in execution order
 */
enum class InferencePass {
    PLAIN_NUMERIC,           // TEXT "12.5" -> DECIMAL
    PARENTHESIZED_NEGATIVE,  // TEXT "(12.50)" -> DECIMAL -12.5
    CURRENCY_STRIP,          // TEXT "$1,234.56" -> DECIMAL
    WHOLE_NUMBER_COLLAPSE,   // DECIMAL with integral values -> INTEGER
    ISO_DATE,                // TEXT/CATEGORICAL "2024-01-31" -> DATE
    CATEGORICAL,             // low-cardinality TEXT -> CATEGORICAL
    WIDTH_SHRINK             // narrow INTEGER/DECIMAL storage
};

constexpr std::array<InferencePass, 7> kInferencePassOrder = {
    InferencePass::PLAIN_NUMERIC,         InferencePass::PARENTHESIZED_NEGATIVE,
    InferencePass::CURRENCY_STRIP,        InferencePass::WHOLE_NUMBER_COLLAPSE,
    InferencePass::ISO_DATE,              InferencePass::CATEGORICAL,
    InferencePass::WIDTH_SHRINK};

std::string inference_pass_to_string(InferencePass pass);

/**
 * @brief One column changed by one pass
 */
struct ColumnRetype {
    std::string column;
    InferencePass pass;
    SemanticType from_type;
    SemanticType to_type;
    StorageWidth width;
};

struct InferenceReport {
    std::vector<ColumnRetype> changes;

    /**
     * @brief Passes that touched the named column, in order
     */
    std::vector<InferencePass> passes_for(const std::string& column) const;
};

/**
 * @brief Re-derives a better semantic type for every column
 *
 * Each pass sees the output of the previous one. A pass converts a column
 * only when every non-null value passes its test; a single bad value leaves
 * the column untouched for that pass. Columns without any non-null value are
 * never retyped. Row identity and order are never altered.
 */
class TypeInferenceEngine {
public:
    explicit TypeInferenceEngine(EngineConfig config = EngineConfig{});

    /**
     * @brief Run every pass in order
     * @param report Optional sink for the per-column changes
     */
    Table infer(const Table& table, InferenceReport* report = nullptr) const;

    /**
     * @brief Run a single pass over every column
     */
    Table apply_pass(const Table& table, InferencePass pass,
                     InferenceReport* report = nullptr) const;

    /**
     * @brief Run a single pass over one column
     * @return the converted column, or nullopt when the column is not eligible
     */
    std::optional<Column> try_pass(const Column& column, InferencePass pass) const;

private:
    std::optional<Column> to_categorical(const Column& column) const;

    EngineConfig config_;
};

}  // namespace tablewright
