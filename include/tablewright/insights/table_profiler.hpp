// include/tablewright/insights/table_profiler.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "tablewright/core/error.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Moments and nearest-rank quantiles of a numeric column
 */
struct NumericSummary {
    double mean{0.0};
    std::optional<double> stddev;  // sample standard deviation, needs two values
    double q25{0.0};
    double q50{0.0};
    double q75{0.0};
};

/**
 * @brief Summary statistics of one column
 */
struct ColumnProfile {
    std::string name;
    SemanticType type{SemanticType::TEXT};
    StorageWidth width{StorageWidth::BITS_64};
    size_t count{0};       // non-null cells
    size_t null_count{0};  // nulls plus NaN decimals
    std::optional<NumericSummary> numeric;  // INTEGER and DECIMAL only
    std::optional<std::string> min;         // rendered like Column::format_value
    std::optional<std::string> max;

    /**
     * @brief Physical type name, e.g. "Int16", "Float32", "Categorical"
     */
    std::string dtype() const;
};

struct TableProfile {
    size_t num_rows{0};
    std::vector<ColumnProfile> columns;

    const ColumnProfile* find(const std::string& name) const;
};

/**
 * @brief Per-column describe() report including storage types
 */
class TableProfiler {
public:
    TableProfiler();

    TableProfile describe(const Table& table) const;
    ColumnProfile describe_column(const Column& column) const;

    /**
     * @brief Render a profile as a TEXT table
     *
     * The first column, "statistic", holds the row labels dtype, count,
     * null_count, mean, std, min, 25%, 50%, 75% and max. Each profiled column
     * follows under its own name; statistics that do not apply are null.
     * @return SCHEMA_ERROR when a profiled column is itself named "statistic"
     */
    static Result<Table> to_table(const TableProfile& profile);

    static const std::vector<std::string>& statistic_labels();
};

}  // namespace tablewright
