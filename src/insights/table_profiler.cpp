#include "tablewright/insights/table_profiler.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "tablewright/core/logger.hpp"

namespace tablewright {

namespace {

// Nearest-rank quantile of sorted data
double nearest_rank(const std::vector<double>& sorted, double q) {
    const size_t n = sorted.size();
    size_t rank = static_cast<size_t>(std::ceil(q * static_cast<double>(n)));
    if (rank == 0) rank = 1;
    return sorted[std::min(rank, n) - 1];
}

// NaN decimals are profiled as missing, like nulls
bool is_missing(const Column& column, size_t row) {
    if (column.is_null(row)) return true;
    return column.type() == SemanticType::DECIMAL && std::isnan(column.decimals()[row]);
}

std::vector<double> numeric_values(const Column& column) {
    std::vector<double> values;
    values.reserve(column.size() - column.null_count());
    for (size_t row = 0; row < column.size(); ++row) {
        if (is_missing(column, row)) continue;
        if (column.type() == SemanticType::INTEGER) {
            values.push_back(static_cast<double>(column.integers()[row]));
        } else {
            values.push_back(column.decimals()[row]);
        }
    }
    return values;
}

NumericSummary summarize(const std::vector<double>& values) {
    NumericSummary summary;
    Eigen::Map<const Eigen::VectorXd> data(values.data(), static_cast<Eigen::Index>(values.size()));
    summary.mean = data.mean();
    if (values.size() > 1) {
        Eigen::VectorXd centered = data.array() - summary.mean;
        summary.stddev = std::sqrt(centered.squaredNorm() / static_cast<double>(values.size() - 1));
    }

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());
    summary.q25 = nearest_rank(sorted, 0.25);
    summary.q50 = nearest_rank(sorted, 0.50);
    summary.q75 = nearest_rank(sorted, 0.75);
    return summary;
}

/**
 * Row index of the smallest and largest non-null cell under `less`.
 * Returns false when every cell is missing.
 */
template <typename Less>
bool extreme_rows(const Column& column, Less less, size_t& min_row, size_t& max_row) {
    bool found = false;
    for (size_t row = 0; row < column.size(); ++row) {
        if (is_missing(column, row)) continue;
        if (!found) {
            min_row = max_row = row;
            found = true;
            continue;
        }
        if (less(row, min_row)) min_row = row;
        if (less(max_row, row)) max_row = row;
    }
    return found;
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

}  // namespace

std::string ColumnProfile::dtype() const {
    switch (type) {
        case SemanticType::INTEGER:
            return "Int" + std::to_string(static_cast<int>(width));
        case SemanticType::DECIMAL:
            return "Float" + std::to_string(static_cast<int>(width));
        case SemanticType::DATE:
            return "Date";
        case SemanticType::CATEGORICAL:
            return "Categorical";
        case SemanticType::TEXT:
            return "Text";
    }
    return "Unknown";
}

const ColumnProfile* TableProfile::find(const std::string& name) const {
    for (const auto& column : columns) {
        if (column.name == name) return &column;
    }
    return nullptr;
}

TableProfiler::TableProfiler() {
    Logger::register_component("TableProfiler");
}

const std::vector<std::string>& TableProfiler::statistic_labels() {
    static const std::vector<std::string> labels{"dtype", "count", "null_count", "mean", "std",
                                                 "min",   "25%",   "50%",        "75%",  "max"};
    return labels;
}

ColumnProfile TableProfiler::describe_column(const Column& column) const {
    ColumnProfile profile;
    profile.name = column.name();
    profile.type = column.type();
    profile.width = column.width();
    for (size_t row = 0; row < column.size(); ++row) {
        if (is_missing(column, row)) ++profile.null_count;
    }
    profile.count = column.size() - profile.null_count;

    size_t min_row = 0;
    size_t max_row = 0;
    bool found = false;
    switch (column.type()) {
        case SemanticType::INTEGER: {
            const auto& v = column.integers();
            found = extreme_rows(column, [&v](size_t a, size_t b) { return v[a] < v[b]; },
                                 min_row, max_row);
            break;
        }
        case SemanticType::DECIMAL: {
            const auto& v = column.decimals();
            found = extreme_rows(column, [&v](size_t a, size_t b) { return v[a] < v[b]; },
                                 min_row, max_row);
            break;
        }
        case SemanticType::DATE: {
            const auto& v = column.dates();
            found = extreme_rows(column, [&v](size_t a, size_t b) { return v[a] < v[b]; },
                                 min_row, max_row);
            break;
        }
        case SemanticType::CATEGORICAL:
        case SemanticType::TEXT:
            found = extreme_rows(
                column,
                [&column](size_t a, size_t b) { return *column.string_at(a) < *column.string_at(b); },
                min_row, max_row);
            break;
    }

    if (found) {
        profile.min = column.format_value(min_row);
        profile.max = column.format_value(max_row);
        if (column.type() == SemanticType::INTEGER || column.type() == SemanticType::DECIMAL) {
            profile.numeric = summarize(numeric_values(column));
        }
    }
    return profile;
}

TableProfile TableProfiler::describe(const Table& table) const {
    Logger::register_component("TableProfiler");
    TableProfile profile;
    profile.num_rows = table.num_rows();
    profile.columns.reserve(table.num_columns());
    for (const auto& column : table.columns()) {
        profile.columns.push_back(describe_column(column));
    }
    DEBUG("Profiled " << profile.columns.size() << " column(s) over " << profile.num_rows
                      << " row(s)");
    return profile;
}

Result<Table> TableProfiler::to_table(const TableProfile& profile) {
    std::vector<Column> columns;
    columns.reserve(profile.columns.size() + 1);
    columns.push_back(Column::text("statistic", statistic_labels()));

    for (const auto& p : profile.columns) {
        std::vector<std::optional<std::string>> cells(statistic_labels().size());
        cells[0] = p.dtype();
        cells[1] = std::to_string(p.count);
        cells[2] = std::to_string(p.null_count);
        if (p.numeric) {
            cells[3] = format_double(p.numeric->mean);
            if (p.numeric->stddev) cells[4] = format_double(*p.numeric->stddev);
            cells[6] = format_double(p.numeric->q25);
            cells[7] = format_double(p.numeric->q50);
            cells[8] = format_double(p.numeric->q75);
        }
        cells[5] = p.min;
        cells[9] = p.max;
        columns.push_back(Column::nullable_text(p.name, cells));
    }

    return Table::make(std::move(columns));
}

}  // namespace tablewright
