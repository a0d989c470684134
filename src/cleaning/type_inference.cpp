#include "tablewright/cleaning/type_inference.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <unordered_map>
#include "tablewright/cleaning/value_parsers.hpp"
#include "tablewright/core/logger.hpp"

namespace tablewright {

std::string inference_pass_to_string(InferencePass pass) {
    switch (pass) {
        case InferencePass::PLAIN_NUMERIC:
            return "plain_numeric";
        case InferencePass::PARENTHESIZED_NEGATIVE:
            return "parenthesized_negative";
        case InferencePass::CURRENCY_STRIP:
            return "currency_strip";
        case InferencePass::WHOLE_NUMBER_COLLAPSE:
            return "whole_number_collapse";
        case InferencePass::ISO_DATE:
            return "iso_date";
        case InferencePass::CATEGORICAL:
            return "categorical";
        case InferencePass::WIDTH_SHRINK:
            return "width_shrink";
    }
    return "unknown";
}

std::vector<InferencePass> InferenceReport::passes_for(const std::string& column) const {
    std::vector<InferencePass> passes;
    for (const auto& change : changes) {
        if (change.column == column) {
            passes.push_back(change.pass);
        }
    }
    return passes;
}

namespace {

using NumberParser = std::function<std::optional<double>(const std::string&)>;

// 2^63 as a double; every integral double strictly below it fits in int64_t
constexpr double kInt64Bound = 9223372036854775808.0;

bool has_values(const Column& column) {
    return column.size() > 0 && !column.all_null();
}

/**
 * All-or-nothing TEXT -> DECIMAL conversion: the first value the parser
 * rejects disqualifies the whole column.
 */
std::optional<Column> text_to_decimal(const Column& column, const NumberParser& parse) {
    if (column.type() != SemanticType::TEXT || !has_values(column)) {
        return std::nullopt;
    }

    const auto& values = column.texts();
    std::vector<double> numbers(values.size(), 0.0);
    for (size_t row = 0; row < values.size(); ++row) {
        if (column.is_null(row)) continue;
        auto parsed = parse(values[row]);
        if (!parsed) {
            TRACE("Column '" << column.name() << "' rejected at row " << row << ": '"
                             << values[row] << "'");
            return std::nullopt;
        }
        numbers[row] = *parsed;
    }
    return Column::decimal(column.name(), std::move(numbers), column.nulls());
}

std::optional<Column> plain_numeric(const Column& column) {
    return text_to_decimal(column, [](const std::string& value) {
        return parsing::parse_plain_number(value);
    });
}

std::optional<Column> parenthesized_negative(const Column& column) {
    if (column.type() != SemanticType::TEXT) {
        return std::nullopt;
    }

    const auto& values = column.texts();
    bool any_parenthesized = false;
    for (size_t row = 0; row < values.size() && !any_parenthesized; ++row) {
        any_parenthesized =
            !column.is_null(row) && parsing::rewrite_parenthesized_negative(values[row]);
    }
    if (!any_parenthesized) {
        return std::nullopt;
    }

    return text_to_decimal(column, [](const std::string& value) {
        std::string rewritten = parsing::rewrite_parenthesized_negative(value).value_or(value);
        return parsing::parse_plain_number(parsing::strip_currency(rewritten));
    });
}

std::optional<Column> currency_strip(const Column& column) {
    return text_to_decimal(column, [](const std::string& value) {
        return parsing::parse_plain_number(parsing::strip_currency(value));
    });
}

std::optional<Column> whole_number_collapse(const Column& column) {
    if (column.type() != SemanticType::DECIMAL || !has_values(column)) {
        return std::nullopt;
    }

    const auto& values = column.decimals();
    std::vector<int64_t> integers(values.size(), 0);
    for (size_t row = 0; row < values.size(); ++row) {
        if (column.is_null(row)) continue;
        double v = values[row];
        if (!std::isfinite(v) || v != std::floor(v) || v < -kInt64Bound || v >= kInt64Bound) {
            return std::nullopt;
        }
        integers[row] = static_cast<int64_t>(v);
    }
    return Column::integer(column.name(), std::move(integers), column.nulls());
}

std::optional<Column> iso_date(const Column& column) {
    if ((column.type() != SemanticType::TEXT && column.type() != SemanticType::CATEGORICAL) ||
        !has_values(column)) {
        return std::nullopt;
    }

    std::vector<int32_t> days(column.size(), 0);
    for (size_t row = 0; row < column.size(); ++row) {
        if (column.is_null(row)) continue;
        auto parsed = parsing::parse_iso_date(*column.string_at(row));
        if (!parsed) {
            return std::nullopt;
        }
        days[row] = *parsed;
    }
    return Column::date(column.name(), std::move(days), column.nulls());
}

StorageWidth integer_width(int64_t min_value, int64_t max_value) {
    if (min_value >= std::numeric_limits<int8_t>::min() &&
        max_value <= std::numeric_limits<int8_t>::max())
        return StorageWidth::BITS_8;
    if (min_value >= std::numeric_limits<int16_t>::min() &&
        max_value <= std::numeric_limits<int16_t>::max())
        return StorageWidth::BITS_16;
    if (min_value >= std::numeric_limits<int32_t>::min() &&
        max_value <= std::numeric_limits<int32_t>::max())
        return StorageWidth::BITS_32;
    return StorageWidth::BITS_64;
}

bool fits_float(double v) {
    if (std::isnan(v) || std::isinf(v)) return true;
    if (std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) return false;
    return static_cast<double>(static_cast<float>(v)) == v;
}

std::optional<Column> width_shrink(const Column& column) {
    if (!has_values(column)) {
        return std::nullopt;
    }

    StorageWidth target = column.width();
    switch (column.type()) {
        case SemanticType::INTEGER: {
            const auto& values = column.integers();
            int64_t lo = std::numeric_limits<int64_t>::max();
            int64_t hi = std::numeric_limits<int64_t>::min();
            for (size_t row = 0; row < values.size(); ++row) {
                if (column.is_null(row)) continue;
                lo = std::min(lo, values[row]);
                hi = std::max(hi, values[row]);
            }
            target = integer_width(lo, hi);
            break;
        }
        case SemanticType::DECIMAL: {
            const auto& values = column.decimals();
            bool narrow = true;
            for (size_t row = 0; row < values.size() && narrow; ++row) {
                narrow = column.is_null(row) || fits_float(values[row]);
            }
            target = narrow ? StorageWidth::BITS_32 : StorageWidth::BITS_64;
            break;
        }
        case SemanticType::DATE:
        case SemanticType::CATEGORICAL:
        case SemanticType::TEXT:
            return std::nullopt;
    }

    if (target == column.width()) {
        return std::nullopt;
    }
    return column.with_width(target);
}

}  // namespace

TypeInferenceEngine::TypeInferenceEngine(EngineConfig config) : config_(std::move(config)) {
    Logger::register_component("TypeInferenceEngine");
}

std::optional<Column> TypeInferenceEngine::to_categorical(const Column& column) const {
    if (column.type() != SemanticType::TEXT || !has_values(column)) {
        return std::nullopt;
    }

    const auto& values = column.texts();
    std::vector<std::string> dictionary;
    std::vector<int32_t> codes(values.size(), 0);
    std::unordered_map<std::string, int32_t> lookup;

    for (size_t row = 0; row < values.size(); ++row) {
        if (column.is_null(row)) continue;
        auto it = lookup.find(values[row]);
        if (it == lookup.end()) {
            it = lookup.emplace(values[row], static_cast<int32_t>(dictionary.size())).first;
            dictionary.push_back(values[row]);
        }
        codes[row] = it->second;
    }

    // Null counts as one distinct value when present
    const size_t distinct = dictionary.size() + (column.null_count() > 0 ? 1 : 0);
    const double ratio = static_cast<double>(distinct) / static_cast<double>(column.size());
    if (ratio >= config_.categorical_max_ratio) {
        return std::nullopt;
    }
    if (config_.categorical_max_distinct > 0 && distinct > config_.categorical_max_distinct) {
        return std::nullopt;
    }

    return Column::categorical(column.name(), std::move(dictionary), std::move(codes),
                               column.nulls());
}

std::optional<Column> TypeInferenceEngine::try_pass(const Column& column,
                                                    InferencePass pass) const {
    switch (pass) {
        case InferencePass::PLAIN_NUMERIC:
            return plain_numeric(column);
        case InferencePass::PARENTHESIZED_NEGATIVE:
            return parenthesized_negative(column);
        case InferencePass::CURRENCY_STRIP:
            return currency_strip(column);
        case InferencePass::WHOLE_NUMBER_COLLAPSE:
            return whole_number_collapse(column);
        case InferencePass::ISO_DATE:
            return iso_date(column);
        case InferencePass::CATEGORICAL:
            return to_categorical(column);
        case InferencePass::WIDTH_SHRINK:
            return width_shrink(column);
    }
    return std::nullopt;
}

Table TypeInferenceEngine::apply_pass(const Table& table, InferencePass pass,
                                      InferenceReport* report) const {
    std::vector<Column> columns;
    columns.reserve(table.num_columns());

    for (const auto& column : table.columns()) {
        auto converted = try_pass(column, pass);
        if (!converted) {
            columns.push_back(column);
            continue;
        }

        DEBUG("Pass " << inference_pass_to_string(pass) << ": column '" << column.name()
                      << "' " << semantic_type_to_string(column.type()) << " -> "
                      << semantic_type_to_string(converted->type()) << " ("
                      << static_cast<int>(converted->width()) << " bits)");
        if (report) {
            report->changes.push_back(ColumnRetype{column.name(), pass, column.type(),
                                                   converted->type(), converted->width()});
        }
        columns.push_back(std::move(*converted));
    }

    return Table(std::move(columns));
}

Table TypeInferenceEngine::infer(const Table& table, InferenceReport* report) const {
    Logger::register_component("TypeInferenceEngine");
    InferenceReport local;
    Table current = table;

    for (InferencePass pass : kInferencePassOrder) {
        if (pass == InferencePass::WIDTH_SHRINK && !config_.shrink_numeric_widths) {
            continue;
        }
        current = apply_pass(current, pass, &local);
    }

    INFO("Type inference applied " << local.changes.size() << " change(s) across "
                                   << current.num_columns() << " column(s)");
    if (report) {
        report->changes.insert(report->changes.end(), local.changes.begin(), local.changes.end());
    }
    return current;
}

}  // namespace tablewright
