#include "tablewright/cleaning/content_normalizer.hpp"
#include "tablewright/cleaning/value_parsers.hpp"
#include "tablewright/core/logger.hpp"

namespace tablewright {

ContentNormalizer::ContentNormalizer(EngineConfig config) : config_(std::move(config)) {}

Column ContentNormalizer::canonicalize_column(const Column& column) const {
    if (column.type() != SemanticType::TEXT) {
        return column;
    }

    const auto& values = column.texts();
    std::vector<std::string> stripped(values.size());
    NullMask nulls = column.nulls();
    size_t markers_found = 0;

    for (size_t row = 0; row < values.size(); ++row) {
        if (nulls[row]) continue;
        stripped[row] = parsing::strip_whitespace(values[row]);
        if (parsing::is_null_marker(stripped[row], config_.null_markers)) {
            nulls[row] = 1;
            stripped[row].clear();
            ++markers_found;
        }
    }

    if (markers_found > 0) {
        DEBUG("Column '" << column.name() << "': " << markers_found
                         << " null marker value(s) replaced");
    }
    return Column::text(column.name(), std::move(stripped), std::move(nulls));
}

Table ContentNormalizer::canonicalize_text(const Table& table) const {
    std::vector<Column> columns;
    columns.reserve(table.num_columns());
    for (const auto& column : table.columns()) {
        columns.push_back(canonicalize_column(column));
    }
    return Table(std::move(columns));
}

Table ContentNormalizer::drop_empty_rows(const Table& table) {
    std::vector<size_t> keep;
    keep.reserve(table.num_rows());
    for (size_t row = 0; row < table.num_rows(); ++row) {
        for (const auto& column : table.columns()) {
            if (!column.is_null(row)) {
                keep.push_back(row);
                break;
            }
        }
    }

    if (keep.size() == table.num_rows()) {
        return table;
    }
    DEBUG("Dropping " << (table.num_rows() - keep.size()) << " all-null row(s)");
    return table.take_rows(keep);
}

Table ContentNormalizer::drop_empty_columns(const Table& table) {
    std::vector<size_t> keep;
    keep.reserve(table.num_columns());
    for (size_t i = 0; i < table.num_columns(); ++i) {
        if (table.column(i).all_null()) {
            DEBUG("Dropping all-null column '" << table.column(i).name() << "'");
            continue;
        }
        keep.push_back(i);
    }

    if (keep.size() == table.num_columns()) {
        return table;
    }
    return table.select_columns(keep);
}

Table ContentNormalizer::normalize(const Table& table) const {
    Logger::register_component("ContentNormalizer");
    Table canonical = canonicalize_text(table);
    Table without_rows = drop_empty_rows(canonical);
    return drop_empty_columns(without_rows);
}

}  // namespace tablewright
