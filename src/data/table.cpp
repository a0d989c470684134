#include "tablewright/data/table.hpp"
#include <unordered_set>

namespace tablewright {

std::string Table::check_columns(const std::vector<Column>& columns) {
    std::unordered_set<std::string> seen;
    for (const auto& column : columns) {
        if (column.size() != columns.front().size()) {
            return "Column '" + column.name() + "' has " + std::to_string(column.size()) +
                   " rows, expected " + std::to_string(columns.front().size());
        }
        if (!seen.insert(column.name()).second) {
            return "Duplicate column name '" + column.name() + "'";
        }
    }
    return "";
}

Table::Table(std::vector<Column> columns) : columns_(std::move(columns)) {
    std::string problem = check_columns(columns_);
    if (!problem.empty()) {
        throw TableError(ErrorCode::SCHEMA_ERROR, problem, "Table");
    }
    num_rows_ = columns_.empty() ? 0 : columns_.front().size();
}

Result<Table> Table::make(std::vector<Column> columns) {
    std::string problem = check_columns(columns);
    if (!problem.empty()) {
        return make_error<Table>(ErrorCode::SCHEMA_ERROR, problem, "Table");
    }
    return Result<Table>(Table(std::move(columns)));
}

const Column* Table::find_column(const std::string& name) const {
    int index = column_index(name);
    return index < 0 ? nullptr : &columns_[static_cast<size_t>(index)];
}

int Table::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name() == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<std::string> Table::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name());
    }
    return names;
}

Table Table::take_rows(const std::vector<size_t>& rows) const {
    std::vector<Column> taken;
    taken.reserve(columns_.size());
    for (const auto& column : columns_) {
        taken.push_back(column.take(rows));
    }
    return Table(std::move(taken));
}

Table Table::select_columns(const std::vector<size_t>& indices) const {
    std::vector<Column> selected;
    selected.reserve(indices.size());
    for (size_t index : indices) {
        selected.push_back(columns_.at(index));
    }
    return Table(std::move(selected));
}

}  // namespace tablewright
