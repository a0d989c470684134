// include/tablewright/data/table.hpp
#pragma once

#include <string>
#include <vector>
#include "tablewright/core/error.hpp"
#include "tablewright/data/column.hpp"

namespace tablewright {

/**
 * @brief Ordered collection of equal-length columns with unique names
 *
 * Row order is significant and preserved by every component.
 */
class Table {
public:
    Table() = default;

    /**
     * @brief Build a table, throwing TableError(SCHEMA_ERROR) on ragged or duplicate columns
     */
    explicit Table(std::vector<Column> columns);

    /**
     * @brief Build a table from collaborator-supplied columns
     * @return SCHEMA_ERROR when lengths differ or names repeat
     */
    static Result<Table> make(std::vector<Column> columns);

    size_t num_rows() const {
        return num_rows_;
    }
    size_t num_columns() const {
        return columns_.size();
    }
    bool empty() const {
        return num_rows_ == 0 || columns_.empty();
    }

    const std::vector<Column>& columns() const {
        return columns_;
    }
    const Column& column(size_t index) const {
        return columns_.at(index);
    }

    /**
     * @brief Returns the named column or nullptr when absent
     */
    const Column* find_column(const std::string& name) const;

    /**
     * @brief Returns index of named column or -1 when absent
     */
    int column_index(const std::string& name) const;

    std::vector<std::string> column_names() const;

    Table take_rows(const std::vector<size_t>& rows) const;
    Table select_columns(const std::vector<size_t>& indices) const;

    bool operator==(const Table& other) const {
        return columns_ == other.columns_;
    }
    bool operator!=(const Table& other) const {
        return !(*this == other);
    }

private:
    static std::string check_columns(const std::vector<Column>& columns);

    std::vector<Column> columns_;
    size_t num_rows_ = 0;
};

}  // namespace tablewright
