// include/tablewright/cleaning/column_sanitizer.hpp
#pragma once

#include <string>
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Renames columns to the [A-Za-z0-9_] identifier charset
 *
 * Spaces and hyphens become underscores, punctuation and any other
 * character outside the charset is removed. Underscores produced by the
 * space/hyphen substitution are trimmed from both ends of the result.
 */
class ColumnSanitizer {
public:
    /**
     * @brief Sanitize a single name; may return an empty string
     */
    static std::string sanitize_name(const std::string& raw);

    /**
     * @brief Rename every column of the table, row data untouched
     *
     * Names that sanitize to nothing become column_<position> (1-based).
     * A name already taken by an earlier column gets the first free
     * suffix _2, _3, ... so distinct columns are never merged.
     */
    static Table sanitize(const Table& table);
};

}  // namespace tablewright
