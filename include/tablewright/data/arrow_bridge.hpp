// include/tablewright/data/arrow_bridge.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include "tablewright/core/error.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Conversion between Arrow tables and the in-memory Table model
 */
class ArrowBridge {
public:
    /**
     * @brief Import an Arrow table
     *
     * Strings become TEXT, signed and unsigned integers INTEGER, floats
     * DECIMAL, date32 DATE, booleans TEXT ("true"/"false") and utf8
     * dictionaries CATEGORICAL. Chunked columns are concatenated.
     * @return INVALID_ARGUMENT for a null table, CONVERSION_ERROR for any other type
     */
    static Result<Table> from_arrow(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Export a Table, materializing each column's storage width
     */
    static Result<std::shared_ptr<arrow::Table>> to_arrow(const Table& table);

    /**
     * @brief Arrow type a column is exported as
     */
    static std::shared_ptr<arrow::DataType> arrow_type_for(const Column& column);
};

}  // namespace tablewright
