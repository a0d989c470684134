// include/tablewright/data/column.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tablewright {

/**
 * @brief Logical category of a column
 *
 * Closed set: every component switches over all five tags.
 */
enum class SemanticType {
    INTEGER,      // 64-bit signed integers
    DECIMAL,      // Floating point / decimal numbers
    DATE,         // Calendar dates, days since 1970-01-01
    CATEGORICAL,  // Low-cardinality strings stored as dictionary codes
    TEXT          // Free-form strings
};

/**
 * @brief Physical width used when the column is materialized
 *
 * Only meaningful for INTEGER (8/16/32/64) and DECIMAL (32/64) columns.
 */
enum class StorageWidth { BITS_8 = 8, BITS_16 = 16, BITS_32 = 32, BITS_64 = 64 };

std::string semantic_type_to_string(SemanticType type);

// Non-zero entries mark null cells
using NullMask = std::vector<uint8_t>;

struct CategoricalValues {
    std::vector<std::string> dictionary;  // distinct values, first-seen order
    std::vector<int32_t> codes;           // per-row index into dictionary, 0 for null rows
};

using ColumnValues = std::variant<std::vector<int64_t>, std::vector<double>, std::vector<int32_t>,
                                  CategoricalValues, std::vector<std::string>>;

/**
 * @brief Named, typed, nullable sequence of values
 *
 * Columns are immutable values. Every transformation returns a new column.
 * Factories throw TableError(SCHEMA_ERROR) when the null mask or categorical
 * codes do not line up with the values.
 */
class Column {
public:
    Column() = default;

    static Column integer(std::string name, std::vector<int64_t> values, NullMask nulls = {},
                          StorageWidth width = StorageWidth::BITS_64);
    static Column decimal(std::string name, std::vector<double> values, NullMask nulls = {},
                          StorageWidth width = StorageWidth::BITS_64);
    static Column date(std::string name, std::vector<int32_t> days, NullMask nulls = {});
    static Column categorical(std::string name, std::vector<std::string> dictionary,
                              std::vector<int32_t> codes, NullMask nulls = {});
    static Column text(std::string name, std::vector<std::string> values, NullMask nulls = {});

    // Convenience factories taking std::nullopt for null cells
    static Column nullable_integer(std::string name,
                                   const std::vector<std::optional<int64_t>>& values);
    static Column nullable_decimal(std::string name,
                                   const std::vector<std::optional<double>>& values);
    static Column nullable_text(std::string name,
                                const std::vector<std::optional<std::string>>& values);

    const std::string& name() const {
        return name_;
    }
    SemanticType type() const {
        return type_;
    }
    StorageWidth width() const {
        return width_;
    }
    size_t size() const {
        return nulls_.size();
    }
    const NullMask& nulls() const {
        return nulls_;
    }

    bool is_null(size_t row) const {
        return nulls_[row] != 0;
    }
    size_t null_count() const;
    bool all_null() const {
        return null_count() == size();
    }

    /**
     * @brief Typed views of the stored values
     * @throws TableError(INVALID_ARGUMENT) when the column has another type
     */
    const std::vector<int64_t>& integers() const;
    const std::vector<double>& decimals() const;
    const std::vector<int32_t>& dates() const;
    const CategoricalValues& categories() const;
    const std::vector<std::string>& texts() const;

    /**
     * @brief String content of a TEXT or CATEGORICAL cell, nullopt for null cells
     */
    std::optional<std::string> string_at(size_t row) const;

    /**
     * @brief Human-readable rendering of any cell, nullopt for null cells
     */
    std::optional<std::string> format_value(size_t row) const;

    Column renamed(std::string name) const;
    Column with_width(StorageWidth width) const;

    /**
     * @brief Gather rows by index, preserving the given order
     */
    Column take(const std::vector<size_t>& rows) const;

    /**
     * @brief Value equality; payloads under null cells are ignored
     */
    bool operator==(const Column& other) const;
    bool operator!=(const Column& other) const {
        return !(*this == other);
    }

private:
    Column(std::string name, SemanticType type, StorageWidth width, ColumnValues values,
           NullMask nulls);

    std::string name_;
    SemanticType type_{SemanticType::TEXT};
    StorageWidth width_{StorageWidth::BITS_64};
    ColumnValues values_{std::vector<std::string>{}};
    NullMask nulls_;
};

}  // namespace tablewright
