// include/tablewright/cleaning/content_normalizer.hpp
#pragma once

#include "tablewright/cleaning/engine_config.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Canonicalizes nulls and prunes fully-empty rows and columns
 *
 * Steps run in a fixed order: strip TEXT values, null out marker strings,
 * drop all-null rows, drop all-null columns. Whitespace stripping must come
 * before marker matching so " N/A " is recognized. None of the steps fail;
 * an empty table is valid output.
 */
class ContentNormalizer {
public:
    explicit ContentNormalizer(EngineConfig config = EngineConfig{});

    Table normalize(const Table& table) const;

    /**
     * @brief Steps 1 and 2: strip TEXT values and replace null markers
     */
    Table canonicalize_text(const Table& table) const;

    static Table drop_empty_rows(const Table& table);
    static Table drop_empty_columns(const Table& table);

private:
    Column canonicalize_column(const Column& column) const;

    EngineConfig config_;
};

}  // namespace tablewright
