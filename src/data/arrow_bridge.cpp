#include "tablewright/data/arrow_bridge.hpp"
#include <arrow/type_traits.h>
#include <unordered_map>
#include "tablewright/core/logger.hpp"

namespace tablewright {

namespace {

/**
 * Column contents gathered across chunks before the Column is built.
 */
struct ColumnBuffer {
    SemanticType type{SemanticType::TEXT};
    StorageWidth width{StorageWidth::BITS_64};
    std::vector<int64_t> integers;
    std::vector<double> decimals;
    std::vector<int32_t> dates;
    std::vector<std::string> strings;
    std::vector<std::string> dictionary;
    std::unordered_map<std::string, int32_t> dictionary_lookup;
    std::vector<int32_t> codes;
    NullMask nulls;

    Column build(const std::string& name) {
        switch (type) {
            case SemanticType::INTEGER:
                return Column::integer(name, std::move(integers), std::move(nulls), width);
            case SemanticType::DECIMAL:
                return Column::decimal(name, std::move(decimals), std::move(nulls), width);
            case SemanticType::DATE:
                return Column::date(name, std::move(dates), std::move(nulls));
            case SemanticType::CATEGORICAL:
                return Column::categorical(name, std::move(dictionary), std::move(codes),
                                           std::move(nulls));
            case SemanticType::TEXT:
                return Column::text(name, std::move(strings), std::move(nulls));
        }
        return Column::text(name, {}, {});
    }
};

template <typename ArrayType>
void append_integers(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
        const bool null = array.IsNull(i);
        buffer.integers.push_back(null ? 0 : static_cast<int64_t>(array.Value(i)));
        buffer.nulls.push_back(null ? 1 : 0);
    }
}

template <typename ArrayType>
void append_decimals(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
        const bool null = array.IsNull(i);
        buffer.decimals.push_back(null ? 0.0 : static_cast<double>(array.Value(i)));
        buffer.nulls.push_back(null ? 1 : 0);
    }
}

template <typename ArrayType>
void append_strings(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
        const bool null = array.IsNull(i);
        buffer.strings.push_back(null ? std::string() : array.GetString(i));
        buffer.nulls.push_back(null ? 1 : 0);
    }
}

void append_dates(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const arrow::Date32Array&>(chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
        const bool null = array.IsNull(i);
        buffer.dates.push_back(null ? 0 : array.Value(i));
        buffer.nulls.push_back(null ? 1 : 0);
    }
}

void append_booleans(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const arrow::BooleanArray&>(chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
        const bool null = array.IsNull(i);
        buffer.strings.push_back(null ? std::string() : (array.Value(i) ? "true" : "false"));
        buffer.nulls.push_back(null ? 1 : 0);
    }
}

// Chunks may carry different dictionaries; entries are merged by string value
void append_dictionary(const arrow::Array& chunk, ColumnBuffer& buffer) {
    const auto& array = static_cast<const arrow::DictionaryArray&>(chunk);
    const auto& values = static_cast<const arrow::StringArray&>(*array.dictionary());
    for (int64_t i = 0; i < array.length(); ++i) {
        int64_t index = array.IsNull(i) ? -1 : array.GetValueIndex(i);
        if (index < 0 || values.IsNull(index)) {
            buffer.codes.push_back(0);
            buffer.nulls.push_back(1);
            continue;
        }
        std::string value = values.GetString(index);
        auto it = buffer.dictionary_lookup.find(value);
        if (it == buffer.dictionary_lookup.end()) {
            it = buffer.dictionary_lookup
                     .emplace(value, static_cast<int32_t>(buffer.dictionary.size()))
                     .first;
            buffer.dictionary.push_back(value);
        }
        buffer.codes.push_back(it->second);
        buffer.nulls.push_back(0);
    }
}

/**
 * Decide the target type of an Arrow column; false when it has no counterpart.
 */
bool classify(const arrow::DataType& type, ColumnBuffer& buffer) {
    switch (type.id()) {
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BOOL:
            buffer.type = SemanticType::TEXT;
            return true;
        case arrow::Type::INT8:
            buffer.type = SemanticType::INTEGER;
            buffer.width = StorageWidth::BITS_8;
            return true;
        case arrow::Type::INT16:
        case arrow::Type::UINT8:
            buffer.type = SemanticType::INTEGER;
            buffer.width = StorageWidth::BITS_16;
            return true;
        case arrow::Type::INT32:
        case arrow::Type::UINT16:
            buffer.type = SemanticType::INTEGER;
            buffer.width = StorageWidth::BITS_32;
            return true;
        case arrow::Type::INT64:
        case arrow::Type::UINT32:
            buffer.type = SemanticType::INTEGER;
            buffer.width = StorageWidth::BITS_64;
            return true;
        case arrow::Type::FLOAT:
            buffer.type = SemanticType::DECIMAL;
            buffer.width = StorageWidth::BITS_32;
            return true;
        case arrow::Type::DOUBLE:
            buffer.type = SemanticType::DECIMAL;
            buffer.width = StorageWidth::BITS_64;
            return true;
        case arrow::Type::DATE32:
            buffer.type = SemanticType::DATE;
            buffer.width = StorageWidth::BITS_32;
            return true;
        case arrow::Type::DICTIONARY: {
            const auto& dict_type = static_cast<const arrow::DictionaryType&>(type);
            if (dict_type.value_type()->id() != arrow::Type::STRING ||
                !arrow::is_integer(dict_type.index_type()->id())) {
                return false;
            }
            buffer.type = SemanticType::CATEGORICAL;
            buffer.width = StorageWidth::BITS_32;
            return true;
        }
        default:
            return false;
    }
}

void append_chunk(const arrow::Array& chunk, ColumnBuffer& buffer) {
    switch (chunk.type_id()) {
        case arrow::Type::STRING:
            append_strings<arrow::StringArray>(chunk, buffer);
            break;
        case arrow::Type::LARGE_STRING:
            append_strings<arrow::LargeStringArray>(chunk, buffer);
            break;
        case arrow::Type::BOOL:
            append_booleans(chunk, buffer);
            break;
        case arrow::Type::INT8:
            append_integers<arrow::Int8Array>(chunk, buffer);
            break;
        case arrow::Type::INT16:
            append_integers<arrow::Int16Array>(chunk, buffer);
            break;
        case arrow::Type::INT32:
            append_integers<arrow::Int32Array>(chunk, buffer);
            break;
        case arrow::Type::INT64:
            append_integers<arrow::Int64Array>(chunk, buffer);
            break;
        case arrow::Type::UINT8:
            append_integers<arrow::UInt8Array>(chunk, buffer);
            break;
        case arrow::Type::UINT16:
            append_integers<arrow::UInt16Array>(chunk, buffer);
            break;
        case arrow::Type::UINT32:
            append_integers<arrow::UInt32Array>(chunk, buffer);
            break;
        case arrow::Type::FLOAT:
            append_decimals<arrow::FloatArray>(chunk, buffer);
            break;
        case arrow::Type::DOUBLE:
            append_decimals<arrow::DoubleArray>(chunk, buffer);
            break;
        case arrow::Type::DATE32:
            append_dates(chunk, buffer);
            break;
        case arrow::Type::DICTIONARY:
            append_dictionary(chunk, buffer);
            break;
        default:
            break;
    }
}

template <typename Builder, typename Source>
arrow::Status build_numeric(const Column& column, const std::vector<Source>& values,
                            std::shared_ptr<arrow::Array>* out) {
    using Value = typename Builder::value_type;
    Builder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(column.size())));
    for (size_t row = 0; row < column.size(); ++row) {
        if (column.is_null(row)) {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        } else {
            ARROW_RETURN_NOT_OK(builder.Append(static_cast<Value>(values[row])));
        }
    }
    return builder.Finish(out);
}

arrow::Status build_strings(const Column& column, const std::vector<std::string>& values,
                            std::shared_ptr<arrow::Array>* out) {
    arrow::StringBuilder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(column.size())));
    for (size_t row = 0; row < column.size(); ++row) {
        if (column.is_null(row)) {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        } else {
            ARROW_RETURN_NOT_OK(builder.Append(values[row]));
        }
    }
    return builder.Finish(out);
}

arrow::Status build_categorical(const Column& column, std::shared_ptr<arrow::Array>* out) {
    const auto& cat = column.categories();

    arrow::StringBuilder dictionary_builder;
    ARROW_RETURN_NOT_OK(dictionary_builder.AppendValues(cat.dictionary));
    std::shared_ptr<arrow::Array> dictionary;
    ARROW_RETURN_NOT_OK(dictionary_builder.Finish(&dictionary));

    std::shared_ptr<arrow::Array> indices;
    ARROW_RETURN_NOT_OK(build_numeric<arrow::Int32Builder>(column, cat.codes, &indices));

    ARROW_ASSIGN_OR_RAISE(
        *out, arrow::DictionaryArray::FromArrays(arrow::dictionary(arrow::int32(), arrow::utf8()),
                                                 indices, dictionary));
    return arrow::Status::OK();
}

arrow::Status build_array(const Column& column, std::shared_ptr<arrow::Array>* out) {
    switch (column.type()) {
        case SemanticType::INTEGER:
            switch (column.width()) {
                case StorageWidth::BITS_8:
                    return build_numeric<arrow::Int8Builder>(column, column.integers(), out);
                case StorageWidth::BITS_16:
                    return build_numeric<arrow::Int16Builder>(column, column.integers(), out);
                case StorageWidth::BITS_32:
                    return build_numeric<arrow::Int32Builder>(column, column.integers(), out);
                case StorageWidth::BITS_64:
                    return build_numeric<arrow::Int64Builder>(column, column.integers(), out);
            }
            break;
        case SemanticType::DECIMAL:
            if (column.width() == StorageWidth::BITS_32) {
                return build_numeric<arrow::FloatBuilder>(column, column.decimals(), out);
            }
            return build_numeric<arrow::DoubleBuilder>(column, column.decimals(), out);
        case SemanticType::DATE:
            return build_numeric<arrow::Date32Builder>(column, column.dates(), out);
        case SemanticType::CATEGORICAL:
            return build_categorical(column, out);
        case SemanticType::TEXT:
            return build_strings(column, column.texts(), out);
    }
    return arrow::Status::Invalid("Unhandled column type for ", column.name());
}

}  // namespace

std::shared_ptr<arrow::DataType> ArrowBridge::arrow_type_for(const Column& column) {
    switch (column.type()) {
        case SemanticType::INTEGER:
            switch (column.width()) {
                case StorageWidth::BITS_8:
                    return arrow::int8();
                case StorageWidth::BITS_16:
                    return arrow::int16();
                case StorageWidth::BITS_32:
                    return arrow::int32();
                case StorageWidth::BITS_64:
                    return arrow::int64();
            }
            break;
        case SemanticType::DECIMAL:
            return column.width() == StorageWidth::BITS_32 ? arrow::float32() : arrow::float64();
        case SemanticType::DATE:
            return arrow::date32();
        case SemanticType::CATEGORICAL:
            return arrow::dictionary(arrow::int32(), arrow::utf8());
        case SemanticType::TEXT:
            return arrow::utf8();
    }
    return arrow::utf8();
}

Result<Table> ArrowBridge::from_arrow(const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<Table>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                 "ArrowBridge");
    }

    Logger::register_component("ArrowBridge");
    try {
        std::vector<Column> columns;
        columns.reserve(static_cast<size_t>(table->num_columns()));

        for (int i = 0; i < table->num_columns(); ++i) {
            const std::string& name = table->field(i)->name();
            const auto& chunked = table->column(i);

            ColumnBuffer buffer;
            if (!classify(*chunked->type(), buffer)) {
                return make_error<Table>(ErrorCode::CONVERSION_ERROR,
                                         "Unsupported Arrow type " + chunked->type()->ToString() +
                                             " for column '" + name + "'",
                                         "ArrowBridge");
            }

            buffer.nulls.reserve(static_cast<size_t>(chunked->length()));
            for (const auto& chunk : chunked->chunks()) {
                append_chunk(*chunk, buffer);
            }
            columns.push_back(buffer.build(name));
        }

        DEBUG("Imported Arrow table with " << table->num_columns() << " column(s) and "
                                           << table->num_rows() << " row(s)");
        return Table::make(std::move(columns));

    } catch (const std::exception& e) {
        return make_error<Table>(ErrorCode::CONVERSION_ERROR,
                                 std::string("Error converting Arrow table: ") + e.what(),
                                 "ArrowBridge");
    }
}

Result<std::shared_ptr<arrow::Table>> ArrowBridge::to_arrow(const Table& table) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.num_columns());
    arrays.reserve(table.num_columns());

    for (const auto& column : table.columns()) {
        std::shared_ptr<arrow::Array> array;
        arrow::Status status = build_array(column, &array);
        if (!status.ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to build Arrow array for column '" + column.name() +
                    "': " + status.ToString(),
                "ArrowBridge");
        }
        fields.push_back(arrow::field(column.name(), arrow_type_for(column)));
        arrays.push_back(std::move(array));
    }

    auto schema = arrow::schema(fields);
    return Result<std::shared_ptr<arrow::Table>>(
        arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.num_rows())));
}

}  // namespace tablewright
