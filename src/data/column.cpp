#include "tablewright/data/column.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include "tablewright/core/error.hpp"
#include "tablewright/core/time_utils.hpp"

namespace tablewright {

std::string semantic_type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::INTEGER:
            return "Integer";
        case SemanticType::DECIMAL:
            return "Decimal";
        case SemanticType::DATE:
            return "Date";
        case SemanticType::CATEGORICAL:
            return "Categorical";
        case SemanticType::TEXT:
            return "Text";
    }
    return "Unknown";
}

namespace {

size_t values_length(const ColumnValues& values) {
    return std::visit(
        [](const auto& v) -> size_t {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, CategoricalValues>) {
                return v.codes.size();
            } else {
                return v.size();
            }
        },
        values);
}

[[noreturn]] void throw_wrong_type(const std::string& name, SemanticType actual,
                                   SemanticType requested) {
    throw TableError(ErrorCode::INVALID_ARGUMENT,
                     "Column '" + name + "' is " + semantic_type_to_string(actual) + ", not " +
                         semantic_type_to_string(requested),
                     "Column");
}

template <typename T>
std::vector<T> gather(const std::vector<T>& source, const std::vector<size_t>& rows) {
    std::vector<T> out;
    out.reserve(rows.size());
    for (size_t row : rows) {
        out.push_back(source[row]);
    }
    return out;
}

}  // namespace

Column::Column(std::string name, SemanticType type, StorageWidth width, ColumnValues values,
               NullMask nulls)
    : name_(std::move(name)),
      type_(type),
      width_(width),
      values_(std::move(values)),
      nulls_(std::move(nulls)) {
    const size_t length = values_length(values_);
    if (nulls_.empty()) {
        nulls_.assign(length, 0);
    }
    if (nulls_.size() != length) {
        throw TableError(ErrorCode::SCHEMA_ERROR,
                         "Column '" + name_ + "' has " + std::to_string(length) +
                             " values but a null mask of " + std::to_string(nulls_.size()),
                         "Column");
    }

    if (type_ == SemanticType::CATEGORICAL) {
        const auto& cat = std::get<CategoricalValues>(values_);
        const auto dictionary_size = static_cast<int32_t>(cat.dictionary.size());
        for (size_t i = 0; i < cat.codes.size(); ++i) {
            if (nulls_[i]) continue;
            if (cat.codes[i] < 0 || cat.codes[i] >= dictionary_size) {
                throw TableError(ErrorCode::SCHEMA_ERROR,
                                 "Column '" + name_ + "' has dictionary code " +
                                     std::to_string(cat.codes[i]) + " out of range at row " +
                                     std::to_string(i),
                                 "Column");
            }
        }
    }
}

Column Column::integer(std::string name, std::vector<int64_t> values, NullMask nulls,
                       StorageWidth width) {
    return Column(std::move(name), SemanticType::INTEGER, width, std::move(values),
                  std::move(nulls));
}

Column Column::decimal(std::string name, std::vector<double> values, NullMask nulls,
                       StorageWidth width) {
    if (width != StorageWidth::BITS_32 && width != StorageWidth::BITS_64) {
        throw TableError(ErrorCode::SCHEMA_ERROR,
                         "Decimal column '" + name + "' must be 32 or 64 bits wide", "Column");
    }
    return Column(std::move(name), SemanticType::DECIMAL, width, std::move(values),
                  std::move(nulls));
}

Column Column::date(std::string name, std::vector<int32_t> days, NullMask nulls) {
    return Column(std::move(name), SemanticType::DATE, StorageWidth::BITS_32, std::move(days),
                  std::move(nulls));
}

Column Column::categorical(std::string name, std::vector<std::string> dictionary,
                           std::vector<int32_t> codes, NullMask nulls) {
    return Column(std::move(name), SemanticType::CATEGORICAL, StorageWidth::BITS_32,
                  CategoricalValues{std::move(dictionary), std::move(codes)}, std::move(nulls));
}

Column Column::text(std::string name, std::vector<std::string> values, NullMask nulls) {
    return Column(std::move(name), SemanticType::TEXT, StorageWidth::BITS_64, std::move(values),
                  std::move(nulls));
}

Column Column::nullable_integer(std::string name,
                                const std::vector<std::optional<int64_t>>& values) {
    std::vector<int64_t> data(values.size(), 0);
    NullMask nulls(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            data[i] = *values[i];
        } else {
            nulls[i] = 1;
        }
    }
    return integer(std::move(name), std::move(data), std::move(nulls));
}

Column Column::nullable_decimal(std::string name,
                                const std::vector<std::optional<double>>& values) {
    std::vector<double> data(values.size(), 0.0);
    NullMask nulls(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            data[i] = *values[i];
        } else {
            nulls[i] = 1;
        }
    }
    return decimal(std::move(name), std::move(data), std::move(nulls));
}

Column Column::nullable_text(std::string name,
                             const std::vector<std::optional<std::string>>& values) {
    std::vector<std::string> data(values.size());
    NullMask nulls(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            data[i] = *values[i];
        } else {
            nulls[i] = 1;
        }
    }
    return text(std::move(name), std::move(data), std::move(nulls));
}

size_t Column::null_count() const {
    return static_cast<size_t>(
        std::count_if(nulls_.begin(), nulls_.end(), [](uint8_t n) { return n != 0; }));
}

const std::vector<int64_t>& Column::integers() const {
    if (type_ != SemanticType::INTEGER) throw_wrong_type(name_, type_, SemanticType::INTEGER);
    return std::get<std::vector<int64_t>>(values_);
}

const std::vector<double>& Column::decimals() const {
    if (type_ != SemanticType::DECIMAL) throw_wrong_type(name_, type_, SemanticType::DECIMAL);
    return std::get<std::vector<double>>(values_);
}

const std::vector<int32_t>& Column::dates() const {
    if (type_ != SemanticType::DATE) throw_wrong_type(name_, type_, SemanticType::DATE);
    return std::get<std::vector<int32_t>>(values_);
}

const CategoricalValues& Column::categories() const {
    if (type_ != SemanticType::CATEGORICAL)
        throw_wrong_type(name_, type_, SemanticType::CATEGORICAL);
    return std::get<CategoricalValues>(values_);
}

const std::vector<std::string>& Column::texts() const {
    if (type_ != SemanticType::TEXT) throw_wrong_type(name_, type_, SemanticType::TEXT);
    return std::get<std::vector<std::string>>(values_);
}

std::optional<std::string> Column::string_at(size_t row) const {
    if (is_null(row)) return std::nullopt;
    switch (type_) {
        case SemanticType::TEXT:
            return texts()[row];
        case SemanticType::CATEGORICAL: {
            const auto& cat = categories();
            return cat.dictionary[static_cast<size_t>(cat.codes[row])];
        }
        case SemanticType::INTEGER:
        case SemanticType::DECIMAL:
        case SemanticType::DATE:
            break;
    }
    throw_wrong_type(name_, type_, SemanticType::TEXT);
}

std::optional<std::string> Column::format_value(size_t row) const {
    if (is_null(row)) return std::nullopt;
    switch (type_) {
        case SemanticType::INTEGER:
            return std::to_string(integers()[row]);
        case SemanticType::DECIMAL: {
            std::ostringstream os;
            os << std::setprecision(15) << decimals()[row];
            return os.str();
        }
        case SemanticType::DATE:
            return core::format_iso_date(dates()[row]);
        case SemanticType::CATEGORICAL:
        case SemanticType::TEXT:
            return string_at(row);
    }
    return std::nullopt;
}

Column Column::renamed(std::string name) const {
    Column copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

Column Column::with_width(StorageWidth width) const {
    Column copy = *this;
    copy.width_ = width;
    return copy;
}

Column Column::take(const std::vector<size_t>& rows) const {
    ColumnValues gathered = std::visit(
        [&rows](const auto& v) -> ColumnValues {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, CategoricalValues>) {
                return CategoricalValues{v.dictionary, gather(v.codes, rows)};
            } else {
                return gather(v, rows);
            }
        },
        values_);
    return Column(name_, type_, width_, std::move(gathered), gather(nulls_, rows));
}

bool Column::operator==(const Column& other) const {
    if (name_ != other.name_ || type_ != other.type_ || width_ != other.width_ ||
        size() != other.size()) {
        return false;
    }
    for (size_t row = 0; row < size(); ++row) {
        if (is_null(row) != other.is_null(row)) return false;
        if (is_null(row)) continue;

        bool same = true;
        switch (type_) {
            case SemanticType::INTEGER:
                same = integers()[row] == other.integers()[row];
                break;
            case SemanticType::DECIMAL:
                same = decimals()[row] == other.decimals()[row];
                break;
            case SemanticType::DATE:
                same = dates()[row] == other.dates()[row];
                break;
            case SemanticType::CATEGORICAL:
            case SemanticType::TEXT:
                same = string_at(row) == other.string_at(row);
                break;
        }
        if (!same) return false;
    }
    return true;
}

}  // namespace tablewright
