// include/tablewright/cleaning/value_parsers.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tablewright {
namespace parsing {

/**
 * @brief Cell strings that mean "no value": *, N/A, N.A., #N/A, ???, NULL, null
 */
const std::vector<std::string>& default_null_markers();

/**
 * @brief True when the value equals one of the markers exactly (case-sensitive)
 */
bool is_null_marker(std::string_view value, const std::vector<std::string>& markers);

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
std::string strip_whitespace(std::string_view value);

/**
 * @brief Parse a base-10 number with optional sign and decimal point
 *
 * Accepts "12", "-3.5", "+.25", "7."; rejects exponents, separators,
 * "inf"/"nan" and anything with surrounding text. Values with more
 * significant digits than a double holds exactly are rejected.
 */
std::optional<double> parse_plain_number(std::string_view value);

/**
 * @brief Rewrite an accounting negative "(1,234.50)" as "-1,234.50"
 * @return nullopt when the value is not a parenthesized amount
 */
std::optional<std::string> rewrite_parenthesized_negative(std::string_view value);

/**
 * @brief Remove currency symbols ($¢£¥€₹₽¤), commas and whitespace anywhere in the value
 */
std::string strip_currency(std::string_view value);

/**
 * @brief Parse a strict YYYY-MM-DD calendar date
 * @return days since 1970-01-01, nullopt for any other shape or an invalid day
 */
std::optional<int32_t> parse_iso_date(std::string_view value);

}  // namespace parsing
}  // namespace tablewright
