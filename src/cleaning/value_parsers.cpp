#include "tablewright/cleaning/value_parsers.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <limits>
#include "tablewright/core/time_utils.hpp"

namespace tablewright {
namespace parsing {

namespace {

const char* const kWhitespace = " \t\r\n\f\v";

// UTF-8 encodings of the characters removed before a currency parse
const std::array<std::string_view, 10> kCurrencyTokens = {
    "$",             // dollar
    "\xC2\xA2",      // cent
    "\xC2\xA3",      // pound
    "\xC2\xA5",      // yen
    "\xE2\x82\xAC",  // euro
    "\xE2\x82\xB9",  // rupee
    "\xE2\x82\xBD",  // ruble
    "\xC2\xA4",      // generic currency sign
    ",",
    "\xC2\xA0",  // no-break space
};

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool parse_fixed_int(std::string_view s, size_t offset, size_t len, int& out) {
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        char c = s[offset + i];
        if (!is_digit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // namespace

const std::vector<std::string>& default_null_markers() {
    static const std::vector<std::string> markers = {"*",   "N/A",  "N.A.", "#N/A",
                                                     "???", "NULL", "null"};
    return markers;
}

bool is_null_marker(std::string_view value, const std::vector<std::string>& markers) {
    return std::any_of(markers.begin(), markers.end(),
                       [value](const std::string& marker) { return value == marker; });
}

std::string strip_whitespace(std::string_view value) {
    const size_t begin = value.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) return "";
    const size_t end = value.find_last_not_of(kWhitespace);
    return std::string(value.substr(begin, end - begin + 1));
}

std::optional<double> parse_plain_number(std::string_view value) {
    size_t i = 0;
    if (i < value.size() && (value[i] == '+' || value[i] == '-')) ++i;

    size_t digits = 0;
    std::string significant;
    while (i < value.size() && is_digit(value[i])) {
        if (!significant.empty() || value[i] != '0') significant.push_back(value[i]);
        ++i;
        ++digits;
    }
    size_t integer_significant = significant.size();
    if (i < value.size() && value[i] == '.') {
        ++i;
        while (i < value.size() && is_digit(value[i])) {
            if (!significant.empty() || value[i] != '0') significant.push_back(value[i]);
            ++i;
            ++digits;
        }
    }
    if (digits == 0 || i != value.size()) {
        return std::nullopt;
    }

    // Trailing fractional zeros carry no precision
    while (significant.size() > integer_significant && significant.back() == '0') {
        significant.pop_back();
    }
    if (significant.size() > static_cast<size_t>(std::numeric_limits<double>::digits10)) {
        return std::nullopt;
    }

    std::string buffer(value);
    char* end = nullptr;
    double parsed = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) {
        return std::nullopt;
    }
    if (parsed == std::numeric_limits<double>::infinity() ||
        parsed == -std::numeric_limits<double>::infinity()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::string> rewrite_parenthesized_negative(std::string_view value) {
    const size_t begin = value.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) return std::nullopt;
    const size_t end = value.find_last_not_of(kWhitespace);
    std::string_view core = value.substr(begin, end - begin + 1);

    if (core.size() < 3 || core.front() != '(' || core.back() != ')') {
        return std::nullopt;
    }
    std::string_view inner = core.substr(1, core.size() - 2);
    bool allowed = std::all_of(inner.begin(), inner.end(),
                               [](char c) { return is_digit(c) || c == ',' || c == '.'; });
    if (!allowed) {
        return std::nullopt;
    }
    return "-" + std::string(inner);
}

std::string strip_currency(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        if (std::isspace(static_cast<unsigned char>(value[i]))) {
            ++i;
            continue;
        }
        bool matched = false;
        for (std::string_view token : kCurrencyTokens) {
            if (value.compare(i, token.size(), token) == 0) {
                i += token.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            out.push_back(value[i]);
            ++i;
        }
    }
    return out;
}

std::optional<int32_t> parse_iso_date(std::string_view value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_fixed_int(value, 0, 4, year) || !parse_fixed_int(value, 5, 2, month) ||
        !parse_fixed_int(value, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > core::days_in_month(year, month)) {
        return std::nullopt;
    }
    return static_cast<int32_t>(core::days_from_civil(year, static_cast<unsigned>(month),
                                                      static_cast<unsigned>(day)));
}

}  // namespace parsing
}  // namespace tablewright
