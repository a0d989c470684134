#include "tablewright/cleaning/column_sanitizer.hpp"
#include <cctype>
#include <deque>
#include <unordered_set>
#include <utility>
#include "tablewright/cleaning/value_parsers.hpp"
#include "tablewright/core/logger.hpp"

namespace tablewright {

namespace {

constexpr char kSafeSeparator = '_';

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

std::string ColumnSanitizer::sanitize_name(const std::string& raw) {
    std::string trimmed = parsing::strip_whitespace(raw);

    // (character, produced by separator substitution)
    std::deque<std::pair<char, bool>> chars;
    for (char c : trimmed) {
        if (c == ' ' || c == '-') {
            chars.emplace_back(kSafeSeparator, true);
        } else if (static_cast<unsigned char>(c) < 0x80 && is_identifier_char(c)) {
            chars.emplace_back(c, false);
        }
    }

    while (!chars.empty() && chars.front().second) {
        chars.pop_front();
    }
    while (!chars.empty() && chars.back().second) {
        chars.pop_back();
    }

    std::string sanitized;
    sanitized.reserve(chars.size());
    for (const auto& entry : chars) {
        sanitized.push_back(entry.first);
    }
    return sanitized;
}

Table ColumnSanitizer::sanitize(const Table& table) {
    Logger::register_component("ColumnSanitizer");
    std::unordered_set<std::string> used;
    std::vector<Column> renamed;
    renamed.reserve(table.num_columns());

    for (size_t i = 0; i < table.num_columns(); ++i) {
        const Column& column = table.column(i);
        std::string name = sanitize_name(column.name());
        if (name.empty()) {
            name = "column_" + std::to_string(i + 1);
            WARN("Column name '" << column.name() << "' has no safe characters, renamed to "
                                 << name);
        }

        if (used.count(name) > 0) {
            std::string base = name;
            for (size_t suffix = 2;; ++suffix) {
                name = base + "_" + std::to_string(suffix);
                if (used.count(name) == 0) break;
            }
            WARN("Sanitized column name '" << base << "' collides with an earlier column; '"
                                           << column.name() << "' renamed to " << name);
        }

        if (name != column.name()) {
            DEBUG("Renamed column '" << column.name() << "' -> '" << name << "'");
        }
        used.insert(name);
        renamed.push_back(column.renamed(name));
    }

    return Table(std::move(renamed));
}

}  // namespace tablewright
