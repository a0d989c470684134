#include "tablewright/keys/composite_key_finder.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <iterator>
#include <numeric>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include "tablewright/core/logger.hpp"

namespace tablewright {

Result<void> KeyFinderConfig::validate() const {
    if (n_candidates <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "n_candidates must be positive, got " +
                                    std::to_string(n_candidates),
                                "KeyFinderConfig");
    }
    if (max_key_size <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "max_key_size must be positive, got " +
                                    std::to_string(max_key_size),
                                "KeyFinderConfig");
    }
    if (sample_size <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "sample_size must be positive, got " + std::to_string(sample_size),
                                "KeyFinderConfig");
    }
    if (worker_threads == 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "worker_threads must be at least 1", "KeyFinderConfig");
    }
    return Result<void>();
}

namespace {

// Dense per-row value codes; equal values share a code, every null gets kNullCode
using Codes = std::vector<uint32_t>;
constexpr uint32_t kNullCode = 0;

// Combinations evaluated per scheduling round
constexpr size_t kBatchSize = 4096;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

template <typename T>
Codes factorize_by(const Column& column, const std::vector<T>& values) {
    Codes codes(column.size(), kNullCode);
    std::unordered_map<T, uint32_t> lookup;
    for (size_t row = 0; row < values.size(); ++row) {
        if (column.is_null(row)) continue;
        auto it = lookup.emplace(values[row], static_cast<uint32_t>(lookup.size() + 1)).first;
        codes[row] = it->second;
    }
    return codes;
}

Codes factorize_decimals(const Column& column) {
    const auto& values = column.decimals();
    // NaN never equals itself, so it is folded onto one shared code
    const uint32_t nan_code = 1;
    Codes codes(column.size(), kNullCode);
    std::unordered_map<double, uint32_t> lookup;
    for (size_t row = 0; row < values.size(); ++row) {
        if (column.is_null(row)) continue;
        double v = values[row];
        if (std::isnan(v)) {
            codes[row] = nan_code;
            continue;
        }
        if (v == 0.0) v = 0.0;  // fold -0.0
        auto it = lookup.emplace(v, static_cast<uint32_t>(lookup.size() + 2)).first;
        codes[row] = it->second;
    }
    return codes;
}

Codes factorize_categories(const Column& column) {
    const auto& cat = column.categories();
    // Dictionaries from collaborators may repeat a string under two indices
    std::unordered_map<std::string, uint32_t> lookup;
    std::vector<uint32_t> dictionary_codes(cat.dictionary.size());
    for (size_t i = 0; i < cat.dictionary.size(); ++i) {
        auto it =
            lookup.emplace(cat.dictionary[i], static_cast<uint32_t>(lookup.size() + 1)).first;
        dictionary_codes[i] = it->second;
    }

    Codes codes(column.size(), kNullCode);
    for (size_t row = 0; row < cat.codes.size(); ++row) {
        if (column.is_null(row)) continue;
        codes[row] = dictionary_codes[static_cast<size_t>(cat.codes[row])];
    }
    return codes;
}

Codes factorize(const Column& column) {
    switch (column.type()) {
        case SemanticType::INTEGER:
            return factorize_by(column, column.integers());
        case SemanticType::DECIMAL:
            return factorize_decimals(column);
        case SemanticType::DATE:
            return factorize_by(column, column.dates());
        case SemanticType::CATEGORICAL:
            return factorize_categories(column);
        case SemanticType::TEXT:
            return factorize_by(column, column.texts());
    }
    return Codes(column.size(), kNullCode);
}

/**
 * True when the projection of `rows` onto the coded columns has no repeated
 * tuple. Columns are folded pairwise into dense tuple codes, so arbitrary
 * key sizes stay within 64-bit hash keys.
 */
bool all_distinct(const std::vector<const Codes*>& columns, const std::vector<size_t>& rows) {
    if (rows.size() <= 1 || columns.empty()) {
        return rows.size() <= 1;
    }

    std::vector<uint32_t> current(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        current[r] = (*columns[0])[rows[r]];
    }

    for (size_t c = 1; c < columns.size(); ++c) {
        std::unordered_map<uint64_t, uint32_t> combined;
        combined.reserve(rows.size());
        for (size_t r = 0; r < rows.size(); ++r) {
            uint64_t key = (static_cast<uint64_t>(current[r]) << 32) | (*columns[c])[rows[r]];
            auto it = combined.emplace(key, static_cast<uint32_t>(combined.size())).first;
            current[r] = it->second;
        }
    }

    std::unordered_set<uint32_t> seen;
    seen.reserve(current.size());
    for (uint32_t code : current) {
        if (!seen.insert(code).second) {
            return false;
        }
    }
    return true;
}

std::vector<size_t> sample_rows(const std::vector<size_t>& all_rows, size_t sample_size,
                                uint64_t seed) {
    if (sample_size >= all_rows.size()) {
        return all_rows;
    }
    std::vector<size_t> sample;
    sample.reserve(sample_size);
    std::mt19937_64 rng(seed);
    std::sample(all_rows.begin(), all_rows.end(), std::back_inserter(sample), sample_size, rng);
    return sample;
}

/**
 * Sample-then-confirm uniqueness over the eligible columns of one table.
 * Immutable after construction, so concurrent qualifies() calls are safe.
 */
class UniquenessOracle {
public:
    UniquenessOracle(const Table& table, const std::vector<size_t>& eligible,
                     size_t sample_size, uint64_t seed)
        : all_rows_(table.num_rows()) {
        std::iota(all_rows_.begin(), all_rows_.end(), size_t{0});
        sample_ = sample_rows(all_rows_, sample_size, seed);
        sample_is_full_ = sample_.size() == all_rows_.size();

        codes_.reserve(eligible.size());
        for (size_t index : eligible) {
            codes_.push_back(factorize(table.column(index)));
        }
    }

    // `positions` index into the eligible column list
    bool qualifies(const std::vector<size_t>& positions) const {
        std::vector<const Codes*> columns;
        columns.reserve(positions.size());
        for (size_t pos : positions) {
            columns.push_back(&codes_[pos]);
        }
        if (!all_distinct(columns, sample_)) {
            return false;
        }
        return sample_is_full_ || all_distinct(columns, all_rows_);
    }

    size_t sample_size() const {
        return sample_.size();
    }

private:
    std::vector<size_t> all_rows_;
    std::vector<size_t> sample_;
    bool sample_is_full_{false};
    std::vector<Codes> codes_;
};

bool next_combination(std::vector<size_t>& combo, size_t m) {
    const size_t k = combo.size();
    for (size_t i = k; i-- > 0;) {
        if (combo[i] < m - k + i) {
            ++combo[i];
            for (size_t j = i + 1; j < k; ++j) {
                combo[j] = combo[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

std::vector<char> evaluate_batch(const UniquenessOracle& oracle,
                                 const std::vector<std::vector<size_t>>& batch,
                                 size_t workers) {
    std::vector<char> flags(batch.size(), 0);
    if (workers <= 1 || batch.size() < 2 * workers) {
        for (size_t i = 0; i < batch.size(); ++i) {
            flags[i] = oracle.qualifies(batch[i]) ? 1 : 0;
        }
        return flags;
    }

    // Each worker owns a contiguous slice, so results land in enumeration order
    const size_t chunk = (batch.size() + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    for (size_t begin = 0; begin < batch.size(); begin += chunk) {
        const size_t end = std::min(batch.size(), begin + chunk);
        futures.push_back(std::async(std::launch::async, [&oracle, &batch, &flags, begin, end]() {
            for (size_t i = begin; i < end; ++i) {
                flags[i] = oracle.qualifies(batch[i]) ? 1 : 0;
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    return flags;
}

}  // namespace

int preference_score(const std::vector<std::string>& columns,
                     const std::vector<std::string>& patterns) {
    int score = 0;
    for (const auto& column : columns) {
        const std::string lowered = to_lower(column);
        for (const auto& pattern : patterns) {
            if (lowered.find(to_lower(pattern)) != std::string::npos) {
                score += 10;
                break;
            }
        }
        score += std::max(0, 20 - static_cast<int>(column.size()));
    }
    return score;
}

CompositeKeyFinder::CompositeKeyFinder(KeyFinderConfig config) : config_(std::move(config)) {
    Logger::register_component("CompositeKeyFinder");
}

std::vector<size_t> CompositeKeyFinder::eligible_columns(const Table& table) {
    std::vector<size_t> eligible;
    for (size_t i = 0; i < table.num_columns(); ++i) {
        const Column& column = table.column(i);
        switch (column.type()) {
            case SemanticType::INTEGER:
            case SemanticType::DATE:
            case SemanticType::CATEGORICAL:
            case SemanticType::TEXT:
                eligible.push_back(i);
                break;
            case SemanticType::DECIMAL: {
                const auto& values = column.decimals();
                bool any_value = false;
                bool integral = true;
                for (size_t row = 0; row < values.size() && integral; ++row) {
                    if (column.is_null(row)) continue;
                    any_value = true;
                    integral = std::isfinite(values[row]) && values[row] == std::floor(values[row]);
                }
                if (any_value && integral) {
                    eligible.push_back(i);
                }
                break;
            }
        }
    }
    return eligible;
}

bool CompositeKeyFinder::is_unique(const Table& table, const std::vector<size_t>& columns) {
    std::vector<Codes> codes;
    codes.reserve(columns.size());
    for (size_t index : columns) {
        codes.push_back(factorize(table.column(index)));
    }
    std::vector<const Codes*> pointers;
    for (const auto& c : codes) {
        pointers.push_back(&c);
    }
    std::vector<size_t> rows(table.num_rows());
    std::iota(rows.begin(), rows.end(), size_t{0});
    return all_distinct(pointers, rows);
}

Result<std::vector<KeyCandidate>> CompositeKeyFinder::find(const Table& table) const {
    Logger::register_component("CompositeKeyFinder");
    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR("Key search rejected: " << valid.error()->what());
        return make_error<std::vector<KeyCandidate>>(valid.error()->code(), valid.error()->what(),
                                                     "CompositeKeyFinder");
    }

    std::vector<KeyCandidate> candidates;
    const std::vector<size_t> eligible = eligible_columns(table);
    if (eligible.empty() || table.num_rows() == 0) {
        INFO("No key search possible: " << eligible.size() << " eligible column(s), "
                                        << table.num_rows() << " row(s)");
        return Result<std::vector<KeyCandidate>>(std::move(candidates));
    }

    UniquenessOracle oracle(table, eligible, static_cast<size_t>(config_.sample_size),
                            config_.random_seed);
    DEBUG("Key search over " << eligible.size() << " of " << table.num_columns()
                             << " column(s), sample of " << oracle.sample_size() << " row(s)");

    auto names_of = [&table, &eligible](const std::vector<size_t>& positions) {
        std::vector<std::string> names;
        names.reserve(positions.size());
        for (size_t pos : positions) {
            names.push_back(table.column(eligible[pos]).name());
        }
        return names;
    };

    // A single-column key always wins over any combination
    std::vector<KeyCandidate> singles;
    for (size_t pos = 0; pos < eligible.size(); ++pos) {
        if (oracle.qualifies({pos})) {
            auto names = names_of({pos});
            int score = preference_score(names, config_.preference_patterns);
            singles.push_back(KeyCandidate{std::move(names), score});
        }
    }
    if (!singles.empty()) {
        auto best = std::max_element(
            singles.begin(), singles.end(),
            [](const KeyCandidate& a, const KeyCandidate& b) { return a.score < b.score; });
        INFO("Single-column key found: " << best->columns.front() << " (score " << best->score
                                         << ")");
        candidates.push_back(*best);
        return Result<std::vector<KeyCandidate>>(std::move(candidates));
    }

    const size_t m = eligible.size();
    const size_t max_size = std::min(static_cast<size_t>(config_.max_key_size), m);
    const size_t wanted = static_cast<size_t>(config_.n_candidates);

    for (size_t k = 2; k <= max_size; ++k) {
        std::vector<KeyCandidate> size_candidates;
        std::vector<size_t> combo(k);
        std::iota(combo.begin(), combo.end(), size_t{0});

        bool more = true;
        std::vector<std::vector<size_t>> batch;
        while (more) {
            batch.clear();
            while (more && batch.size() < kBatchSize) {
                batch.push_back(combo);
                more = next_combination(combo, m);
            }

            std::vector<char> flags = evaluate_batch(oracle, batch, config_.worker_threads);
            for (size_t i = 0; i < batch.size(); ++i) {
                if (!flags[i]) continue;
                auto names = names_of(batch[i]);
                int score = preference_score(names, config_.preference_patterns);
                size_candidates.push_back(KeyCandidate{std::move(names), score});
            }
        }

        DEBUG("Key size " << k << ": " << size_candidates.size() << " qualifying combination(s)");
        std::stable_sort(
            size_candidates.begin(), size_candidates.end(),
            [](const KeyCandidate& a, const KeyCandidate& b) { return a.score > b.score; });
        candidates.insert(candidates.end(), size_candidates.begin(), size_candidates.end());

        if (candidates.size() >= wanted) {
            break;
        }
    }

    if (candidates.size() > wanted) {
        candidates.resize(wanted);
    }
    INFO("Key search returned " << candidates.size() << " candidate(s)");
    return Result<std::vector<KeyCandidate>>(std::move(candidates));
}

Result<std::vector<KeyCandidate>> find_ranked_keys(const Table& table, int n_candidates,
                                                   int max_key_size, int sample_size,
                                                   const std::vector<std::string>& patterns) {
    KeyFinderConfig config;
    config.n_candidates = n_candidates;
    config.max_key_size = max_key_size;
    config.sample_size = sample_size;
    config.preference_patterns = patterns;
    return CompositeKeyFinder(std::move(config)).find(table);
}

Result<std::vector<KeyCandidate>> find_ranked_keys(const Table& table,
                                                   const KeyFinderConfig& config) {
    return CompositeKeyFinder(config).find(table);
}

}  // namespace tablewright
