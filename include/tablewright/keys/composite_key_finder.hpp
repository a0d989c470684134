// include/tablewright/keys/composite_key_finder.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "tablewright/core/config_base.hpp"
#include "tablewright/core/error.hpp"
#include "tablewright/data/table.hpp"

namespace tablewright {

/**
 * @brief Parameters of the ranked composite-key search
 */
struct KeyFinderConfig : public ConfigBase {
    int n_candidates{5};
    int max_key_size{4};
    int sample_size{50000};
    std::vector<std::string> preference_patterns{"id",   "key",     "number",
                                                 "code", "invoice", "document"};
    uint64_t random_seed{42};  // row sample generator seed
    size_t worker_threads{1};  // >1 evaluates combinations concurrently

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["n_candidates"] = n_candidates;
        j["max_key_size"] = max_key_size;
        j["sample_size"] = sample_size;
        j["preference_patterns"] = preference_patterns;
        j["random_seed"] = random_seed;
        j["worker_threads"] = worker_threads;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("n_candidates"))
            n_candidates = j.at("n_candidates").get<int>();
        if (j.contains("max_key_size"))
            max_key_size = j.at("max_key_size").get<int>();
        if (j.contains("sample_size"))
            sample_size = j.at("sample_size").get<int>();
        if (j.contains("preference_patterns"))
            preference_patterns = j.at("preference_patterns").get<std::vector<std::string>>();
        if (j.contains("random_seed"))
            random_seed = j.at("random_seed").get<uint64_t>();
        if (j.contains("worker_threads"))
            worker_threads = j.at("worker_threads").get<size_t>();
    }

    Result<void> validate() const override;
};

/**
 * @brief Column set whose joint values identify every row of a table
 */
struct KeyCandidate {
    std::vector<std::string> columns;
    int score{0};

    size_t size() const {
        return columns.size();
    }

    bool operator==(const KeyCandidate& other) const {
        return columns == other.columns && score == other.score;
    }
};

/**
 * @brief Preference score of a column set
 *
 * Each column earns +10 when its lower-cased name contains any pattern and
 * max(0, 20 - length) as a short-name bonus.
 */
int preference_score(const std::vector<std::string>& columns,
                     const std::vector<std::string>& patterns);

/**
 * @brief Finds small column sets that uniquely identify rows
 *
 * Uniqueness is screened on a uniform row sample before the full-table
 * check. A single-column key, when one exists, is returned alone; otherwise
 * combinations of 2..max_key_size columns are searched in ascending size and
 * ranked by preference score within each size.
 */
class CompositeKeyFinder {
public:
    explicit CompositeKeyFinder(KeyFinderConfig config = KeyFinderConfig{});

    /**
     * @brief Ranked key candidates, best first
     * @return CONFIGURATION_ERROR for non-positive parameters; an empty list when no
     *         column is eligible or the table has no rows
     */
    Result<std::vector<KeyCandidate>> find(const Table& table) const;

    /**
     * @brief Indices of columns that may take part in a key
     *
     * DECIMAL columns qualify only when every non-null value is integral.
     */
    static std::vector<size_t> eligible_columns(const Table& table);

    /**
     * @brief Full-table check: projecting onto the columns yields num_rows distinct rows
     *
     * Nulls compare equal to each other.
     */
    static bool is_unique(const Table& table, const std::vector<size_t>& columns);

private:
    KeyFinderConfig config_;
};

Result<std::vector<KeyCandidate>> find_ranked_keys(const Table& table, int n_candidates,
                                                   int max_key_size, int sample_size,
                                                   const std::vector<std::string>& patterns);

Result<std::vector<KeyCandidate>> find_ranked_keys(const Table& table,
                                                   const KeyFinderConfig& config);

}  // namespace tablewright
