#pragma once

#include "core/types.hpp"
#include "schema/schema_model.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemagraph {

/**
 * @brief Score of one accepted (source column -> target key) candidate
 */
struct ScoredCandidate {
    double score = 0.0;
    Basis basis = Basis::PATTERN_MATCH;
};

/**
 * @brief Pure confidence scorer for foreign-key candidates
 *
 * Tiers, checked in order:
 * 1. Generic source names ("id", "name", "status", ...) and names without an
 *    entity stem are never sources.
 * 2. Type gate: source and target key must share a TypeClass.
 * 3. Same table: only hierarchical names ("parent_id", "parent_category_id") pass,
 *    scored hierarchical_score / hierarchical_bare_score.
 * 4. Exact: stem equals the target table name (or its singular/plural) and
 *    the column is named exactly like the target key. exact_typed_score when
 *    the declared type names also agree, exact_score otherwise.
 * 5. Pattern: best of edit-distance ratio against the table name variants,
 *    edit-distance ratio against the target key's stem, and word overlap with
 *    the table name. Below min_similarity the candidate is dropped; above, the
 *    score rises linearly from pattern_min_score to pattern_max_score.
 *    A column without a key marker ("cost", "customer") skips the fuzzy
 *    measures: its stem must equal a table variant or the key's stem.
 *
 * Thread-safety: immutable after construction, safe to share.
 */
class ConfidenceScorer {
public:
    struct Config {
        double exact_typed_score = 0.98;
        double exact_score = 0.95;
        double pattern_min_score = 0.50;
        double pattern_max_score = 0.92;
        double hierarchical_score = 0.90;       // "parent_id"
        double hierarchical_bare_score = 0.85;  // "parent"
        double min_similarity = 0.75;

        // Lower-case column names that never trigger inference as a source
        std::vector<std::string> generic_names = {
            "id", "key", "fk", "pk", "uuid", "guid", "oid", "rowid",
            "name", "title", "label", "status", "state", "type", "kind",
            "category", "code", "value", "description", "comment", "notes",
            "created_at", "updated_at", "deleted_at", "created", "updated",
            "timestamp", "version",
        };

        // Words marking a self-reference ("parent_id", "parent_category_id").
        // Person-style markers ("manager", "reports_to") come from config.
        std::vector<std::string> hierarchical_markers = {
            "parent",
        };
    };

    ConfidenceScorer() : ConfidenceScorer(Config{}) {}
    explicit ConfidenceScorer(Config config);

    /**
     * @brief Score @p source_column of @p source_table against the key
     *        @p target_key of @p target_table
     * @return Score and basis, or nullopt when the pair is not a candidate
     */
    [[nodiscard]] std::optional<ScoredCandidate> score(
        const ColumnInfo& source_column,
        const TableInfo& source_table,
        const TableInfo& target_table,
        const ColumnInfo& target_key) const;

    /** @brief True when @p column_name can never be an inference source */
    [[nodiscard]] bool is_generic_name(std::string_view column_name) const;

    /** @brief True when @p column_name carries a hierarchical marker word */
    [[nodiscard]] bool is_hierarchical_name(std::string_view column_name) const;

    /**
     * @brief Name similarity in [0, 1] between a source column and a target
     *        table / key pair (the pattern tier's input)
     */
    [[nodiscard]] static double name_similarity(std::string_view column_name,
                                                std::string_view table_name,
                                                std::string_view key_name);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] double pattern_score(double similarity) const;

    Config config_;
    std::vector<std::vector<std::string>> marker_tokens_;
};

} // namespace schemagraph
