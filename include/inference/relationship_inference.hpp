#pragma once

#include "core/types.hpp"
#include "inference/confidence_scorer.hpp"
#include "schema/schema_model.hpp"
#include <vector>

namespace schemagraph {

/**
 * @brief Infers undeclared foreign keys across one SchemaModel
 *
 * infer():
 * 1. Seeds every table with its declared foreign keys (DECLARED, 1.0).
 *    A declared key whose target table/column is missing is still emitted,
 *    flagged dangling.
 * 2. For every column that is neither the designated primary key nor covered
 *    by a declared key, scores each table with a primary key as a target
 *    (its own table only for hierarchical names).
 * 3. Keeps the best candidate at or above min_confidence. Ties go to the
 *    shorter target table name, then the lexicographically smaller one.
 *
 * Never throws on ambiguity: no match simply means no relationship. Output
 * is ordered by table name, and each table's foreign keys by
 * (source column, target table, target column), so repeated runs over the
 * same model are identical.
 */
class RelationshipInferenceEngine {
public:
    struct Config {
        ConfidenceScorer::Config scorer;
        double min_confidence = 0.0;
    };

    RelationshipInferenceEngine() : RelationshipInferenceEngine(Config{}) {}
    explicit RelationshipInferenceEngine(Config config);

    [[nodiscard]] RelationshipMap infer(const SchemaModel& schema) const;

    [[nodiscard]] const ConfidenceScorer& scorer() const { return scorer_; }
    [[nodiscard]] double min_confidence() const { return min_confidence_; }

private:
    [[nodiscard]] std::optional<Relationship> best_candidate(
        const SchemaModel& schema,
        const TableInfo& source_table,
        const ColumnInfo& column) const;

    ConfidenceScorer scorer_;
    double min_confidence_;
};

/** @brief infer() with the default configuration */
[[nodiscard]] RelationshipMap infer_relationships(const SchemaModel& schema);

/**
 * @brief One warning per dangling declared relationship, in map order
 */
[[nodiscard]] std::vector<DanglingReferenceWarning> collect_dangling_references(
    const SchemaModel& schema, const RelationshipMap& relationships);

} // namespace schemagraph
