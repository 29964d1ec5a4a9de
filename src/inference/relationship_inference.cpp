#include "inference/relationship_inference.hpp"

#include <algorithm>
#include <tuple>

namespace schemagraph {

namespace {

bool is_dangling(const SchemaModel& schema, const DeclaredForeignKey& fk) {
    const auto* target = schema.find_table(fk.references_table);
    return target == nullptr || target->find_column(fk.references_column) == nullptr;
}

// true when (score, target) should replace the current best
bool beats(double score, const std::string& target, double best_score, const std::string& best_target) {
    if (score != best_score) {
        return score > best_score;
    }
    if (target.size() != best_target.size()) {
        return target.size() < best_target.size();
    }
    return target < best_target;
}

} // anonymous namespace

RelationshipInferenceEngine::RelationshipInferenceEngine(Config config)
    : scorer_(std::move(config.scorer)),
      min_confidence_(config.min_confidence) {}

std::optional<Relationship> RelationshipInferenceEngine::best_candidate(
    const SchemaModel& schema,
    const TableInfo& source_table,
    const ColumnInfo& column) const {

    std::optional<Relationship> best;

    for (const auto& [target_name, target_table] : schema.tables()) {
        const ColumnInfo* target_key = target_table.primary_key_column();
        if (!target_key) {
            continue;
        }

        const auto scored = scorer_.score(column, source_table, target_table, *target_key);
        if (!scored || scored->score < min_confidence_) {
            continue;
        }

        if (!best || beats(scored->score, target_name, best->confidence, best->target_table)) {
            best.emplace(source_table.name, column.name, target_name, target_key->name,
                         scored->score, scored->basis);
        }
    }

    return best;
}

RelationshipMap RelationshipInferenceEngine::infer(const SchemaModel& schema) const {
    RelationshipMap result;

    for (const auto& [table_name, table] : schema.tables()) {
        auto& entry = result[table_name];
        entry.primary_key = table.primary_key;

        for (const auto& fk : table.foreign_keys) {
            Relationship rel(table_name, fk.column, fk.references_table, fk.references_column,
                             1.0, Basis::DECLARED);
            rel.dangling = is_dangling(schema, fk);
            entry.foreign_keys.push_back(std::move(rel));
        }

        for (const auto& column : table.columns) {
            if (table.primary_key && column.name == *table.primary_key) {
                continue;
            }
            if (table.has_declared_foreign_key(column.name)) {
                continue;
            }
            if (auto rel = best_candidate(schema, table, column)) {
                entry.foreign_keys.push_back(std::move(*rel));
            }
        }

        std::sort(entry.foreign_keys.begin(), entry.foreign_keys.end(),
            [](const Relationship& a, const Relationship& b) {
                return std::tie(a.source_column, a.target_table, a.target_column) <
                       std::tie(b.source_column, b.target_table, b.target_column);
            });
    }

    return result;
}

RelationshipMap infer_relationships(const SchemaModel& schema) {
    return RelationshipInferenceEngine{}.infer(schema);
}

std::vector<DanglingReferenceWarning> collect_dangling_references(
    const SchemaModel& schema, const RelationshipMap& relationships) {

    std::vector<DanglingReferenceWarning> warnings;
    for (const auto& [table_name, entry] : relationships) {
        for (const auto& rel : entry.foreign_keys) {
            if (!rel.dangling) {
                continue;
            }
            DanglingReferenceWarning warning;
            warning.source_table = rel.source_table;
            warning.source_column = rel.source_column;
            warning.target_table = rel.target_table;
            warning.target_column = rel.target_column;
            warning.missing_table = !schema.has_table(rel.target_table);
            warnings.push_back(std::move(warning));
        }
    }
    return warnings;
}

} // namespace schemagraph
