#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schemagraph {

// ============================================================================
// Relationship Basis
// ============================================================================

/**
 * @brief Why a relationship was emitted
 *
 * DECLARED comes from a constraint in the catalog; the other three are
 * heuristic tiers of the confidence scorer.
 */
enum class Basis : uint8_t {
    DECLARED,
    EXACT_MATCH,
    PATTERN_MATCH,
    HIERARCHICAL,
};

[[nodiscard]] inline const char* basis_to_string(Basis basis) {
    switch (basis) {
        case Basis::DECLARED: return "declared";
        case Basis::EXACT_MATCH: return "exact_match";
        case Basis::PATTERN_MATCH: return "pattern_match";
        case Basis::HIERARCHICAL: return "hierarchical";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_inferred(Basis basis) {
    return basis != Basis::DECLARED;
}

// ============================================================================
// Relationships
// ============================================================================

struct Relationship {
    std::string source_table;
    std::string source_column;
    std::string target_table;
    std::string target_column;
    double confidence = 0.0;
    Basis basis = Basis::PATTERN_MATCH;
    bool dangling = false;      // Declared target table/column not in the schema

    Relationship() = default;
    Relationship(std::string st, std::string sc, std::string tt, std::string tc,
                 double conf, Basis b)
        : source_table(std::move(st)), source_column(std::move(sc)),
          target_table(std::move(tt)), target_column(std::move(tc)),
          confidence(conf), basis(b) {}

    // "<target_table>.<target_column>"
    [[nodiscard]] std::string references() const {
        return target_table + "." + target_column;
    }

    [[nodiscard]] bool is_self_reference() const {
        return source_table == target_table;
    }

    bool operator==(const Relationship&) const = default;
};

struct TableRelationships {
    std::optional<std::string> primary_key;
    std::vector<Relationship> foreign_keys;     // Sorted by source column

    bool operator==(const TableRelationships&) const = default;
};

// Ordered by table name so iteration (and every export) is reproducible.
using RelationshipMap = std::map<std::string, TableRelationships>;

/**
 * @brief Non-fatal: a declared foreign key points at a table/column that is
 *        not part of the schema. The relationship is still emitted.
 */
struct DanglingReferenceWarning {
    std::string source_table;
    std::string source_column;
    std::string target_table;
    std::string target_column;
    bool missing_table = false;     // false: table exists, column does not

    [[nodiscard]] std::string message() const {
        if (missing_table) {
            return "declared foreign key " + source_table + "." + source_column +
                   " references unknown table '" + target_table + "'";
        }
        return "declared foreign key " + source_table + "." + source_column +
               " references unknown column '" + target_table + "." + target_column + "'";
    }
};

} // namespace schemagraph
