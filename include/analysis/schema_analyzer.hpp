#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "dialect/dialect_registry.hpp"
#include "graph/schema_graph.hpp"
#include "inference/relationship_inference.hpp"
#include "schema/schema_description.hpp"
#include "schema/schema_model.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace schemagraph {

struct AnalysisStats {
    size_t table_count = 0;
    size_t column_count = 0;
    size_t declared_count = 0;
    size_t inferred_count = 0;
    size_t dangling_count = 0;
    std::chrono::microseconds elapsed{0};
};

/**
 * @brief Everything one analysis produced. Owned by the caller.
 */
struct AnalysisResult {
    SchemaModel schema;
    RelationshipMap relationships;
    SchemaGraph graph;
    std::vector<DanglingReferenceWarning> warnings;
    AnalysisStats stats;
};

/**
 * @brief Chained schema -> relationships -> graph convenience
 *
 * Remembers the last schema and relationship map it worked on so the
 * *_only() calls can be chained without passing them again. That state
 * belongs to this instance only: two analyzers never see each other's
 * results. Not thread-safe; use one analyzer per thread.
 */
class SchemaAnalyzer {
public:
    SchemaAnalyzer() = default;
    explicit SchemaAnalyzer(RelationshipInferenceEngine::Config config);

    /**
     * @brief Infer relationships and build the graph for @p schema
     *
     * Logs progress and one warning per dangling declared reference.
     */
    [[nodiscard]] AnalysisResult analyze(const SchemaModel& schema);

    /**
     * @brief Relationships only
     * @param schema Schema to analyze, or nullptr for the last one used
     * @throws std::invalid_argument if nullptr and no schema was analyzed yet
     */
    [[nodiscard]] RelationshipMap infer_relationships_only(const SchemaModel* schema = nullptr);

    /**
     * @brief Graph only
     * @param schema Schema, or nullptr for the last one used
     * @param relationships Relationships, or nullptr: the last map when the
     *        last schema is used, freshly inferred otherwise
     * @throws std::invalid_argument if no schema is available
     */
    [[nodiscard]] SchemaGraph build_graph_only(const SchemaModel* schema = nullptr,
                                               const RelationshipMap* relationships = nullptr);

    [[nodiscard]] const std::optional<SchemaModel>& last_schema() const { return last_schema_; }
    [[nodiscard]] const std::optional<RelationshipMap>& last_relationships() const { return last_relationships_; }

    [[nodiscard]] const RelationshipInferenceEngine& engine() const { return engine_; }

private:
    RelationshipInferenceEngine engine_;
    std::optional<SchemaModel> last_schema_;
    std::optional<RelationshipMap> last_relationships_;
};

/**
 * @brief Database type for a description: @p override_type, else the
 *        document's own database_type, else @p fallback
 * @throws std::runtime_error for an unknown type name
 */
[[nodiscard]] DatabaseType resolve_database_type(const SchemaDescription& description,
                                                 const std::optional<std::string>& override_type,
                                                 DatabaseType fallback = DatabaseType::POSTGRESQL);

/**
 * @brief Validate @p description with the dialect registered for @p type
 * @throws InvalidSchemaError, or std::runtime_error when no dialect is registered
 */
[[nodiscard]] SchemaModel load_schema_model(const SchemaDescription& description,
                                            const DialectRegistry& registry,
                                            DatabaseType type);

} // namespace schemagraph
