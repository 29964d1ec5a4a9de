#include "analysis/schema_analyzer.hpp"
#include "graph/graph_builder.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace schemagraph {

namespace {

void count_relationships(const RelationshipMap& relationships, AnalysisStats& stats) {
    for (const auto& [table, entry] : relationships) {
        for (const auto& rel : entry.foreign_keys) {
            if (is_inferred(rel.basis)) {
                ++stats.inferred_count;
            } else {
                ++stats.declared_count;
            }
        }
    }
}

} // anonymous namespace

SchemaAnalyzer::SchemaAnalyzer(RelationshipInferenceEngine::Config config)
    : engine_(std::move(config)) {}

AnalysisResult SchemaAnalyzer::analyze(const SchemaModel& schema) {
    utils::Timer timer;
    utils::log::info(std::format("Analyzing schema '{}' ({}): {} tables, {} columns",
        schema.database(), database_type_to_string(schema.database_type()),
        schema.table_count(), schema.column_count()));

    AnalysisResult result;
    result.schema = schema;
    result.relationships = engine_.infer(schema);
    result.graph = SchemaGraphBuilder{}.build(schema, result.relationships);
    result.warnings = collect_dangling_references(schema, result.relationships);

    for (const auto& warning : result.warnings) {
        utils::log::warn(warning.message());
    }

    auto& stats = result.stats;
    stats.table_count = schema.table_count();
    stats.column_count = schema.column_count();
    count_relationships(result.relationships, stats);
    stats.dangling_count = result.warnings.size();
    stats.elapsed = timer.elapsed_us();

    utils::log::info(std::format("Found {} declared and {} inferred relationships; graph has {} nodes, {} edges ({} us)",
        stats.declared_count, stats.inferred_count,
        result.graph.node_count(), result.graph.edge_count(), stats.elapsed.count()));

    last_schema_ = schema;
    last_relationships_ = result.relationships;
    return result;
}

RelationshipMap SchemaAnalyzer::infer_relationships_only(const SchemaModel* schema) {
    if (!schema) {
        if (!last_schema_) {
            throw std::invalid_argument("No schema provided and no previous schema available");
        }
        schema = &*last_schema_;
    } else {
        last_schema_ = *schema;
    }

    auto relationships = engine_.infer(*last_schema_);
    utils::log::debug(std::format("Inferred relationships for {} tables", relationships.size()));
    last_relationships_ = relationships;
    return relationships;
}

SchemaGraph SchemaAnalyzer::build_graph_only(const SchemaModel* schema,
                                             const RelationshipMap* relationships) {
    const bool reuse_last = (schema == nullptr);
    if (reuse_last) {
        if (!last_schema_) {
            throw std::invalid_argument("No schema provided and no previous schema available");
        }
        schema = &*last_schema_;
    }

    if (relationships) {
        return SchemaGraphBuilder{}.build(*schema, *relationships);
    }
    if (reuse_last && last_relationships_) {
        return SchemaGraphBuilder{}.build(*schema, *last_relationships_);
    }

    const auto inferred = engine_.infer(*schema);
    return SchemaGraphBuilder{}.build(*schema, inferred);
}

// ============================================================================
// Loading
// ============================================================================

DatabaseType resolve_database_type(const SchemaDescription& description,
                                   const std::optional<std::string>& override_type,
                                   DatabaseType fallback) {
    if (override_type && !override_type->empty()) {
        return parse_database_type(*override_type);
    }
    if (description.database_type && !description.database_type->empty()) {
        return parse_database_type(*description.database_type);
    }
    return fallback;
}

SchemaModel load_schema_model(const SchemaDescription& description,
                              const DialectRegistry& registry,
                              DatabaseType type) {
    const auto dialect = registry.create(type);
    utils::log::debug(std::format("Normalizing column types with the {} dialect", dialect->display_name()));
    return SchemaModel::build(description, *dialect);
}

} // namespace schemagraph
