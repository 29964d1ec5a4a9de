#pragma once

#include <optional>
#include <string>
#include <vector>

namespace schemagraph {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

struct InputConfig {
    // Used when neither the command line nor the schema document names one
    std::optional<std::string> database_type;
};

struct InferenceSettings {
    double min_similarity = 0.75;
    double min_confidence = 0.0;
    std::vector<std::string> generic_names;         // Appended to the built-in list
    std::vector<std::string> hierarchical_markers;  // Appended to the built-in list
};

struct OutputConfig {
    std::string directory = "output";
    // "{db}" is replaced by the database name
    std::string relationships_file = "{db}_inferred_relationships.yaml";
    std::string relationships_json_file = "{db}_inferred_relationships.json";
    std::string graph_file = "{db}_schema_graph.json";
    bool write_json_relationships = false;
};

struct AppConfig {
    LoggingConfig logging;
    InputConfig input;
    InferenceSettings inference;
    OutputConfig output;
};

} // namespace schemagraph
