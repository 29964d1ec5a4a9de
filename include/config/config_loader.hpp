#pragma once

#include "config/config_types.hpp"
#include "inference/relationship_inference.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace schemagraph {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to schemagraph.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem in @p config, each naming its key
     *        ("inference.min_similarity must be in (0, 1), got 1.5")
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoadResult validate_and_return(AppConfig config);
};

// ============================================================================
// Derived settings
// ============================================================================

/**
 * @brief Engine configuration: built-in scorer defaults plus the configured
 *        thresholds and extra generic names / hierarchical markers
 */
[[nodiscard]] RelationshipInferenceEngine::Config make_inference_config(const InferenceSettings& settings);

/** @brief Replace every "{db}" in @p pattern with @p database */
[[nodiscard]] std::string expand_file_pattern(std::string_view pattern, std::string_view database);

} // namespace schemagraph
