#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace schemagraph {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

InputConfig extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;

    cfg.database_type = toml_optional_string(*input, "database_type");
    return cfg;
}

InferenceSettings extract_inference(const toml::table& root) {
    InferenceSettings cfg;
    const auto* inference = root["inference"].as_table();
    if (!inference) return cfg;
    const auto& i = *inference;

    cfg.min_similarity = i["min_similarity"].value_or(cfg.min_similarity);
    cfg.min_confidence = i["min_confidence"].value_or(cfg.min_confidence);
    cfg.generic_names = toml_string_array(i, "generic_names");
    cfg.hierarchical_markers = toml_string_array(i, "hierarchical_markers");
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    cfg.directory = o["directory"].value_or(cfg.directory);
    cfg.relationships_file = o["relationships_file"].value_or(cfg.relationships_file);
    cfg.relationships_json_file = o["relationships_json_file"].value_or(cfg.relationships_json_file);
    cfg.graph_file = o["graph_file"].value_or(cfg.graph_file);
    cfg.write_json_relationships = o["write_json_relationships"].value_or(cfg.write_json_relationships);
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.logging = extract_logging(tbl);
    config.input = extract_input(tbl);
    config.inference = extract_inference(tbl);
    config.output = extract_output(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    if (config.input.database_type) {
        try {
            (void)parse_database_type(*config.input.database_type);
        } catch (const std::runtime_error& e) {
            errors.push_back(std::format("input.database_type: {}", e.what()));
        }
    }

    const auto& inf = config.inference;
    if (!(inf.min_similarity > 0.0 && inf.min_similarity < 1.0)) {
        errors.push_back(std::format("inference.min_similarity must be in (0, 1), got {}", inf.min_similarity));
    }
    if (!(inf.min_confidence >= 0.0 && inf.min_confidence <= 1.0)) {
        errors.push_back(std::format("inference.min_confidence must be in [0, 1], got {}", inf.min_confidence));
    }
    for (size_t i = 0; i < inf.generic_names.size(); ++i) {
        if (utils::trim(inf.generic_names[i]).empty()) {
            errors.push_back(std::format("inference.generic_names[{}] must not be empty", i));
        }
    }
    for (size_t i = 0; i < inf.hierarchical_markers.size(); ++i) {
        if (utils::trim(inf.hierarchical_markers[i]).empty()) {
            errors.push_back(std::format("inference.hierarchical_markers[{}] must not be empty", i));
        }
    }

    const auto& out = config.output;
    if (out.directory.empty()) {
        errors.emplace_back("output.directory must not be empty");
    }
    if (out.relationships_file.empty()) {
        errors.emplace_back("output.relationships_file must not be empty");
    }
    if (out.relationships_json_file.empty()) {
        errors.emplace_back("output.relationships_json_file must not be empty");
    }
    if (out.graph_file.empty()) {
        errors.emplace_back("output.graph_file must not be empty");
    }

    return errors;
}

// ============================================================================
// Derived settings
// ============================================================================

RelationshipInferenceEngine::Config make_inference_config(const InferenceSettings& settings) {
    RelationshipInferenceEngine::Config cfg;
    cfg.min_confidence = settings.min_confidence;
    cfg.scorer.min_similarity = settings.min_similarity;

    auto& generic = cfg.scorer.generic_names;
    for (const auto& name : settings.generic_names) {
        const std::string lower = utils::to_lower(utils::trim(name));
        if (!lower.empty() && std::find(generic.begin(), generic.end(), lower) == generic.end()) {
            generic.push_back(lower);
        }
    }

    auto& markers = cfg.scorer.hierarchical_markers;
    for (const auto& marker : settings.hierarchical_markers) {
        const std::string lower = utils::to_lower(utils::trim(marker));
        if (!lower.empty() && std::find(markers.begin(), markers.end(), lower) == markers.end()) {
            markers.push_back(lower);
        }
    }
    return cfg;
}

std::string expand_file_pattern(std::string_view pattern, std::string_view database) {
    constexpr std::string_view kPlaceholder = "{db}";
    std::string result;
    result.reserve(pattern.size() + database.size());

    size_t pos = 0;
    while (pos < pattern.size()) {
        const size_t hit = pattern.find(kPlaceholder, pos);
        if (hit == std::string_view::npos) {
            result.append(pattern.substr(pos));
            break;
        }
        result.append(pattern.substr(pos, hit - pos));
        result.append(database);
        pos = hit + kPlaceholder.size();
    }
    return result;
}

} // namespace schemagraph
