#include "inference/confidence_scorer.hpp"
#include "inference/name_matching.hpp"
#include "dialect/type_name.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace schemagraph {

namespace {

bool starts_with_tokens(const std::vector<std::string>& tokens,
                        const std::vector<std::string>& marker) {
    return !marker.empty() && tokens.size() >= marker.size() &&
           std::equal(marker.begin(), marker.end(), tokens.begin());
}

bool ends_with_tokens(const std::vector<std::string>& tokens,
                      const std::vector<std::string>& marker) {
    return !marker.empty() && tokens.size() >= marker.size() &&
           std::equal(marker.rbegin(), marker.rend(), tokens.rbegin());
}

bool same_declared_type(const std::string& a, const std::string& b) {
    return normalize_type_name(a).base == normalize_type_name(b).base;
}

} // anonymous namespace

ConfidenceScorer::ConfidenceScorer(Config config)
    : config_(std::move(config)) {
    for (auto& name : config_.generic_names) {
        name = utils::to_lower(name);
    }
    marker_tokens_.reserve(config_.hierarchical_markers.size());
    for (const auto& marker : config_.hierarchical_markers) {
        auto tokens = naming::tokenize(marker);
        if (!tokens.empty()) {
            marker_tokens_.push_back(std::move(tokens));
        }
    }
}

bool ConfidenceScorer::is_generic_name(std::string_view column_name) const {
    const std::string lower = utils::to_lower(column_name);
    if (std::find(config_.generic_names.begin(), config_.generic_names.end(), lower)
            != config_.generic_names.end()) {
        return true;
    }
    return naming::entity_stem(column_name).empty();
}

bool ConfidenceScorer::is_hierarchical_name(std::string_view column_name) const {
    const auto tokens = naming::entity_tokens(column_name);
    return std::any_of(marker_tokens_.begin(), marker_tokens_.end(),
        [&tokens](const std::vector<std::string>& marker) {
            return starts_with_tokens(tokens, marker) || ends_with_tokens(tokens, marker);
        });
}

double ConfidenceScorer::name_similarity(std::string_view column_name,
                                         std::string_view table_name,
                                         std::string_view key_name) {
    const std::string stem = naming::entity_stem(column_name);
    if (stem.empty()) {
        return 0.0;
    }

    const auto variants = naming::table_name_variants(table_name);
    const std::string key_stem = naming::entity_stem(key_name);

    // Without a key marker ("cost", "hooks") only an exact entity name counts
    if (!naming::has_key_marker(column_name)) {
        const bool names_entity = stem == key_stem ||
            std::find(variants.begin(), variants.end(), stem) != variants.end();
        return names_entity ? 1.0 : 0.0;
    }

    double best = 0.0;
    for (const auto& variant : variants) {
        best = std::max(best, naming::similarity_ratio(stem, variant));
    }
    if (!key_stem.empty()) {
        best = std::max(best, naming::similarity_ratio(stem, key_stem));
    }

    auto column_tokens = naming::entity_tokens(column_name);
    auto table_tokens = naming::tokenize(table_name);
    for (auto& t : column_tokens) t = naming::singular(t);
    for (auto& t : table_tokens) t = naming::singular(t);
    best = std::max(best, naming::token_overlap(column_tokens, table_tokens));

    return std::clamp(best, 0.0, 1.0);
}

double ConfidenceScorer::pattern_score(double similarity) const {
    const double span = 1.0 - config_.min_similarity;
    if (span <= 0.0) {
        return config_.pattern_max_score;
    }
    const double t = std::clamp((similarity - config_.min_similarity) / span, 0.0, 1.0);
    return config_.pattern_min_score + (config_.pattern_max_score - config_.pattern_min_score) * t;
}

std::optional<ScoredCandidate> ConfidenceScorer::score(
    const ColumnInfo& source_column,
    const TableInfo& source_table,
    const TableInfo& target_table,
    const ColumnInfo& target_key) const {

    if (is_generic_name(source_column.name)) {
        return std::nullopt;
    }

    // Type gate
    if (source_column.type_class != target_key.type_class) {
        return std::nullopt;
    }

    if (source_table.name == target_table.name) {
        if (source_column.name == target_key.name || !is_hierarchical_name(source_column.name)) {
            return std::nullopt;
        }
        const double s = naming::has_key_suffix(source_column.name)
            ? config_.hierarchical_score
            : config_.hierarchical_bare_score;
        return ScoredCandidate{std::clamp(s, 0.0, 1.0), Basis::HIERARCHICAL};
    }

    const std::string stem = naming::entity_stem(source_column.name);
    const auto variants = naming::table_name_variants(target_table.name);
    const bool stem_names_table = std::find(variants.begin(), variants.end(), stem) != variants.end();

    if (stem_names_table &&
        utils::to_lower(source_column.name) == utils::to_lower(target_key.name)) {
        const double s = same_declared_type(source_column.declared_type, target_key.declared_type)
            ? config_.exact_typed_score
            : config_.exact_score;
        return ScoredCandidate{std::clamp(s, 0.0, 1.0), Basis::EXACT_MATCH};
    }

    const double similarity = name_similarity(source_column.name, target_table.name, target_key.name);
    if (similarity < config_.min_similarity) {
        return std::nullopt;
    }
    return ScoredCandidate{std::clamp(pattern_score(similarity), 0.0, 1.0), Basis::PATTERN_MATCH};
}

} // namespace schemagraph
