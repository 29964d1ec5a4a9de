#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace schemagraph::naming {

/**
 * @brief Split an identifier into lower-case words
 *
 * Splits on '_', '-', '.', ' ' and on lower→upper camelCase boundaries:
 * "parentCategory_ID" -> {"parent", "category", "id"}.
 */
[[nodiscard]] std::vector<std::string> tokenize(std::string_view identifier);

/**
 * @brief Lower-case and remove separators: "Order_Items" -> "orderitems"
 */
[[nodiscard]] std::string normalize(std::string_view identifier);

/**
 * @brief Entity stem of a column name
 *
 * Lower-cases, strips one known key suffix ("_id", "_key", "_fk", or a bare
 * "id" when at least three characters remain), then removes separators.
 * "customer_id" -> "customer", "CustomerID" -> "customer", "id" -> "".
 */
[[nodiscard]] std::string entity_stem(std::string_view column_name);

/**
 * @brief Tokens of a column name minus a trailing key-suffix token
 *        ("id", "key", "fk")
 */
[[nodiscard]] std::vector<std::string> entity_tokens(std::string_view column_name);

/** @brief True when the column name ends in a key-suffix token */
[[nodiscard]] bool has_key_suffix(std::string_view column_name);

/**
 * @brief True when entity_stem() strips a key marker from the name
 *        ("customer_id", "CustomerID"; not "cost" or "hooks")
 */
[[nodiscard]] bool has_key_marker(std::string_view column_name);

/** @brief Simple English singular: "categories" -> "category", "boxes" -> "box" */
[[nodiscard]] std::string singular(const std::string& word);

/** @brief Simple English plural: "category" -> "categories", "box" -> "boxes" */
[[nodiscard]] std::string plural(const std::string& word);

/**
 * @brief Normalized spellings a column stem may use to refer to a table:
 *        the name itself, its singular and its plural (deduplicated, in that
 *        order)
 */
[[nodiscard]] std::vector<std::string> table_name_variants(std::string_view table_name);

/** @brief Classic Levenshtein edit distance */
[[nodiscard]] size_t edit_distance(std::string_view a, std::string_view b);

/**
 * @brief 1 - edit_distance / max(len); 1.0 for two empty strings
 */
[[nodiscard]] double similarity_ratio(std::string_view a, std::string_view b);

/**
 * @brief |a ∩ b| / max(|a|, |b|) over word sets; 0.0 if either is empty
 */
[[nodiscard]] double token_overlap(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b);

} // namespace schemagraph::naming
