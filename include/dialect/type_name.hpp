#pragma once

#include "core/type_class.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace schemagraph {

/**
 * @brief A declared type split into its base name and parameters
 *
 * "NUMBER(10, 2)"          -> base "number", params {"10", "2"}
 * "int(11) unsigned"       -> base "int", params {"11"}
 * "character varying(64)"  -> base "character varying", params {"64"}
 * "integer[]"              -> base "integer", is_array
 */
struct NormalizedType {
    std::string base;
    std::vector<std::string> params;
    bool is_array = false;
};

/**
 * @brief Lower-case, drop parameter lists and sign/zerofill modifiers,
 *        collapse whitespace.
 */
[[nodiscard]] NormalizedType normalize_type_name(std::string_view declared_type);

/**
 * @brief Keyword-based classification shared by every dialect as fallback
 * @param base Normalized base type name
 */
[[nodiscard]] TypeClass classify_generic(const std::string& base);

} // namespace schemagraph
