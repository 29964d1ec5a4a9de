#pragma once

#include <cstdint>

namespace schemagraph {

/**
 * @brief Database-agnostic coarse type classification
 *
 * Dialects map vendor type names ("int4", "VARCHAR2(30)", "uniqueidentifier")
 * into one of these buckets. Relationship inference only pairs columns of the
 * same class.
 */
enum class TypeClass : uint8_t {
    INTEGER,
    STRING,
    UUID,
    TEMPORAL,
    OTHER,
};

[[nodiscard]] inline const char* type_class_to_string(TypeClass type) {
    switch (type) {
        case TypeClass::INTEGER: return "integer";
        case TypeClass::STRING: return "string";
        case TypeClass::UUID: return "uuid";
        case TypeClass::TEMPORAL: return "temporal";
        case TypeClass::OTHER: return "other";
    }
    return "other";
}

} // namespace schemagraph
