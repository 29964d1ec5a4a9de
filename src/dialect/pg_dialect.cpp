#include "dialect/pg_dialect.hpp"
#include "dialect/type_name.hpp"

#include <string>
#include <unordered_map>

namespace schemagraph {

std::string_view PgDialect::display_name() const {
    return type_ == DatabaseType::REDSHIFT ? "Amazon Redshift" : "PostgreSQL";
}

uint16_t PgDialect::default_port() const {
    return type_ == DatabaseType::REDSHIFT ? 5439 : 5432;
}

TypeClass PgDialect::classify(std::string_view declared_type) const {
    static const std::unordered_map<std::string, TypeClass> TYPE_CLASSES = {
        {"integer", TypeClass::INTEGER},    {"int4", TypeClass::INTEGER},
        {"smallint", TypeClass::INTEGER},   {"int2", TypeClass::INTEGER},
        {"bigint", TypeClass::INTEGER},     {"int8", TypeClass::INTEGER},
        {"serial", TypeClass::INTEGER},     {"serial4", TypeClass::INTEGER},
        {"smallserial", TypeClass::INTEGER},{"serial2", TypeClass::INTEGER},
        {"bigserial", TypeClass::INTEGER},  {"serial8", TypeClass::INTEGER},
        {"oid", TypeClass::INTEGER},
        {"text", TypeClass::STRING},
        {"varchar", TypeClass::STRING},     {"character varying", TypeClass::STRING},
        {"char", TypeClass::STRING},        {"character", TypeClass::STRING},
        {"bpchar", TypeClass::STRING},      {"citext", TypeClass::STRING},
        {"name", TypeClass::STRING},
        {"uuid", TypeClass::UUID},
        {"date", TypeClass::TEMPORAL},
        {"time", TypeClass::TEMPORAL},      {"time without time zone", TypeClass::TEMPORAL},
        {"timetz", TypeClass::TEMPORAL},    {"time with time zone", TypeClass::TEMPORAL},
        {"timestamp", TypeClass::TEMPORAL}, {"timestamp without time zone", TypeClass::TEMPORAL},
        {"timestamptz", TypeClass::TEMPORAL}, {"timestamp with time zone", TypeClass::TEMPORAL},
        {"interval", TypeClass::TEMPORAL},
        {"numeric", TypeClass::OTHER},      {"decimal", TypeClass::OTHER},
        {"real", TypeClass::OTHER},         {"float4", TypeClass::OTHER},
        {"double precision", TypeClass::OTHER}, {"float8", TypeClass::OTHER},
        {"money", TypeClass::OTHER},
        {"boolean", TypeClass::OTHER},      {"bool", TypeClass::OTHER},
        {"bytea", TypeClass::OTHER},
        {"json", TypeClass::OTHER},         {"jsonb", TypeClass::OTHER},
        {"inet", TypeClass::OTHER},         {"cidr", TypeClass::OTHER},
        {"macaddr", TypeClass::OTHER},      {"xml", TypeClass::OTHER},
        {"point", TypeClass::OTHER},        {"tsvector", TypeClass::OTHER},
        {"user-defined", TypeClass::OTHER},
    };

    const auto normalized = normalize_type_name(declared_type);
    if (normalized.is_array) {
        return TypeClass::OTHER;
    }

    const auto it = TYPE_CLASSES.find(normalized.base);
    return it != TYPE_CLASSES.end() ? it->second : classify_generic(normalized.base);
}

} // namespace schemagraph
