#include "dialect/mssql_dialect.hpp"
#include "dialect/type_name.hpp"

#include <string>
#include <unordered_map>

namespace schemagraph {

std::string_view MssqlDialect::display_name() const {
    return type_ == DatabaseType::SYBASE ? "Sybase/SAP ASE" : "MS SQL Server";
}

uint16_t MssqlDialect::default_port() const {
    return type_ == DatabaseType::SYBASE ? 5000 : 1433;
}

TypeClass MssqlDialect::classify(std::string_view declared_type) const {
    static const std::unordered_map<std::string, TypeClass> TYPE_CLASSES = {
        {"tinyint", TypeClass::INTEGER},
        {"smallint", TypeClass::INTEGER},
        {"int", TypeClass::INTEGER},
        {"integer", TypeClass::INTEGER},
        {"bigint", TypeClass::INTEGER},
        {"char", TypeClass::STRING},
        {"varchar", TypeClass::STRING},
        {"text", TypeClass::STRING},
        {"nchar", TypeClass::STRING},
        {"nvarchar", TypeClass::STRING},
        {"ntext", TypeClass::STRING},
        {"sysname", TypeClass::STRING},
        {"univarchar", TypeClass::STRING},
        {"unichar", TypeClass::STRING},
        {"uniqueidentifier", TypeClass::UUID},
        {"date", TypeClass::TEMPORAL},
        {"time", TypeClass::TEMPORAL},
        {"datetime", TypeClass::TEMPORAL},
        {"datetime2", TypeClass::TEMPORAL},
        {"smalldatetime", TypeClass::TEMPORAL},
        {"datetimeoffset", TypeClass::TEMPORAL},
        {"bigdatetime", TypeClass::TEMPORAL},
        {"bit", TypeClass::OTHER},
        {"decimal", TypeClass::OTHER},
        {"numeric", TypeClass::OTHER},
        {"money", TypeClass::OTHER},
        {"smallmoney", TypeClass::OTHER},
        {"float", TypeClass::OTHER},
        {"real", TypeClass::OTHER},
        {"binary", TypeClass::OTHER},
        {"varbinary", TypeClass::OTHER},
        {"image", TypeClass::OTHER},
        {"xml", TypeClass::OTHER},
        {"timestamp", TypeClass::OTHER},    // rowversion, not a point in time
        {"rowversion", TypeClass::OTHER},
        {"sql_variant", TypeClass::OTHER},
    };

    const auto normalized = normalize_type_name(declared_type);
    const auto it = TYPE_CLASSES.find(normalized.base);
    return it != TYPE_CLASSES.end() ? it->second : classify_generic(normalized.base);
}

} // namespace schemagraph
