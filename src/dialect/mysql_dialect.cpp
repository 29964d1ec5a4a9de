#include "dialect/mysql_dialect.hpp"
#include "dialect/type_name.hpp"

#include <string>
#include <unordered_map>

namespace schemagraph {

TypeClass MysqlDialect::classify(std::string_view declared_type) const {
    static const std::unordered_map<std::string, TypeClass> TYPE_CLASSES = {
        {"tinyint", TypeClass::INTEGER},
        {"smallint", TypeClass::INTEGER},
        {"mediumint", TypeClass::INTEGER},
        {"int", TypeClass::INTEGER},
        {"integer", TypeClass::INTEGER},
        {"bigint", TypeClass::INTEGER},
        {"year", TypeClass::INTEGER},
        {"float", TypeClass::OTHER},
        {"double", TypeClass::OTHER},
        {"decimal", TypeClass::OTHER},
        {"numeric", TypeClass::OTHER},
        {"char", TypeClass::STRING},
        {"varchar", TypeClass::STRING},
        {"text", TypeClass::STRING},
        {"tinytext", TypeClass::STRING},
        {"mediumtext", TypeClass::STRING},
        {"longtext", TypeClass::STRING},
        {"enum", TypeClass::STRING},
        {"set", TypeClass::STRING},
        {"blob", TypeClass::OTHER},
        {"tinyblob", TypeClass::OTHER},
        {"mediumblob", TypeClass::OTHER},
        {"longblob", TypeClass::OTHER},
        {"binary", TypeClass::OTHER},
        {"varbinary", TypeClass::OTHER},
        {"date", TypeClass::TEMPORAL},
        {"time", TypeClass::TEMPORAL},
        {"datetime", TypeClass::TEMPORAL},
        {"timestamp", TypeClass::TEMPORAL},
        {"boolean", TypeClass::OTHER},
        {"bool", TypeClass::OTHER},
        {"json", TypeClass::OTHER},
        {"bit", TypeClass::OTHER},
        {"geometry", TypeClass::OTHER},
    };

    const auto normalized = normalize_type_name(declared_type);

    // tinyint(1) is MySQL's boolean
    if (normalized.base == "tinyint" && normalized.params.size() == 1 &&
        normalized.params.front() == "1") {
        return TypeClass::OTHER;
    }

    const auto it = TYPE_CLASSES.find(normalized.base);
    return it != TYPE_CLASSES.end() ? it->second : classify_generic(normalized.base);
}

} // namespace schemagraph
