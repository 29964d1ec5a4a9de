#include "dialect/oracle_dialect.hpp"
#include "dialect/type_name.hpp"

#include <string>
#include <unordered_map>

namespace schemagraph {

TypeClass OracleDialect::classify(std::string_view declared_type) const {
    static const std::unordered_map<std::string, TypeClass> TYPE_CLASSES = {
        {"integer", TypeClass::INTEGER},
        {"int", TypeClass::INTEGER},
        {"smallint", TypeClass::INTEGER},
        {"pls_integer", TypeClass::INTEGER},
        {"binary_integer", TypeClass::INTEGER},
        {"varchar2", TypeClass::STRING},
        {"nvarchar2", TypeClass::STRING},
        {"varchar", TypeClass::STRING},
        {"char", TypeClass::STRING},
        {"nchar", TypeClass::STRING},
        {"clob", TypeClass::STRING},
        {"nclob", TypeClass::STRING},
        {"long", TypeClass::STRING},
        {"date", TypeClass::TEMPORAL},
        {"timestamp", TypeClass::TEMPORAL},
        {"timestamp with time zone", TypeClass::TEMPORAL},
        {"timestamp with local time zone", TypeClass::TEMPORAL},
        {"float", TypeClass::OTHER},
        {"binary_float", TypeClass::OTHER},
        {"binary_double", TypeClass::OTHER},
        {"blob", TypeClass::OTHER},
        {"bfile", TypeClass::OTHER},
        {"long raw", TypeClass::OTHER},
        {"rowid", TypeClass::OTHER},
        {"urowid", TypeClass::OTHER},
        {"xmltype", TypeClass::OTHER},
    };

    const auto normalized = normalize_type_name(declared_type);

    if (normalized.base == "number") {
        // NUMBER, NUMBER(p), NUMBER(p,0) -> integer; NUMBER(p,s) with s > 0 -> other
        if (normalized.params.size() < 2 || normalized.params[1] == "0") {
            return TypeClass::INTEGER;
        }
        return TypeClass::OTHER;
    }

    if (normalized.base == "raw") {
        const bool guid_sized = normalized.params.size() == 1 && normalized.params.front() == "16";
        return guid_sized ? TypeClass::UUID : TypeClass::OTHER;
    }

    const auto it = TYPE_CLASSES.find(normalized.base);
    return it != TYPE_CLASSES.end() ? it->second : classify_generic(normalized.base);
}

} // namespace schemagraph
