#include "dialect/generic_dialect.hpp"
#include "dialect/type_name.hpp"

namespace schemagraph {

std::string_view GenericDialect::display_name() const {
    return type_ == DatabaseType::DB2 ? "IBM DB2" : "Generic SQL";
}

uint16_t GenericDialect::default_port() const {
    return type_ == DatabaseType::DB2 ? 50000 : 0;
}

TypeClass GenericDialect::classify(std::string_view declared_type) const {
    const auto normalized = normalize_type_name(declared_type);
    if (normalized.is_array) {
        return TypeClass::OTHER;
    }
    return classify_generic(normalized.base);
}

} // namespace schemagraph
