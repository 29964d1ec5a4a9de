#include "dialect/dialect_registry.hpp"
#include "dialect/pg_dialect.hpp"
#include "dialect/mysql_dialect.hpp"
#include "dialect/mssql_dialect.hpp"
#include "dialect/oracle_dialect.hpp"
#include "dialect/generic_dialect.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace schemagraph {

DialectRegistry DialectRegistry::with_builtin_dialects() {
    DialectRegistry registry;

    registry.register_dialect(DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgDialect>(DatabaseType::POSTGRESQL); });
    registry.register_dialect(DatabaseType::REDSHIFT,
        [] { return std::make_unique<PgDialect>(DatabaseType::REDSHIFT); });
    registry.register_dialect(DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlDialect>(); });
    registry.register_dialect(DatabaseType::MSSQL,
        [] { return std::make_unique<MssqlDialect>(DatabaseType::MSSQL); });
    registry.register_dialect(DatabaseType::SYBASE,
        [] { return std::make_unique<MssqlDialect>(DatabaseType::SYBASE); });
    registry.register_dialect(DatabaseType::ORACLE,
        [] { return std::make_unique<OracleDialect>(); });
    registry.register_dialect(DatabaseType::DB2,
        [] { return std::make_unique<GenericDialect>(DatabaseType::DB2); });
    registry.register_dialect(DatabaseType::GENERIC,
        [] { return std::make_unique<GenericDialect>(DatabaseType::GENERIC); });

    return registry;
}

std::unique_ptr<IDialect> DialectRegistry::create(DatabaseType type) const {
    const auto it = factories_.find(type);
    if (it == factories_.end()) {
        throw std::runtime_error(std::format(
            "No dialect registered for database type: {}", database_type_to_string(type)));
    }
    return it->second();
}

std::vector<DatabaseType> DialectRegistry::registered_types() const {
    std::vector<DatabaseType> types;
    types.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end(), [](DatabaseType a, DatabaseType b) {
        return static_cast<int>(a) < static_cast<int>(b);
    });
    return types;
}

} // namespace schemagraph
