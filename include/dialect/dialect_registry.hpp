#pragma once

#include "dialect/idialect.hpp"
#include "core/database_type.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace schemagraph {

/**
 * @brief Registration table for database dialects
 *
 * An ordinary value owned by whoever needs it; there is no process-wide
 * instance. Two analyses running side by side can use different tables.
 *
 * Usage:
 *   auto registry = DialectRegistry::with_builtin_dialects();
 *   registry.register_dialect(DatabaseType::DB2,
 *       [] { return std::make_unique<MyDb2Dialect>(); });
 *   auto dialect = registry.create(DatabaseType::DB2);
 */
class DialectRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDialect>()>;

    DialectRegistry() = default;

    /**
     * @brief Registry pre-populated with every dialect shipped here
     *
     * postgresql, redshift -> PgDialect; mysql -> MysqlDialect;
     * mssql, sybase -> MssqlDialect; oracle -> OracleDialect;
     * db2, generic -> GenericDialect.
     */
    [[nodiscard]] static DialectRegistry with_builtin_dialects();

    /** @brief Register or replace the factory for a database type */
    void register_dialect(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /**
     * @brief Instantiate the dialect for a database type
     * @throws std::runtime_error if nothing is registered for @p type
     */
    [[nodiscard]] std::unique_ptr<IDialect> create(DatabaseType type) const;

    [[nodiscard]] bool has_dialect(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

    /** @brief Registered types in enum order */
    [[nodiscard]] std::vector<DatabaseType> registered_types() const;

private:
    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace schemagraph
