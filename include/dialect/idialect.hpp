#pragma once

#include "core/database_type.hpp"
#include "core/type_class.hpp"
#include <cstdint>
#include <string_view>

namespace schemagraph {

/**
 * @brief Per-database capability: knows the vendor's type vocabulary
 *
 * Each database family (PostgreSQL, MySQL, MSSQL, Oracle, ...) provides a
 * concrete implementation. Connectivity stays with the extraction tooling;
 * a dialect only interprets what the catalog reported.
 *
 * Usage:
 *   auto registry = DialectRegistry::with_builtin_dialects();
 *   auto dialect = registry.create(DatabaseType::POSTGRESQL);
 *   TypeClass tc = dialect->classify("character varying(64)");
 */
class IDialect {
public:
    virtual ~IDialect() = default;

    /** @brief Database type this dialect describes */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Human readable name ("PostgreSQL", "MS SQL Server") */
    [[nodiscard]] virtual std::string_view display_name() const = 0;

    /** @brief Conventional server port, 0 when there is none */
    [[nodiscard]] virtual uint16_t default_port() const = 0;

    /**
     * @brief Map a declared column type to its coarse type class
     * @param declared_type Type as reported by the catalog, any case,
     *        with or without parameters ("VARCHAR(100)", "int(11) unsigned")
     */
    [[nodiscard]] virtual TypeClass classify(std::string_view declared_type) const = 0;
};

} // namespace schemagraph
