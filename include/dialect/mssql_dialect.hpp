#pragma once

#include "dialect/idialect.hpp"

namespace schemagraph {

/**
 * @brief Transact-SQL type vocabulary (MS SQL Server, Sybase/SAP ASE)
 */
class MssqlDialect : public IDialect {
public:
    explicit MssqlDialect(DatabaseType type = DatabaseType::MSSQL) : type_(type) {}

    [[nodiscard]] DatabaseType type() const override { return type_; }
    [[nodiscard]] std::string_view display_name() const override;
    [[nodiscard]] uint16_t default_port() const override;
    [[nodiscard]] TypeClass classify(std::string_view declared_type) const override;

private:
    DatabaseType type_;
};

} // namespace schemagraph
