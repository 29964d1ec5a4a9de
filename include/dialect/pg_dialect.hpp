#pragma once

#include "dialect/idialect.hpp"

namespace schemagraph {

/**
 * @brief PostgreSQL type vocabulary
 *
 * Also serves Amazon Redshift, whose catalog reports PostgreSQL type names.
 */
class PgDialect : public IDialect {
public:
    explicit PgDialect(DatabaseType type = DatabaseType::POSTGRESQL) : type_(type) {}

    [[nodiscard]] DatabaseType type() const override { return type_; }
    [[nodiscard]] std::string_view display_name() const override;
    [[nodiscard]] uint16_t default_port() const override;
    [[nodiscard]] TypeClass classify(std::string_view declared_type) const override;

private:
    DatabaseType type_;
};

} // namespace schemagraph
