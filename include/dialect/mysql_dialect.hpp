#pragma once

#include "dialect/idialect.hpp"

namespace schemagraph {

/**
 * @brief MySQL / MariaDB type vocabulary
 */
class MysqlDialect : public IDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }
    [[nodiscard]] std::string_view display_name() const override { return "MySQL"; }
    [[nodiscard]] uint16_t default_port() const override { return 3306; }
    [[nodiscard]] TypeClass classify(std::string_view declared_type) const override;
};

} // namespace schemagraph
