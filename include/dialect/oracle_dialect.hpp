#pragma once

#include "dialect/idialect.hpp"

namespace schemagraph {

/**
 * @brief Oracle type vocabulary
 *
 * NUMBER without a fractional scale is treated as integer-like since that is
 * how Oracle schemas spell surrogate keys. RAW(16) is the usual GUID column.
 */
class OracleDialect : public IDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::ORACLE; }
    [[nodiscard]] std::string_view display_name() const override { return "Oracle Database"; }
    [[nodiscard]] uint16_t default_port() const override { return 1521; }
    [[nodiscard]] TypeClass classify(std::string_view declared_type) const override;
};

} // namespace schemagraph
