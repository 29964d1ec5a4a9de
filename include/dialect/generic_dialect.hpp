#pragma once

#include "dialect/idialect.hpp"

namespace schemagraph {

/**
 * @brief Keyword-based classification for databases without a dedicated
 *        type map (IBM DB2, or schema files of unknown origin)
 */
class GenericDialect : public IDialect {
public:
    explicit GenericDialect(DatabaseType type = DatabaseType::GENERIC) : type_(type) {}

    [[nodiscard]] DatabaseType type() const override { return type_; }
    [[nodiscard]] std::string_view display_name() const override;
    [[nodiscard]] uint16_t default_port() const override;
    [[nodiscard]] TypeClass classify(std::string_view declared_type) const override;

private:
    DatabaseType type_;
};

} // namespace schemagraph
