#pragma once

#include "core/error.hpp"
#include <string>

namespace schemagraph::io {

/** @brief Whole file as a string, or IO_ERROR */
[[nodiscard]] Result<std::string> read_text_file(const std::string& path);

/**
 * @brief Write @p content to @p path, creating missing parent directories
 * @return The path written, or IO_ERROR
 */
[[nodiscard]] Result<std::string> write_text_file(const std::string& path,
                                                  const std::string& content);

} // namespace schemagraph::io
