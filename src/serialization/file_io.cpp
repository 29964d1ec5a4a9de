#include "serialization/file_io.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace schemagraph::io {

Result<std::string> read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("cannot open '{}' for reading", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("failed reading '{}'", path));
    }
    return Result<std::string>::ok(buffer.str());
}

Result<std::string> write_text_file(const std::string& path, const std::string& content) {
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                std::format("cannot create directory '{}': {}", target.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("cannot open '{}' for writing", path));
    }
    out << content;
    out.flush();
    if (!out) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("failed writing '{}'", path));
    }
    return Result<std::string>::ok(path);
}

} // namespace schemagraph::io
