#include "file_access.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace mdimport::io {

bool DiskFileAccess::exists(const std::string& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throw FileAccessError(ec.message());
    }
    if (!std::filesystem::exists(status)) {
        return false;
    }
    // ディレクトリは読み込み対象外
    return std::filesystem::is_regular_file(status);
}

std::string DiskFileAccess::read_text(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw FileAccessError("Failed to open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileAccessError("Failed to read file: " + path);
    }
    return buffer.str();
}

}  // namespace mdimport::io
