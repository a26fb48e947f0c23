#include "path_policy.hpp"

#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace mdimport::preprocessor {

namespace {

// 末尾の区切り文字を除去（ルート自身は残す）
std::string strip_trailing_separator(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

std::vector<std::string> compute_allowed_directories(const std::string& base_directory) {
    std::vector<std::string> dirs;
    fs::path current = strip_trailing_separator(base_directory);

    while (!current.empty() && current != current.root_path()) {
        dirs.push_back(current.generic_string());

        fs::path parent = current.parent_path();
        if (parent == current || parent == parent.root_path()) {
            break;  // ルートに到達
        }
        current = parent;
    }

    return dirs;
}

bool has_url_scheme(const std::string& path) {
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) の後に "://"
    if (path.empty() || !std::isalpha(static_cast<unsigned char>(path[0]))) {
        return false;
    }
    size_t i = 1;
    while (i < path.size()) {
        unsigned char c = static_cast<unsigned char>(path[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            break;
        }
        ++i;
    }
    return path.compare(i, 3, "://") == 0;
}

std::string resolve_import_path(const std::string& candidate_path,
                                const std::string& base_directory) {
    fs::path candidate(candidate_path);
    fs::path resolved = candidate.is_absolute() ? candidate : fs::path(base_directory) / candidate;
    return strip_trailing_separator(resolved.lexically_normal().generic_string());
}

bool is_within_directory(const std::string& path, const std::string& directory) {
    std::string dir = strip_trailing_separator(directory);
    if (dir.empty()) {
        return false;
    }
    if (path == dir) {
        return true;
    }
    if (path.compare(0, dir.size(), dir) != 0) {
        return false;
    }
    // "/allowed" は "/allowed2/x" を含まない
    if (dir.back() == '/') {
        return path.size() > dir.size();
    }
    return path.size() > dir.size() && path[dir.size()] == '/';
}

bool validate_path(const std::string& candidate_path, const std::string& base_directory,
                   const std::vector<std::string>& allowed_directories) {
    if (has_url_scheme(candidate_path)) {
        return false;
    }

    std::string resolved = resolve_import_path(candidate_path, base_directory);
    for (const auto& dir : allowed_directories) {
        if (is_within_directory(resolved, dir)) {
            return true;
        }
    }
    return false;
}

}  // namespace mdimport::preprocessor
