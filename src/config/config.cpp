// ============================================================
// 設定システム - 実装
// ============================================================

#include "config.hpp"

#include "../common/debug_messages.hpp"
#include "../preprocessor/path_policy.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mdimport {
namespace config {

bool ConfigLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        debug::cfg::log(debug::cfg::Id::OpenFailed, filepath, debug::Level::Warn);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parse_yaml(buffer.str())) {
        return false;
    }

    // 相対パスは設定ファイルのディレクトリ基準
    fs::path config_dir = fs::absolute(filepath).parent_path();
    for (auto& dir : imports_.allowed_directories) {
        dir = preprocessor::resolve_import_path(dir, config_dir.generic_string());
    }

    config_path_ = filepath;
    loaded_ = true;
    debug::cfg::log(debug::cfg::Id::Loaded, filepath);
    return true;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    fs::path current = fs::absolute(start_path);
    debug::cfg::log(debug::cfg::Id::Search, current.string());

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / kConfigFileName;
        if (fs::exists(config_file)) {
            debug::cfg::log(debug::cfg::Id::Found, config_file.string());
            return load(config_file.string());
        }

        // 親ディレクトリへ
        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    debug::cfg::log(debug::cfg::Id::NotFound);
    return false;
}

bool ConfigLoader::load_from_string(const std::string& content) {
    if (!parse_yaml(content)) {
        return false;
    }
    loaded_ = true;
    return true;
}

preprocessor::ImportOptions ConfigLoader::to_options() const {
    preprocessor::ImportOptions options;
    if (!imports_.allowed_directories.empty()) {
        options.allowed_directories = imports_.allowed_directories;
    }
    return options;
}

preprocessor::ImportState ConfigLoader::to_state() const {
    preprocessor::ImportState state;
    state.max_depth = imports_.max_depth;
    return state;
}

bool ConfigLoader::parse_yaml(const std::string& content) {
    // 簡易YAMLパーサー
    // サポート形式:
    // imports:
    //   enabled: true
    //   max_depth: 10
    //   allowed_directories:
    //     - /path/to/docs

    std::istringstream stream(content);
    std::string line;

    bool in_imports_section = false;
    bool in_allowed_list = false;

    while (std::getline(stream, line)) {
        // コメント行をスキップ
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // インデントレベルを計算
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        // セクション判定
        if (indent == 0) {
            in_imports_section = trimmed.substr(0, 8) == "imports:";
            in_allowed_list = false;
            if (!in_imports_section) {
                debug::cfg::log(debug::cfg::Id::UnknownKey, trimmed);
            }
        } else if (in_allowed_list && indent >= 2 && trimmed[0] == '-') {
            // リスト要素: "- /path"
            std::string dir = unquote(trim(trimmed.substr(1)));
            if (!dir.empty()) {
                imports_.allowed_directories.push_back(dir);
            }
        } else if (in_imports_section && indent >= 2) {
            in_allowed_list = false;
            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                add_warning("Malformed line: " + trimmed);
                continue;
            }
            std::string key = trim(trimmed.substr(0, colon_pos));
            std::string value = unquote(trim(trimmed.substr(colon_pos + 1)));
            if (key == "allowed_directories" && value.empty()) {
                in_allowed_list = true;
                continue;
            }
            apply_import_key(key, value);
        }
    }

    return true;  // 空の設定も有効
}

void ConfigLoader::apply_import_key(const std::string& key, const std::string& value) {
    if (key == "enabled") {
        bool enabled = true;
        if (parse_bool(value, enabled)) {
            imports_.enabled = enabled;
        } else {
            add_warning("imports.enabled must be true or false: " + value);
        }
    } else if (key == "max_depth") {
        try {
            size_t consumed = 0;
            int depth = std::stoi(value, &consumed);
            if (consumed != value.size() || depth < 0) {
                add_warning("imports.max_depth must be a non-negative integer: " + value);
            } else {
                imports_.max_depth = depth;
            }
        } catch (const std::exception&) {
            add_warning("imports.max_depth must be a non-negative integer: " + value);
        }
    } else if (key == "allowed_directories") {
        // 1行形式: allowed_directories: /path
        imports_.allowed_directories.push_back(value);
    } else {
        debug::cfg::log(debug::cfg::Id::UnknownKey, key);
    }
}

void ConfigLoader::add_warning(const std::string& message) {
    debug::cfg::log(debug::cfg::Id::InvalidValue, message, debug::Level::Warn);
    warnings_.push_back(message);
}

bool ConfigLoader::parse_bool(const std::string& str, bool& out) {
    if (str == "true" || str == "yes" || str == "on") {
        out = true;
        return true;
    }
    if (str == "false" || str == "no" || str == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string ConfigLoader::unquote(const std::string& str) {
    if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'') &&
        str.back() == str.front()) {
        return str.substr(1, str.size() - 2);
    }
    return str;
}

}  // namespace config
}  // namespace mdimport
