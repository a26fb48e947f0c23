// ============================================================
// 設定システム
// ============================================================
// .mdimport.yml からインポート設定を読み込む

#pragma once

#include "../preprocessor/import.hpp"

#include <string>
#include <vector>

namespace mdimport {
namespace config {

// 設定ファイル名
inline constexpr const char* kConfigFileName = ".mdimport.yml";

// インポート設定
struct ImportConfig {
    bool enabled = true;                             // インポート展開を行うか
    int max_depth = preprocessor::kDefaultMaxDepth;  // 最大インポート深さ
    std::vector<std::string> allowed_directories;    // 空なら自動計算
};

// 設定ローダー
class ConfigLoader {
   public:
    // .mdimport.yml を読み込み
    bool load(const std::string& filepath);

    // .mdimport.yml を探す（指定ディレクトリから親に向かって）
    bool find_and_load(const std::string& start_path = ".");

    // 文字列から設定を読み込み
    bool load_from_string(const std::string& content);

    // 設定が読み込まれているか
    bool is_loaded() const { return loaded_; }

    // 設定ファイルのパスを取得
    const std::string& config_path() const { return config_path_; }

    const ImportConfig& imports() const { return imports_; }
    ImportConfig& imports() { return imports_; }

    // 解析中に見つかった問題（不正な値など）
    const std::vector<std::string>& warnings() const { return warnings_; }

    // ImportProcessor 用のオプション
    preprocessor::ImportOptions to_options() const;

    // ルート呼び出し用の初期状態
    preprocessor::ImportState to_state() const;

   private:
    // 簡易YAMLパーサー（key: value形式とリストのみ）
    bool parse_yaml(const std::string& content);

    // imports: セクションの key: value を適用
    void apply_import_key(const std::string& key, const std::string& value);

    void add_warning(const std::string& message);

    // 真偽値文字列を解析
    static bool parse_bool(const std::string& str, bool& out);

    // 行をトリム
    static std::string trim(const std::string& str);

    // 前後の引用符を除去
    static std::string unquote(const std::string& str);

    ImportConfig imports_;
    std::string config_path_;
    bool loaded_ = false;
    std::vector<std::string> warnings_;
};

}  // namespace config
}  // namespace mdimport
