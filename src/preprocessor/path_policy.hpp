#pragma once

#include <string>
#include <vector>

namespace mdimport::preprocessor {

// インポート可能なディレクトリの一覧を計算する
// base自身から始まり、親ディレクトリを1段ずつ辿る（ルート "/" は含めない）
// 例: "/a/b/c" -> ["/a/b/c", "/a/b", "/a"]
std::vector<std::string> compute_allowed_directories(const std::string& base_directory);

// インポートパスが許可ディレクトリ内に収まるか検証する
// URLスキーム（http://, file:// など）は常に拒否
// 相対パスは base_directory 基準で字句的に解決する（I/Oなし）
bool validate_path(const std::string& candidate_path, const std::string& base_directory,
                   const std::vector<std::string>& allowed_directories);

// candidate_path を base_directory 基準で絶対パスへ字句的に解決
std::string resolve_import_path(const std::string& candidate_path,
                                const std::string& base_directory);

// URLスキームで始まるか（scheme://）
bool has_url_scheme(const std::string& path);

// パスがディレクトリと一致するか、その配下にあるか（セグメント境界を考慮）
bool is_within_directory(const std::string& path, const std::string& directory);

}  // namespace mdimport::preprocessor
