#pragma once

#include "../common/log_sink.hpp"
#include "../io/file_access.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mdimport::preprocessor {

// ログのタグ
inline constexpr const char* kImportTag = "ImportProcessor";

// デフォルトの最大インポート深さ
inline constexpr int kDefaultMaxDepth = 10;

// インポート処理の状態
// 再帰呼び出しごとに derive() で新しい値を作り、親の値は変更しない
struct ImportState {
    std::set<std::string> processed_files;  // 祖先チェーンでインライン済みの絶対パス
    int max_depth = kDefaultMaxDepth;       // 最大深さ
    int current_depth = 0;                  // 現在の深さ（ルートは0）
    std::optional<std::string> current_file;  // 展開中のファイル（ルートの文字列なら空）

    // resolved_path を展開するための子状態を作る
    ImportState derive(const std::string& resolved_path) const;
};

// インポート指令ごとの処理結果
enum class ImportStatus {
    Imported,
    UnsupportedFileType,
    PathNotAllowed,
    AbsolutePathNotAllowed,
    CircularImport,
    FileSystemFailure,
};

const char* status_str(ImportStatus status);

// インポートツリーのノード
struct ImportRecord {
    std::string path;           // 記述されたままのパス
    std::string resolved_path;  // 解決後の絶対パス（検証前に失敗した場合は空）
    ImportStatus status = ImportStatus::Imported;
    std::string message;               // 失敗理由
    std::vector<ImportRecord> children;  // ネストしたインポート
};

struct ImportOptions {
    // 指定時は compute_allowed_directories() の代わりに使う
    std::optional<std::vector<std::string>> allowed_directories;
};

// インポートプロセッサ
// @path 形式の指令を検出し、.mdファイルの内容をインライン展開する
class ImportProcessor {
   public:
    struct ProcessResult {
        std::string content;               // 展開後のテキスト
        std::vector<ImportRecord> imports;  // 出現順のインポート
        bool depth_exceeded = false;        // どこかで最大深さに到達したか
    };

    ImportProcessor(io::FileAccess& files, debug::Sink& sink, ImportOptions options = {});

    // インポートを展開したテキストを返す
    std::string process(const std::string& content, const std::string& base_directory,
                        bool imports_enabled, const ImportState& state = ImportState{});

    // process() と同じ処理でインポートツリーも返す
    ProcessResult process_with_tree(const std::string& content,
                                    const std::string& base_directory, bool imports_enabled,
                                    const ImportState& state = ImportState{});

    // ルートファイルを読み込んで処理する
    // ルートファイル自体の読み込み失敗は io::FileAccessError として送出
    ProcessResult process_file(const std::string& file_path, bool imports_enabled,
                               const ImportState& state = ImportState{});

   private:
    // 1つの指令を処理して置換テキストを返す
    std::string expand_directive(const std::string& import_path,
                                 const std::string& base_directory, const ImportState& state,
                                 ImportRecord& record, bool& depth_exceeded);

    // 失敗を記録してマーカーを返す
    static std::string fail(ImportRecord& record, ImportStatus status,
                            const std::string& reason);

    io::FileAccess& files_;
    debug::Sink& sink_;
    ImportOptions options_;
};

}  // namespace mdimport::preprocessor
