#include "common/debug_messages.hpp"
#include "common/log_sink.hpp"
#include "config/config.hpp"
#include "io/file_access.hpp"
#include "preprocessor/import.hpp"
#include "preprocessor/path_policy.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef MDIMPORT_VERSION
#define MDIMPORT_VERSION "0.1.0"
#endif

namespace mdimport {

// コマンドラインオプション
enum class Command { None, Expand, Tree, Help };

struct Options {
    Command command = Command::None;
    std::string input_file;
    std::string output_file;  // -o オプション
    std::string config_file;  // --config=
    bool no_imports = false;
    std::optional<int> max_depth;
    std::vector<std::string> allowed_directories;  // --allow=
    bool debug = false;
    std::string debug_level = "info";
};

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "mdimport v" << MDIMPORT_VERSION << "\n\n";
    std::cout << "使用方法:\n";
    std::cout << "  " << program_name << " <コマンド> [オプション] <ファイル>\n\n";
    std::cout << "コマンド:\n";
    std::cout << "  expand <file>         @path 形式のインポートを展開して出力\n";
    std::cout << "  tree <file>           インポートツリーを表示\n";
    std::cout << "  help                  このヘルプを表示\n\n";
    std::cout << "オプション:\n";
    std::cout << "  -o <file>             出力ファイル名を指定\n";
    std::cout << "  --no-imports          インポート展開を無効化\n";
    std::cout << "  --max-depth=<n>       最大インポート深さ（デフォルト 10）\n";
    std::cout << "  --allow=<dir>         許可ディレクトリを指定（複数可）\n";
    std::cout << "  --config=<file>       設定ファイルを指定（デフォルト .mdimport.yml を探索）\n";
    std::cout << "  --debug, -d           デバッグ出力を有効化\n";
    std::cout << "  -d=<level>            デバッグレベル（trace/debug/info/warn/error）\n";
    std::cout << "  --lang=ja             日本語メッセージ\n";
    std::cout << "  --version             バージョン情報を表示\n\n";
    std::cout << "例:\n";
    std::cout << "  " << program_name << " expand docs/README.md\n";
    std::cout << "  " << program_name << " expand --max-depth=3 -o out.md docs/index.md\n";
    std::cout << "  " << program_name << " tree --allow=/srv/docs docs/index.md\n";
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        return opts;  // コマンドなし
    }

    // 最初の引数でコマンドを判定
    std::string cmd = argv[1];
    if (cmd == "expand") {
        opts.command = Command::Expand;
    } else if (cmd == "tree") {
        opts.command = Command::Tree;
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (cmd == "--version") {
        std::cout << "mdimport v" << MDIMPORT_VERSION << "\n";
        std::exit(0);
    } else {
        std::cerr << "不明なコマンド: " << cmd << "\n";
        std::cerr << "'mdimport help' でヘルプを表示\n";
        std::exit(1);
    }

    // 残りの引数を処理
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--no-imports") {
            opts.no_imports = true;
        } else if (arg.substr(0, 12) == "--max-depth=") {
            try {
                opts.max_depth = std::stoi(arg.substr(12));
            } catch (const std::exception&) {
                std::cerr << "--max-depth には整数を指定してください\n";
                std::exit(1);
            }
            if (*opts.max_depth < 0) {
                std::cerr << "--max-depth には0以上を指定してください\n";
                std::exit(1);
            }
        } else if (arg.substr(0, 8) == "--allow=") {
            opts.allowed_directories.push_back(arg.substr(8));
        } else if (arg.substr(0, 9) == "--config=") {
            opts.config_file = arg.substr(9);
        } else if (arg == "-o") {
            if (i + 1 < argc) {
                opts.output_file = argv[++i];
            } else {
                std::cerr << "-o オプションには出力ファイル名が必要です\n";
                std::exit(1);
            }
        } else if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
            debug::set_debug_mode(true);
        } else if (arg.substr(0, 3) == "-d=") {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
            debug::set_debug_mode(true);
            debug::set_level(debug::parse_level(opts.debug_level));
        } else if (arg == "--lang=ja") {
            debug::set_lang(1);
        } else if (arg[0] != '-') {
            if (opts.input_file.empty()) {
                opts.input_file = arg;
            } else {
                std::cerr << "複数の入力ファイルは指定できません\n";
                std::exit(1);
            }
        } else {
            std::cerr << "不明なオプション: " << arg << "\n";
            std::cerr << "'mdimport help' でヘルプを表示\n";
            std::exit(1);
        }
    }

    return opts;
}

// インポートツリーを表示
void print_tree(const std::vector<preprocessor::ImportRecord>& records, std::ostream& out,
                int indent = 1) {
    for (const auto& record : records) {
        out << std::string(indent * 2, ' ') << record.path;
        if (record.status == preprocessor::ImportStatus::Imported) {
            out << " -> " << record.resolved_path << "\n";
        } else {
            out << " [" << preprocessor::status_str(record.status);
            if (!record.message.empty() &&
                record.status != preprocessor::ImportStatus::CircularImport) {
                out << ": " << record.message;
            }
            out << "]\n";
        }
        print_tree(record.children, out, indent + 1);
    }
}

}  // namespace mdimport

int main(int argc, char* argv[]) {
    using namespace mdimport;
    namespace fs = std::filesystem;

    // オプションをパース
    Options opts = parse_options(argc, argv);

    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }

    if (opts.command == Command::None || opts.input_file.empty()) {
        if (argc == 1) {
            std::cerr << "エラー: コマンドが指定されていません\n";
            std::cerr << "'mdimport help' でヘルプを表示\n";
        } else {
            std::cerr << "エラー: 入力ファイルが指定されていません\n";
        }
        return 1;
    }

    std::string input_path =
        preprocessor::resolve_import_path(opts.input_file, fs::current_path().generic_string());

    // 設定ファイル（CLIオプションが優先）
    config::ConfigLoader loader;
    if (!opts.config_file.empty()) {
        if (!loader.load(opts.config_file)) {
            std::cerr << "エラー: 設定ファイルを開けません: " << opts.config_file << "\n";
            return 1;
        }
    } else if (!loader.find_and_load(fs::path(input_path).parent_path().string())) {
        // 設定ファイルがなければデフォルト値
        debug::log(debug::Stage::Cli, debug::Level::Info, "Using default import settings");
    }
    for (const auto& warning : loader.warnings()) {
        std::cerr << "[WARN] [Config] " << warning << "\n";
    }

    auto& imports = loader.imports();
    if (opts.no_imports) {
        imports.enabled = false;
    }
    if (opts.max_depth) {
        imports.max_depth = *opts.max_depth;
    }
    if (!opts.allowed_directories.empty()) {
        imports.allowed_directories.clear();
        for (const auto& dir : opts.allowed_directories) {
            imports.allowed_directories.push_back(
                preprocessor::resolve_import_path(dir, fs::current_path().generic_string()));
        }
    }

    io::DiskFileAccess files;
    debug::StderrSink sink;
    preprocessor::ImportProcessor processor(files, sink, loader.to_options());

    preprocessor::ImportProcessor::ProcessResult result;
    try {
        result = processor.process_file(input_path, imports.enabled, loader.to_state());
    } catch (const std::exception& e) {
        std::cerr << "エラー: " << e.what() << "\n";
        return 1;
    }

    if (opts.command == Command::Tree) {
        std::cout << opts.input_file << "\n";
        print_tree(result.imports, std::cout);
        if (result.depth_exceeded) {
            std::cout << "(max depth " << imports.max_depth << " reached)\n";
        }
        return 0;
    }

    if (opts.output_file.empty()) {
        std::cout << result.content;
        return 0;
    }

    std::ofstream out(opts.output_file, std::ios::out | std::ios::binary);
    if (!out) {
        std::cerr << "エラー: 出力ファイルを開けません: " << opts.output_file << "\n";
        return 1;
    }
    out << result.content;
    if (!out) {
        std::cerr << "エラー: 出力ファイルへの書き込みに失敗しました: " << opts.output_file << "\n";
        return 1;
    }
    return 0;
}
