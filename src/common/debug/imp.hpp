#pragma once

#include "../debug.hpp"

#include <string>
#include <vector>

namespace mdimport::debug::imp {

/// ImportProcessor メッセージID
enum class Id {
    // 基本フロー
    Start,
    End,
    Directive,
    Resolved,
    Skipped,

    // 警告・エラー（シンクへ送るメッセージ）
    DepthExceeded,
    UnsupportedType,
    PathNotAllowed,
    CircularImport,
    ImportFailed,
    Imported,
};

/// メッセージテーブル [en, ja]
/// {0}, {1} は format() で置換される
inline const char* messages[][2] = {
    // Start
    {"Processing imports", "インポート処理を開始"},
    // End
    {"Completed import processing", "インポート処理を完了"},
    // Directive
    {"Found import directive", "インポート指令を検出"},
    // Resolved
    {"Resolved import path", "インポートパスを解決"},
    // Skipped
    {"Imports disabled, returning content unchanged", "インポート無効のため内容をそのまま返す"},
    // DepthExceeded
    {"Maximum import depth ({0}) reached. Stopping import processing.",
     "最大インポート深さ ({0}) に到達しました。インポート処理を中止します。"},
    // UnsupportedType
    {"Import processor only supports .md files. Attempting to import non-md file: {0}. This "
     "will fail.",
     ".mdファイルのみインポート可能です。非mdファイルのインポートは失敗します: {0}"},
    // PathNotAllowed
    {"Import path not allowed: {0}", "許可されていないインポートパス: {0}"},
    // CircularImport
    {"Circular import detected: {0}", "循環インポートを検出: {0}"},
    // ImportFailed
    {"Failed to import {0}: {1}", "{0} のインポートに失敗: {1}"},
    // Imported
    {"Successfully imported {0}", "{0} をインポートしました"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::mdimport::debug::g_lang];
}

/// {n} を args[n] で置換したメッセージを返す
inline std::string format(Id id, const std::vector<std::string>& args) {
    std::string tmpl = get(id);
    std::string result;
    result.reserve(tmpl.size());
    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i);
            if (close != std::string::npos && close > i + 1) {
                size_t index = std::stoul(tmpl.substr(i + 1, close - i - 1));
                if (index < args.size()) {
                    result += args[index];
                }
                i = close;
                continue;
            }
        }
        result += tmpl[i];
    }
    return result;
}

inline void log(Id id, ::mdimport::debug::Level level = ::mdimport::debug::Level::Debug) {
    if (!::mdimport::debug::g_debug_mode || level < ::mdimport::debug::g_debug_level)
        return;
    ::mdimport::debug::log(::mdimport::debug::Stage::Import, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::mdimport::debug::Level level = ::mdimport::debug::Level::Debug) {
    if (!::mdimport::debug::g_debug_mode || level < ::mdimport::debug::g_debug_level)
        return;
    ::mdimport::debug::log(::mdimport::debug::Stage::Import, level,
                           std::string(get(id)) + ": " + detail);
}

}  // namespace mdimport::debug::imp
