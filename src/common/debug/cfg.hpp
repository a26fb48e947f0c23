#pragma once

#include "../debug.hpp"

#include <string>

namespace mdimport::debug::cfg {

/// Config メッセージID
enum class Id { Search, Found, NotFound, Loaded, OpenFailed, InvalidValue, UnknownKey };

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    // Search
    {"Searching for config file", "設定ファイルを探索"},
    // Found
    {"Found config file", "設定ファイルを検出"},
    // NotFound
    {"No config file found", "設定ファイルが見つかりません"},
    // Loaded
    {"Loaded config", "設定を読み込み"},
    // OpenFailed
    {"Failed to open config file", "設定ファイルを開けません"},
    // InvalidValue
    {"Invalid config value", "不正な設定値"},
    // UnknownKey
    {"Unknown config key ignored", "不明な設定キーを無視"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::mdimport::debug::g_lang];
}

inline void log(Id id, ::mdimport::debug::Level level = ::mdimport::debug::Level::Debug) {
    if (!::mdimport::debug::g_debug_mode || level < ::mdimport::debug::g_debug_level)
        return;
    ::mdimport::debug::log(::mdimport::debug::Stage::Config, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::mdimport::debug::Level level = ::mdimport::debug::Level::Debug) {
    if (!::mdimport::debug::g_debug_mode || level < ::mdimport::debug::g_debug_level)
        return;
    ::mdimport::debug::log(::mdimport::debug::Stage::Config, level,
                           std::string(get(id)) + ": " + detail);
}

}  // namespace mdimport::debug::cfg
