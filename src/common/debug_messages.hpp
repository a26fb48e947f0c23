#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/cfg.hpp"
#include "debug/imp.hpp"

// 使用例:
// debug::imp::log(debug::imp::Id::Start);
// debug::imp::log(debug::imp::Id::Directive, "./intro.md", debug::Level::Trace);
// debug::cfg::log(debug::cfg::Id::Found, ".mdimport.yml");
