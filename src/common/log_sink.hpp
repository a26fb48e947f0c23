#pragma once

#include "debug.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace mdimport::debug {

/// 構造化ログの受け口
/// ImportProcessor はこのインターフェース経由で警告・エラーを報告する
class Sink {
   public:
    virtual ~Sink() = default;

    virtual void write(Level level, const std::string& tag, const std::string& message) = 0;

    void warn(const std::string& tag, const std::string& message) {
        write(Level::Warn, tag, message);
    }
    void error(const std::string& tag, const std::string& message) {
        write(Level::Error, tag, message);
    }
    void debug(const std::string& tag, const std::string& message) {
        write(Level::Debug, tag, message);
    }
};

/// 標準エラー出力へ書き出すシンク
/// Warn/Error は常に出力、それ以外はデバッグモード時のみ
class StderrSink : public Sink {
   public:
    explicit StderrSink(std::ostream& out = std::cerr) : out_(out) {}

    void write(Level level, const std::string& tag, const std::string& message) override;

   private:
    std::ostream& out_;
};

/// メモリ上に記録するシンク
class MemorySink : public Sink {
   public:
    struct Entry {
        Level level;
        std::string tag;
        std::string message;
    };

    void write(Level level, const std::string& tag, const std::string& message) override {
        entries_.push_back({level, tag, message});
    }

    const std::vector<Entry>& entries() const { return entries_; }

    /// 指定レベルのエントリ数
    size_t count(Level level) const;

    /// 指定レベルで完全一致するメッセージがあるか
    bool contains(Level level, const std::string& message) const;

    void clear() { entries_.clear(); }

   private:
    std::vector<Entry> entries_;
};

}  // namespace mdimport::debug
