#pragma once

#include <stdexcept>
#include <string>

namespace mdimport::io {

/// ファイルアクセス失敗（理由は what() で取得）
class FileAccessError : public std::runtime_error {
   public:
    explicit FileAccessError(const std::string& message) : std::runtime_error(message) {}
};

/// ファイルアクセス能力
/// 存在確認と読み込みのみ。失敗時は FileAccessError を投げる
class FileAccess {
   public:
    virtual ~FileAccess() = default;

    // ファイルが存在するか（アクセス不能な場合は例外）
    virtual bool exists(const std::string& path) = 0;

    // テキストとして全体を読み込む
    virtual std::string read_text(const std::string& path) = 0;
};

/// ディスク上のファイルを扱う実装
class DiskFileAccess : public FileAccess {
   public:
    bool exists(const std::string& path) override;
    std::string read_text(const std::string& path) override;
};

}  // namespace mdimport::io
