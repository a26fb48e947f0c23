#include "import.hpp"

#include "../common/debug_messages.hpp"
#include "path_policy.hpp"

#include <filesystem>
#include <utility>

namespace mdimport::preprocessor {

namespace {

constexpr const char* kMarkdownExtension = ".md";
constexpr const char* kReasonUnsupported = "Only .md files are supported";
constexpr const char* kReasonAbsolute = "Absolute paths not allowed";
constexpr const char* kReasonNotAllowed = "Path not allowed";
constexpr const char* kReasonNotFound = "File not found";
constexpr const char* kWhitespace = " \t\n\r\f\v";

bool has_markdown_extension(const std::string& path) {
    const std::string ext = kMarkdownExtension;
    return path.size() >= ext.size() &&
           path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}

std::string import_failed_marker(const std::string& path, const std::string& reason) {
    return "<!-- Import failed: " + path + " - " + reason + " -->";
}

std::string circular_marker(const std::string& path) {
    return "<!-- Circular import detected: " + path + " -->";
}

std::string imported_block(const std::string& path, const std::string& content) {
    return "<!-- Imported from: " + path + " -->\n" + content + "\n<!-- End of import from: " +
           path + " -->";
}

}  // namespace

ImportState ImportState::derive(const std::string& resolved_path) const {
    ImportState next;
    next.processed_files = processed_files;
    // 展開中のファイルも祖先チェーンの一部
    if (current_file) {
        next.processed_files.insert(*current_file);
    }
    next.processed_files.insert(resolved_path);
    next.max_depth = max_depth;
    next.current_depth = current_depth + 1;
    next.current_file = resolved_path;
    return next;
}

const char* status_str(ImportStatus status) {
    switch (status) {
        case ImportStatus::Imported:
            return "imported";
        case ImportStatus::UnsupportedFileType:
            return "unsupported file type";
        case ImportStatus::PathNotAllowed:
            return "path not allowed";
        case ImportStatus::AbsolutePathNotAllowed:
            return "absolute path not allowed";
        case ImportStatus::CircularImport:
            return "circular import";
        case ImportStatus::FileSystemFailure:
            return "file system failure";
    }
    return "unknown";
}

ImportProcessor::ImportProcessor(io::FileAccess& files, debug::Sink& sink, ImportOptions options)
    : files_(files), sink_(sink), options_(std::move(options)) {}

std::string ImportProcessor::process(const std::string& content,
                                     const std::string& base_directory, bool imports_enabled,
                                     const ImportState& state) {
    return process_with_tree(content, base_directory, imports_enabled, state).content;
}

ImportProcessor::ProcessResult ImportProcessor::process_with_tree(
    const std::string& content, const std::string& base_directory, bool imports_enabled,
    const ImportState& state) {
    ProcessResult result;

    if (!imports_enabled) {
        debug::imp::log(debug::imp::Id::Skipped);
        result.content = content;
        return result;
    }

    // 深さ制限はこの階層全体に適用（指令単位ではない）
    if (state.current_depth >= state.max_depth) {
        sink_.warn(kImportTag, debug::imp::format(debug::imp::Id::DepthExceeded,
                                                  {std::to_string(state.max_depth)}));
        result.content = content;
        result.depth_exceeded = true;
        return result;
    }

    debug::imp::log(debug::imp::Id::Start, base_directory);

    // @ の後に続く空白以外の最長の並びを1つずつ処理
    std::string output;
    size_t last = 0;
    size_t at = content.find('@');
    while (at != std::string::npos) {
        size_t end = content.find_first_of(kWhitespace, at + 1);
        if (end == std::string::npos) {
            end = content.size();
        }
        if (end == at + 1) {
            // @ の直後が空白または末尾なら指令ではない
            at = content.find('@', at + 1);
            continue;
        }

        output.append(content, last, at - last);

        ImportRecord record;
        record.path = content.substr(at + 1, end - at - 1);
        output += expand_directive(record.path, base_directory, state, record,
                                   result.depth_exceeded);
        result.imports.push_back(std::move(record));

        last = end;
        at = content.find('@', end);
    }
    output.append(content, last, std::string::npos);

    debug::imp::log(debug::imp::Id::End, base_directory);
    result.content = std::move(output);
    return result;
}

ImportProcessor::ProcessResult ImportProcessor::process_file(const std::string& file_path,
                                                             bool imports_enabled,
                                                             const ImportState& state) {
    std::string path = std::filesystem::path(file_path).lexically_normal().generic_string();
    if (!files_.exists(path)) {
        throw io::FileAccessError(std::string(kReasonNotFound) + ": " + file_path);
    }
    std::string content = files_.read_text(path);

    ImportState root = state;
    root.current_file = path;
    std::string base_directory = std::filesystem::path(path).parent_path().generic_string();
    return process_with_tree(content, base_directory, imports_enabled, root);
}

std::string ImportProcessor::expand_directive(const std::string& import_path,
                                              const std::string& base_directory,
                                              const ImportState& state, ImportRecord& record,
                                              bool& depth_exceeded) {
    debug::imp::log(debug::imp::Id::Directive, import_path, debug::Level::Trace);

    // .md以外はファイルアクセスしない
    if (!has_markdown_extension(import_path)) {
        sink_.warn(kImportTag, debug::imp::format(debug::imp::Id::UnsupportedType, {import_path}));
        return fail(record, ImportStatus::UnsupportedFileType, kReasonUnsupported);
    }

    const auto allowed = options_.allowed_directories
                             ? *options_.allowed_directories
                             : compute_allowed_directories(base_directory);
    if (!validate_path(import_path, base_directory, allowed)) {
        sink_.warn(kImportTag, debug::imp::format(debug::imp::Id::PathNotAllowed, {import_path}));
        if (std::filesystem::path(import_path).is_absolute()) {
            return fail(record, ImportStatus::AbsolutePathNotAllowed, kReasonAbsolute);
        }
        return fail(record, ImportStatus::PathNotAllowed, kReasonNotAllowed);
    }

    record.resolved_path = resolve_import_path(import_path, base_directory);
    debug::imp::log(debug::imp::Id::Resolved, record.resolved_path, debug::Level::Trace);

    if (state.current_file == record.resolved_path ||
        state.processed_files.count(record.resolved_path) > 0) {
        sink_.warn(kImportTag, debug::imp::format(debug::imp::Id::CircularImport, {import_path}));
        record.status = ImportStatus::CircularImport;
        return circular_marker(import_path);
    }

    std::optional<std::string> error;
    std::string imported;
    try {
        if (files_.exists(record.resolved_path)) {
            imported = files_.read_text(record.resolved_path);
        } else {
            error = kReasonNotFound;
        }
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (error) {
        sink_.error(kImportTag,
                    debug::imp::format(debug::imp::Id::ImportFailed, {import_path, *error}));
        return fail(record, ImportStatus::FileSystemFailure, *error);
    }

    // インポートしたファイルのディレクトリを基準に再帰
    std::string child_base =
        std::filesystem::path(record.resolved_path).parent_path().generic_string();
    auto child = process_with_tree(imported, child_base, true, state.derive(record.resolved_path));
    if (child.depth_exceeded) {
        depth_exceeded = true;
    }

    record.status = ImportStatus::Imported;
    record.children = std::move(child.imports);
    sink_.debug(kImportTag, debug::imp::format(debug::imp::Id::Imported, {import_path}));
    return imported_block(import_path, child.content);
}

std::string ImportProcessor::fail(ImportRecord& record, ImportStatus status,
                                  const std::string& reason) {
    record.status = status;
    record.message = reason;
    return import_failed_marker(record.path, reason);
}

}  // namespace mdimport::preprocessor
