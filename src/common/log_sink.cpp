#include "log_sink.hpp"

#include <algorithm>

namespace mdimport::debug {

void StderrSink::write(Level level, const std::string& tag, const std::string& message) {
    if (level < Level::Warn && (!g_debug_mode || level < g_debug_level)) {
        return;
    }
    // [WARN] [ImportProcessor] メッセージ
    out_ << "[" << level_str(level) << "] [" << tag << "] " << message << std::endl;
}

size_t MemorySink::count(Level level) const {
    return std::count_if(entries_.begin(), entries_.end(),
                         [level](const Entry& e) { return e.level == level; });
}

bool MemorySink::contains(Level level, const std::string& message) const {
    return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& e) {
        return e.level == level && e.message == message;
    });
}

}  // namespace mdimport::debug
