// Thread-safe stderr logging for makemock.
#pragma once

#include <fmt/format.h>
#include <llvm/Support/raw_ostream.h>

#include <atomic>
#include <iterator>
#include <mutex>
#include <string_view>
#include <utility>

namespace makemock {

inline std::mutex &errs_mutex() {
    static std::mutex mu;
    return mu;
}

inline std::atomic<bool> &verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool enabled) { verbose_flag().store(enabled); }

inline bool verbose_enabled() { return verbose_flag().load(); }

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    llvm::errs() << fmt::to_string(buffer);
}

// Same as log_err, but only when --verbose was given.
template <typename... Args>
void log_note(fmt::format_string<Args...> format_string, Args &&...args) {
    if (!verbose_enabled()) {
        return;
    }
    log_err(format_string, std::forward<Args>(args)...);
}

inline void log_err_raw(std::string_view message) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    llvm::errs() << message;
}

} // namespace makemock
