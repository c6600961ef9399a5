#pragma once
// Logging: timestamped component lines on stderr
//
//   [14:03:22.517][KnowledgeGraph] Deleted pattern 42 (confidence 0.21)
//
// Debug lines only appear in verbose mode.

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace cortex {
namespace log {

enum class Level { Debug, Info, Warn, Error };

namespace detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "debug ";
        case Level::Warn:  return "warn ";
        case Level::Error: return "error ";
        default:           return "";
    }
}

} // namespace detail

inline void set_verbose(bool on) { detail::verbose_flag() = on; }
inline bool verbose() { return detail::verbose_flag(); }

// Silence info/debug output (tests, --json mode). Warnings still print.
inline void set_quiet(bool on) { detail::quiet_flag() = on; }

inline void write(Level level, const std::string& component, const std::string& message) {
    if (level == Level::Debug && !verbose()) return;
    if (level <= Level::Info && detail::quiet_flag()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] " << detail::level_tag(level) << message << "\n";
}

// Stream-style helpers: log::info("Store", "opened ", path)
template<typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename... Args>
void debug(const std::string& component, Args&&... args) {
    if (!verbose()) return;
    write(Level::Debug, component, concat(std::forward<Args>(args)...));
}

template<typename... Args>
void info(const std::string& component, Args&&... args) {
    write(Level::Info, component, concat(std::forward<Args>(args)...));
}

template<typename... Args>
void warn(const std::string& component, Args&&... args) {
    write(Level::Warn, component, concat(std::forward<Args>(args)...));
}

template<typename... Args>
void error(const std::string& component, Args&&... args) {
    write(Level::Error, component, concat(std::forward<Args>(args)...));
}

} // namespace log
} // namespace cortex
