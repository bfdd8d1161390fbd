#ifndef HOOKGATE_LOG_HPP
#define HOOKGATE_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string_view>

namespace hookgate {
namespace log {

enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

inline const char* level_name(Level lvl) noexcept {
    switch (lvl) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

// Unknown names map to Info
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off" || name == "none") return Level::Off;
    return Level::Info;
}

namespace detail {

inline std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::Info)};
    return value;
}

inline std::mutex& sink_mutex() {
    static std::mutex mtx;
    return mtx;
}

} // namespace detail

inline void set_level(Level lvl) noexcept {
    detail::threshold().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

inline Level level() noexcept {
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

inline bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= detail::threshold().load(std::memory_order_relaxed);
}

inline void write(Level lvl, const char* fmt, ...) {
    if (!enabled(lvl)) return;
    va_list args;
    va_start(args, fmt);
    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::fprintf(stderr, "[hookgate] %s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    va_end(args);
}

} // namespace log
} // namespace hookgate

#define HG_LOG_TRACE(...) ::hookgate::log::write(::hookgate::log::Level::Trace, __VA_ARGS__)
#define HG_LOG_DEBUG(...) ::hookgate::log::write(::hookgate::log::Level::Debug, __VA_ARGS__)
#define HG_LOG_INFO(...)  ::hookgate::log::write(::hookgate::log::Level::Info, __VA_ARGS__)
#define HG_LOG_WARN(...)  ::hookgate::log::write(::hookgate::log::Level::Warn, __VA_ARGS__)
#define HG_LOG_ERROR(...) ::hookgate::log::write(::hookgate::log::Level::Error, __VA_ARGS__)

#endif // HOOKGATE_LOG_HPP
