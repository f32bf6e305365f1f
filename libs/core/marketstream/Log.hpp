/*
MarketStream — Log
Role: Header-only leveled logger shared by every MarketStream module.
Inputs/Outputs: Category + fmt-style message in; one formatted line on stdout (or the installed writer) out.
Threading: Level and writer are process-wide; set them before the io_context starts.
Performance: Level check happens before formatting so disabled levels cost a comparison.
Integration: Used through the LOG_* macros; categories are short module names (hub, realtime, ...).
Observability: Level is read once from MARKETSTREAM_LOG (trace|debug|info|warn|error).
Related: Config.hpp (reads the same environment family).
Assumptions: Callers never pass credentials; URLs are redacted before they reach the logger.
*/
#pragma once
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <string_view>

namespace MarketStream {
namespace Log {

enum class Level { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Unknown names map to ERROR so a typo never makes the log noisier
inline Level parseLevel(const char* env) {
    if(!env) return Level::INFO;
    std::string s(env);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info")  return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    return Level::ERROR;
}

inline Level& runtimeLevel() {
    static Level level = []{
#ifdef NDEBUG
        Level def = Level::INFO;
#else
        Level def = Level::DEBUG;
#endif
        if(const char* env = std::getenv("MARKETSTREAM_LOG"))
            return parseLevel(env);
        return def;
    }();
    return level;
}

inline void setLevel(Level lvl) { runtimeLevel() = lvl; }

// Receives each finished line without the trailing newline. Empty means stdout.
using Writer = std::function<void(Level, std::string_view)>;

inline Writer& writer() {
    static Writer w;
    return w;
}

inline void setWriter(Writer w) { writer() = std::move(w); }

inline const char* toString(Level lvl) {
    switch(lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        default:           return "ERROR";
    }
}

inline std::string_view baseName(const char* file) {
    std::string_view f(file);
    size_t pos = f.find_last_of("/\\");
    return pos==std::string_view::npos ? f : f.substr(pos+1);
}

template<class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line, std::string_view fmt, Args&&... args) {
    if (lvl < runtimeLevel()) return;
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    auto msg = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    auto text = fmt::format("[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] {}",
                            std::chrono::floor<std::chrono::seconds>(now),
                            us%1000000,
                            toString(lvl), category, baseName(file), line, msg);
    if (const auto& w = writer()) {
        w(lvl, text);
        return;
    }
    fmt::print("{}\n", text);
}

}
}

#define LOG_IMPL(level, cat, fmt, ...) ::MarketStream::Log::log(::MarketStream::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_T(cat, fmt, ...) LOG_IMPL(TRACE, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_D(cat, fmt, ...) LOG_IMPL(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_I(cat, fmt, ...) LOG_IMPL(INFO,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_W(cat, fmt, ...) LOG_IMPL(WARN,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_E(cat, fmt, ...) LOG_IMPL(ERROR, cat, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOG_EVERY_N(level, N, cat, fmt, ...) \
    do { static int LOG_##level##_CNT = 0; if(++LOG_##level##_CNT % (N) == 0) LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } while(0)
#define LOG_FIRST_N(level, N, cat, fmt, ...) \
    do { static int LOG_##level##_FIRST_CNT = 0; if(LOG_##level##_FIRST_CNT < (N)) { ++LOG_##level##_FIRST_CNT; LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } } while(0)
