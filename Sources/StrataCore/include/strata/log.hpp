#pragma once

#include <atomic>
#include <cctype>
#include <cstdio>
#include <optional>
#include <string>

namespace strata {

// Levels are cumulative: a store logging at warn also logs errors.
enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Defined in src/store.cpp. Starts at off; STRATA_LOG_LEVEL in the
/// environment overrides it when the first store opens.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return level != log_level::off && static_cast<int>(level) <= static_cast<int>(get_log_level());
}

constexpr const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "?";
}

/// Case-insensitive; accepts "warning" for warn. nullopt for anything else.
inline std::optional<log_level> parse_log_level(std::string name) {
    for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "warning") return log_level::warn;
    for (auto level : {log_level::off, log_level::error, log_level::warn, log_level::info, log_level::debug}) {
        if (name == to_string(level)) return level;
    }
    return std::nullopt;
}

}  // namespace strata

// Lines read "[strata:<level>] <tag>: <message>". Tags name the layer:
// db (SQLite adapter), schema, tx, query, notify, store.
#define STRATA_LOG(level, tag, fmt, ...) \
    do { \
        if (strata::log_enabled(level)) { \
            std::fprintf(stderr, "[strata:%s] %s: " fmt "\n", strata::to_string(level), tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) STRATA_LOG(strata::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  STRATA_LOG(strata::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  STRATA_LOG(strata::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) STRATA_LOG(strata::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
