#pragma once
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace Logger {

enum class Level : int {
    Quiet = 0,
    Debug = 1,
    Trace = 2
};

// WAVIFY_LOG=quiet|debug|trace, read once. WAVIFY_TRACE=1 is shorthand for trace.
inline Level level() {
    static const Level cached = []() {
        const char* trace = std::getenv("WAVIFY_TRACE");
        if (trace && trace[0] == '1') return Level::Trace;

        const char* val = std::getenv("WAVIFY_LOG");
        if (!val) return Level::Debug;
        if (std::strcmp(val, "quiet") == 0) return Level::Quiet;
        if (std::strcmp(val, "trace") == 0) return Level::Trace;
        return Level::Debug;
    }();
    return cached;
}

inline bool enabled(Level wanted) {
    return static_cast<int>(level()) >= static_cast<int>(wanted);
}

} // namespace Logger

#ifdef NDEBUG
#define WAVIFY_DEBUG_LOG(expr) do {} while (0)
#define WAVIFY_TRACE_LOG(expr) do {} while (0)
#else
#define WAVIFY_DEBUG_LOG(expr) do { if (::Logger::enabled(::Logger::Level::Debug)) { std::cerr << expr; } } while (0)
#define WAVIFY_TRACE_LOG(expr) do { if (::Logger::enabled(::Logger::Level::Trace)) { std::cerr << expr; } } while (0)
#endif
