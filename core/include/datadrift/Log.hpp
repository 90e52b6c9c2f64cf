// Minimal logging utility (header-only) for DataDrift core.
// Enabled with DATADRIFT_LOG=1; DATADRIFT_LOG=debug also prints LOGD.
#pragma once
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>
#include <mutex>

namespace datadrift {

inline int logLevelFromEnv() {
    const char* v = std::getenv("DATADRIFT_LOG");
    if (!v || !*v || *v == '0') return 0;
    if (std::strcmp(v, "debug") == 0 || std::strcmp(v, "2") == 0) return 2;
    return 1;
}

inline std::atomic<int>& logLevelRef() {
    static std::atomic<int> lvl{logLevelFromEnv()};
    return lvl;
}

// 0 = off, 1 = normal, 2 = debug. Overrides the environment.
inline void setLogLevel(int level) { logLevelRef().store(level); }

inline bool logEnabled(int level = 1) {
    return logLevelRef().load() >= level;
}

inline void logf(const char* level, const char* fmt, ...) {
    static std::mutex m;
    std::lock_guard<std::mutex> lk(m);
    std::fprintf(stderr, "[DataDrift][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace datadrift

#define LOGD(fmt, ...) \
    do { \
        if (datadrift::logEnabled(2)) \
            datadrift::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (datadrift::logEnabled()) \
            datadrift::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (datadrift::logEnabled()) \
            datadrift::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (datadrift::logEnabled()) \
            datadrift::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
