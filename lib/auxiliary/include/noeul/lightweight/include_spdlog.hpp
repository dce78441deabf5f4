#pragma once

#ifdef SPDLOG_ACTIVE_LEVEL
    #undef SPDLOG_ACTIVE_LEVEL
#endif

// Compile-time floor for SPDLOG_* macros, trace unless the build says otherwise
#ifdef NOEUL_LOG_LEVEL
    #define SPDLOG_ACTIVE_LEVEL NOEUL_LOG_LEVEL
#else
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cstdlib>

#include <SDL3/SDL_error.h>
#include <spdlog/spdlog.h>


#define NOEUL_ABORT(...)                           \
    do {                                           \
        const auto msg = fmt::format(__VA_ARGS__); \
        SPDLOG_CRITICAL("{}", msg);                \
        std::abort();                              \
    } while (0)

#define NOEUL_ASSERT(cond)                        \
    do {                                          \
        if (!(cond))                              \
            NOEUL_ABORT("Assert failed: " #cond); \
    } while (0)

#define NOEUL_ASSERTM(cond, ...)      \
    do {                              \
        if (!(cond))                  \
            NOEUL_ABORT(__VA_ARGS__); \
    } while (0)

// Logs and carries on
#define NOEUL_VERIFY(cond)                              \
    do {                                                \
        if (!(cond))                                    \
            SPDLOG_WARN("Verification failed: " #cond); \
    } while (0)

#define NOEUL_VERIFYM(cond, ...)      \
    do {                              \
        if (!(cond))                  \
            SPDLOG_WARN(__VA_ARGS__); \
    } while (0)

// For SDL calls returning false on failure. Appends SDL_GetError().
#define NOEUL_VERIFY_SDL(call)                                   \
    do {                                                         \
        if (!(call))                                             \
            SPDLOG_WARN("{} failed: {}", #call, SDL_GetError()); \
    } while (0)
