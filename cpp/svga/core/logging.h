#pragma once

#include <cstdio>

#ifndef SVGA_ENABLE_LOGGING
#define SVGA_ENABLE_LOGGING 0
#endif

#if SVGA_ENABLE_LOGGING
#define SVGA_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[svga] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SVGA_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[svga] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SVGA_LOG_DEBUG(...) do { } while (0)
#define SVGA_LOG_WARN(...) do { } while (0)
#endif
