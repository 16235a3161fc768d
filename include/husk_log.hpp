#pragma once

/**
 * @file husk_log.hpp
 * @brief Device-side logging macros
 *
 * On Android these forward to liblog under the "husk" tag. Host builds
 * (tests, tools) print the same lines to stderr.
 */

#define HUSK_LOG_TAG "husk"

#if defined(__ANDROID__)
    #include <android/log.h>

    #define HUSK_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, HUSK_LOG_TAG, __VA_ARGS__)
    #define HUSK_LOGI(...) __android_log_print(ANDROID_LOG_INFO, HUSK_LOG_TAG, __VA_ARGS__)
    #define HUSK_LOGW(...) __android_log_print(ANDROID_LOG_WARN, HUSK_LOG_TAG, __VA_ARGS__)
    #define HUSK_LOGE(...) __android_log_print(ANDROID_LOG_ERROR, HUSK_LOG_TAG, __VA_ARGS__)
#else
    #include <cstdio>

    #define HUSK_LOG_STDERR(level, ...)                          \
        do {                                                     \
            std::fprintf(stderr, level "/" HUSK_LOG_TAG ": ");   \
            std::fprintf(stderr, __VA_ARGS__);                   \
            std::fputc('\n', stderr);                            \
        } while (0)

    #define HUSK_LOGD(...) HUSK_LOG_STDERR("D", __VA_ARGS__)
    #define HUSK_LOGI(...) HUSK_LOG_STDERR("I", __VA_ARGS__)
    #define HUSK_LOGW(...) HUSK_LOG_STDERR("W", __VA_ARGS__)
    #define HUSK_LOGE(...) HUSK_LOG_STDERR("E", __VA_ARGS__)
#endif
