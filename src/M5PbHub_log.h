/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

// 库内部日志宏，不属于公共 API
// Library-internal logging macros, not part of the public API

#ifndef _M5PBHUB_LOG_H_
#define _M5PBHUB_LOG_H_

#include "M5PbHub_types.h"

// 当前日志级别（由 M5PbHub::setLogLevel 设置）
// Current log level (set by M5PbHub::setLogLevel)
m5pbhub_log_level_t m5pbhub_current_log_level();

#ifdef ARDUINO
#include <Arduino.h>

#define M5PBHUB_LOG_I(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_INFO) {        \
            Serial.printf("[%s] " fmt "\r\n", tag, ##__VA_ARGS__);          \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_W(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_WARN) {        \
            Serial.printf("[%s] WARN: " fmt "\r\n", tag, ##__VA_ARGS__);    \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_E(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_ERROR) {       \
            Serial.printf("[%s] ERROR: " fmt "\r\n", tag, ##__VA_ARGS__);   \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_D(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_DEBUG) {       \
            Serial.printf("[%s] DEBUG: " fmt "\r\n", tag, ##__VA_ARGS__);   \
        }                                                                   \
    } while (0)

#elif defined(ESP_PLATFORM)
#include "esp_log.h"

#define M5PBHUB_LOG_I(tag, fmt, ...) ESP_LOGI(tag, fmt, ##__VA_ARGS__)
#define M5PBHUB_LOG_W(tag, fmt, ...) ESP_LOGW(tag, fmt, ##__VA_ARGS__)
#define M5PBHUB_LOG_E(tag, fmt, ...) ESP_LOGE(tag, fmt, ##__VA_ARGS__)
#define M5PBHUB_LOG_D(tag, fmt, ...) ESP_LOGD(tag, fmt, ##__VA_ARGS__)

#else  // Linux / host
#include <stdio.h>

#define M5PBHUB_LOG_I(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_INFO) {        \
            fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__);          \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_W(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_WARN) {        \
            fprintf(stderr, "[%s] WARN: " fmt "\n", tag, ##__VA_ARGS__);    \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_E(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_ERROR) {       \
            fprintf(stderr, "[%s] ERROR: " fmt "\n", tag, ##__VA_ARGS__);   \
        }                                                                   \
    } while (0)

#define M5PBHUB_LOG_D(tag, fmt, ...)                                        \
    do {                                                                    \
        if (m5pbhub_current_log_level() >= M5PBHUB_LOG_LEVEL_DEBUG) {       \
            fprintf(stderr, "[%s] DEBUG: " fmt "\n", tag, ##__VA_ARGS__);   \
        }                                                                   \
    } while (0)
#endif

#endif  // _M5PBHUB_LOG_H_
