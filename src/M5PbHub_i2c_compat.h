/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef __M5PBHUB_I2C_COMPAT_H__
#define __M5PBHUB_I2C_COMPAT_H__

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include <string.h>

#ifdef ARDUINO

#include "Wire.h"

// ============================
// Arduino I2C 功能
// Arduino I2C Functions
// ============================

#ifndef M5PBHUB_I2C_READ_BYTES
static inline bool M5PBHUB_I2C_READ_BYTES(TwoWire *wire, uint8_t addr, uint8_t reg, size_t len, uint8_t *data)
{
    wire->beginTransmission(addr);
    wire->write(reg);
    if (wire->endTransmission(false) != 0) {
        return false;
    }
    if (wire->requestFrom(addr, (uint8_t)len) != len) {
        return false;
    }
    for (size_t i = 0; i < len; i++) {
        data[i] = wire->read();
    }
    return true;
}
#endif

#ifndef M5PBHUB_I2C_WRITE_BYTES
static inline bool M5PBHUB_I2C_WRITE_BYTES(TwoWire *wire, uint8_t addr, uint8_t reg, size_t len,
                                           const uint8_t *data)
{
    wire->beginTransmission(addr);
    wire->write(reg);
    for (size_t i = 0; i < len; i++) {
        wire->write(data[i]);
    }
    return wire->endTransmission() == 0;
}
#endif

// 地址应答探测
// Address ACK probe
#ifndef M5PBHUB_I2C_PROBE
static inline bool M5PBHUB_I2C_PROBE(TwoWire *wire, uint8_t addr)
{
    wire->beginTransmission(addr);
    return wire->endTransmission() == 0;
}
#endif

#elif defined(ESP_PLATFORM)  // ESP-IDF

#include <stdlib.h>
#include <esp_err.h>
#include <esp_idf_version.h>

// ============================
// I2C 驱动检测
// I2C Driver Detection
// ============================

// 检测 i2c_bus 是否可用
// Detect if i2c_bus is available
//
// ESP-IDF < 5.3.0:
//   Without BACKWARD_CONFIG: i2c_bus not supported.
//   With    BACKWARD_CONFIG: i2c_bus.h falls back to driver/i2c.h internally, safe to use.
// ESP-IDF >= 5.3.0:
//   With    BACKWARD_CONFIG: i2c_bus.h uses driver/i2c.h internally, always conflict-free.
//   Without BACKWARD_CONFIG:
//     _DRIVER_I2C_H_ defined   (driver/i2c.h already included by another component)
//       → i2c_bus.h would define its own i2c_config_t, conflicting with the existing one → disabled.
//     _DRIVER_I2C_H_ not defined
//       → no conflict risk, enable i2c_bus with default config.
#if __has_include(<i2c_bus.h>)
  #if ESP_IDF_VERSION < ESP_IDF_VERSION_VAL(5, 3, 0)
    #if defined(CONFIG_I2C_BUS_BACKWARD_CONFIG)
      #define M5PBHUB_HAS_I2C_BUS 1
    #else
      #define M5PBHUB_HAS_I2C_BUS 0
    #endif
  #else
    #if defined(CONFIG_I2C_BUS_BACKWARD_CONFIG)
      #define M5PBHUB_HAS_I2C_BUS 1
    #elif defined(_DRIVER_I2C_H_)
      #define M5PBHUB_HAS_I2C_BUS 0  // driver/i2c.h 已提前包含，冲突风险 / included early, conflict risk
    #else
      #define M5PBHUB_HAS_I2C_BUS 1
    #endif
  #endif
#else
  #define M5PBHUB_HAS_I2C_BUS 0
#endif

// i2c_master 驱动仅在 ESP-IDF >= 5.3.0 上使用（5.1 引入，5.3 稳定）
// i2c_master driver is used on ESP-IDF >= 5.3.0 only (introduced in 5.1, stable in 5.3)
#if ESP_IDF_VERSION >= ESP_IDF_VERSION_VAL(5, 3, 0) && __has_include(<driver/i2c_master.h>)
  #define M5PBHUB_HAS_I2C_MASTER 1
  #include <driver/i2c_master.h>
#else
  #define M5PBHUB_HAS_I2C_MASTER 0
#endif

#if M5PBHUB_HAS_I2C_BUS
  #include <i2c_bus.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

// ============================
// ESP-IDF I2C 函数 (i2c_bus)
// ESP-IDF I2C Functions (i2c_bus)
// ============================

#if M5PBHUB_HAS_I2C_BUS

#ifndef M5PBHUB_I2C_BUS_READ_BYTES
static inline esp_err_t M5PBHUB_I2C_BUS_READ_BYTES(i2c_bus_device_handle_t dev, uint8_t reg, size_t len,
                                                   uint8_t *data)
{
    return i2c_bus_read_bytes(dev, reg, len, data);
}
#endif

#ifndef M5PBHUB_I2C_BUS_WRITE_BYTES
static inline esp_err_t M5PBHUB_I2C_BUS_WRITE_BYTES(i2c_bus_device_handle_t dev, uint8_t reg, size_t len,
                                                    const uint8_t *data)
{
    return i2c_bus_write_bytes(dev, reg, len, (uint8_t *)data);
}
#endif

#endif  // M5PBHUB_HAS_I2C_BUS

// ============================
// ESP-IDF I2C 函数 (i2c_master - 原生驱动)
// ESP-IDF I2C Functions (i2c_master - native driver)
// ============================

#if M5PBHUB_HAS_I2C_MASTER

#ifndef M5PBHUB_I2C_MASTER_READ_BYTES
static inline esp_err_t M5PBHUB_I2C_MASTER_READ_BYTES(i2c_master_dev_handle_t dev, uint8_t reg, size_t len,
                                                      uint8_t *data, int timeout_ms)
{
    return i2c_master_transmit_receive(dev, &reg, 1, data, len, timeout_ms);
}
#endif

#ifndef M5PBHUB_I2C_MASTER_WRITE_BYTES
static inline esp_err_t M5PBHUB_I2C_MASTER_WRITE_BYTES(i2c_master_dev_handle_t dev, uint8_t reg, size_t len,
                                                       const uint8_t *data, int timeout_ms)
{
    // 需要在数据前添加寄存器地址
    // Need to prepend register address
    uint8_t *buf = (uint8_t *)malloc(len + 1);
    if (buf == NULL) return ESP_ERR_NO_MEM;
    buf[0] = reg;
    if (len > 0) {
        memcpy(buf + 1, data, len);
    }
    esp_err_t ret = i2c_master_transmit(dev, buf, len + 1, timeout_ms);
    free(buf);
    return ret;
}
#endif

#endif  // M5PBHUB_HAS_I2C_MASTER

#ifdef __cplusplus
}
#endif

#elif defined(__linux__)  // Linux i2c-dev

#include <errno.h>
#include <sys/ioctl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>

// ============================
// Linux I2C 功能 (i2c-dev)
// Linux I2C Functions (i2c-dev)
// ============================

#ifndef M5PBHUB_I2C_READ_BYTES
static inline bool M5PBHUB_I2C_READ_BYTES(int fd, uint8_t addr, uint8_t reg, size_t len, uint8_t *data)
{
    struct i2c_msg msgs[2];
    msgs[0].addr  = addr;
    msgs[0].flags = 0;
    msgs[0].len   = 1;
    msgs[0].buf   = &reg;
    msgs[1].addr  = addr;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len   = (uint16_t)len;
    msgs[1].buf   = data;

    struct i2c_rdwr_ioctl_data xfer;
    xfer.msgs  = msgs;
    xfer.nmsgs = 2;
    return ioctl(fd, I2C_RDWR, &xfer) == 2;
}
#endif

// 单次写入的最大负载（不含寄存器地址）
// Largest payload of one write, register byte excluded
#ifndef M5PBHUB_I2C_MAX_WRITE_LEN
#define M5PBHUB_I2C_MAX_WRITE_LEN 32
#endif

#ifndef M5PBHUB_I2C_WRITE_BYTES
static inline bool M5PBHUB_I2C_WRITE_BYTES(int fd, uint8_t addr, uint8_t reg, size_t len, const uint8_t *data)
{
    uint8_t buf[M5PBHUB_I2C_MAX_WRITE_LEN + 1];
    if (len > M5PBHUB_I2C_MAX_WRITE_LEN) {
        errno = EMSGSIZE;
        return false;
    }
    buf[0] = reg;
    if (len > 0) {
        memcpy(buf + 1, data, len);
    }

    struct i2c_msg msg;
    msg.addr  = addr;
    msg.flags = 0;
    msg.len   = (uint16_t)(len + 1);
    msg.buf   = buf;

    struct i2c_rdwr_ioctl_data xfer;
    xfer.msgs  = &msg;
    xfer.nmsgs = 1;
    return ioctl(fd, I2C_RDWR, &xfer) == 1;
}
#endif

#endif  // ARDUINO / ESP_PLATFORM / __linux__

#endif  // __M5PBHUB_I2C_COMPAT_H__
