/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

/**
 * @file M5PbHub_types.h
 * @brief M5Stack PbHub 公共类型、常量与寄存器表
 *        M5Stack PbHub common types, constants and register map
 */

#ifndef _M5PBHUB_TYPES_H_
#define _M5PBHUB_TYPES_H_

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

// ============================
// 错误码
// Error Codes
// ============================
typedef enum {
    M5PBHUB_OK = 0,                       // 成功
                                          // Success
    M5PBHUB_FAIL = -1,                    // 一般失败
                                          // General failure
    M5PBHUB_ERR_I2C_CONFIG = -2,          // I2C 配置错误 (如设备句柄创建失败)
                                          // I2C configuration error
    M5PBHUB_ERR_INVALID_ARG = -3,         // 无效参数 (如空指针)
                                          // Invalid argument
    M5PBHUB_ERR_INVALID_PORT = -4,        // 端口/通道/操作组合不受支持
                                          // Unsupported port/channel/operation combination
    M5PBHUB_ERR_VALUE_RANGE = -5,         // 数值超出操作的有效范围
                                          // Value outside the operation's domain
    M5PBHUB_ERR_MALFORMED_RESPONSE = -6,  // 响应字节长度与预期不符
                                          // Response length mismatches the operation
    M5PBHUB_ERR_NOT_SUPPORTED = -7,       // 不支持的功能
                                          // Function not supported
    M5PBHUB_ERR_I2C_COMM = -8,            // I2C 通信错误
                                          // I2C communication error
    M5PBHUB_ERR_NOT_INIT = -9,            // 设备未初始化
                                          // Device not initialized
} m5pbhub_err_t;

// ============================
// 设备常量
// Device Constants
// ============================
#ifndef M5PBHUB_DEFAULT_ADDR
#define M5PBHUB_DEFAULT_ADDR 0x61  // 默认I2C地址 / Default I2C address
#endif
#define M5PBHUB_MAX_PORTS     6   // 端口 A-F / Ports A-F
#define M5PBHUB_MAX_CHANNELS  2   // 每端口 2 个引脚 / 2 pins per port
#define M5PBHUB_CHANNEL_STRIDE 1  // 相邻通道寄存器间距 / Register distance between channels
#define M5PBHUB_MAX_LED_COUNT 74  // 每端口最大 NeoPixel 数量 / Maximum NeoPixels per port

// 数值范围
// Value ranges
#define M5PBHUB_ANALOG_MAX      4095      // 12 位 ADC / 12-bit ADC
#define M5PBHUB_PWM_MAX         255       // 8 位 PWM / 8-bit PWM
#define M5PBHUB_SERVO_ANGLE_MAX 180       // 舵机角度 / Servo angle in degrees
#define M5PBHUB_SERVO_PULSE_MIN 500       // 舵机脉宽 us (50Hz) / Servo pulse width in us (50Hz)
#define M5PBHUB_SERVO_PULSE_MAX 2500
#define M5PBHUB_RGB_MAX         0xFFFFFF  // 24 位 RGB / 24-bit RGB

// 单次编码的最大字节数
// Largest encoded value in bytes
#define M5PBHUB_MAX_WIRE_LEN 3

// ============================
// I2C 频率常量
// I2C Frequency Constants
// ============================
#define M5PBHUB_I2C_FREQ_100K    100000  // 标准模式 / Standard mode
#define M5PBHUB_I2C_FREQ_400K    400000  // 快速模式 / Fast mode
#define M5PBHUB_I2C_FREQ_DEFAULT M5PBHUB_I2C_FREQ_100K
#ifndef M5PBHUB_I2C_TIMEOUT_MS
#define M5PBHUB_I2C_TIMEOUT_MS 50
#endif

// ============================
// 寄存器地址
// Register Addresses
// ============================

// ---- 端口基地址 ----
// ---- Port Base Registers ----
// 每个端口占用 16 字节寄存器块，寄存器地址 = 基地址 | 操作偏移
// Each port owns a 16-byte register block, address = base | operation offset
#define M5PBHUB_REG_PORT_A_BASE 0x40
#define M5PBHUB_REG_PORT_B_BASE 0x50
#define M5PBHUB_REG_PORT_C_BASE 0x60
#define M5PBHUB_REG_PORT_D_BASE 0x70
#define M5PBHUB_REG_PORT_E_BASE 0x80
#define M5PBHUB_REG_PORT_F_BASE 0xA0  // 0x90 保留 / 0x90 is reserved

// ---- 端口内偏移 ----
// ---- Per-port Offsets ----
#define M5PBHUB_OFS_DIGITAL_OUT   0x00  // R/W   [0] 数字输出 (通道0/1: 0x00/0x01) / Digital output (ch0/1: 0x00/0x01)
#define M5PBHUB_OFS_PWM           0x02  // R/W   [7:0] PWM 占空比 (0x02/0x03) / PWM duty (0x02/0x03)
#define M5PBHUB_OFS_DIGITAL_IN    0x04  // R     [0] 数字输入 (0x04/0x05) / Digital input (0x04/0x05)
#define M5PBHUB_OFS_ANALOG_IN     0x06  // R     [11:0] ADC，小端，仅通道0 / ADC, little-endian, ch0 only
#define M5PBHUB_OFS_LED_COUNT     0x08  // R/W   [15:0] LED 数量，小端 / LED count, little-endian
#define M5PBHUB_OFS_LED_COLOR     0x09  // W     idx[2] + R,G,B 单个 LED / Single LED
#define M5PBHUB_OFS_LED_RANGE     0x0A  // W     start[2] + count[2] + R,G,B 区间 / LED range
#define M5PBHUB_OFS_LED_BRIGHT    0x0B  // R/W   [7:0] LED 亮度 / LED brightness
#define M5PBHUB_OFS_SERVO_ANGLE   0x0C  // R/W   [7:0] 舵机角度 (0x0C/0x0D) / Servo angle (0x0C/0x0D)
#define M5PBHUB_OFS_SERVO_PULSE   0x0E  // R/W   [15:0] 舵机脉宽，小端 (0x0E/0x0F) / Servo pulse, LE (0x0E/0x0F)

// ---- 全局寄存器 ----
// ---- Global Registers ----
#define M5PBHUB_REG_FW_VERSION 0xFE  // R     [7:0] 固件版本 / Firmware version

// ============================
// 端口
// Ports
// ============================
typedef enum {
    M5PBHUB_PORT_A = 0,
    M5PBHUB_PORT_B,
    M5PBHUB_PORT_C,
    M5PBHUB_PORT_D,
    M5PBHUB_PORT_E,
    M5PBHUB_PORT_F,
    M5PBHUB_PORT_MAX,
} m5pbhub_port_t;

// ============================
// 端口内通道 (引脚)
// Channel (pin) within a port
// ============================
typedef enum {
    M5PBHUB_CHANNEL_0 = 0,
    M5PBHUB_CHANNEL_1 = 1,
    M5PBHUB_CHANNEL_MAX,
} m5pbhub_channel_t;

// ============================
// 操作类型
// Operation Kinds
// ============================
typedef enum {
    M5PBHUB_OP_DIGITAL_READ = 0,  // 数字输入 / Digital input
    M5PBHUB_OP_DIGITAL_WRITE,     // 数字输出 / Digital output
    M5PBHUB_OP_ANALOG_READ,       // ADC 输入 / ADC input
    M5PBHUB_OP_PWM_WRITE,         // PWM 输出 (0-255) / PWM output (0-255)
    M5PBHUB_OP_SERVO_WRITE,       // 舵机角度 / Servo angle
    M5PBHUB_OP_SERVO_PULSE,       // 舵机脉宽 / Servo pulse width
    M5PBHUB_OP_RGB_WRITE,         // 单个 LED 颜色 / Single LED color
    M5PBHUB_OP_RGB_FILL,          // LED 区间颜色 / LED range color
    M5PBHUB_OP_LED_COUNT,         // LED 数量 / LED count
    M5PBHUB_OP_LED_BRIGHTNESS,    // LED 亮度 / LED brightness
    M5PBHUB_OP_ENCODER_READ,      // 编码器读取 (PbHub 不提供) / Encoder read (not provided by PbHub)
    M5PBHUB_OP_ENCODER_RESET,     // 编码器清零 (PbHub 不提供) / Encoder reset (not provided by PbHub)
    M5PBHUB_OP_MAX,
} m5pbhub_op_t;

// ============================
// RGB 颜色结构
// RGB Color Structure
// ============================
typedef struct {
    uint8_t r;
    uint8_t g;
    uint8_t b;
} m5pbhub_rgb_t;

// ============================
// 日志级别
// Log Level
// ============================
typedef enum {
    M5PBHUB_LOG_LEVEL_NONE = 0,
    M5PBHUB_LOG_LEVEL_ERROR,
    M5PBHUB_LOG_LEVEL_WARN,
    M5PBHUB_LOG_LEVEL_INFO,
    M5PBHUB_LOG_LEVEL_DEBUG,
    M5PBHUB_LOG_LEVEL_VERBOSE,
} m5pbhub_log_level_t;

/**
 * @brief 错误码转字符串
 *        Convert an error code to its name
 */
const char* m5pbhub_err_to_name(m5pbhub_err_t err);

#endif  // _M5PBHUB_TYPES_H_
