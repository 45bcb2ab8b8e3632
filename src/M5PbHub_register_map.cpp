/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

#include "M5PbHub_register_map.h"

// ============================
// 寄存器表
// Register Tables
// ============================

static const uint8_t PORT_BASE_REG[M5PBHUB_MAX_PORTS] = {
    M5PBHUB_REG_PORT_A_BASE, M5PBHUB_REG_PORT_B_BASE, M5PBHUB_REG_PORT_C_BASE,
    M5PBHUB_REG_PORT_D_BASE, M5PBHUB_REG_PORT_E_BASE, M5PBHUB_REG_PORT_F_BASE,
};

// 支持的通道掩码
// Supported channel mask
#define CH_NONE 0x00
#define CH_0    0x01
#define CH_BOTH 0x03

typedef struct {
    const char* name;
    uint8_t offset;
    uint8_t channels;
    uint8_t wireLen;
    uint8_t readLen;
    bool readable;
    bool writable;
    uint32_t minValue;
    uint32_t maxValue;
} op_info_t;

// 与 m5pbhub_op_t 顺序一致；LED 数量写 2 字节，固件只回读低字节
// Same order as m5pbhub_op_t; LED count is written as 2 bytes, the firmware only reads back the low byte
static const op_info_t OP_INFO[M5PBHUB_OP_MAX] = {
    {"digital_read", M5PBHUB_OFS_DIGITAL_IN, CH_BOTH, 1, 1, true, false, 0, 1},
    {"digital_write", M5PBHUB_OFS_DIGITAL_OUT, CH_BOTH, 1, 1, true, true, 0, 1},
    {"analog_read", M5PBHUB_OFS_ANALOG_IN, CH_0, 2, 2, true, false, 0, M5PBHUB_ANALOG_MAX},
    {"pwm_write", M5PBHUB_OFS_PWM, CH_BOTH, 1, 1, true, true, 0, M5PBHUB_PWM_MAX},
    {"servo_write", M5PBHUB_OFS_SERVO_ANGLE, CH_BOTH, 1, 1, true, true, 0, M5PBHUB_SERVO_ANGLE_MAX},
    {"servo_pulse", M5PBHUB_OFS_SERVO_PULSE, CH_BOTH, 2, 2, true, true, M5PBHUB_SERVO_PULSE_MIN,
     M5PBHUB_SERVO_PULSE_MAX},
    {"rgb_write", M5PBHUB_OFS_LED_COLOR, CH_0, 3, 3, false, true, 0, M5PBHUB_RGB_MAX},
    {"rgb_fill", M5PBHUB_OFS_LED_RANGE, CH_0, 3, 3, false, true, 0, M5PBHUB_RGB_MAX},
    {"led_count", M5PBHUB_OFS_LED_COUNT, CH_0, 2, 1, true, true, 0, M5PBHUB_MAX_LED_COUNT},
    {"led_brightness", M5PBHUB_OFS_LED_BRIGHT, CH_0, 1, 1, true, true, 0, 255},
    {"encoder_read", 0, CH_NONE, 0, 0, false, false, 0, 0},
    {"encoder_reset", 0, CH_NONE, 0, 0, false, false, 0, 0},
};

static inline bool _isValidOp(m5pbhub_op_t op)
{
    return (int)op >= 0 && op < M5PBHUB_OP_MAX;
}

// ============================
// 端口/通道
// Port / Channel
// ============================

bool M5PbHubRegisterMapper::isValidPort(m5pbhub_port_t port)
{
    return (int)port >= 0 && (int)port < M5PBHUB_MAX_PORTS;
}

bool M5PbHubRegisterMapper::isValidChannel(m5pbhub_channel_t channel)
{
    return (int)channel >= 0 && (int)channel < M5PBHUB_MAX_CHANNELS;
}

uint8_t M5PbHubRegisterMapper::portBase(m5pbhub_port_t port)
{
    if (!isValidPort(port)) {
        return 0;
    }
    return PORT_BASE_REG[port];
}

char M5PbHubRegisterMapper::portName(m5pbhub_port_t port)
{
    if (!isValidPort(port)) {
        return '?';
    }
    return (char)('A' + (int)port);
}

// ============================
// 地址解析
// Address Resolution
// ============================

m5pbhub_err_t M5PbHubRegisterMapper::resolveAddress(m5pbhub_port_t port, m5pbhub_channel_t channel,
                                                    m5pbhub_op_t op, uint8_t* reg)
{
    if (reg == nullptr) {
        return M5PBHUB_ERR_INVALID_ARG;
    }
    if (!isValidPort(port) || !isValidChannel(channel) || !_isValidOp(op)) {
        return M5PBHUB_ERR_INVALID_PORT;
    }
    const op_info_t& info = OP_INFO[op];
    if ((info.channels & (1u << channel)) == 0) {
        return M5PBHUB_ERR_INVALID_PORT;
    }

    *reg = (uint8_t)(PORT_BASE_REG[port] + M5PBHUB_CHANNEL_STRIDE * (uint8_t)channel + info.offset);
    return M5PBHUB_OK;
}

// ============================
// 编解码
// Codec
// ============================

size_t M5PbHubRegisterMapper::wireLength(m5pbhub_op_t op)
{
    if (!_isValidOp(op)) {
        return 0;
    }
    return OP_INFO[op].wireLen;
}

size_t M5PbHubRegisterMapper::readLength(m5pbhub_op_t op)
{
    if (!_isValidOp(op)) {
        return 0;
    }
    return OP_INFO[op].readLen;
}

uint32_t M5PbHubRegisterMapper::minValue(m5pbhub_op_t op)
{
    return _isValidOp(op) ? OP_INFO[op].minValue : 0;
}

uint32_t M5PbHubRegisterMapper::maxValue(m5pbhub_op_t op)
{
    return _isValidOp(op) ? OP_INFO[op].maxValue : 0;
}

bool M5PbHubRegisterMapper::isReadable(m5pbhub_op_t op)
{
    return _isValidOp(op) && OP_INFO[op].readable;
}

bool M5PbHubRegisterMapper::isWritable(m5pbhub_op_t op)
{
    return _isValidOp(op) && OP_INFO[op].writable;
}

m5pbhub_err_t M5PbHubRegisterMapper::encode(m5pbhub_op_t op, uint32_t value, uint8_t* buf, size_t bufSize,
                                            size_t* len)
{
    if (buf == nullptr || len == nullptr) {
        return M5PBHUB_ERR_INVALID_ARG;
    }
    size_t width = wireLength(op);
    if (width == 0) {
        return M5PBHUB_ERR_NOT_SUPPORTED;
    }
    const op_info_t& info = OP_INFO[op];
    if (value < info.minValue || value > info.maxValue) {
        return M5PBHUB_ERR_VALUE_RANGE;
    }
    if (bufSize < width) {
        return M5PBHUB_ERR_INVALID_ARG;
    }

    switch (width) {
        case 1:
            buf[0] = (uint8_t)value;
            break;
        case 2:
            // 小端模式：低字节在前
            // Little-endian: low byte first
            buf[0] = (uint8_t)(value & 0xFF);
            buf[1] = (uint8_t)((value >> 8) & 0xFF);
            break;
        case 3:
            // R, G, B
            buf[0] = (uint8_t)((value >> 16) & 0xFF);
            buf[1] = (uint8_t)((value >> 8) & 0xFF);
            buf[2] = (uint8_t)(value & 0xFF);
            break;
        default:
            return M5PBHUB_ERR_NOT_SUPPORTED;
    }
    *len = width;
    return M5PBHUB_OK;
}

m5pbhub_err_t M5PbHubRegisterMapper::decode(m5pbhub_op_t op, const uint8_t* buf, size_t len, uint32_t* value)
{
    if (value == nullptr) {
        return M5PBHUB_ERR_INVALID_ARG;
    }
    size_t width = wireLength(op);
    if (width == 0) {
        return M5PBHUB_ERR_NOT_SUPPORTED;
    }
    if (buf == nullptr || (len != width && len != OP_INFO[op].readLen)) {
        return M5PBHUB_ERR_MALFORMED_RESPONSE;
    }

    switch (len) {
        case 1:
            if (op == M5PBHUB_OP_DIGITAL_READ || op == M5PBHUB_OP_DIGITAL_WRITE) {
                *value = buf[0] != 0 ? 1 : 0;
            } else {
                *value = buf[0];
            }
            break;
        case 2:
            *value = (uint32_t)buf[0] | ((uint32_t)buf[1] << 8);
            break;
        case 3:
            *value = ((uint32_t)buf[0] << 16) | ((uint32_t)buf[1] << 8) | (uint32_t)buf[2];
            break;
        default:
            return M5PBHUB_ERR_NOT_SUPPORTED;
    }
    return M5PBHUB_OK;
}

const char* M5PbHubRegisterMapper::opName(m5pbhub_op_t op)
{
    if (!_isValidOp(op)) {
        return "unknown";
    }
    return OP_INFO[op].name;
}

// ============================
// 错误码名称
// Error Names
// ============================

const char* m5pbhub_err_to_name(m5pbhub_err_t err)
{
    switch (err) {
        case M5PBHUB_OK:
            return "M5PBHUB_OK";
        case M5PBHUB_FAIL:
            return "M5PBHUB_FAIL";
        case M5PBHUB_ERR_I2C_CONFIG:
            return "M5PBHUB_ERR_I2C_CONFIG";
        case M5PBHUB_ERR_INVALID_ARG:
            return "M5PBHUB_ERR_INVALID_ARG";
        case M5PBHUB_ERR_INVALID_PORT:
            return "M5PBHUB_ERR_INVALID_PORT";
        case M5PBHUB_ERR_VALUE_RANGE:
            return "M5PBHUB_ERR_VALUE_RANGE";
        case M5PBHUB_ERR_MALFORMED_RESPONSE:
            return "M5PBHUB_ERR_MALFORMED_RESPONSE";
        case M5PBHUB_ERR_NOT_SUPPORTED:
            return "M5PBHUB_ERR_NOT_SUPPORTED";
        case M5PBHUB_ERR_I2C_COMM:
            return "M5PBHUB_ERR_I2C_COMM";
        case M5PBHUB_ERR_NOT_INIT:
            return "M5PBHUB_ERR_NOT_INIT";
        default:
            return "UNKNOWN_ERROR";
    }
}
