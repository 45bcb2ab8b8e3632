/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

#include "M5PbHub.h"
#include "M5PbHub_log.h"
#include <string.h>

static const char* TAG = "M5PbHub";

// ============================
// 全局日志级别控制
// Global Log Level Control
// ============================

static m5pbhub_log_level_t _m5pbhub_log_level = M5PBHUB_LOG_LEVEL_INFO;

m5pbhub_log_level_t m5pbhub_current_log_level()
{
    return _m5pbhub_log_level;
}

void M5PbHub::setLogLevel(m5pbhub_log_level_t level)
{
    _m5pbhub_log_level = level;

#if defined(ESP_PLATFORM) && !defined(ARDUINO)
    // 将 M5PbHub 日志级别映射到 ESP-IDF 日志级别
    // Map M5PbHub log level to ESP-IDF log level
    esp_log_level_t esp_level;
    switch (level) {
        case M5PBHUB_LOG_LEVEL_NONE:
            esp_level = ESP_LOG_NONE;
            break;
        case M5PBHUB_LOG_LEVEL_ERROR:
            esp_level = ESP_LOG_ERROR;
            break;
        case M5PBHUB_LOG_LEVEL_WARN:
            esp_level = ESP_LOG_WARN;
            break;
        case M5PBHUB_LOG_LEVEL_INFO:
            esp_level = ESP_LOG_INFO;
            break;
        case M5PBHUB_LOG_LEVEL_DEBUG:
            esp_level = ESP_LOG_DEBUG;
            break;
        case M5PBHUB_LOG_LEVEL_VERBOSE:
            esp_level = ESP_LOG_VERBOSE;
            break;
        default:
            esp_level = ESP_LOG_INFO;
            break;
    }

    esp_log_level_set(TAG, esp_level);
#endif
}

m5pbhub_log_level_t M5PbHub::getLogLevel()
{
    return _m5pbhub_log_level;
}

// ============================
// 构造函数 / 析构函数
// Constructor / Destructor
// ============================

M5PbHub::M5PbHub() : _transport(nullptr), _initialized(false)
{
}

M5PbHub::~M5PbHub()
{
    // 平台传输层成员自行释放设备句柄；外部传输层由调用者管理
    // Member transports release their device handles; external transports stay with the caller
    _transport = nullptr;
}

// ============================
// 初始化函数
// Initialization Functions
// ============================

m5pbhub_err_t M5PbHub::beginWithTransport(M5PbHubTransport* transport)
{
    _initialized = false;
    _transport   = nullptr;
    if (transport == nullptr) {
        M5PBHUB_LOG_E(TAG, "begin transport is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    _transport = transport;

    m5pbhub_err_t err = _initDevice();
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "PbHub not responding: %s", m5pbhub_err_to_name(err));
        _transport = nullptr;
        return err;
    }

    _initialized = true;
    return M5PBHUB_OK;
}

#ifdef ARDUINO

m5pbhub_err_t M5PbHub::begin(TwoWire* wire, uint8_t addr, int8_t sda, int8_t scl, uint32_t speed)
{
    // 重新初始化前先失效旧状态
    // Drop the previous state before re-initializing
    _initialized = false;
    _transport   = nullptr;

    uint32_t actualSpeed = _validateSpeed(speed);
    m5pbhub_err_t err    = _wireTransport.begin(wire, addr, sda, scl, actualSpeed);
    if (err != M5PBHUB_OK) {
        return err;
    }
    if (!_wireTransport.probe()) {
        M5PBHUB_LOG_E(TAG, "No ACK at address 0x%02X", addr);
        return M5PBHUB_ERR_I2C_COMM;
    }
    err = beginWithTransport(&_wireTransport);
    if (err == M5PBHUB_OK) {
        M5PBHUB_LOG_I(TAG, "M5PbHub initialized at address 0x%02X (I2C: %lu Hz)", addr,
                      (unsigned long)actualSpeed);
    }
    return err;
}

#elif defined(ESP_PLATFORM)

#if M5PBHUB_HAS_I2C_MASTER
m5pbhub_err_t M5PbHub::begin(i2c_master_bus_handle_t bus, uint8_t addr, uint32_t speed)
{
    // 重新初始化前先失效旧状态
    // Drop the previous state before re-initializing
    _initialized = false;
    _transport   = nullptr;

    uint32_t actualSpeed = _validateSpeed(speed);
    m5pbhub_err_t err    = _masterTransport.begin(bus, addr, actualSpeed);
    if (err != M5PBHUB_OK) {
        return err;
    }
    if (!_masterTransport.probe()) {
        M5PBHUB_LOG_E(TAG, "No ACK at address 0x%02X", addr);
        _masterTransport.end();
        return M5PBHUB_ERR_I2C_COMM;
    }
    err = beginWithTransport(&_masterTransport);
    if (err != M5PBHUB_OK) {
        _masterTransport.end();
        return err;
    }
    M5PBHUB_LOG_I(TAG, "M5PbHub initialized at address 0x%02X (I2C: %lu Hz)", addr,
                  (unsigned long)actualSpeed);
    return M5PBHUB_OK;
}
#endif  // M5PBHUB_HAS_I2C_MASTER

#if M5PBHUB_HAS_I2C_BUS
m5pbhub_err_t M5PbHub::begin(i2c_bus_handle_t bus, uint8_t addr, uint32_t speed)
{
    // 重新初始化前先失效旧状态
    // Drop the previous state before re-initializing
    _initialized = false;
    _transport   = nullptr;

    uint32_t actualSpeed = _validateSpeed(speed);
    m5pbhub_err_t err    = _busTransport.begin(bus, addr, actualSpeed);
    if (err != M5PBHUB_OK) {
        return err;
    }
    err = beginWithTransport(&_busTransport);
    if (err != M5PBHUB_OK) {
        _busTransport.end();
        return err;
    }
    M5PBHUB_LOG_I(TAG, "M5PbHub initialized at address 0x%02X (I2C: %lu Hz)", addr,
                  (unsigned long)actualSpeed);
    return M5PBHUB_OK;
}
#endif  // M5PBHUB_HAS_I2C_BUS

#elif defined(__linux__)

m5pbhub_err_t M5PbHub::begin(const char* device, uint8_t addr)
{
    // 重新初始化前先失效旧状态
    // Drop the previous state before re-initializing
    _initialized = false;
    _transport   = nullptr;

    m5pbhub_err_t err = _linuxTransport.begin(device, addr);
    if (err != M5PBHUB_OK) {
        return err;
    }
    err = beginWithTransport(&_linuxTransport);
    if (err != M5PBHUB_OK) {
        _linuxTransport.end();
        return err;
    }
    M5PBHUB_LOG_I(TAG, "M5PbHub initialized on %s at address 0x%02X", device, addr);
    return M5PBHUB_OK;
}

#endif  // ARDUINO / ESP_PLATFORM / __linux__

bool M5PbHub::isInitialized() const
{
    return _initialized;
}

// ============================
// 内部辅助函数
// Internal Helper Functions
// ============================

uint32_t M5PbHub::_validateSpeed(uint32_t speed)
{
    if (speed != M5PBHUB_I2C_FREQ_100K && speed != M5PBHUB_I2C_FREQ_400K) {
        M5PBHUB_LOG_W(TAG, "Invalid I2C frequency: %lu Hz. PbHub only supports 100KHz or 400KHz. Falling back to 100KHz.",
                      (unsigned long)speed);
        return M5PBHUB_I2C_FREQ_100K;
    }
    return speed;
}

m5pbhub_err_t M5PbHub::_initDevice()
{
    uint8_t version   = 0;
    m5pbhub_err_t err = _transport->readRegister(M5PBHUB_REG_FW_VERSION, &version, 1);
    if (err != M5PBHUB_OK) {
        return err;
    }
    M5PBHUB_LOG_I(TAG, "Device: FW=0x%02X", version);
    return M5PBHUB_OK;
}

uint32_t M5PbHub::_packRgb(m5pbhub_rgb_t color)
{
    return ((uint32_t)color.r << 16) | ((uint32_t)color.g << 8) | (uint32_t)color.b;
}

m5pbhub_err_t M5PbHub::_checkReady()
{
    if (!_initialized || _transport == nullptr) {
        M5PBHUB_LOG_E(TAG, "Not initialized");
        return M5PBHUB_ERR_NOT_INIT;
    }
    return M5PBHUB_OK;
}

// ============================
// 设备信息
// Device Information
// ============================

m5pbhub_err_t M5PbHub::getFirmwareVersion(uint8_t* version)
{
    if (version == nullptr) {
        M5PBHUB_LOG_E(TAG, "getFirmwareVersion version is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    m5pbhub_err_t err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }
    err = _transport->readRegister(M5PBHUB_REG_FW_VERSION, version, 1);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to read firmware version: %s", m5pbhub_err_to_name(err));
    }
    return err;
}

// ============================
// 通用操作
// Generic Operations
// ============================

m5pbhub_err_t M5PbHub::write(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op, uint32_t value)
{
    uint8_t reg       = 0;
    m5pbhub_err_t err = M5PbHubRegisterMapper::resolveAddress(port, channel, op, &reg);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "%s not available on port %c channel %d", M5PbHubRegisterMapper::opName(op),
                      M5PbHubRegisterMapper::portName(port), (int)channel);
        return err;
    }
    // LED 颜色需要索引头，走 setLedColor/setLedColors
    // LED colors need an index header, see setLedColor/setLedColors
    if (!M5PbHubRegisterMapper::isWritable(op) || op == M5PBHUB_OP_RGB_WRITE || op == M5PBHUB_OP_RGB_FILL) {
        M5PBHUB_LOG_E(TAG, "%s is not a plain register write", M5PbHubRegisterMapper::opName(op));
        return M5PBHUB_ERR_NOT_SUPPORTED;
    }

    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    err        = M5PbHubRegisterMapper::encode(op, value, buf, sizeof(buf), &len);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "%s value %lu out of range (%lu-%lu)", M5PbHubRegisterMapper::opName(op),
                      (unsigned long)value, (unsigned long)M5PbHubRegisterMapper::minValue(op),
                      (unsigned long)M5PbHubRegisterMapper::maxValue(op));
        return err;
    }

    err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }

    err = _transport->writeRegister(reg, buf, len);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to write %s (reg 0x%02X): %s", M5PbHubRegisterMapper::opName(op), reg,
                      m5pbhub_err_to_name(err));
        return err;
    }
    M5PBHUB_LOG_D(TAG, "%s port %c ch%d = %lu", M5PbHubRegisterMapper::opName(op),
                  M5PbHubRegisterMapper::portName(port), (int)channel, (unsigned long)value);
    return M5PBHUB_OK;
}

m5pbhub_err_t M5PbHub::read(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op, uint32_t* value)
{
    if (value == nullptr) {
        M5PBHUB_LOG_E(TAG, "read value is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint8_t reg       = 0;
    m5pbhub_err_t err = M5PbHubRegisterMapper::resolveAddress(port, channel, op, &reg);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "%s not available on port %c channel %d", M5PbHubRegisterMapper::opName(op),
                      M5PbHubRegisterMapper::portName(port), (int)channel);
        return err;
    }
    if (!M5PbHubRegisterMapper::isReadable(op)) {
        M5PBHUB_LOG_E(TAG, "%s is write-only", M5PbHubRegisterMapper::opName(op));
        return M5PBHUB_ERR_NOT_SUPPORTED;
    }

    err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }

    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = M5PbHubRegisterMapper::readLength(op);
    err        = _transport->readRegister(reg, buf, len);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to read %s (reg 0x%02X): %s", M5PbHubRegisterMapper::opName(op), reg,
                      m5pbhub_err_to_name(err));
        return err;
    }

    err = M5PbHubRegisterMapper::decode(op, buf, len, value);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Malformed %s response", M5PbHubRegisterMapper::opName(op));
    }
    return err;
}

// ============================
// 数字 I/O
// Digital I/O
// ============================

m5pbhub_err_t M5PbHub::digitalRead(m5pbhub_port_t port, m5pbhub_channel_t channel, bool* value)
{
    if (value == nullptr) {
        M5PBHUB_LOG_E(TAG, "digitalRead value is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, channel, M5PBHUB_OP_DIGITAL_READ, &raw);
    if (err == M5PBHUB_OK) {
        *value = raw != 0;
    }
    return err;
}

m5pbhub_err_t M5PbHub::digitalWrite(m5pbhub_port_t port, m5pbhub_channel_t channel, bool value)
{
    return write(port, channel, M5PBHUB_OP_DIGITAL_WRITE, value ? 1 : 0);
}

m5pbhub_err_t M5PbHub::getDigitalOutput(m5pbhub_port_t port, m5pbhub_channel_t channel, bool* value)
{
    if (value == nullptr) {
        M5PBHUB_LOG_E(TAG, "getDigitalOutput value is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, channel, M5PBHUB_OP_DIGITAL_WRITE, &raw);
    if (err == M5PBHUB_OK) {
        *value = raw != 0;
    }
    return err;
}

// ============================
// ADC / PWM
// ============================

m5pbhub_err_t M5PbHub::analogRead(m5pbhub_port_t port, uint16_t* value)
{
    if (value == nullptr) {
        M5PBHUB_LOG_E(TAG, "analogRead value is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, M5PBHUB_CHANNEL_0, M5PBHUB_OP_ANALOG_READ, &raw);
    if (err == M5PBHUB_OK) {
        *value = (uint16_t)raw;
    }
    return err;
}

m5pbhub_err_t M5PbHub::setPwm(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t duty)
{
    return write(port, channel, M5PBHUB_OP_PWM_WRITE, duty);
}

m5pbhub_err_t M5PbHub::getPwm(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t* duty)
{
    if (duty == nullptr) {
        M5PBHUB_LOG_E(TAG, "getPwm duty is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, channel, M5PBHUB_OP_PWM_WRITE, &raw);
    if (err == M5PBHUB_OK) {
        *duty = (uint8_t)raw;
    }
    return err;
}

// ============================
// 舵机
// Servo
// ============================

m5pbhub_err_t M5PbHub::setServoAngle(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t angle)
{
    return write(port, channel, M5PBHUB_OP_SERVO_WRITE, angle);
}

m5pbhub_err_t M5PbHub::getServoAngle(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t* angle)
{
    if (angle == nullptr) {
        M5PBHUB_LOG_E(TAG, "getServoAngle angle is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, channel, M5PBHUB_OP_SERVO_WRITE, &raw);
    if (err == M5PBHUB_OK) {
        *angle = (uint8_t)raw;
    }
    return err;
}

m5pbhub_err_t M5PbHub::setServoPulse(m5pbhub_port_t port, m5pbhub_channel_t channel, uint16_t pulseUs)
{
    return write(port, channel, M5PBHUB_OP_SERVO_PULSE, pulseUs);
}

m5pbhub_err_t M5PbHub::getServoPulse(m5pbhub_port_t port, m5pbhub_channel_t channel, uint16_t* pulseUs)
{
    if (pulseUs == nullptr) {
        M5PBHUB_LOG_E(TAG, "getServoPulse pulseUs is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, channel, M5PBHUB_OP_SERVO_PULSE, &raw);
    if (err == M5PBHUB_OK) {
        *pulseUs = (uint16_t)raw;
    }
    return err;
}

// ============================
// NeoPixel 功能
// NeoPixel Functions
// ============================

m5pbhub_err_t M5PbHub::setLedCount(m5pbhub_port_t port, uint16_t count)
{
    return write(port, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_COUNT, count);
}

m5pbhub_err_t M5PbHub::getLedCount(m5pbhub_port_t port, uint16_t* count)
{
    if (count == nullptr) {
        M5PBHUB_LOG_E(TAG, "getLedCount count is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_COUNT, &raw);
    if (err == M5PBHUB_OK) {
        *count = (uint16_t)raw;
    }
    return err;
}

m5pbhub_err_t M5PbHub::setLedBrightness(m5pbhub_port_t port, uint8_t brightness)
{
    return write(port, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_BRIGHTNESS, brightness);
}

m5pbhub_err_t M5PbHub::getLedBrightness(m5pbhub_port_t port, uint8_t* brightness)
{
    if (brightness == nullptr) {
        M5PBHUB_LOG_E(TAG, "getLedBrightness brightness is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    uint32_t raw      = 0;
    m5pbhub_err_t err = read(port, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_BRIGHTNESS, &raw);
    if (err == M5PBHUB_OK) {
        *brightness = (uint8_t)raw;
    }
    return err;
}

m5pbhub_err_t M5PbHub::setLedColor(m5pbhub_port_t port, uint16_t index, uint32_t rgb)
{
    if (!M5PbHubRegisterMapper::isValidPort(port)) {
        M5PBHUB_LOG_E(TAG, "Invalid LED port: %d", (int)port);
        return M5PBHUB_ERR_INVALID_PORT;
    }
    if (index >= M5PBHUB_MAX_LED_COUNT) {
        M5PBHUB_LOG_E(TAG, "Invalid LED index: %d", index);
        return M5PBHUB_ERR_VALUE_RANGE;
    }
    return _writeLedFrame(port, M5PBHUB_OP_RGB_WRITE, &index, 1, rgb);
}

m5pbhub_err_t M5PbHub::setLedColor(m5pbhub_port_t port, uint16_t index, m5pbhub_rgb_t color)
{
    return setLedColor(port, index, _packRgb(color));
}

m5pbhub_err_t M5PbHub::setLedColors(m5pbhub_port_t port, uint16_t start, uint16_t stop, uint32_t rgb)
{
    if (!M5PbHubRegisterMapper::isValidPort(port)) {
        M5PBHUB_LOG_E(TAG, "Invalid LED port: %d", (int)port);
        return M5PBHUB_ERR_INVALID_PORT;
    }
    if (start > M5PBHUB_MAX_LED_COUNT || stop > M5PBHUB_MAX_LED_COUNT) {
        M5PBHUB_LOG_E(TAG, "LED range [%d, %d) exceeds %d LEDs", start, stop, M5PBHUB_MAX_LED_COUNT);
        return M5PBHUB_ERR_VALUE_RANGE;
    }
    if (stop < start) {
        M5PBHUB_LOG_E(TAG, "LED range stop %d is before start %d", stop, start);
        return M5PBHUB_ERR_INVALID_ARG;
    }

    uint16_t header[2] = {start, (uint16_t)(stop - start)};
    return _writeLedFrame(port, M5PBHUB_OP_RGB_FILL, header, 2, rgb);
}

m5pbhub_err_t M5PbHub::setLedColors(m5pbhub_port_t port, uint16_t start, uint16_t stop, m5pbhub_rgb_t color)
{
    return setLedColors(port, start, stop, _packRgb(color));
}

m5pbhub_err_t M5PbHub::fillLeds(m5pbhub_port_t port, m5pbhub_rgb_t color)
{
    return fillLeds(port, _packRgb(color));
}

m5pbhub_err_t M5PbHub::fillLeds(m5pbhub_port_t port, uint32_t rgb)
{
    uint16_t count    = 0;
    m5pbhub_err_t err = getLedCount(port, &count);
    if (err != M5PBHUB_OK) {
        return err;
    }
    if (count > M5PBHUB_MAX_LED_COUNT) {
        M5PBHUB_LOG_E(TAG, "Port %c reports %d LEDs", M5PbHubRegisterMapper::portName(port), count);
        return M5PBHUB_ERR_MALFORMED_RESPONSE;
    }
    return setLedColors(port, 0, count, rgb);
}

m5pbhub_err_t M5PbHub::_writeLedFrame(m5pbhub_port_t port, m5pbhub_op_t op, const uint16_t* header,
                                      size_t headerCount, uint32_t rgb)
{
    uint8_t reg       = 0;
    m5pbhub_err_t err = M5PbHubRegisterMapper::resolveAddress(port, M5PBHUB_CHANNEL_0, op, &reg);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Invalid LED port: %d", (int)port);
        return err;
    }

    // 帧格式：小端 16 位头字段 + R,G,B
    // Frame layout: little-endian 16-bit header fields + R,G,B
    uint8_t frame[2 * 2 + M5PBHUB_MAX_WIRE_LEN];
    size_t pos = 0;
    for (size_t i = 0; i < headerCount; i++) {
        frame[pos++] = (uint8_t)(header[i] & 0xFF);
        frame[pos++] = (uint8_t)((header[i] >> 8) & 0xFF);
    }
    size_t colorLen = 0;
    err             = M5PbHubRegisterMapper::encode(op, rgb, frame + pos, sizeof(frame) - pos, &colorLen);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Invalid color: 0x%08lX", (unsigned long)rgb);
        return err;
    }
    pos += colorLen;

    // 空区间不需要访问总线
    // Empty range needs no bus access
    if (op == M5PBHUB_OP_RGB_FILL && header[1] == 0) {
        return M5PBHUB_OK;
    }

    err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }

    err = _transport->writeRegister(reg, frame, pos);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to write LED data on port %c: %s", M5PbHubRegisterMapper::portName(port),
                      m5pbhub_err_to_name(err));
    }
    return err;
}

// ============================
// 原始寄存器访问
// Raw Register Access
// ============================

m5pbhub_err_t M5PbHub::readRegister(uint8_t reg, uint8_t* data, size_t len)
{
    if (data == nullptr || len == 0) {
        M5PBHUB_LOG_E(TAG, "readRegister invalid buffer");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    m5pbhub_err_t err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }
    err = _transport->readRegister(reg, data, len);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to read reg 0x%02X: %s", reg, m5pbhub_err_to_name(err));
    }
    return err;
}

m5pbhub_err_t M5PbHub::writeRegister(uint8_t reg, const uint8_t* data, size_t len)
{
    if (data == nullptr && len > 0) {
        M5PBHUB_LOG_E(TAG, "writeRegister data is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    m5pbhub_err_t err = _checkReady();
    if (err != M5PBHUB_OK) {
        return err;
    }
    err = _transport->writeRegister(reg, data, len);
    if (err != M5PBHUB_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to write reg 0x%02X: %s", reg, m5pbhub_err_to_name(err));
    }
    return err;
}
