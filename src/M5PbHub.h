/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

/**
 * @file M5PbHub.h
 * @brief M5Stack PbHub 扩展板驱动库（Arduino、ESP-IDF 与 Linux）
 *        M5Stack PbHub expansion board driver library (Arduino, ESP-IDF & Linux)
 *
 * @note PbHub 通过一个 I2C 地址复用 6 个端口（A-F），每个端口 2 个引脚，支持：
 *       PbHub multiplexes 6 ports (A-F) with 2 pins each behind one I2C address, supporting:
 *       - 数字输入/输出 / Digital input/output
 *       - 12 位 ADC 输入（仅引脚0） / 12-bit ADC input (pin 0 only)
 *       - 8 位 PWM 输出 / 8-bit PWM output
 *       - RC 舵机（角度或脉宽） / RC servo (angle or pulse width)
 *       - NeoPixel LED 灯带（每端口最多 74 颗） / NeoPixel LED strips (up to 74 per port)
 */

#ifndef _M5PBHUB_H_
#define _M5PBHUB_H_

#include "M5PbHub_types.h"
#include "M5PbHub_register_map.h"
#include "M5PbHub_transport.h"

// ============================
// M5PbHub 类
// M5PbHub Class
// ============================
class M5PbHub {
public:
    M5PbHub();
    ~M5PbHub();

    // ========================
    // 初始化
    // Initialization
    // ========================

    /**
     * @brief 使用外部传输层初始化
     *        Initialize with an external transport
     * @param transport 传输层（由调用者拥有，生命周期需覆盖本对象）
     *                  Transport owned by the caller, must outlive this object
     * @return 成功返回 M5PBHUB_OK，否则返回传输层错误码
     *         Return M5PBHUB_OK on success, the transport error otherwise
     * @note 任一 begin 失败后对象均处于未初始化状态
     *       After any failed begin the object is uninitialized
     */
    m5pbhub_err_t beginWithTransport(M5PbHubTransport* transport);

#ifdef ARDUINO
    /**
     * @brief Initialize the device (Arduino)
     * @param wire Pointer to TwoWire instance
     * @param addr I2C address (default 0x61)
     * @param sda SDA pin (default -1, uses default I2C pins)
     * @param scl SCL pin (default -1, uses default I2C pins)
     * @param speed I2C speed in Hz (default 100000)
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t begin(TwoWire* wire = &Wire, uint8_t addr = M5PBHUB_DEFAULT_ADDR, int8_t sda = -1,
                        int8_t scl = -1, uint32_t speed = M5PBHUB_I2C_FREQ_DEFAULT);
#elif defined(ESP_PLATFORM)
#if M5PBHUB_HAS_I2C_MASTER
    /**
     * @brief Initialize with existing i2c_master_bus handle (ESP-IDF native, IDF >= 5.3.0)
     * @param bus Existing i2c_master_bus_handle_t
     * @param addr I2C address (default 0x61)
     * @param speed I2C speed in Hz
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t begin(i2c_master_bus_handle_t bus, uint8_t addr = M5PBHUB_DEFAULT_ADDR,
                        uint32_t speed = M5PBHUB_I2C_FREQ_DEFAULT);
#endif  // M5PBHUB_HAS_I2C_MASTER

#if M5PBHUB_HAS_I2C_BUS
    /**
     * @brief Initialize with existing i2c_bus handle (esp-idf-lib)
     * @param bus Existing i2c_bus_handle_t
     * @param addr I2C address (default 0x61)
     * @param speed I2C speed in Hz
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t begin(i2c_bus_handle_t bus, uint8_t addr = M5PBHUB_DEFAULT_ADDR,
                        uint32_t speed = M5PBHUB_I2C_FREQ_DEFAULT);
#endif  // M5PBHUB_HAS_I2C_BUS
#elif defined(__linux__)
    /**
     * @brief Initialize on a Linux i2c-dev node
     * @param device Device path, e.g. "/dev/i2c-1"
     * @param addr I2C address (default 0x61)
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t begin(const char* device, uint8_t addr = M5PBHUB_DEFAULT_ADDR);
#endif

    bool isInitialized() const;

    /**
     * @brief 设置全局日志级别
     *        Set global log level
     */
    static void setLogLevel(m5pbhub_log_level_t level);

    /**
     * @brief 获取当前日志级别
     *        Get current log level
     */
    static m5pbhub_log_level_t getLogLevel();

    // ========================
    // 设备信息
    // Device Information
    // ========================
    /**
     * @brief 读取固件版本
     *        Read firmware version
     * @param version 输出：固件版本 / Output: firmware version
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t getFirmwareVersion(uint8_t* version);

    // ========================
    // 数字 I/O
    // Digital I/O
    // ========================
    /**
     * @brief 读取数字输入
     *        Read a digital input
     * @param port 端口 A-F / Port A-F
     * @param channel 引脚 0-1 / Pin 0-1
     * @param value 输出：引脚电平 / Output: pin level
     * @return 成功返回 M5PBHUB_OK，否则返回错误码
     *         Return M5PBHUB_OK on success, error code otherwise
     */
    m5pbhub_err_t digitalRead(m5pbhub_port_t port, m5pbhub_channel_t channel, bool* value);

    /**
     * @brief 设置数字输出
     *        Drive a digital output
     */
    m5pbhub_err_t digitalWrite(m5pbhub_port_t port, m5pbhub_channel_t channel, bool value);

    /**
     * @brief 回读数字输出寄存器
     *        Read back the digital output register
     */
    m5pbhub_err_t getDigitalOutput(m5pbhub_port_t port, m5pbhub_channel_t channel, bool* value);

    // ========================
    // ADC / PWM
    // ========================
    /**
     * @brief 读取 ADC（仅引脚0，12 位：0-4095）
     *        Read the ADC (pin 0 only, 12-bit: 0-4095)
     */
    m5pbhub_err_t analogRead(m5pbhub_port_t port, uint16_t* value);

    /**
     * @brief 设置 PWM 占空比（0-255）
     *        Set PWM duty (0-255)
     */
    m5pbhub_err_t setPwm(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t duty);
    m5pbhub_err_t getPwm(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t* duty);

    // ========================
    // 舵机
    // Servo
    // ========================
    /**
     * @brief 设置舵机角度
     *        Set servo angle
     * @param angle 角度 0-180 / Angle in degrees, 0-180
     * @return 超出范围返回 M5PBHUB_ERR_VALUE_RANGE
     *         M5PBHUB_ERR_VALUE_RANGE when out of range
     */
    m5pbhub_err_t setServoAngle(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t angle);
    m5pbhub_err_t getServoAngle(m5pbhub_port_t port, m5pbhub_channel_t channel, uint8_t* angle);

    /**
     * @brief 以脉宽设置舵机（50Hz）
     *        Set servo by pulse width (50Hz)
     * @param pulseUs 脉宽 500-2500us，1500us 约等于 90 度
     *                Pulse width 500-2500us, 1500us is about 90 degrees
     */
    m5pbhub_err_t setServoPulse(m5pbhub_port_t port, m5pbhub_channel_t channel, uint16_t pulseUs);
    m5pbhub_err_t getServoPulse(m5pbhub_port_t port, m5pbhub_channel_t channel, uint16_t* pulseUs);

    // ========================
    // NeoPixel
    // ========================
    /**
     * @brief 设置端口上的 LED 数量（0-74）
     *        Set the number of LEDs on a port (0-74)
     */
    m5pbhub_err_t setLedCount(m5pbhub_port_t port, uint16_t count);
    m5pbhub_err_t getLedCount(m5pbhub_port_t port, uint16_t* count);

    /**
     * @brief 设置 LED 亮度（0-255）
     *        Set LED brightness (0-255)
     * @note 亮度仅对之后写入的颜色生效
     *       Brightness applies to colors written afterwards
     */
    m5pbhub_err_t setLedBrightness(m5pbhub_port_t port, uint8_t brightness);
    m5pbhub_err_t getLedBrightness(m5pbhub_port_t port, uint8_t* brightness);

    /**
     * @brief 设置单个 LED 颜色
     *        Set the color of one LED
     * @param index LED 索引 0-73 / LED index 0-73
     * @param rgb 颜色 0xRRGGBB / Color as 0xRRGGBB
     */
    m5pbhub_err_t setLedColor(m5pbhub_port_t port, uint16_t index, uint32_t rgb);
    m5pbhub_err_t setLedColor(m5pbhub_port_t port, uint16_t index, m5pbhub_rgb_t color);

    /**
     * @brief 设置 LED 区间 [start, stop) 的颜色
     *        Set the color of LEDs in [start, stop)
     * @note 空区间不访问总线；stop < start 返回 M5PBHUB_ERR_INVALID_ARG
     *       An empty range does not touch the bus; stop < start returns M5PBHUB_ERR_INVALID_ARG
     */
    m5pbhub_err_t setLedColors(m5pbhub_port_t port, uint16_t start, uint16_t stop, uint32_t rgb);
    m5pbhub_err_t setLedColors(m5pbhub_port_t port, uint16_t start, uint16_t stop, m5pbhub_rgb_t color);

    /**
     * @brief 读取 LED 数量后用同一颜色填充全部 LED
     *        Read the LED count, then fill every LED with one color
     */
    m5pbhub_err_t fillLeds(m5pbhub_port_t port, uint32_t rgb);
    m5pbhub_err_t fillLeds(m5pbhub_port_t port, m5pbhub_rgb_t color);

    // ========================
    // 通用操作
    // Generic Operations
    // ========================
    /**
     * @brief 解析地址、编码并写入任意可写操作
     *        Resolve, encode and write any writable operation
     */
    m5pbhub_err_t write(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op, uint32_t value);

    /**
     * @brief 解析地址、读取并解码任意可读操作
     *        Resolve, read and decode any readable operation
     */
    m5pbhub_err_t read(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op, uint32_t* value);

    // ========================
    // 原始寄存器访问
    // Raw Register Access
    // ========================
    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len);
    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len);

private:
    M5PbHubTransport* _transport;
    bool _initialized;

#ifdef ARDUINO
    M5PbHubWireTransport _wireTransport;
#elif defined(ESP_PLATFORM)
#if M5PBHUB_HAS_I2C_MASTER
    M5PbHubI2cMasterTransport _masterTransport;
#endif
#if M5PBHUB_HAS_I2C_BUS
    M5PbHubI2cBusTransport _busTransport;
#endif
#elif defined(__linux__)
    M5PbHubLinuxTransport _linuxTransport;
#endif

    uint32_t _validateSpeed(uint32_t speed);
    m5pbhub_err_t _initDevice();
    static uint32_t _packRgb(m5pbhub_rgb_t color);
    m5pbhub_err_t _checkReady();
    m5pbhub_err_t _writeLedFrame(m5pbhub_port_t port, m5pbhub_op_t op, const uint16_t* header, size_t headerCount,
                                 uint32_t rgb);

    M5PbHub(const M5PbHub&);
    M5PbHub& operator=(const M5PbHub&);
};

#endif  // _M5PBHUB_H_
