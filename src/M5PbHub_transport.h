/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

/**
 * @file M5PbHub_transport.h
 * @brief PbHub I2C 传输层接口与各平台实现
 *        PbHub I2C transport interface and platform implementations
 *
 * @note 传输层只借用总线，不拥有总线；在 ESP-IDF 上创建的设备句柄会在析构时释放。
 *       Transports borrow the bus and never own it; device handles created on
 *       ESP-IDF are released on destruction.
 */

#ifndef _M5PBHUB_TRANSPORT_H_
#define _M5PBHUB_TRANSPORT_H_

#include "M5PbHub_types.h"
#include "M5PbHub_i2c_compat.h"

// ============================
// 传输层接口
// Transport Interface
// ============================
class M5PbHubTransport {
public:
    virtual ~M5PbHubTransport() {}

    /**
     * @brief 写寄存器地址后读取 len 字节
     *        Write the register byte, then read len bytes
     * @return 成功返回 M5PBHUB_OK，总线错误返回 M5PBHUB_ERR_I2C_COMM
     *         M5PBHUB_OK on success, M5PBHUB_ERR_I2C_COMM on bus error
     */
    virtual m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) = 0;

    /**
     * @brief 在一次写事务中发送寄存器地址和 len 字节负载
     *        Send the register byte followed by len payload bytes in one write
     * @return 成功返回 M5PBHUB_OK，总线错误返回 M5PBHUB_ERR_I2C_COMM
     *         M5PBHUB_OK on success, M5PBHUB_ERR_I2C_COMM on bus error
     */
    virtual m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) = 0;
};

#ifdef ARDUINO

// ============================
// Arduino TwoWire
// ============================
class M5PbHubWireTransport : public M5PbHubTransport {
public:
    M5PbHubWireTransport();

    /**
     * @brief 绑定 TwoWire 实例
     *        Bind a TwoWire instance
     * @param wire TwoWire 实例（由调用者拥有） / TwoWire instance (owned by the caller)
     * @param addr I2C 地址 / I2C address
     * @param sda SDA 引脚，-1 使用默认 / SDA pin, -1 for default
     * @param scl SCL 引脚，-1 使用默认 / SCL pin, -1 for default
     * @param speed I2C 频率 / I2C speed in Hz
     */
    m5pbhub_err_t begin(TwoWire* wire, uint8_t addr, int8_t sda, int8_t scl, uint32_t speed);
    bool probe();

    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) override;
    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) override;

private:
    TwoWire* _wire;
    uint8_t _addr;
};

#elif defined(ESP_PLATFORM)

#if M5PBHUB_HAS_I2C_MASTER
// ============================
// ESP-IDF i2c_master (IDF >= 5.3.0)
// ============================
class M5PbHubI2cMasterTransport : public M5PbHubTransport {
public:
    M5PbHubI2cMasterTransport();
    ~M5PbHubI2cMasterTransport();

    /**
     * @brief 在已有的主机总线上添加设备
     *        Add the device to an existing master bus
     * @param bus 由调用者拥有的 i2c_master 总线 / i2c_master bus owned by the caller
     */
    m5pbhub_err_t begin(i2c_master_bus_handle_t bus, uint8_t addr, uint32_t speed);
    void end();
    bool probe();

    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) override;
    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) override;

private:
    i2c_master_bus_handle_t _bus;
    i2c_master_dev_handle_t _dev;
    uint8_t _addr;

    M5PbHubI2cMasterTransport(const M5PbHubI2cMasterTransport&);
    M5PbHubI2cMasterTransport& operator=(const M5PbHubI2cMasterTransport&);
};
#endif  // M5PBHUB_HAS_I2C_MASTER

#if M5PBHUB_HAS_I2C_BUS
// ============================
// esp-idf-lib i2c_bus
// ============================
class M5PbHubI2cBusTransport : public M5PbHubTransport {
public:
    M5PbHubI2cBusTransport();
    ~M5PbHubI2cBusTransport();

    m5pbhub_err_t begin(i2c_bus_handle_t bus, uint8_t addr, uint32_t speed);
    void end();

    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) override;
    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) override;

private:
    i2c_bus_device_handle_t _dev;

    M5PbHubI2cBusTransport(const M5PbHubI2cBusTransport&);
    M5PbHubI2cBusTransport& operator=(const M5PbHubI2cBusTransport&);
};
#endif  // M5PBHUB_HAS_I2C_BUS

#elif defined(__linux__)

// ============================
// Linux i2c-dev
// ============================
class M5PbHubLinuxTransport : public M5PbHubTransport {
public:
    M5PbHubLinuxTransport();
    ~M5PbHubLinuxTransport();

    /**
     * @brief 打开 i2c-dev 设备节点
     *        Open an i2c-dev device node
     * @param device 设备路径，如 "/dev/i2c-1" / Device path, e.g. "/dev/i2c-1"
     * @param addr I2C 地址 / I2C address
     */
    m5pbhub_err_t begin(const char* device, uint8_t addr);
    void end();

    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) override;

    /**
     * @note 负载超过 M5PBHUB_I2C_MAX_WRITE_LEN 时不访问总线，返回 M5PBHUB_ERR_INVALID_ARG
     *       Payloads above M5PBHUB_I2C_MAX_WRITE_LEN return M5PBHUB_ERR_INVALID_ARG without bus access
     */
    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) override;

private:
    int _fd;
    uint8_t _addr;

    M5PbHubLinuxTransport(const M5PbHubLinuxTransport&);
    M5PbHubLinuxTransport& operator=(const M5PbHubLinuxTransport&);
};

#endif  // ARDUINO / ESP_PLATFORM / __linux__

#endif  // _M5PBHUB_TRANSPORT_H_
