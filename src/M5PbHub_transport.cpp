/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

#include "M5PbHub_transport.h"
#include "M5PbHub_log.h"

#if defined(__linux__) && !defined(ARDUINO) && !defined(ESP_PLATFORM)
#include <fcntl.h>
#include <unistd.h>
#endif

static const char* TAG = "M5PbHub";

#ifdef ARDUINO

// ============================
// Arduino TwoWire
// ============================

M5PbHubWireTransport::M5PbHubWireTransport() : _wire(nullptr), _addr(M5PBHUB_DEFAULT_ADDR)
{
}

m5pbhub_err_t M5PbHubWireTransport::begin(TwoWire* wire, uint8_t addr, int8_t sda, int8_t scl, uint32_t speed)
{
    if (wire == nullptr) {
        M5PBHUB_LOG_E(TAG, "TwoWire is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    _wire = wire;
    _addr = addr;

    if (!_wire->begin(sda, scl, speed)) {
        M5PBHUB_LOG_E(TAG, "Failed to initialize I2C bus (SDA=%d, SCL=%d)", sda, scl);
        _wire = nullptr;
        return M5PBHUB_ERR_I2C_CONFIG;
    }
    return M5PBHUB_OK;
}

bool M5PbHubWireTransport::probe()
{
    return _wire != nullptr && M5PBHUB_I2C_PROBE(_wire, _addr);
}

m5pbhub_err_t M5PbHubWireTransport::readRegister(uint8_t reg, uint8_t* data, size_t len)
{
    if (_wire == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    return M5PBHUB_I2C_READ_BYTES(_wire, _addr, reg, len, data) ? M5PBHUB_OK : M5PBHUB_ERR_I2C_COMM;
}

m5pbhub_err_t M5PbHubWireTransport::writeRegister(uint8_t reg, const uint8_t* data, size_t len)
{
    if (_wire == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    return M5PBHUB_I2C_WRITE_BYTES(_wire, _addr, reg, len, data) ? M5PBHUB_OK : M5PBHUB_ERR_I2C_COMM;
}

#elif defined(ESP_PLATFORM)

#if M5PBHUB_HAS_I2C_MASTER

// ============================
// ESP-IDF i2c_master
// ============================

M5PbHubI2cMasterTransport::M5PbHubI2cMasterTransport() : _bus(nullptr), _dev(nullptr), _addr(M5PBHUB_DEFAULT_ADDR)
{
}

M5PbHubI2cMasterTransport::~M5PbHubI2cMasterTransport()
{
    end();
}

m5pbhub_err_t M5PbHubI2cMasterTransport::begin(i2c_master_bus_handle_t bus, uint8_t addr, uint32_t speed)
{
    if (bus == nullptr) {
        M5PBHUB_LOG_E(TAG, "i2c_master bus is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    end();
    _bus  = bus;
    _addr = addr;

    i2c_device_config_t dev_config = {
        .dev_addr_length = I2C_ADDR_BIT_LEN_7,
        .device_address  = _addr,
        .scl_speed_hz    = speed,
        .scl_wait_us     = 0,
        .flags =
            {
                .disable_ack_check = false,
            },
    };

    esp_err_t ret = i2c_master_bus_add_device(_bus, &dev_config, &_dev);
    if (ret != ESP_OK) {
        M5PBHUB_LOG_E(TAG, "Failed to add I2C device: %s", esp_err_to_name(ret));
        _dev = nullptr;
        return M5PBHUB_ERR_I2C_CONFIG;
    }
    return M5PBHUB_OK;
}

void M5PbHubI2cMasterTransport::end()
{
    // 只移除设备句柄，总线由调用者管理
    // Only the device handle is removed, the bus stays with the caller
    if (_dev) {
        i2c_master_bus_rm_device(_dev);
        _dev = nullptr;
    }
}

bool M5PbHubI2cMasterTransport::probe()
{
    return _bus != nullptr && i2c_master_probe(_bus, _addr, M5PBHUB_I2C_TIMEOUT_MS) == ESP_OK;
}

m5pbhub_err_t M5PbHubI2cMasterTransport::readRegister(uint8_t reg, uint8_t* data, size_t len)
{
    if (_dev == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    esp_err_t ret = M5PBHUB_I2C_MASTER_READ_BYTES(_dev, reg, len, data, M5PBHUB_I2C_TIMEOUT_MS);
    if (ret != ESP_OK) {
        M5PBHUB_LOG_D(TAG, "i2c read 0x%02X failed: %s", reg, esp_err_to_name(ret));
        return M5PBHUB_ERR_I2C_COMM;
    }
    return M5PBHUB_OK;
}

m5pbhub_err_t M5PbHubI2cMasterTransport::writeRegister(uint8_t reg, const uint8_t* data, size_t len)
{
    if (_dev == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    esp_err_t ret = M5PBHUB_I2C_MASTER_WRITE_BYTES(_dev, reg, len, data, M5PBHUB_I2C_TIMEOUT_MS);
    if (ret != ESP_OK) {
        M5PBHUB_LOG_D(TAG, "i2c write 0x%02X failed: %s", reg, esp_err_to_name(ret));
        return M5PBHUB_ERR_I2C_COMM;
    }
    return M5PBHUB_OK;
}

#endif  // M5PBHUB_HAS_I2C_MASTER

#if M5PBHUB_HAS_I2C_BUS

// ============================
// esp-idf-lib i2c_bus
// ============================

M5PbHubI2cBusTransport::M5PbHubI2cBusTransport() : _dev(nullptr)
{
}

M5PbHubI2cBusTransport::~M5PbHubI2cBusTransport()
{
    end();
}

m5pbhub_err_t M5PbHubI2cBusTransport::begin(i2c_bus_handle_t bus, uint8_t addr, uint32_t speed)
{
    if (bus == nullptr) {
        M5PBHUB_LOG_E(TAG, "i2c_bus handle is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    end();
    _dev = i2c_bus_device_create(bus, addr, speed);
    if (_dev == nullptr) {
        M5PBHUB_LOG_E(TAG, "Failed to create I2C device");
        return M5PBHUB_ERR_I2C_CONFIG;
    }
    return M5PBHUB_OK;
}

void M5PbHubI2cBusTransport::end()
{
    if (_dev) {
        i2c_bus_device_delete(&_dev);
        _dev = nullptr;
    }
}

m5pbhub_err_t M5PbHubI2cBusTransport::readRegister(uint8_t reg, uint8_t* data, size_t len)
{
    if (_dev == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    return M5PBHUB_I2C_BUS_READ_BYTES(_dev, reg, len, data) == ESP_OK ? M5PBHUB_OK : M5PBHUB_ERR_I2C_COMM;
}

m5pbhub_err_t M5PbHubI2cBusTransport::writeRegister(uint8_t reg, const uint8_t* data, size_t len)
{
    if (_dev == nullptr) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    return M5PBHUB_I2C_BUS_WRITE_BYTES(_dev, reg, len, data) == ESP_OK ? M5PBHUB_OK : M5PBHUB_ERR_I2C_COMM;
}

#endif  // M5PBHUB_HAS_I2C_BUS

#elif defined(__linux__)

// ============================
// Linux i2c-dev
// ============================

M5PbHubLinuxTransport::M5PbHubLinuxTransport() : _fd(-1), _addr(M5PBHUB_DEFAULT_ADDR)
{
}

M5PbHubLinuxTransport::~M5PbHubLinuxTransport()
{
    end();
}

m5pbhub_err_t M5PbHubLinuxTransport::begin(const char* device, uint8_t addr)
{
    if (device == nullptr) {
        M5PBHUB_LOG_E(TAG, "I2C device path is null");
        return M5PBHUB_ERR_INVALID_ARG;
    }
    end();
    _addr = addr;

    _fd = open(device, O_RDWR);
    if (_fd < 0) {
        M5PBHUB_LOG_E(TAG, "Failed to open %s: %s", device, strerror(errno));
        return M5PBHUB_ERR_I2C_CONFIG;
    }

    unsigned long funcs = 0;
    if (ioctl(_fd, I2C_FUNCS, &funcs) < 0 || (funcs & I2C_FUNC_I2C) == 0) {
        M5PBHUB_LOG_E(TAG, "%s does not support plain I2C transfers", device);
        end();
        return M5PBHUB_ERR_I2C_CONFIG;
    }
    return M5PBHUB_OK;
}

void M5PbHubLinuxTransport::end()
{
    if (_fd >= 0) {
        close(_fd);
        _fd = -1;
    }
}

m5pbhub_err_t M5PbHubLinuxTransport::readRegister(uint8_t reg, uint8_t* data, size_t len)
{
    if (_fd < 0) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    if (!M5PBHUB_I2C_READ_BYTES(_fd, _addr, reg, len, data)) {
        M5PBHUB_LOG_D(TAG, "i2c read 0x%02X failed: %s", reg, strerror(errno));
        return M5PBHUB_ERR_I2C_COMM;
    }
    return M5PBHUB_OK;
}

m5pbhub_err_t M5PbHubLinuxTransport::writeRegister(uint8_t reg, const uint8_t* data, size_t len)
{
    if (len > M5PBHUB_I2C_MAX_WRITE_LEN || (data == nullptr && len > 0)) {
        M5PBHUB_LOG_E(TAG, "i2c write 0x%02X: payload of %u bytes exceeds %d", reg, (unsigned)len,
                      M5PBHUB_I2C_MAX_WRITE_LEN);
        return M5PBHUB_ERR_INVALID_ARG;
    }
    if (_fd < 0) {
        return M5PBHUB_ERR_NOT_INIT;
    }
    if (!M5PBHUB_I2C_WRITE_BYTES(_fd, _addr, reg, len, data)) {
        M5PBHUB_LOG_D(TAG, "i2c write 0x%02X failed: %s", reg, strerror(errno));
        return M5PBHUB_ERR_I2C_COMM;
    }
    return M5PBHUB_OK;
}

#endif  // ARDUINO / ESP_PLATFORM / __linux__
