/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

/**
 * @file M5PbHub_register_map.h
 * @brief PbHub 端口寄存器映射与数值编解码
 *        PbHub port register mapping and value codec
 *
 * @note 所有函数均为纯函数，不访问总线。
 *       All functions are pure and never touch the bus.
 */

#ifndef _M5PBHUB_REGISTER_MAP_H_
#define _M5PBHUB_REGISTER_MAP_H_

#include "M5PbHub_types.h"

class M5PbHubRegisterMapper {
public:
    /**
     * @brief 计算 (端口, 通道, 操作) 对应的寄存器地址
     *        Resolve the register address of a (port, channel, operation) tuple
     * @param port 端口 A-F / Port A-F
     * @param channel 通道 0-1 / Channel 0-1
     * @param op 操作类型 / Operation kind
     * @param reg 输出：寄存器地址 / Output: register address
     * @return M5PBHUB_OK，或组合不受支持时返回 M5PBHUB_ERR_INVALID_PORT
     *         M5PBHUB_OK, or M5PBHUB_ERR_INVALID_PORT for an unsupported combination
     * @note 寄存器地址 = 端口基地址 + 通道 * 通道间距 + 操作偏移
     *       Register address = port base + channel * channel stride + operation offset
     */
    static m5pbhub_err_t resolveAddress(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op,
                                        uint8_t* reg);

    /**
     * @brief 将逻辑值编码为总线字节
     *        Encode a logical value into wire bytes
     * @param op 操作类型 / Operation kind
     * @param value 逻辑值 (布尔量用 0/1，RGB 用 0xRRGGBB)
     *              Logical value (0/1 for booleans, 0xRRGGBB for colors)
     * @param buf 输出缓冲 / Output buffer
     * @param bufSize 缓冲大小 / Buffer size
     * @param len 输出：写入的字节数 / Output: bytes written
     * @return M5PBHUB_OK；数值越界返回 M5PBHUB_ERR_VALUE_RANGE；
     *         无编解码的操作返回 M5PBHUB_ERR_NOT_SUPPORTED
     *         M5PBHUB_OK; M5PBHUB_ERR_VALUE_RANGE when out of domain;
     *         M5PBHUB_ERR_NOT_SUPPORTED for kinds without a codec
     */
    static m5pbhub_err_t encode(m5pbhub_op_t op, uint32_t value, uint8_t* buf, size_t bufSize, size_t* len);

    /**
     * @brief 将总线字节解码为逻辑值 (encode 的逆运算)
     *        Decode wire bytes into a logical value (inverse of encode)
     * @param len 编码宽度或回读宽度 / Encoded width or read-back width
     * @return M5PBHUB_OK；长度不符返回 M5PBHUB_ERR_MALFORMED_RESPONSE
     *         M5PBHUB_OK; M5PBHUB_ERR_MALFORMED_RESPONSE on length mismatch
     */
    static m5pbhub_err_t decode(m5pbhub_op_t op, const uint8_t* buf, size_t len, uint32_t* value);

    /**
     * @brief 操作的编码字节数，无编解码时为 0
     *        Encoded width of an operation in bytes, 0 when it has no codec
     */
    static size_t wireLength(m5pbhub_op_t op);

    /**
     * @brief 读取寄存器时的字节数 (LED 数量只回读 1 字节)
     *        Bytes fetched when reading the register back (LED count reads 1 byte)
     */
    static size_t readLength(m5pbhub_op_t op);

    static uint32_t minValue(m5pbhub_op_t op);
    static uint32_t maxValue(m5pbhub_op_t op);
    static bool isReadable(m5pbhub_op_t op);
    static bool isWritable(m5pbhub_op_t op);

    static bool isValidPort(m5pbhub_port_t port);
    static bool isValidChannel(m5pbhub_channel_t channel);

    /**
     * @brief 端口寄存器块基地址，无效端口返回 0
     *        Base register of a port block, 0 for an invalid port
     */
    static uint8_t portBase(m5pbhub_port_t port);

    static const char* opName(m5pbhub_op_t op);
    static char portName(m5pbhub_port_t port);

private:
    M5PbHubRegisterMapper();
};

#endif  // _M5PBHUB_REGISTER_MAP_H_
