/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <set>

#include "M5PbHub_register_map.h"

typedef M5PbHubRegisterMapper Mapper;

static const m5pbhub_op_t ADDRESSED_OPS[] = {
    M5PBHUB_OP_DIGITAL_READ, M5PBHUB_OP_DIGITAL_WRITE, M5PBHUB_OP_ANALOG_READ, M5PBHUB_OP_PWM_WRITE,
    M5PBHUB_OP_SERVO_WRITE,  M5PBHUB_OP_SERVO_PULSE,   M5PBHUB_OP_RGB_WRITE,   M5PBHUB_OP_RGB_FILL,
    M5PBHUB_OP_LED_COUNT,    M5PBHUB_OP_LED_BRIGHTNESS,
};

static uint8_t resolveOrFail(m5pbhub_port_t port, m5pbhub_channel_t channel, m5pbhub_op_t op)
{
    uint8_t reg = 0;
    EXPECT_EQ(Mapper::resolveAddress(port, channel, op, &reg), M5PBHUB_OK) << Mapper::opName(op);
    return reg;
}

TEST(RegisterMapTest, PortAChannel0DigitalWrite)
{
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_0, M5PBHUB_OP_DIGITAL_WRITE), 0x40);
}

TEST(RegisterMapTest, VendorTableSamples)
{
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_1, M5PBHUB_OP_DIGITAL_WRITE), 0x41);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_B, M5PBHUB_CHANNEL_0, M5PBHUB_OP_PWM_WRITE), 0x52);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_B, M5PBHUB_CHANNEL_1, M5PBHUB_OP_DIGITAL_READ), 0x55);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_C, M5PBHUB_CHANNEL_0, M5PBHUB_OP_ANALOG_READ), 0x66);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_D, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_COUNT), 0x78);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_D, M5PBHUB_CHANNEL_0, M5PBHUB_OP_RGB_WRITE), 0x79);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_E, M5PBHUB_CHANNEL_0, M5PBHUB_OP_RGB_FILL), 0x8A);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_E, M5PBHUB_CHANNEL_0, M5PBHUB_OP_LED_BRIGHTNESS), 0x8B);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_F, M5PBHUB_CHANNEL_1, M5PBHUB_OP_SERVO_WRITE), 0xAD);
    EXPECT_EQ(resolveOrFail(M5PBHUB_PORT_F, M5PBHUB_CHANNEL_1, M5PBHUB_OP_SERVO_PULSE), 0xAF);
}

TEST(RegisterMapTest, PortFSkipsReservedBlock)
{
    EXPECT_EQ(Mapper::portBase(M5PBHUB_PORT_E), 0x80);
    EXPECT_EQ(Mapper::portBase(M5PBHUB_PORT_F), 0xA0);
    EXPECT_EQ(Mapper::portBase(M5PBHUB_PORT_MAX), 0);
}

TEST(RegisterMapTest, AddressesAreUniqueWithinEachPortBlock)
{
    for (int p = 0; p < M5PBHUB_MAX_PORTS; p++) {
        m5pbhub_port_t port = (m5pbhub_port_t)p;
        uint8_t base        = Mapper::portBase(port);
        std::set<uint8_t> seen;
        size_t valid = 0;
        for (size_t i = 0; i < sizeof(ADDRESSED_OPS) / sizeof(ADDRESSED_OPS[0]); i++) {
            for (int c = 0; c < M5PBHUB_MAX_CHANNELS; c++) {
                uint8_t reg = 0;
                if (Mapper::resolveAddress(port, (m5pbhub_channel_t)c, ADDRESSED_OPS[i], &reg) != M5PBHUB_OK) {
                    continue;
                }
                uint8_t again = 0;
                ASSERT_EQ(Mapper::resolveAddress(port, (m5pbhub_channel_t)c, ADDRESSED_OPS[i], &again), M5PBHUB_OK);
                EXPECT_EQ(reg, again);
                EXPECT_GE(reg, base);
                EXPECT_LT(reg, base + 0x10);
                EXPECT_TRUE(seen.insert(reg).second) << "duplicate register 0x" << std::hex << (int)reg;
                valid++;
            }
        }
        // 5 种双引脚操作 + 5 种仅引脚0操作
        // 5 dual-pin kinds + 5 pin-0-only kinds
        EXPECT_EQ(valid, 15u);
    }
}

TEST(RegisterMapTest, RejectsUnsupportedCombinations)
{
    uint8_t reg = 0xEE;
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_1, M5PBHUB_OP_ANALOG_READ, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_B, M5PBHUB_CHANNEL_1, M5PBHUB_OP_RGB_WRITE, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_B, M5PBHUB_CHANNEL_1, M5PBHUB_OP_LED_COUNT, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_MAX, M5PBHUB_CHANNEL_0, M5PBHUB_OP_DIGITAL_WRITE, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_MAX, M5PBHUB_OP_DIGITAL_WRITE, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_0, M5PBHUB_OP_MAX, &reg),
              M5PBHUB_ERR_INVALID_PORT);
    EXPECT_EQ(reg, 0xEE);
}

TEST(RegisterMapTest, EncoderKindsHaveNoRegister)
{
    for (int p = 0; p < M5PBHUB_MAX_PORTS; p++) {
        for (int c = 0; c < M5PBHUB_MAX_CHANNELS; c++) {
            uint8_t reg = 0;
            EXPECT_EQ(Mapper::resolveAddress((m5pbhub_port_t)p, (m5pbhub_channel_t)c, M5PBHUB_OP_ENCODER_READ, &reg),
                      M5PBHUB_ERR_INVALID_PORT);
            EXPECT_EQ(
                Mapper::resolveAddress((m5pbhub_port_t)p, (m5pbhub_channel_t)c, M5PBHUB_OP_ENCODER_RESET, &reg),
                M5PBHUB_ERR_INVALID_PORT);
        }
    }
    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_ENCODER_READ, 0, buf, sizeof(buf), &len), M5PBHUB_ERR_NOT_SUPPORTED);
    EXPECT_EQ(Mapper::wireLength(M5PBHUB_OP_ENCODER_RESET), 0u);
}

TEST(RegisterMapTest, ResolveRejectsNullOutput)
{
    EXPECT_EQ(Mapper::resolveAddress(M5PBHUB_PORT_A, M5PBHUB_CHANNEL_0, M5PBHUB_OP_DIGITAL_WRITE, nullptr),
              M5PBHUB_ERR_INVALID_ARG);
}

TEST(CodecTest, ServoAngle)
{
    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    ASSERT_EQ(Mapper::encode(M5PBHUB_OP_SERVO_WRITE, 90, buf, sizeof(buf), &len), M5PBHUB_OK);
    ASSERT_EQ(len, 1u);
    EXPECT_EQ(buf[0], 90);

    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_SERVO_WRITE, 181, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
}

TEST(CodecTest, ServoPulseIsLittleEndian)
{
    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    ASSERT_EQ(Mapper::encode(M5PBHUB_OP_SERVO_PULSE, 1500, buf, sizeof(buf), &len), M5PBHUB_OK);
    ASSERT_EQ(len, 2u);
    EXPECT_EQ(buf[0], 0xDC);
    EXPECT_EQ(buf[1], 0x05);

    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_SERVO_PULSE, 499, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_SERVO_PULSE, 2501, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
}

TEST(CodecTest, RgbIsRedGreenBlue)
{
    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    ASSERT_EQ(Mapper::encode(M5PBHUB_OP_RGB_WRITE, 0x123456, buf, sizeof(buf), &len), M5PBHUB_OK);
    ASSERT_EQ(len, 3u);
    EXPECT_EQ(buf[0], 0x12);
    EXPECT_EQ(buf[1], 0x34);
    EXPECT_EQ(buf[2], 0x56);

    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_RGB_WRITE, 0x1000000, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_RGB_FILL, 0xFFFFFFFF, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
}

TEST(CodecTest, DomainLimits)
{
    uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
    size_t len = 0;
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_DIGITAL_WRITE, 2, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_PWM_WRITE, 256, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_ANALOG_READ, 4096, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_LED_COUNT, 75, buf, sizeof(buf), &len), M5PBHUB_ERR_VALUE_RANGE);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_LED_COUNT, 74, buf, sizeof(buf), &len), M5PBHUB_OK);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_PWM_WRITE, 255, buf, sizeof(buf), &len), M5PBHUB_OK);
}

TEST(CodecTest, EncodeChecksBuffer)
{
    uint8_t buf[2];
    size_t len = 0;
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_RGB_WRITE, 0x010203, buf, sizeof(buf), &len), M5PBHUB_ERR_INVALID_ARG);
    EXPECT_EQ(Mapper::encode(M5PBHUB_OP_PWM_WRITE, 1, nullptr, 0, &len), M5PBHUB_ERR_INVALID_ARG);
}

TEST(CodecTest, RoundTripOverEachDomain)
{
    for (int i = 0; i < M5PBHUB_OP_MAX; i++) {
        m5pbhub_op_t op = (m5pbhub_op_t)i;
        if (Mapper::wireLength(op) == 0) {
            continue;
        }
        uint32_t lo   = Mapper::minValue(op);
        uint32_t hi   = Mapper::maxValue(op);
        uint32_t step = (hi - lo) > 5000 ? 4099 : 1;
        for (uint64_t v = lo; v <= hi; v += step) {
            uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
            size_t len = 0;
            ASSERT_EQ(Mapper::encode(op, (uint32_t)v, buf, sizeof(buf), &len), M5PBHUB_OK) << Mapper::opName(op);
            uint32_t decoded = 0xDEADBEEF;
            ASSERT_EQ(Mapper::decode(op, buf, len, &decoded), M5PBHUB_OK) << Mapper::opName(op);
            ASSERT_EQ(decoded, (uint32_t)v) << Mapper::opName(op);
        }
        // 端点 / Endpoints
        uint8_t buf[M5PBHUB_MAX_WIRE_LEN];
        size_t len       = 0;
        uint32_t decoded = 0;
        ASSERT_EQ(Mapper::encode(op, hi, buf, sizeof(buf), &len), M5PBHUB_OK);
        ASSERT_EQ(Mapper::decode(op, buf, len, &decoded), M5PBHUB_OK);
        EXPECT_EQ(decoded, hi) << Mapper::opName(op);
    }
}

TEST(CodecTest, DecodeRejectsWrongLength)
{
    uint8_t buf[4] = {0x34, 0x0A, 0x00, 0x00};
    uint32_t value = 0;
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_ANALOG_READ, buf, 1, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_ANALOG_READ, buf, 3, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_SERVO_WRITE, buf, 0, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_RGB_WRITE, buf, 4, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_PWM_WRITE, nullptr, 1, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);

    ASSERT_EQ(Mapper::decode(M5PBHUB_OP_ANALOG_READ, buf, 2, &value), M5PBHUB_OK);
    EXPECT_EQ(value, 0x0A34u);
}

TEST(CodecTest, LedCountReadsBackOneByte)
{
    EXPECT_EQ(Mapper::wireLength(M5PBHUB_OP_LED_COUNT), 2u);
    EXPECT_EQ(Mapper::readLength(M5PBHUB_OP_LED_COUNT), 1u);
    EXPECT_EQ(Mapper::readLength(M5PBHUB_OP_ANALOG_READ), 2u);

    uint8_t raw[2] = {42, 0xFF};
    uint32_t value = 0;
    ASSERT_EQ(Mapper::decode(M5PBHUB_OP_LED_COUNT, raw, 1, &value), M5PBHUB_OK);
    EXPECT_EQ(value, 42u);
    EXPECT_EQ(Mapper::decode(M5PBHUB_OP_LED_COUNT, raw, 3, &value), M5PBHUB_ERR_MALFORMED_RESPONSE);
}

TEST(CodecTest, DigitalDecodesAnyNonZeroAsHigh)
{
    uint8_t raw    = 0x80;
    uint32_t value = 0;
    ASSERT_EQ(Mapper::decode(M5PBHUB_OP_DIGITAL_READ, &raw, 1, &value), M5PBHUB_OK);
    EXPECT_EQ(value, 1u);
    raw = 0;
    ASSERT_EQ(Mapper::decode(M5PBHUB_OP_DIGITAL_WRITE, &raw, 1, &value), M5PBHUB_OK);
    EXPECT_EQ(value, 0u);
}

TEST(CodecTest, Direction)
{
    EXPECT_TRUE(Mapper::isReadable(M5PBHUB_OP_ANALOG_READ));
    EXPECT_FALSE(Mapper::isWritable(M5PBHUB_OP_ANALOG_READ));
    EXPECT_FALSE(Mapper::isReadable(M5PBHUB_OP_RGB_WRITE));
    EXPECT_TRUE(Mapper::isWritable(M5PBHUB_OP_SERVO_PULSE));
    EXPECT_FALSE(Mapper::isReadable(M5PBHUB_OP_ENCODER_READ));
}

TEST(ErrorNameTest, KnownCodes)
{
    EXPECT_STREQ(m5pbhub_err_to_name(M5PBHUB_ERR_VALUE_RANGE), "M5PBHUB_ERR_VALUE_RANGE");
    EXPECT_STREQ(m5pbhub_err_to_name(M5PBHUB_ERR_INVALID_PORT), "M5PBHUB_ERR_INVALID_PORT");
    EXPECT_STREQ(m5pbhub_err_to_name((m5pbhub_err_t)-100), "UNKNOWN_ERROR");
}
