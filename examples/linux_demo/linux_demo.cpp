/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

/*
 * Linux i2c-dev 示例：读取每个端口的 ADC 和数字输入。
 * Linux i2c-dev demo: read ADC and digital inputs of every port.
 *
 * 用法 / Usage: pbhub_linux_demo [/dev/i2c-1] [0x61]
 */

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include "M5PbHub.h"

int main(int argc, char** argv)
{
    const char* device = argc > 1 ? argv[1] : "/dev/i2c-1";
    uint8_t addr       = argc > 2 ? (uint8_t)strtoul(argv[2], nullptr, 0) : M5PBHUB_DEFAULT_ADDR;

    M5PbHub pbhub;
    m5pbhub_err_t err = pbhub.begin(device, addr);
    if (err != M5PBHUB_OK) {
        fprintf(stderr, "PbHub begin failed: %s\n", m5pbhub_err_to_name(err));
        return 1;
    }

    uint8_t version = 0;
    err             = pbhub.getFirmwareVersion(&version);
    if (err != M5PBHUB_OK) {
        fprintf(stderr, "getFirmwareVersion failed: %s\n", m5pbhub_err_to_name(err));
        return 1;
    }
    printf("PbHub at %s:0x%02X firmware %u\n", device, addr, version);

    for (int round = 0; round < 10; round++) {
        for (int p = 0; p < M5PBHUB_MAX_PORTS; p++) {
            m5pbhub_port_t port = (m5pbhub_port_t)p;
            uint16_t adc        = 0;
            bool in0            = false;
            bool in1            = false;
            if ((err = pbhub.analogRead(port, &adc)) != M5PBHUB_OK ||
                (err = pbhub.digitalRead(port, M5PBHUB_CHANNEL_0, &in0)) != M5PBHUB_OK ||
                (err = pbhub.digitalRead(port, M5PBHUB_CHANNEL_1, &in1)) != M5PBHUB_OK) {
                fprintf(stderr, "port %c read failed: %s\n", M5PbHubRegisterMapper::portName(port),
                        m5pbhub_err_to_name(err));
                return 1;
            }
            printf("%c: adc=%4u in0=%d in1=%d  ", M5PbHubRegisterMapper::portName(port), adc, in0, in1);
        }
        printf("\n");
        sleep(1);
    }
    return 0;
}
