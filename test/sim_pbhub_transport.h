/*
 * SPDX-FileCopyrightText: 2026 M5Stack Technology CO LTD
 *
 * SPDX-License-Identifier: MIT
 */

// In-memory PbHub: each register keeps the last payload written to it.

#ifndef _SIM_PBHUB_TRANSPORT_H_
#define _SIM_PBHUB_TRANSPORT_H_

#include <map>
#include <vector>

#include "M5PbHub_transport.h"

class SimPbHubTransport : public M5PbHubTransport {
public:
    struct Frame {
        uint8_t reg;
        std::vector<uint8_t> data;
    };

    SimPbHubTransport() : failWith(M5PBHUB_OK), reads(0), lastReadReg(0), lastReadLen(0)
    {
        registers[M5PBHUB_REG_FW_VERSION] = std::vector<uint8_t>(1, 0x01);
    }

    m5pbhub_err_t readRegister(uint8_t reg, uint8_t* data, size_t len) override
    {
        ++reads;
        lastReadReg = reg;
        lastReadLen = len;
        if (failWith != M5PBHUB_OK) {
            return failWith;
        }
        const std::vector<uint8_t>& value = registers[reg];
        for (size_t i = 0; i < len; i++) {
            data[i] = i < value.size() ? value[i] : 0;
        }
        return M5PBHUB_OK;
    }

    m5pbhub_err_t writeRegister(uint8_t reg, const uint8_t* data, size_t len) override
    {
        Frame frame;
        frame.reg = reg;
        frame.data.assign(data, data + len);
        writes.push_back(frame);
        if (failWith != M5PBHUB_OK) {
            return failWith;
        }
        registers[reg] = frame.data;
        return M5PBHUB_OK;
    }

    size_t busAccesses() const
    {
        return reads + writes.size();
    }

    void resetLog()
    {
        reads = 0;
        writes.clear();
    }

    std::map<uint8_t, std::vector<uint8_t> > registers;
    std::vector<Frame> writes;
    m5pbhub_err_t failWith;
    size_t reads;
    uint8_t lastReadReg;
    size_t lastReadLen;
};

#endif  // _SIM_PBHUB_TRANSPORT_H_
