// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "src/lampd/device.hh"
#include "src/lampd/report.hh"

namespace LD {

// Simulated LampArray controller, it outlives the device handles opened on it
struct FakeController {
    uint16_t lamp_count = 12;
    uint32_t min_update_interval = 0;

    bool present = true;
    bool locked = false;
    bool mute = false;
    int fail_writes = 0;
    int stale_responses = 0;

    // Answer reads the way libhs does on Linux, see GetHidrawFeatureReport()
    bool libhs_framing = false;

    int opens = 0;
    bool autonomous = true;
    uint16_t requested_id = 0;

    HeapArray<ReportFrame> written;

    std::function<OpenDeviceFunc> GetOpener();

    Size CountReports(ReportId id) const;
    Size CountWrites() const { return written.len; }
    void ClearWrites() { written.Clear(); }
};

class FakeLampDevice: public LampDevice {
    FakeController *ctrl;

public:
    FakeLampDevice(FakeController *ctrl) : ctrl(ctrl) {}

    const char *GetPath() const override { return "/dev/fake-hidraw"; }

    Size SendFeatureReport(Span<const uint8_t> buf) override
    {
        if (!ctrl->present)
            return -1;
        if (ctrl->fail_writes > 0) {
            ctrl->fail_writes--;
            return -1;
        }

        ReportFrame frame;
        frame.Append(buf);
        ctrl->written.Append(frame);

        switch ((ReportId)buf[0]) {
            case ReportId::AttributesRequest: {
                ctrl->requested_id = (uint16_t)(buf[1] | (buf[2] << 8));
            } break;
            case ReportId::ArrayControl: {
                ctrl->autonomous = buf[1];
            } break;

            default: {} break;
        }

        return buf.len;
    }

    Size GetFeatureReport(uint8_t id, Span<uint8_t> out_buf) override
    {
        if (!ctrl->present)
            return -1;

        MemSet(out_buf.ptr, 0, out_buf.len);
        out_buf[0] = id;

        switch ((ReportId)id) {
            case ReportId::ArrayAttributes: {
                if (out_buf.len < ArrayAttributesSize)
                    return -1;

                Put(out_buf.ptr + 1, ctrl->lamp_count, 2);
                Put(out_buf.ptr + 3, 300000, 4);
                Put(out_buf.ptr + 7, 100000, 4);
                Put(out_buf.ptr + 11, 1000, 4);
                Put(out_buf.ptr + 15, 1, 4); // Keyboard
                Put(out_buf.ptr + 19, ctrl->min_update_interval, 4);

                return ArrayAttributesSize;
            } break;

            case ReportId::AttributesResponse: {
                if (out_buf.len < AttributesResponseSize)
                    return -1;

                uint16_t lamp_id = ctrl->requested_id;

                if (ctrl->mute) {
                    lamp_id = 0xFFFF;
                } else if (ctrl->stale_responses > 0) {
                    ctrl->stale_responses--;
                    lamp_id = (uint16_t)(lamp_id - 1);
                }

                Put(out_buf.ptr + 1, lamp_id, 2);
                Put(out_buf.ptr + 3, 1000u * lamp_id, 4);
                Put(out_buf.ptr + 7, 2000, 4);
                Put(out_buf.ptr + 11, 0, 4);
                Put(out_buf.ptr + 15, 4000, 4);
                Put(out_buf.ptr + 19, 1, 4); // Control
                out_buf[23] = 255;
                out_buf[24] = 255;
                out_buf[25] = 255;
                out_buf[26] = 1;
                out_buf[27] = 1;
                out_buf[28] = 0;

                return AttributesResponseSize;
            } break;

            default: return -1;
        }
    }

private:
    static void Put(uint8_t *ptr, uint32_t value, int bytes)
    {
        for (int i = 0; i < bytes; i++) {
            ptr[i] = (uint8_t)(value >> (8 * i));
        }
    }
};

// Wraps the fake with the libhs layout: the hidraw answer, report id first,
// lands one byte in and the report id is written again in front of it
class LibhsLampDevice: public LampDevice {
    FakeLampDevice hidraw;

public:
    LibhsLampDevice(FakeController *ctrl) : hidraw(ctrl) {}

    const char *GetPath() const override { return hidraw.GetPath(); }

    Size SendFeatureReport(Span<const uint8_t> buf) override { return hidraw.SendFeatureReport(buf); }

    Size GetFeatureReport(uint8_t id, Span<uint8_t> out_buf) override
    {
        return GetHidrawFeatureReport(id, out_buf, [&](uint8_t report_id, Span<uint8_t> buf) {
            return GetLibhsReport(report_id, buf);
        });
    }

    Size GetLibhsReport(uint8_t id, Span<uint8_t> buf)
    {
        if (buf.len >= 2) {
            buf[1] = id;
        }

        Size ret = hidraw.GetFeatureReport(id, buf.Take(1, buf.len - 1));
        if (ret < 0)
            return -1;

        buf[0] = id;
        return ret + 1;
    }
};

inline std::function<OpenDeviceFunc> FakeController::GetOpener()
{
    return [this](const char *) -> std::unique_ptr<LampDevice> {
        if (!present) {
            LogError("Cannot find LampArray HID device");
            return nullptr;
        }
        if (locked) {
            LogError("Device '/dev/fake-hidraw' is already in use by another process");
            return nullptr;
        }

        opens++;

        if (libhs_framing)
            return std::make_unique<LibhsLampDevice>(this);
        return std::make_unique<FakeLampDevice>(this);
    };
}

inline Size FakeController::CountReports(ReportId id) const
{
    Size count = 0;
    for (const ReportFrame &frame: written) {
        count += (frame.len && frame[0] == (uint8_t)id);
    }
    return count;
}

}
