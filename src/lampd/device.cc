// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "device.hh"
#include "report.hh"

#include <libhs.h>
#include <sys/file.h>

namespace LD {

class HidLampDevice: public LampDevice {
    hs_port *port;
    char path[512];

public:
    HidLampDevice(hs_port *port, const char *path);
    ~HidLampDevice() override;

    const char *GetPath() const override { return path; }

    Size SendFeatureReport(Span<const uint8_t> buf) override;
    Size GetFeatureReport(uint8_t id, Span<uint8_t> out_buf) override;
};

HidLampDevice::HidLampDevice(hs_port *port, const char *path)
    : port(port)
{
    CopyString(path, this->path);
}

HidLampDevice::~HidLampDevice()
{
    // Closing the descriptor drops the flock() too
    hs_port_close(port);
}

Size HidLampDevice::SendFeatureReport(Span<const uint8_t> buf)
{
    ssize_t ret = hs_hid_send_feature_report(port, buf.ptr, (size_t)buf.len);
    return (ret >= 0) ? (Size)ret : -1;
}

Size HidLampDevice::GetFeatureReport(uint8_t id, Span<uint8_t> out_buf)
{
    return GetHidrawFeatureReport(id, out_buf, [&](uint8_t report_id, Span<uint8_t> buf) {
        ssize_t ret = hs_hid_get_feature_report(port, report_id, buf.ptr, (size_t)buf.len);
        return (ret >= 0) ? (Size)ret : -1;
    });
}

Size GetHidrawFeatureReport(uint8_t id, Span<uint8_t> out_buf,
                            FunctionRef<Size(uint8_t id, Span<uint8_t> buf)> func)
{
    LD_ASSERT(out_buf.len > 0 && out_buf.len <= LD_SIZE(ReportFrame::data));

    uint8_t buf[LD_SIZE(ReportFrame::data) + 1];

    Size ret = func(id, MakeSpan(buf, out_buf.len + 1));
    if (ret < 0)
        return -1;
    if (ret < 2 || buf[1] != id) {
        LogError("Malformed %1 report", GetReportName(id));
        return -1;
    }

    Size len = std::min(ret - 1, out_buf.len);
    MemCpy(out_buf.ptr, buf + 1, len);

    return len;
}

std::unique_ptr<LampDevice> OpenHidLampDevice(const char *path)
{
    hs_device *dev = nullptr;

    if (path) {
        hs_match_spec specs[] = {
            HS_MATCH_TYPE(HS_DEVICE_TYPE_HID, nullptr)
        };

        // hs_enumerate() does not keep a reference for us, do it in the callback
        struct FindContext {
            const char *path;
            hs_device *dev;
        } ctx = { path, nullptr };

        int ret = hs_enumerate(specs, LD_LEN(specs), [](hs_device *dev, void *udata) {
            FindContext *ctx = (FindContext *)udata;

            if (TestStr(dev->path, ctx->path)) {
                ctx->dev = hs_device_ref(dev);
                return 1;
            }

            return 0;
        }, &ctx);
        if (ret < 0)
            return nullptr;
        if (!ctx.dev) {
            LogError("Cannot find HID device '%1'", path);
            return nullptr;
        }

        dev = ctx.dev;
    } else {
        hs_match_spec specs[] = {
            HS_MATCH_TYPE_VID_PID(HS_DEVICE_TYPE_HID, LampVendorId, LampProductId, nullptr)
        };

        int ret = hs_find(specs, LD_LEN(specs), &dev);
        if (ret < 0)
            return nullptr;
        if (!ret) {
            LogError("Cannot find LampArray HID device (%1:%2)",
                     FmtHex(LampVendorId).Pad0(4), FmtHex(LampProductId).Pad0(4));
            return nullptr;
        }
    }
    LD_DEFER { hs_device_unref(dev); };

    if (dev->vid != LampVendorId || dev->pid != LampProductId) {
        LogWarning("Device '%1' is %2:%3, not the expected %4:%5", dev->path,
                   FmtHex(dev->vid).Pad0(4), FmtHex(dev->pid).Pad0(4),
                   FmtHex(LampVendorId).Pad0(4), FmtHex(LampProductId).Pad0(4));
    }

    hs_port *port;
    if (hs_port_open(dev, HS_PORT_MODE_RW, &port) < 0)
        return nullptr;
    LD_DEFER_N(port_guard) { hs_port_close(port); };

    // We are the only writer, make sure nobody else is fighting over the lights
    int fd = (int)hs_port_get_poll_handle(port);
    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK) {
            LogError("Device '%1' is already in use by another process", dev->path);
        } else {
            LogError("Failed to lock '%1': %2", dev->path, strerror(errno));
        }
        return nullptr;
    }

    std::unique_ptr<LampDevice> lamps = std::make_unique<HidLampDevice>(port, dev->path);
    port_guard.Disable();

    return lamps;
}

bool DeviceDescriptor::IsContiguous() const
{
    for (Size i = 0; i < lamp_ids.len; i++) {
        if (lamp_ids[i] != i)
            return false;
    }

    return lamp_ids.len > 0;
}

void DumpReport(const char *prefix, Span<const uint8_t> bytes)
{
    Print(stderr, "%!D..%1%!0 %2 (%3 bytes):", prefix, GetReportName(bytes.len ? bytes[0] : 0), bytes.len);

    for (Size i = 0; i < bytes.len; i++) {
        if (!(i % 16)) {
            Print(stderr, "\n  [%1]  ", FmtArg(i).Pad(4));
        }
        Print(stderr, " %1", FmtHex(bytes[i]).Pad0(2));
    }
    PrintLn(stderr);
}

DeviceLink::DeviceLink(const char *path)
    : DeviceLink(path, OpenHidLampDevice) {}

DeviceLink::DeviceLink(const char *path, const std::function<OpenDeviceFunc> &func)
    : open_func(func), path(path), dump_reports(GetDebugFlag("DUMP_REPORTS")) {}

DeviceLink::~DeviceLink()
{
    Close();
}

bool DeviceLink::Open()
{
    LD_ASSERT(!dev);

    dev = open_func(path);
    acquired = false;

    if (!dev) {
        SetError(DeviceError::Unavailable);
        return false;
    }

    LogDebug("Opened device '%1'", dev->GetPath());

    SetError(DeviceError::None);
    return true;
}

void DeviceLink::Close(bool release)
{
    if (!dev)
        return;

    if (acquired) {
        if (!release) {
            LogDebug("Skipping release of '%1'", dev->GetPath());
        } else if (!Release()) {
            LogWarning("Failed to give lamp control back to the firmware");
        }
    }

    dev.reset();
    acquired = false;
}

bool DeviceLink::Write(Span<const uint8_t> frame)
{
    LD_ASSERT(frame.len > 0);

    if (!dev) {
        LogError("Device is not open");
        SetError(DeviceError::Unavailable);
        return false;
    }

    if (dump_reports) {
        DumpReport(">", frame);
    }

    Size ret = dev->SendFeatureReport(frame);

    if (ret < 0) {
        LogError("Failed to send %1 report to '%2'", GetReportName(frame[0]), dev->GetPath());
        SetError(DeviceError::Io);
        return false;
    }
    if (ret != frame.len) {
        LogError("Short write of %1 report (%2 of %3 bytes)", GetReportName(frame[0]), ret, frame.len);
        SetError(DeviceError::Io);
        return false;
    }

    return true;
}

bool DeviceLink::Read(ReportId id, Size size, ReportFrame *out_report)
{
    LD_ASSERT(size > 0 && size <= LD_SIZE(out_report->data));

    if (!dev) {
        LogError("Device is not open");
        SetError(DeviceError::Unavailable);
        return false;
    }

    out_report->Clear();

    Size ret = dev->GetFeatureReport((uint8_t)id, MakeSpan(out_report->data, size));

    if (ret < 0) {
        LogError("Failed to read %1 report from '%2'", GetReportName((uint8_t)id), dev->GetPath());
        SetError(DeviceError::Io);
        return false;
    }
    out_report->len = std::min(ret, size);

    if (dump_reports) {
        DumpReport("<", *out_report);
    }

    return true;
}

bool DeviceLink::Query(Span<const uint8_t> request, ReportId response_id, Size response_size,
                       FunctionRef<bool(Span<const uint8_t>)> match, ReportFrame *out_response)
{
    if (!Write(request))
        return false;

    int64_t start = GetMonotonicTime();

    for (;;) {
        if (!Read(response_id, response_size, out_response))
            return false;
        if (match(*out_response))
            return true;

        if (GetMonotonicTime() - start >= query_timeout) {
            LogError("Timed out waiting for matching %1 report", GetReportName((uint8_t)response_id));
            SetError(DeviceError::Timeout);
            return false;
        }

        WaitDelay(query_delay);
    }
}

bool DeviceLink::Discover(DeviceDescriptor *out_desc)
{
    DeviceDescriptor desc;

    CopyString(GetPath(), desc.path);

    // Array attributes
    {
        ReportFrame report;

        if (!Read(ReportId::ArrayAttributes, ArrayAttributesSize, &report))
            return false;
        if (!DecodeArrayAttributes(report, &desc.array)) {
            SetError(DeviceError::Protocol);
            return false;
        }
    }

    // Lamp attributes, one query per lamp. LampArray ids always run from 0 to
    // lamp_count - 1, anything else is a stale answer.
    for (Size i = 0; i < desc.array.lamp_count; i++) {
        uint16_t lamp_id = (uint16_t)i;

        ReportFrame request = EncodeLampAttributesRequest(lamp_id);
        ReportFrame response;

        // The controller may still answer for the previous request for a little while
        bool success = Query(request, ReportId::AttributesResponse, AttributesResponseSize,
                             [&](Span<const uint8_t> bytes) {
            if (bytes.len < 3 || bytes[0] != (uint8_t)ReportId::AttributesResponse)
                return false;

            uint16_t id = (uint16_t)(bytes[1] | (bytes[2] << 8));
            return id == lamp_id;
        }, &response);
        if (!success)
            return false;

        LampAttributes attr;
        if (!DecodeLampAttributes(response, &attr)) {
            SetError(DeviceError::Protocol);
            return false;
        }

        desc.lamps.Append(attr);
        desc.lamp_ids.Append(attr.lamp_id);
    }

    std::sort(desc.lamp_ids.begin(), desc.lamp_ids.end());

    LogInfo("Found %1 lamps on '%2'", desc.lamps.len, desc.path);
    LogDebug("Minimal update interval: %1 us", desc.array.min_update_interval);

    std::swap(*out_desc, desc);
    return true;
}

bool DeviceLink::Acquire()
{
    ReportFrame frame = EncodeAcquire();

    if (!Write(frame))
        return false;
    acquired = true;

    LogDebug("Took lamp control from the firmware");
    return true;
}

bool DeviceLink::Release()
{
    ReportFrame frame = EncodeRelease();

    if (!Write(frame))
        return false;
    acquired = false;

    LogDebug("Gave lamp control back to the firmware");
    return true;
}

const char *DeviceLink::GetPath() const
{
    if (dev)
        return dev->GetPath();

    return path ? path : "(auto)";
}

}
