// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "report.hh"

namespace LD {

enum class DeviceError {
    None,
    Unavailable,
    Io,
    Timeout,
    Protocol
};
static const char *const DeviceErrorNames[] = {
    "None",
    "Unavailable",
    "Io",
    "Timeout",
    "Protocol"
};

// Raw access to one HID node, feature reports only
class LampDevice {
public:
    virtual ~LampDevice() = default;

    virtual const char *GetPath() const = 0;

    // Both return the number of bytes transferred (report id included), or -1 on error
    virtual Size SendFeatureReport(Span<const uint8_t> buf) = 0;
    virtual Size GetFeatureReport(uint8_t id, Span<uint8_t> out_buf) = 0;
};

// Finds the HID node by vendor and product id unless path is set, and takes an
// exclusive advisory lock on it. Returns nullptr (and logs) if that fails.
std::unique_ptr<LampDevice> OpenHidLampDevice(const char *path);

typedef std::unique_ptr<LampDevice> OpenDeviceFunc(const char *path);

// On Linux, libhs puts the report id in front of the hidraw answer, which starts
// with the report id already. Runs func() on a buffer one byte larger than out_buf
// and strips the extra byte, the result is laid out as [id][data...].
Size GetHidrawFeatureReport(uint8_t id, Span<uint8_t> out_buf,
                            FunctionRef<Size(uint8_t id, Span<uint8_t> buf)> func);

struct DeviceDescriptor {
    uint16_t vid = LampVendorId;
    uint16_t pid = LampProductId;
    char path[512] = {};

    ArrayAttributes array = {};
    HeapArray<LampAttributes> lamps;

    // Lamp identifiers, sorted
    HeapArray<uint16_t> lamp_ids;

    // True when lamp ids are exactly 0 to N - 1
    bool IsContiguous() const;
};

class DeviceLink {
    LD_DELETE_COPY(DeviceLink)

    std::function<OpenDeviceFunc> open_func;
    const char *path;

    std::unique_ptr<LampDevice> dev;
    bool acquired = false;

    DeviceError last_error = DeviceError::None;
    bool dump_reports = false;

public:
    int query_timeout = 500;
    int query_delay = 5;

    DeviceLink(const char *path = nullptr);
    DeviceLink(const char *path, const std::function<OpenDeviceFunc> &func);
    ~DeviceLink();

    bool Open();
    bool IsOpen() const { return !!dev; }
    // Gives control back to the firmware first, unless release is false (device gone)
    void Close(bool release = true);

    bool Write(Span<const uint8_t> frame);
    bool Read(ReportId id, Size size, ReportFrame *out_report);

    // Sends request, then reads the response report until match() accepts it or
    // query_timeout elapses (DeviceError::Timeout)
    bool Query(Span<const uint8_t> request, ReportId response_id, Size response_size,
               FunctionRef<bool(Span<const uint8_t>)> match, ReportFrame *out_response);

    bool Discover(DeviceDescriptor *out_desc);

    bool Acquire();
    bool Release();
    bool IsAcquired() const { return acquired; }

    const char *GetPath() const;
    DeviceError GetLastError() const { return last_error; }

private:
    void SetError(DeviceError error) { last_error = error; }
};

void DumpReport(const char *prefix, Span<const uint8_t> bytes);

}
