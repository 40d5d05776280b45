// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "src/lampd/device.hh"
#include "fake.hh"

namespace LD {

static void SilenceLogs()
{
    PushLogFilter([](LogLevel level, const char *ctx, const char *msg, FunctionRef<LogFunc> func) {
        if (GetDebugFlag("LAMPD_DEBUG")) {
            func(level, ctx, msg);
        }
    });
}

TEST_FUNCTION("lampd/DeviceOpen")
{
    SilenceLogs();
    LD_DEFER { PopLogFilter(); };

    FakeController ctrl;

    // Missing device
    {
        ctrl.present = false;

        DeviceLink link(nullptr, ctrl.GetOpener());
        TEST(!link.Open());
        TEST(!link.IsOpen());
        TEST_EQ((int)link.GetLastError(), (int)DeviceError::Unavailable);
    }

    // Busy device
    {
        ctrl.present = true;
        ctrl.locked = true;

        DeviceLink link(nullptr, ctrl.GetOpener());
        TEST(!link.Open());
        TEST_EQ((int)link.GetLastError(), (int)DeviceError::Unavailable);
    }

    ctrl.locked = false;

    {
        DeviceLink link(nullptr, ctrl.GetOpener());
        TEST(link.Open());
        TEST(link.IsOpen());
        TEST(!link.IsAcquired());
        TEST_STR(link.GetPath(), "/dev/fake-hidraw");
        TEST_EQ(ctrl.opens, 1);

        // Not acquired, nothing to give back
        link.Close();
        TEST(!link.IsOpen());
        TEST_EQ(ctrl.CountWrites(), 0);
    }
}

TEST_FUNCTION("lampd/DeviceDiscover")
{
    SilenceLogs();
    LD_DEFER { PopLogFilter(); };

    FakeController ctrl;
    ctrl.lamp_count = 20;
    ctrl.min_update_interval = 8000;

    DeviceLink link(nullptr, ctrl.GetOpener());
    TEST(link.Open());

    DeviceDescriptor desc;
    TEST(link.Discover(&desc));

    TEST_EQ(desc.vid, 0x0B05);
    TEST_EQ(desc.pid, 0x5570);
    TEST_STR(desc.path, "/dev/fake-hidraw");
    TEST_EQ(desc.array.lamp_count, 20);
    TEST_EQ(desc.array.min_update_interval, 8000);
    TEST_EQ(desc.lamps.len, 20);
    TEST_EQ(desc.lamp_ids.len, 20);
    TEST(desc.IsContiguous());
    TEST_EQ(desc.lamps[7].lamp_id, 7);
    TEST_EQ(desc.lamps[7].x, 7000);
    TEST_EQ(ctrl.CountReports(ReportId::AttributesRequest), 20);

    // One request per lamp, even when the controller lags behind
    {
        ctrl.ClearWrites();
        ctrl.stale_responses = 3;

        DeviceDescriptor desc2;
        TEST(link.Discover(&desc2));
        TEST_EQ(desc2.lamp_ids.len, 20);
        TEST_EQ(ctrl.CountReports(ReportId::AttributesRequest), 20);
    }

    // Controller never answers
    {
        ctrl.mute = true;
        link.query_timeout = 20;
        link.query_delay = 1;

        DeviceDescriptor desc3;
        TEST(!link.Discover(&desc3));
        TEST_EQ((int)link.GetLastError(), (int)DeviceError::Timeout);
    }
}

TEST_FUNCTION("lampd/DeviceHidrawFraming")
{
    SilenceLogs();
    LD_DEFER { PopLogFilter(); };

    // libhs answers [id][id][data...], callers get [id][data...]
    {
        uint8_t out[4] = {};
        Size requested = 0;

        Size len = GetHidrawFeatureReport(0x41, out, [&](uint8_t id, Span<uint8_t> buf) {
            uint8_t answer[] = { id, id, 0xAA, 0xBB, 0xCC };

            requested = buf.len;
            MemCpy(buf.ptr, answer, LD_SIZE(answer));

            return (Size)LD_SIZE(answer);
        });

        TEST_EQ(requested, 5);
        TEST_EQ(len, 4);
        TEST_EQ(out[0], 0x41);
        TEST_EQ(out[1], 0xAA);
        TEST_EQ(out[2], 0xBB);
        TEST_EQ(out[3], 0xCC);
    }

    // Errors and garbage
    {
        uint8_t out[4] = {};
        Size len;

        len = GetHidrawFeatureReport(0x41, out, [](uint8_t, Span<uint8_t>) { return (Size)-1; });
        TEST_EQ(len, -1);

        // Nothing after the libhs byte
        len = GetHidrawFeatureReport(0x41, out, [](uint8_t id, Span<uint8_t> buf) {
            buf[0] = id;
            return (Size)1;
        });
        TEST_EQ(len, -1);

        // Answer for another report
        len = GetHidrawFeatureReport(0x41, out, [](uint8_t id, Span<uint8_t> buf) {
            buf[0] = id;
            buf[1] = 0x43;
            return (Size)2;
        });
        TEST_EQ(len, -1);
    }

    // Full discovery through the libhs layout
    {
        FakeController ctrl;
        ctrl.lamp_count = 4;
        ctrl.min_update_interval = 8000;
        ctrl.libhs_framing = true;

        DeviceLink link(nullptr, ctrl.GetOpener());
        link.query_timeout = 100;
        link.query_delay = 1;

        TEST(link.Open());

        DeviceDescriptor desc;
        TEST(link.Discover(&desc));
        TEST_EQ(desc.array.lamp_count, 4);
        TEST_EQ(desc.array.min_update_interval, 8000);
        TEST_EQ(desc.lamp_ids.len, 4);
        TEST_EQ(desc.lamps[3].lamp_id, 3);
        TEST_EQ(desc.lamps[3].x, 3000);
        TEST_EQ(ctrl.CountReports(ReportId::AttributesRequest), 4);
    }
}

TEST_FUNCTION("lampd/DeviceAcquire")
{
    SilenceLogs();
    LD_DEFER { PopLogFilter(); };

    FakeController ctrl;

    {
        DeviceLink link(nullptr, ctrl.GetOpener());
        TEST(link.Open());

        TEST(link.Acquire());
        TEST(link.IsAcquired());
        TEST(!ctrl.autonomous);

        TEST(link.Write(EncodeRangeUpdate(0, 11, { { 1, 2, 3 }, 4 })));
        TEST_EQ(ctrl.CountWrites(), 2);

        // Failed writes are I/O errors
        ctrl.fail_writes = 1;
        TEST(!link.Write(EncodeRangeUpdate(0, 11, { { 1, 2, 3 }, 4 })));
        TEST_EQ((int)link.GetLastError(), (int)DeviceError::Io);
        TEST_EQ(ctrl.CountWrites(), 2);
    }

    // Going out of scope gives the lamps back
    TEST(ctrl.autonomous);
    TEST_EQ(ctrl.CountWrites(), 3);
    TEST(IsReleaseReport(ctrl.written[ctrl.written.len - 1]));

    // Unless the device is gone
    {
        ctrl.ClearWrites();

        DeviceLink link(nullptr, ctrl.GetOpener());
        TEST(link.Open());
        TEST(link.Acquire());

        link.Close(false);
        TEST(!ctrl.autonomous);
        TEST_EQ(ctrl.CountWrites(), 1);
    }
}

TEST_FUNCTION("lampd/DeviceNotOpen")
{
    SilenceLogs();
    LD_DEFER { PopLogFilter(); };

    DeviceLink link(nullptr, [](const char *) -> std::unique_ptr<LampDevice> { return nullptr; });

    TEST(!link.Write(EncodeAcquire()));
    TEST_EQ((int)link.GetLastError(), (int)DeviceError::Unavailable);
    TEST_STR(link.GetPath(), "(auto)");
}

}
