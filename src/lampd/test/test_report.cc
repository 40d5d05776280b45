// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "src/lampd/report.hh"

namespace LD {

static bool DecodeAll(Span<const ReportFrame> frames, HeapArray<LampUpdate> *out_updates, Size *out_complete)
{
    Size complete = 0;

    for (const ReportFrame &frame: frames) {
        bool last = false;
        if (!DecodeColorUpdate(frame, out_updates, &last))
            return false;
        complete += last;
    }

    *out_complete = complete;
    return true;
}

TEST_FUNCTION("lampd/EncodeColorUpdate")
{
    const LampColor color = { { 12, 200, 7 }, 99 };

    // Lamp ids come out sorted whatever the input order
    {
        uint16_t ids[] = { 5, 3, 1, 4, 0, 2 };
        HeapArray<ReportFrame> frames;

        EncodeColorUpdate(ids, color, &frames);
        TEST_EQ(frames.len, 1);

        HeapArray<LampUpdate> updates;
        Size complete = 0;
        TEST(DecodeAll(frames, &updates, &complete));

        TEST_EQ(updates.len, 6);
        TEST_EQ(complete, 1);
        for (Size i = 0; i < updates.len; i++) {
            TEST_EQ(updates[i].lamp_id, i);
            TEST(updates[i].color == color);
        }
    }

    // Twenty lamps need three frames, the last one partial
    {
        HeapArray<uint16_t> ids;
        for (uint16_t i = 0; i < 20; i++) {
            ids.Append(i);
        }

        HeapArray<ReportFrame> frames;
        EncodeColorUpdate(ids, color, &frames);

        TEST_EQ(frames.len, 3);
        for (const ReportFrame &frame: frames) {
            TEST_EQ(frame.len, MultiUpdateSize);
            TEST_EQ(frame[0], 0x44);
        }

        TEST_EQ(frames[0][1], 8);
        TEST_EQ(frames[1][1], 8);
        TEST_EQ(frames[2][1], 4);

        // Only the last frame latches the colors
        TEST_EQ(frames[0][2], 0);
        TEST_EQ(frames[1][2], 0);
        TEST_EQ(frames[2][2], LampUpdateComplete);

        // Unused slots of the partial frame stay zeroed
        TEST_EQ(frames[2][3 + 2 * 4], 0);
        TEST_EQ(frames[2][3 + 2 * 7 + 1], 0);
        TEST_EQ(frames[2][3 + 16 + 4 * 7], 0);

        HeapArray<LampUpdate> updates;
        Size complete = 0;
        TEST(DecodeAll(frames, &updates, &complete));

        TEST_EQ(updates.len, 20);
        TEST_EQ(complete, 1);
        for (Size i = 0; i < updates.len; i++) {
            TEST_EQ(updates[i].lamp_id, i);
            TEST(updates[i].color == color);
        }
    }

    // Exactly 8 lamps fit in one frame
    {
        uint16_t ids[] = { 0, 1, 2, 3, 4, 5, 6, 7 };
        HeapArray<ReportFrame> frames;

        EncodeColorUpdate(ids, color, &frames);
        TEST_EQ(frames.len, 1);
        TEST_EQ(frames[0][1], 8);
        TEST_EQ(frames[0][2], LampUpdateComplete);
    }

    // Nothing to do
    {
        HeapArray<ReportFrame> frames;

        EncodeColorUpdate({}, color, &frames);
        TEST_EQ(frames.len, 0);
    }
}

TEST_FUNCTION("lampd/EncodeLayout")
{
    // Little-endian lamp ids, then RGBI tuples
    {
        uint16_t ids[] = { 0x0102 };
        HeapArray<ReportFrame> frames;

        EncodeColorUpdate(ids, { { 1, 2, 3 }, 4 }, &frames);
        TEST_EQ(frames.len, 1);

        const ReportFrame &frame = frames[0];

        TEST_EQ(frame[3], 0x02);
        TEST_EQ(frame[4], 0x01);
        TEST_EQ(frame[19], 1);
        TEST_EQ(frame[20], 2);
        TEST_EQ(frame[21], 3);
        TEST_EQ(frame[22], 4);
    }

    {
        ReportFrame frame = EncodeRangeUpdate(0, 127, { { 0, 0, 128 }, 128 });
        const uint8_t expected[] = { 0x45, 0x01, 0x00, 0x00, 0x7F, 0x00, 0, 0, 128, 128 };

        TEST_EQ(frame.len, LD_SIZE(expected));
        TEST(!memcmp(frame.data, expected, LD_SIZE(expected)));
    }

    {
        ReportFrame frame = EncodeAcquire();

        TEST_EQ(frame.len, 2);
        TEST_EQ(frame[0], 0x46);
        TEST_EQ(frame[1], 0);
        TEST(!IsReleaseReport(frame));
    }

    {
        ReportFrame frame = EncodeRelease();

        TEST_EQ(frame.len, 2);
        TEST_EQ(frame[0], 0x46);
        TEST_EQ(frame[1], 1);
        TEST(IsReleaseReport(frame));
    }

    {
        ReportFrame frame = EncodeLampAttributesRequest(300);
        const uint8_t expected[] = { 0x42, 0x2C, 0x01 };

        TEST_EQ(frame.len, LD_SIZE(expected));
        TEST(!memcmp(frame.data, expected, LD_SIZE(expected)));
    }
}

TEST_FUNCTION("lampd/DecodeRangeUpdate")
{
    ReportFrame frame = EncodeRangeUpdate(3, 6, { { 10, 20, 30 }, 40 }, false);

    HeapArray<LampUpdate> updates;
    bool complete = true;

    TEST(DecodeColorUpdate(frame, &updates, &complete));
    TEST(!complete);
    TEST_EQ(updates.len, 4);
    TEST_EQ(updates[0].lamp_id, 3);
    TEST_EQ(updates[3].lamp_id, 6);
    TEST_EQ(updates[2].color.rgb.green, 20);
    TEST_EQ(updates[2].color.intensity, 40);

    // Reversed range
    {
        ReportFrame bad = frame;
        bad.data[2] = 9;

        PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
        LD_DEFER { PopLogFilter(); };

        HeapArray<LampUpdate> ignore;
        TEST(!DecodeColorUpdate(bad, &ignore));
    }
}

TEST_FUNCTION("lampd/DecodeAttributes")
{
    uint8_t array[23] = {
        0x41,
        0x80, 0x00,             // 128 lamps
        0xE0, 0x93, 0x04, 0x00, // 300000
        0xA0, 0x86, 0x01, 0x00, // 100000
        0xE8, 0x03, 0x00, 0x00, // 1000
        0x01, 0x00, 0x00, 0x00, // Keyboard
        0x10, 0x27, 0x00, 0x00  // 10000 us
    };

    ArrayAttributes attr = {};
    TEST(DecodeArrayAttributes(array, &attr));
    TEST_EQ(attr.lamp_count, 128);
    TEST_EQ(attr.width, 300000);
    TEST_EQ(attr.height, 100000);
    TEST_EQ(attr.depth, 1000);
    TEST_EQ(attr.kind, 1);
    TEST_EQ(attr.min_update_interval, 10000);

    uint8_t lamp[29] = {
        0x43,
        0x05, 0x00,             // Lamp 5
        0x10, 0x00, 0x00, 0x00,
        0x20, 0x00, 0x00, 0x00,
        0x30, 0x00, 0x00, 0x00,
        0x40, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00,
        255, 255, 255, 1,
        1,
        0
    };

    LampAttributes lamp_attr = {};
    TEST(DecodeLampAttributes(lamp, &lamp_attr));
    TEST_EQ(lamp_attr.lamp_id, 5);
    TEST_EQ(lamp_attr.x, 0x10);
    TEST_EQ(lamp_attr.y, 0x20);
    TEST_EQ(lamp_attr.z, 0x30);
    TEST_EQ(lamp_attr.update_latency, 0x40);
    TEST_EQ(lamp_attr.purposes, 1);
    TEST_EQ(lamp_attr.red_levels, 255);
    TEST_EQ(lamp_attr.intensity_levels, 1);
    TEST(lamp_attr.programmable);

    // Malformed input
    {
        PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
        LD_DEFER { PopLogFilter(); };

        TEST(!DecodeArrayAttributes(MakeSpan(array, 10), &attr));
        TEST(!DecodeLampAttributes(array, &lamp_attr));
        TEST(!DecodeLampAttributes({}, &lamp_attr));

        uint8_t empty[23] = { 0x41 };
        TEST(!DecodeArrayAttributes(empty, &attr));

        uint8_t multi[51] = { 0x44, 9 };
        HeapArray<LampUpdate> ignore;
        TEST(!DecodeColorUpdate(multi, &ignore));
    }
}

}
