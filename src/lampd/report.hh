// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace LD {

// ITE 5570 embedded controller, as found in some ASUS laptops
static const uint16_t LampVendorId = 0x0B05;
static const uint16_t LampProductId = 0x5570;

// The controller exposes the LampArray reports with ids offset by 0x40
enum class ReportId: uint8_t {
    ArrayAttributes = 0x41,
    AttributesRequest = 0x42,
    AttributesResponse = 0x43,
    MultiUpdate = 0x44,
    RangeUpdate = 0x45,
    ArrayControl = 0x46
};

static const Size ArrayAttributesSize = 23;
static const Size AttributesRequestSize = 3;
static const Size AttributesResponseSize = 29;
static const Size MultiUpdateSize = 51;
static const Size RangeUpdateSize = 10;
static const Size ArrayControlSize = 2;

static const Size MultiUpdateMaxLamps = 8;

// UpdateFlags bit 0, latches pending colors
static const uint8_t LampUpdateComplete = 0x1;

typedef LocalArray<uint8_t, 64> ReportFrame;

struct RgbColor {
    uint8_t red;
    uint8_t green;
    uint8_t blue;

    bool operator==(const RgbColor &other) const
        { return red == other.red && green == other.green && blue == other.blue; }
    bool operator!=(const RgbColor &other) const { return !(*this == other); }
};

struct LampColor {
    RgbColor rgb;
    uint8_t intensity;

    bool operator==(const LampColor &other) const
        { return rgb == other.rgb && intensity == other.intensity; }
    bool operator!=(const LampColor &other) const { return !(*this == other); }
};

struct ArrayAttributes {
    uint16_t lamp_count;

    // Micrometers
    uint32_t width;
    uint32_t height;
    uint32_t depth;

    uint32_t kind;
    uint32_t min_update_interval; // Microseconds
};

struct LampAttributes {
    uint16_t lamp_id;

    // Micrometers, relative to the bounding box
    uint32_t x;
    uint32_t y;
    uint32_t z;

    uint32_t update_latency; // Microseconds
    uint32_t purposes;

    uint8_t red_levels;
    uint8_t green_levels;
    uint8_t blue_levels;
    uint8_t intensity_levels;

    bool programmable;
    uint8_t input_binding;
};

struct LampUpdate {
    uint16_t lamp_id;
    LampColor color;
};

void EncodeColorUpdate(Span<const uint16_t> lamp_ids, const LampColor &color, HeapArray<ReportFrame> *out_frames);
ReportFrame EncodeRangeUpdate(uint16_t first, uint16_t last, const LampColor &color, bool complete = true);

ReportFrame EncodeAcquire();
ReportFrame EncodeRelease();

ReportFrame EncodeLampAttributesRequest(uint16_t lamp_id);

bool DecodeArrayAttributes(Span<const uint8_t> bytes, ArrayAttributes *out_attr);
bool DecodeLampAttributes(Span<const uint8_t> bytes, LampAttributes *out_attr);

// Appends decoded lamps to out_updates, works for multi and range updates
bool DecodeColorUpdate(Span<const uint8_t> bytes, HeapArray<LampUpdate> *out_updates,
                       bool *out_complete = nullptr);

bool IsReleaseReport(Span<const uint8_t> bytes);
const char *GetReportName(uint8_t id);

}
