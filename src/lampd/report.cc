// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "report.hh"

namespace LD {

#pragma pack(push, 1)
struct ArrayAttributesReport {
    uint8_t report; // 0x41
    uint16_t lamp_count;
    uint32_t width;
    uint32_t height;
    uint32_t depth;
    uint32_t kind;
    uint32_t min_update_interval;
};
static_assert(LD_SIZE(ArrayAttributesReport) == ArrayAttributesSize);

struct AttributesRequestReport {
    uint8_t report; // 0x42
    uint16_t lamp_id;
};
static_assert(LD_SIZE(AttributesRequestReport) == AttributesRequestSize);

struct AttributesResponseReport {
    uint8_t report; // 0x43
    uint16_t lamp_id;
    uint32_t x;
    uint32_t y;
    uint32_t z;
    uint32_t update_latency;
    uint32_t purposes;
    uint8_t red_levels;
    uint8_t green_levels;
    uint8_t blue_levels;
    uint8_t intensity_levels;
    uint8_t programmable;
    uint8_t input_binding;
};
static_assert(LD_SIZE(AttributesResponseReport) == AttributesResponseSize);

struct MultiUpdateReport {
    uint8_t report; // 0x44
    uint8_t count; // 1 to 8
    uint8_t flags;
    uint16_t lamp_ids[8];
    uint8_t colors[8][4]; // R, G, B, I
};
static_assert(LD_SIZE(MultiUpdateReport) == MultiUpdateSize);

struct RangeUpdateReport {
    uint8_t report; // 0x45
    uint8_t flags;
    uint16_t start;
    uint16_t end; // Inclusive
    uint8_t red;
    uint8_t green;
    uint8_t blue;
    uint8_t intensity;
};
static_assert(LD_SIZE(RangeUpdateReport) == RangeUpdateSize);

struct ArrayControlReport {
    uint8_t report; // 0x46
    uint8_t autonomous;
};
static_assert(LD_SIZE(ArrayControlReport) == ArrayControlSize);
#pragma pack(pop)

template <typename T>
static ReportFrame MakeFrame(const T &pkt)
{
    ReportFrame frame;
    frame.Append(MakeSpan((const uint8_t *)&pkt, LD_SIZE(pkt)));
    return frame;
}

template <typename T>
static bool ReadReport(Span<const uint8_t> bytes, ReportId id, T *out_pkt)
{
    if (!bytes.len) {
        LogError("Empty %1 report", GetReportName((uint8_t)id));
        return false;
    }
    if (bytes[0] != (uint8_t)id) {
        LogError("Expected %1 report (0x%2), got 0x%3", GetReportName((uint8_t)id),
                 FmtHex((uint8_t)id).Pad0(2), FmtHex(bytes[0]).Pad0(2));
        return false;
    }
    if (bytes.len < LD_SIZE(T)) {
        LogError("Truncated %1 report (%2 bytes, expected %3)", GetReportName((uint8_t)id), bytes.len, LD_SIZE(T));
        return false;
    }

    MemCpy(out_pkt, bytes.ptr, LD_SIZE(T));
    return true;
}

void EncodeColorUpdate(Span<const uint16_t> lamp_ids, const LampColor &color, HeapArray<ReportFrame> *out_frames)
{
    HeapArray<uint16_t> ids;
    ids.Append(lamp_ids);
    std::sort(ids.begin(), ids.end());

    for (Size offset = 0; offset < ids.len; offset += MultiUpdateMaxLamps) {
        Size count = std::min(ids.len - offset, MultiUpdateMaxLamps);
        bool last = (offset + count >= ids.len);

        MultiUpdateReport pkt = {};

        pkt.report = (uint8_t)ReportId::MultiUpdate;
        pkt.count = (uint8_t)count;
        pkt.flags = last ? LampUpdateComplete : 0;
        for (Size i = 0; i < count; i++) {
            pkt.lamp_ids[i] = LittleEndian(ids[offset + i]);

            pkt.colors[i][0] = color.rgb.red;
            pkt.colors[i][1] = color.rgb.green;
            pkt.colors[i][2] = color.rgb.blue;
            pkt.colors[i][3] = color.intensity;
        }

        out_frames->Append(MakeFrame(pkt));
    }
}

ReportFrame EncodeRangeUpdate(uint16_t first, uint16_t last, const LampColor &color, bool complete)
{
    LD_ASSERT(first <= last);

    RangeUpdateReport pkt = {};

    pkt.report = (uint8_t)ReportId::RangeUpdate;
    pkt.flags = complete ? LampUpdateComplete : 0;
    pkt.start = LittleEndian(first);
    pkt.end = LittleEndian(last);
    pkt.red = color.rgb.red;
    pkt.green = color.rgb.green;
    pkt.blue = color.rgb.blue;
    pkt.intensity = color.intensity;

    return MakeFrame(pkt);
}

ReportFrame EncodeAcquire()
{
    ArrayControlReport pkt = {};

    pkt.report = (uint8_t)ReportId::ArrayControl;
    pkt.autonomous = 0;

    return MakeFrame(pkt);
}

ReportFrame EncodeRelease()
{
    ArrayControlReport pkt = {};

    pkt.report = (uint8_t)ReportId::ArrayControl;
    pkt.autonomous = 1;

    return MakeFrame(pkt);
}

ReportFrame EncodeLampAttributesRequest(uint16_t lamp_id)
{
    AttributesRequestReport pkt = {};

    pkt.report = (uint8_t)ReportId::AttributesRequest;
    pkt.lamp_id = LittleEndian(lamp_id);

    return MakeFrame(pkt);
}

bool DecodeArrayAttributes(Span<const uint8_t> bytes, ArrayAttributes *out_attr)
{
    ArrayAttributesReport pkt;
    if (!ReadReport(bytes, ReportId::ArrayAttributes, &pkt))
        return false;

    ArrayAttributes attr = {};

    attr.lamp_count = LittleEndian(pkt.lamp_count);
    attr.width = LittleEndian(pkt.width);
    attr.height = LittleEndian(pkt.height);
    attr.depth = LittleEndian(pkt.depth);
    attr.kind = LittleEndian(pkt.kind);
    attr.min_update_interval = LittleEndian(pkt.min_update_interval);

    if (!attr.lamp_count) {
        LogError("Device reports zero lamps");
        return false;
    }

    *out_attr = attr;
    return true;
}

bool DecodeLampAttributes(Span<const uint8_t> bytes, LampAttributes *out_attr)
{
    AttributesResponseReport pkt;
    if (!ReadReport(bytes, ReportId::AttributesResponse, &pkt))
        return false;

    LampAttributes attr = {};

    attr.lamp_id = LittleEndian(pkt.lamp_id);
    attr.x = LittleEndian(pkt.x);
    attr.y = LittleEndian(pkt.y);
    attr.z = LittleEndian(pkt.z);
    attr.update_latency = LittleEndian(pkt.update_latency);
    attr.purposes = LittleEndian(pkt.purposes);
    attr.red_levels = pkt.red_levels;
    attr.green_levels = pkt.green_levels;
    attr.blue_levels = pkt.blue_levels;
    attr.intensity_levels = pkt.intensity_levels;
    attr.programmable = pkt.programmable;
    attr.input_binding = pkt.input_binding;

    *out_attr = attr;
    return true;
}

bool DecodeColorUpdate(Span<const uint8_t> bytes, HeapArray<LampUpdate> *out_updates, bool *out_complete)
{
    if (!bytes.len) {
        LogError("Empty color update report");
        return false;
    }

    switch ((ReportId)bytes[0]) {
        case ReportId::MultiUpdate: {
            MultiUpdateReport pkt;
            if (!ReadReport(bytes, ReportId::MultiUpdate, &pkt))
                return false;

            if (pkt.count > MultiUpdateMaxLamps) {
                LogError("Invalid lamp count %1 in multi update (maximum = %2)", pkt.count, MultiUpdateMaxLamps);
                return false;
            }

            for (Size i = 0; i < pkt.count; i++) {
                LampUpdate update = {};

                update.lamp_id = LittleEndian(pkt.lamp_ids[i]);
                update.color.rgb = { pkt.colors[i][0], pkt.colors[i][1], pkt.colors[i][2] };
                update.color.intensity = pkt.colors[i][3];

                out_updates->Append(update);
            }

            if (out_complete) {
                *out_complete = pkt.flags & LampUpdateComplete;
            }
        } break;

        case ReportId::RangeUpdate: {
            RangeUpdateReport pkt;
            if (!ReadReport(bytes, ReportId::RangeUpdate, &pkt))
                return false;

            uint16_t start = LittleEndian(pkt.start);
            uint16_t end = LittleEndian(pkt.end);

            if (start > end) {
                LogError("Invalid lamp range %1 to %2 in range update", start, end);
                return false;
            }

            for (Size id = start; id <= end; id++) {
                LampUpdate update = {};

                update.lamp_id = (uint16_t)id;
                update.color.rgb = { pkt.red, pkt.green, pkt.blue };
                update.color.intensity = pkt.intensity;

                out_updates->Append(update);
            }

            if (out_complete) {
                *out_complete = pkt.flags & LampUpdateComplete;
            }
        } break;

        default: {
            LogError("Report 0x%1 is not a color update", FmtHex(bytes[0]).Pad0(2));
            return false;
        } break;
    }

    return true;
}

bool IsReleaseReport(Span<const uint8_t> bytes)
{
    return bytes.len == ArrayControlSize && bytes[0] == (uint8_t)ReportId::ArrayControl && bytes[1] == 1;
}

const char *GetReportName(uint8_t id)
{
    switch ((ReportId)id) {
        case ReportId::ArrayAttributes: return "LampArrayAttributes";
        case ReportId::AttributesRequest: return "LampAttributesRequest";
        case ReportId::AttributesResponse: return "LampAttributesResponse";
        case ReportId::MultiUpdate: return "LampMultiUpdate";
        case ReportId::RangeUpdate: return "LampRangeUpdate";
        case ReportId::ArrayControl: return "LampArrayControl";
    }

    return "Unknown";
}

}
