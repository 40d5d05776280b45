// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "config.hh"
#include "report.hh"

namespace LD {

static const int BreatheStep = 5;
static const int MinTickPeriod = 10;

enum class EffectAction {
    None,
    Update, // Write color to every lamp
    Release // Blank the lamps, then give control back to the firmware
};

class EffectEngine {
    LightConfig config;
    int64_t period = 0;

    int envelope = 0;
    int direction = 1;
    bool emitted = false;

    LampColor last_color = {};
    int64_t last_tick = -1;

public:
    // Clears the phase, the next tick starts the new mode from scratch. The minimal
    // update interval comes from the controller (in microseconds).
    void Reset(const LightConfig &config, int64_t min_interval_us = 0);

    EffectAction Tick(int64_t now, LampColor *out_color);

    // Milliseconds until the next tick is due, 0 if it is due now, -1 if nothing
    // will happen until the next reset
    int64_t GetDelay(int64_t now) const;

    LightMode GetMode() const { return config.mode; }
    int64_t GetPeriod() const { return period; }
    int GetEnvelope() const { return envelope; }
    const LampColor &GetLastColor() const { return last_color; }
};

LampColor ScaleColor(const RgbColor &color, int intensity);

}
