// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "report.hh"

namespace LD {

static const char *const DefaultConfigFile = "/etc/lampd/config.json";

enum class LightMode {
    Static,
    Breathe,
    Off
};
static const OptionDesc LightModeOptions[] = {
    { "static",  "Fixed color, written once" },
    { "breathe", "Color fades in and out" },
    { "off",     "Lamps go back under firmware control" }
};

struct LightConfig {
    LightMode mode = LightMode::Static;
    RgbColor color = { 255, 0, 0 };
    int intensity = 255;
    int breathe_step_ms = 20;

    bool operator==(const LightConfig &other) const
    {
        return mode == other.mode && color == other.color &&
               intensity == other.intensity && breathe_step_ms == other.breathe_step_ms;
    }
    bool operator!=(const LightConfig &other) const { return !(*this == other); }
};

bool CheckLightConfig(const LightConfig &config);

// On failure, out_config is left untouched
bool LoadConfig(Span<const char> buf, const char *filename, LightConfig *out_config);
bool LoadConfig(const char *filename, LightConfig *out_config);

bool ParseColor(Span<const char> str, RgbColor *out_color);

}
