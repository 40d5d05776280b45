// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "effect.hh"

namespace LD {

static inline uint8_t ScaleChannel(int value, int intensity)
{
    int scaled = value * intensity / 255;
    return (uint8_t)std::clamp(scaled, 0, 255);
}

LampColor ScaleColor(const RgbColor &color, int intensity)
{
    intensity = std::clamp(intensity, 0, 255);

    LampColor scaled = {};

    scaled.rgb.red = ScaleChannel(color.red, intensity);
    scaled.rgb.green = ScaleChannel(color.green, intensity);
    scaled.rgb.blue = ScaleChannel(color.blue, intensity);
    scaled.intensity = (uint8_t)intensity;

    return scaled;
}

void EffectEngine::Reset(const LightConfig &config, int64_t min_interval_us)
{
    this->config = config;

    if (config.mode == LightMode::Breathe) {
        int64_t floor = std::max((int64_t)MinTickPeriod, (min_interval_us + 999) / 1000);

        if (config.breathe_step_ms < floor) {
            LogWarning("Breathe step raised from %1 ms to %2 ms", config.breathe_step_ms, floor);
        }
        period = std::max((int64_t)config.breathe_step_ms, floor);
    } else {
        period = 0;
    }

    envelope = 0;
    direction = 1;
    emitted = false;
    last_tick = -1;
}

EffectAction EffectEngine::Tick(int64_t now, LampColor *out_color)
{
    switch (config.mode) {
        case LightMode::Static: {
            if (emitted)
                return EffectAction::None;

            last_color = ScaleColor(config.color, config.intensity);
            emitted = true;
        } break;

        case LightMode::Breathe: {
            int effective = envelope * config.intensity / 255;
            last_color = ScaleColor(config.color, effective);

            envelope += direction * BreatheStep;
            if (envelope >= 255) {
                envelope = 255;
                direction = -1;
            } else if (envelope <= 0) {
                envelope = 0;
                direction = 1;
            }
        } break;

        case LightMode::Off: {
            if (emitted)
                return EffectAction::None;

            last_color = {};
            emitted = true;

            last_tick = now;
            *out_color = last_color;

            return EffectAction::Release;
        } break;
    }

    last_tick = now;
    *out_color = last_color;

    return EffectAction::Update;
}

int64_t EffectEngine::GetDelay(int64_t now) const
{
    switch (config.mode) {
        case LightMode::Static:
        case LightMode::Off: return emitted ? -1 : 0;

        case LightMode::Breathe: {
            if (last_tick < 0)
                return 0;

            int64_t delay = last_tick + period - now;
            return std::max(delay, (int64_t)0);
        } break;
    }

    LD_UNREACHABLE();
}

}
