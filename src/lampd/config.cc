// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/wrap/json.hh"
#include "config.hh"

namespace LD {

static const Size MaxConfigSize = 64 * 1024;

bool CheckLightConfig(const LightConfig &config)
{
    bool valid = true;

    if (config.intensity < 0 || config.intensity > 255) {
        LogError("Intensity must be between 0 and 255");
        valid = false;
    }
    if (config.breathe_step_ms <= 0) {
        LogError("Breathe step must be a positive number of milliseconds");
        valid = false;
    }

    return valid;
}

static bool ParseChannel(json_Parser *parser, const char *name, uint8_t *out_value)
{
    int value = 0;
    if (!parser->ParseInt(&value))
        return false;

    if (value < 0 || value > 255) {
        LogError("Color channel %1 must be between 0 and 255 (got %2)", name, value);
        return false;
    }

    *out_value = (uint8_t)value;
    return true;
}

static bool ParseColorValue(json_Parser *parser, RgbColor *out_color)
{
    switch (parser->PeekToken()) {
        case json_TokenType::String: {
            Span<const char> str = parser->ParseString();
            return ParseColor(str, out_color);
        } break;

        case json_TokenType::StartArray: {
            static const char *const ChannelNames[] = { "red", "green", "blue" };
            uint8_t *channels[] = { &out_color->red, &out_color->green, &out_color->blue };

            Size count = 0;
            bool valid = true;

            parser->ParseArray();
            while (parser->InArray()) {
                if (count >= 3) {
                    parser->Skip();
                    count++;

                    continue;
                }

                valid &= ParseChannel(parser, ChannelNames[count], channels[count]);
                count++;
            }

            if (count != 3 && parser->IsValid()) {
                LogError("Color must have exactly 3 components (got %1)", count);
                valid = false;
            }

            return valid && parser->IsValid();
        } break;

        case json_TokenType::Invalid: return false;

        default: {
            LogError("Color must be an [R, G, B] array or a '#RRGGBB' string");
            parser->Skip();
            return false;
        } break;
    }
}

bool LoadConfig(Span<const char> buf, const char *filename, LightConfig *out_config)
{
    LightConfig config;

    json_Parser parser(buf, filename);
    parser.PushLogFilter();
    LD_DEFER { PopLogFilter(); };

    bool valid = true;
    {
        parser.ParseObject();
        while (parser.InObject()) {
            Span<const char> key = {};
            parser.ParseKey(&key);

            if (key == "mode") {
                Span<const char> str = {};

                if (parser.ParseString(&str) && !OptionToEnumI(LightModeOptions, str, &config.mode)) {
                    LogError("Unknown light mode '%1'", str);
                    valid = false;
                }
            } else if (key == "color") {
                valid &= ParseColorValue(&parser, &config.color);
            } else if (key == "intensity") {
                valid &= parser.ParseInt(&config.intensity);
            } else if (key == "breathe_step_ms") {
                valid &= parser.ParseInt(&config.breathe_step_ms);
            } else if (parser.IsValid()) {
                parser.UnexpectedKey(key);
                valid = false;
            }
        }

        valid &= parser.ParseEnd();
    }
    if (!parser.IsValid() || !valid)
        return false;

    if (!CheckLightConfig(config))
        return false;

    std::swap(*out_config, config);
    return true;
}

bool LoadConfig(const char *filename, LightConfig *out_config)
{
    HeapArray<char> buf;
    if (ReadFile(filename, MaxConfigSize, &buf) < 0)
        return false;

    return LoadConfig(buf, filename, out_config);
}

static inline int ParseHexadecimalChar(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else {
        return -1;
    }
}

bool ParseColor(Span<const char> str, RgbColor *out_color)
{
    Span<const char> remain = TrimStr(str);

    if (!remain.len || remain[0] != '#') {
        LogError("Malformed color '%1' (expected '#RRGGBB')", str);
        return false;
    }
    remain = remain.Take(1, remain.len - 1);

    if (remain.len != 6 || !std::all_of(remain.begin(), remain.end(), [](char c) { return ParseHexadecimalChar(c) >= 0; })) {
        LogError("Malformed hexadecimal color '%1'", str);
        return false;
    }

    out_color->red = (uint8_t)((ParseHexadecimalChar(remain[0]) << 4) | ParseHexadecimalChar(remain[1]));
    out_color->green = (uint8_t)((ParseHexadecimalChar(remain[2]) << 4) | ParseHexadecimalChar(remain[3]));
    out_color->blue = (uint8_t)((ParseHexadecimalChar(remain[4]) << 4) | ParseHexadecimalChar(remain[5]));

    return true;
}

}
