// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "config.hh"
#include "daemon.hh"
#include "device.hh"

#include <libhs.h>

extern "C" const char *AppTarget = "lampd";
extern "C" const char *AppVersion = LAMPD_VERSION;

namespace LD {

static void HarmonizeHidLogs()
{
    hs_log_set_handler([](hs_log_level level, int, const char *msg, void *) {
        switch (level) {
            case HS_LOG_ERROR:
            case HS_LOG_WARNING: { LogError("%1", msg); } break;
            case HS_LOG_DEBUG: { LogDebug("%1", msg); } break;
        }
    }, nullptr);
}

static bool LoadStartupConfig(const char *filename, LightConfig *out_config)
{
    if (!TestFile(filename)) {
        LogInfo("Config file '%1' does not exist, using defaults", filename);
        *out_config = {};

        return true;
    }

    return LoadConfig(filename, out_config);
}

static void PrintConfig(const LightConfig &config)
{
    PrintLn("Mode: %!..+%1%!0", LightModeOptions[(int)config.mode].name);
    PrintLn("Color: %!..+#%1%2%3%!0", FmtHex(config.color.red).Pad0(2),
                                      FmtHex(config.color.green).Pad0(2),
                                      FmtHex(config.color.blue).Pad0(2));
    PrintLn("Intensity: %!..+%1%!0", config.intensity);
    PrintLn("Breathe step: %!..+%1 ms%!0", config.breathe_step_ms);
}

static int RunDaemon(Span<const char *> arguments)
{
    const char *config_filename = DefaultConfigFile;
    const char *device_path = nullptr;

    const auto print_usage = [=](FILE *fp) {
        PrintLn(fp,
R"(Usage: %!..+%1 daemon [option...]%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2)%!0
    %!..+-D, --device path%!0              Use specific HID device node
                                   %!D..(default: first %3:%4 device)%!0

Send SIGHUP or edit the configuration file to reload it.)",
                AppTarget, config_filename, FmtHex(LampVendorId).Pad0(4), FmtHex(LampProductId).Pad0(4));
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else if (opt.Test("-D", "--device", OptionType::Value)) {
                device_path = opt.current_value;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        opt.LogUnusedArguments();
    }

    LightConfig config;
    if (!LoadStartupConfig(config_filename, &config))
        return 1;

    HarmonizeHidLogs();

    DeviceLink link(device_path);
    LightDaemon daemon(&link, config_filename);

    if (!daemon.Start(config))
        return 1;
    LD_DEFER { daemon.Shutdown(); };

    LogInfo("Running in %1 mode", LightModeOptions[(int)config.mode].name);

    return daemon.Run();
}

static int RunInfo(Span<const char *> arguments)
{
    const char *device_path = nullptr;

    const auto print_usage = [=](FILE *fp) {
        PrintLn(fp,
R"(Usage: %!..+%1 info [option...]%!0

Options:

    %!..+-D, --device path%!0              Use specific HID device node
                                   %!D..(default: first %2:%3 device)%!0)",
                AppTarget, FmtHex(LampVendorId).Pad0(4), FmtHex(LampProductId).Pad0(4));
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else if (opt.Test("-D", "--device", OptionType::Value)) {
                device_path = opt.current_value;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        opt.LogUnusedArguments();
    }

    HarmonizeHidLogs();

    DeviceLink link(device_path);
    if (!link.Open())
        return 1;

    DeviceDescriptor desc;
    bool success = link.Discover(&desc);

    // Leave the lamps in firmware hands, whatever happened
    if (!link.Release()) {
        LogWarning("Failed to give lamp control back to the firmware");
    }
    if (!success)
        return 1;

    const ArrayAttributes &array = desc.array;

    PrintLn("Device: %!..+%1%!0", desc.path);
    PrintLn("Lamps: %!..+%1%!0", array.lamp_count);
    PrintLn("Bounding box: %!..+%1 x %2 x %3 µm%!0", array.width, array.height, array.depth);
    PrintLn("Kind: %!..+%1%!0", array.kind);
    PrintLn("Minimal update interval: %!..+%1 µs%!0", array.min_update_interval);
    PrintLn("Contiguous ids: %!..+%1%!0", desc.IsContiguous());
    PrintLn();

    PrintLn("  %!D..%1  %2  %3  %4  %5  %6%!0", FmtArg("Id").Pad(5), FmtArg("Position").Pad(26), FmtArg("Purposes").Pad(10),
                                                 FmtArg("Levels").Pad(15), FmtArg("Latency").Pad(8), "Programmable");
    for (const LampAttributes &lamp: desc.lamps) {
        char position[64];
        char levels[64];

        Fmt(position, "%1, %2, %3", lamp.x, lamp.y, lamp.z);
        Fmt(levels, "%1/%2/%3/%4", lamp.red_levels, lamp.green_levels, lamp.blue_levels, lamp.intensity_levels);

        PrintLn("  %1  %2  0x%3  %4  %5  %6", FmtArg(lamp.lamp_id).Pad(5), FmtArg(position).Pad(26),
                FmtHex(lamp.purposes).Pad0(8), FmtArg(levels).Pad(15), FmtArg(lamp.update_latency).Pad(8),
                lamp.programmable);
    }

    return 0;
}

static int RunCheck(Span<const char *> arguments)
{
    const char *config_filename = DefaultConfigFile;

    const auto print_usage = [=](FILE *fp) {
        PrintLn(fp,
R"(Usage: %!..+%1 check [option...]%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2)%!0)",
                AppTarget, config_filename);
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        opt.LogUnusedArguments();
    }

    LightConfig config;
    if (!LoadStartupConfig(config_filename, &config))
        return 1;

    PrintConfig(config);
    return 0;
}

int Main(int argc, char **argv)
{
    const auto print_usage = [](FILE *fp) {
        PrintLn(fp,
R"(Usage: %!..+%1 command [arg...]%!0

Commands:

    %!..+daemon%!0                         Drive the lamps according to the configuration
    %!..+info%!0                           Print controller and lamp attributes
    %!..+check%!0                          Validate configuration file

Use %!..+%1 help command%!0 or %!..+%1 command --help%!0 for more specific help.)", AppTarget);
    };

    if (argc < 2) {
        print_usage(stderr);
        PrintLn(stderr);
        LogError("No command provided");
        return 1;
    }

    const char *cmd = argv[1];
    Span<const char *> arguments((const char **)argv + 2, argc - 2);

    // Handle help and version arguments
    if (TestStr(cmd, "--help") || TestStr(cmd, "help")) {
        if (arguments.len && arguments[0][0] != '-') {
            cmd = arguments[0];
            arguments[0] = "--help";
        } else {
            print_usage(stdout);
            return 0;
        }
    } else if (TestStr(cmd, "--version")) {
        PrintLn("%!R..%1%!0 %!..+%2%!0", AppTarget, AppVersion);
        return 0;
    }

    if (TestStr(cmd, "daemon")) {
        return RunDaemon(arguments);
    } else if (TestStr(cmd, "info")) {
        return RunInfo(arguments);
    } else if (TestStr(cmd, "check")) {
        return RunCheck(arguments);
    } else {
        LogError("Unknown command '%1'", cmd);
        return 1;
    }
}

}

// C++ namespaces are stupid
int main(int argc, char **argv) { return LD::RunApp(argc, argv); }
