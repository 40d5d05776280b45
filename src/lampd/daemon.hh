// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "config.hh"
#include "device.hh"
#include "effect.hh"

namespace LD {

class LightDaemon {
    LD_DELETE_COPY(LightDaemon)

    DeviceLink *link;
    const char *config_filename;

    DeviceDescriptor desc;
    LightConfig config;
    EffectEngine engine;

    int inotify_fd = -1;

public:
    int reopen_attempts = 5;
    int64_t reopen_delay = 250;
    int64_t reopen_max_delay = 4000;

    // Config reloads are disabled when config_filename is null
    LightDaemon(DeviceLink *link, const char *config_filename);
    ~LightDaemon();

    // Opens the device if needed, discovers the lamps and applies the first frame.
    // SIGINT, SIGTERM and SIGHUP no longer kill the process once this is called.
    bool Start(const LightConfig &config);

    // Runs the effect if a tick is due, and recovers from device loss.
    // Returns false when the device is gone for good.
    bool Tick(int64_t now);

    // Keeps the running effect if the new file is not valid
    bool Reload();
    void Apply(const LightConfig &config);

    // Gives control back to the firmware and closes the device
    void Shutdown();

    // Main loop, returns the exit code
    int Run();

    const LightConfig &GetConfig() const { return config; }
    const DeviceDescriptor &GetDescriptor() const { return desc; }
    const EffectEngine &GetEngine() const { return engine; }

private:
    bool Execute(EffectAction action, const LampColor &color);
    bool WriteColor(const LampColor &color);

    bool Recover();
    void Abandon();

    bool WatchConfig();
    bool HandleConfigEvents();
};

}
