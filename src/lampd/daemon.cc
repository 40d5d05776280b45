// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "daemon.hh"

#include <sys/inotify.h>

namespace LD {

static bool RetryOnce(DeviceLink *link, FunctionRef<bool()> func)
{
    if (func())
        return true;
    if (link->GetLastError() != DeviceError::Io)
        return false;

    LogWarning("Retrying once");
    return func();
}

LightDaemon::LightDaemon(DeviceLink *link, const char *config_filename)
    : link(link), config_filename(config_filename) {}

LightDaemon::~LightDaemon()
{
    if (inotify_fd >= 0) {
        close(inotify_fd);
    }
}

bool LightDaemon::Start(const LightConfig &config)
{
    // From here on, don't quit abruptly: signals are picked up by Run()
    WaitEvents(0);

    if (!link->IsOpen() && !link->Open())
        return false;
    if (!link->Discover(&desc))
        return false;

    this->config = config;
    engine.Reset(config, desc.array.min_update_interval);

    // Make sure it works once, at least
    LampColor color;
    EffectAction action = engine.Tick(GetMonotonicTime(), &color);

    return Execute(action, color);
}

bool LightDaemon::Tick(int64_t now)
{
    if (engine.GetDelay(now))
        return true;

    if (link->IsOpen()) {
        LampColor color;
        EffectAction action = engine.Tick(now, &color);

        if (Execute(action, color))
            return true;
    }

    // The engine starts over from a clean state after this
    return Recover();
}

bool LightDaemon::Reload()
{
    if (!config_filename) {
        LogError("No configuration file to reload");
        return false;
    }

    LogInfo("Reloading configuration from '%1'", config_filename);

    LightConfig new_config;
    if (!LoadConfig(config_filename, &new_config)) {
        LogError("Keeping previous configuration");
        return false;
    }

    Apply(new_config);
    return true;
}

void LightDaemon::Apply(const LightConfig &new_config)
{
    if (new_config.mode != config.mode) {
        LogInfo("Switching to %1 mode", LightModeOptions[(int)new_config.mode].name);
    }

    config = new_config;
    engine.Reset(config, desc.array.min_update_interval);
}

void LightDaemon::Shutdown()
{
    if (!link->IsOpen())
        return;

    LogInfo("Giving lamps back to the firmware");
    link->Close();
}

int LightDaemon::Run()
{
    if (config_filename && !WatchConfig()) {
        LogWarning("Configuration changes will only be picked up on SIGHUP");
    }

    if (!NotifySystemd())
        return 1;

    int status = 0;

    for (;;) {
        if (!Tick(GetMonotonicTime())) {
            status = 1;
            break;
        }

        int64_t delay = engine.GetDelay(GetMonotonicTime());
        if (!delay)
            continue;

        LocalArray<WaitSource, 1> sources;
        if (inotify_fd >= 0) {
            sources.Append({ inotify_fd, -1 });
        }

        uint64_t ready = 0;
        WaitResult ret = WaitEvents(sources, delay, &ready);

        if (ret == WaitResult::Exit) {
            LogInfo("Exit requested");
            break;
        } else if (ret == WaitResult::Interrupt) {
            LogInfo("Process interrupted");
            break;
        }

        bool reload = (ret == WaitResult::Reload);

        if (ret == WaitResult::Ready && (ready & 1)) {
            reload |= HandleConfigEvents();
        }

        if (reload) {
            NotifySystemd("RELOADING=1");
            Reload();
            NotifySystemd("READY=1");
        }
    }

    NotifySystemd("STOPPING=1");
    Shutdown();

    return status;
}

bool LightDaemon::Execute(EffectAction action, const LampColor &color)
{
    switch (action) {
        case EffectAction::None: return true;

        case EffectAction::Update: {
            if (!link->IsAcquired() && !RetryOnce(link, [&]() { return link->Acquire(); }))
                return false;

            return WriteColor(color);
        } break;

        case EffectAction::Release: {
            // Blank the lamps first, or they flash the last color before the firmware takes over
            if (link->IsAcquired() && !WriteColor(color))
                return false;

            return RetryOnce(link, [&]() { return link->Release(); });
        } break;
    }

    LD_UNREACHABLE();
}

bool LightDaemon::WriteColor(const LampColor &color)
{
    // Discovery only accepts ids 0 to N - 1, the multi-update path is for
    // descriptors built some other way
    if (desc.IsContiguous()) {
        ReportFrame frame = EncodeRangeUpdate(0, (uint16_t)(desc.lamp_ids.len - 1), color);
        return RetryOnce(link, [&]() { return link->Write(frame); });
    } else {
        HeapArray<ReportFrame> frames;
        EncodeColorUpdate(desc.lamp_ids, color, &frames);

        for (const ReportFrame &frame: frames) {
            if (!RetryOnce(link, [&]() { return link->Write(frame); }))
                return false;
        }

        return true;
    }
}

bool LightDaemon::Recover()
{
    LogError("Lost device '%1' (%2), trying to reopen it", link->GetPath(), DeviceErrorNames[(int)link->GetLastError()]);

    // Close() tries to release, and copes with a device that is gone
    link->Close();

    int64_t delay = reopen_delay;

    for (int i = 0; i < reopen_attempts; i++) {
        if (delay > 0) {
            WaitDelay(delay);
        }
        delay = std::min(delay * 2, reopen_max_delay);

        LogInfo("Reopening device (attempt %1 of %2)", i + 1, reopen_attempts);

        if (!link->Open())
            continue;

        DeviceDescriptor new_desc;
        if (!link->Discover(&new_desc)) {
            link->Close(false);
            continue;
        }

        if (new_desc.lamp_ids.len != desc.lamp_ids.len ||
                !std::equal(desc.lamp_ids.begin(), desc.lamp_ids.end(), new_desc.lamp_ids.begin())) {
            LogError("Device came back with a different lamp layout (%1 lamps instead of %2)",
                     new_desc.lamp_ids.len, desc.lamp_ids.len);
            Abandon();
            return false;
        }

        engine.Reset(config, desc.array.min_update_interval);

        LogInfo("Device '%1' is back", link->GetPath());
        return true;
    }

    LogError("Giving up on the device after %1 attempts", reopen_attempts);
    Abandon();

    return false;
}

void LightDaemon::Abandon()
{
    // Last chance for the firmware to get the lamps back, if the device is still there
    if (!link->IsOpen() && !link->Open())
        return;

    if (!link->Release()) {
        LogWarning("Failed to give lamp control back to the firmware");
    }
    link->Close(false);
}

bool LightDaemon::WatchConfig()
{
    LD_ASSERT(inotify_fd < 0);

    char directory[4096];
    Fmt(directory, "%1", GetPathDirectory(config_filename));

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        LogError("Failed to initialize inotify: %1", strerror(errno));
        return false;
    }
    LD_DEFER_N(fd_guard) { close(fd); };

    // Watch the directory, editors often replace the file instead of writing it
    if (inotify_add_watch(fd, directory, IN_CLOSE_WRITE | IN_MOVED_TO) < 0) {
        LogError("Cannot watch '%1' for changes: %2", directory, strerror(errno));
        return false;
    }

    LogDebug("Watching '%1' for configuration changes", directory);

    fd_guard.Disable();
    inotify_fd = fd;

    return true;
}

bool LightDaemon::HandleConfigEvents()
{
    Span<const char> basename = GetPathBaseName(config_filename);
    bool changed = false;

    for (;;) {
        alignas(struct inotify_event) char buf[4096];
        ssize_t len = LD_RESTART_EINTR(read(inotify_fd, buf, LD_SIZE(buf)), < 0);

        if (len < 0) {
            if (errno == EAGAIN)
                break;

            LogError("Failed to read inotify events: %1", strerror(errno));
            break;
        }
        if (!len)
            break;

        for (Size offset = 0; offset < len;) {
            const struct inotify_event *ev = (const struct inotify_event *)(buf + offset);

            if (ev->len && TestStr(basename, ev->name)) {
                changed = true;
            }

            offset += LD_SIZE(struct inotify_event) + ev->len;
        }
    }

    if (changed) {
        LogDebug("Configuration file '%1' has changed", config_filename);
    }

    return changed;
}

}
