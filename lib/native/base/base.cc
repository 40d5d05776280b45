// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "base.hh"

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <stddef.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>

namespace LD {

// ------------------------------------------------------------------------
// Assert
// ------------------------------------------------------------------------

extern "C" void AssertMessage(const char *filename, int line, const char *cond)
{
    PrintLn(stderr, "%1:%2: Assertion '%3' failed", filename, line, cond);
}

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

Span<const char> SplitStrReverseAny(Span<const char> str, const char *split_chars,
                                    Span<const char> *out_remainder)
{
    Size remainder_len = str.len - 1;
    while (remainder_len >= 0 && !strchr(split_chars, str[remainder_len])) {
        remainder_len--;
    }

    if (out_remainder) {
        *out_remainder = str.Take(0, std::max(remainder_len, (Size)0));
    }
    return str.Take(remainder_len + 1, str.len - remainder_len - 1);
}

bool CopyString(const char *str, Span<char> buf)
{
    return CopyString(Span<const char>(str), buf);
}

bool CopyString(Span<const char> str, Span<char> buf)
{
    if (!buf.len) [[unlikely]]
        return false;

    Size copy_len = std::min(str.len, buf.len - 1);

    MemCpy(buf.ptr, str.ptr, copy_len);
    buf.ptr[copy_len] = 0;

    return copy_len == str.len;
}

// ------------------------------------------------------------------------
// Clock
// ------------------------------------------------------------------------

int64_t GetMonotonicTime()
{
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) < 0) {
        LD_CRITICAL(false, "clock_gettime(CLOCK_MONOTONIC) failed: %1", strerror(errno));
    }

    return (int64_t)ts.tv_sec * 1000 + (int64_t)ts.tv_nsec / 1000000;
}

static const int64_t start_clock = GetMonotonicTime();

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

static const char DigitPairs[201] = "00010203040506070809101112131415161718192021222324"
                                    "25262728293031323334353637383940414243444546474849"
                                    "50515253545556575859606162636465666768697071727374"
                                    "75767778798081828384858687888990919293949596979899";
static const char BigHexLiterals[] = "0123456789ABCDEF";
static const char SmallHexLiterals[] = "0123456789abcdef";

static Span<char> FormatUnsignedToDecimal(uint64_t value, char out_buf[32])
{
    Size offset = 32;
    {
        int pair_idx;
        do {
            pair_idx = (int)((value % 100) * 2);
            value /= 100;
            offset -= 2;
            MemCpy(out_buf + offset, DigitPairs + pair_idx, 2);
        } while (value);
        offset += (pair_idx < 20);
    }

    return MakeSpan(out_buf + offset, 32 - offset);
}

static Span<char> FormatUnsignedToHex(uint64_t value, const char *literals, char out_buf[32])
{
    Size offset = 32;
    do {
        uint64_t digit = value & 0xF;
        value >>= 4;

        out_buf[--offset] = literals[digit];
    } while (value);

    return MakeSpan(out_buf + offset, 32 - offset);
}

template <typename AppendFunc>
static inline void AppendPad(Size pad, char padding, AppendFunc append)
{
    for (Size i = 0; i < pad; i++) {
        append(padding);
    }
}

template <typename AppendFunc>
static inline void ProcessArg(const FmtArg &arg, AppendFunc append)
{
    switch (arg.type) {
        case FmtType::Str: {
            append(arg.u.str);
            AppendPad((Size)arg.pad - arg.u.str.len, arg.padding, append);
        } break;

        case FmtType::Char: { append(MakeSpan(&arg.u.ch, 1)); } break;
        case FmtType::Bool: { append(arg.u.b ? "true" : "false"); } break;

        case FmtType::Integer: {
            char buf[32];

            if (arg.u.i < 0) {
                Span<const char> str = FormatUnsignedToDecimal((uint64_t)-arg.u.i, buf);

                if (arg.padding == '0') {
                    append('-');
                    AppendPad((Size)arg.pad - str.len - 1, arg.padding, append);
                } else {
                    AppendPad((Size)arg.pad - str.len - 1, arg.padding, append);
                    append('-');
                }

                append(str);
            } else {
                Span<const char> str = FormatUnsignedToDecimal((uint64_t)arg.u.i, buf);

                AppendPad((Size)arg.pad - str.len, arg.padding, append);
                append(str);
            }
        } break;
        case FmtType::Unsigned: {
            char buf[32];
            Span<const char> str = FormatUnsignedToDecimal(arg.u.u, buf);

            AppendPad((Size)arg.pad - str.len, arg.padding, append);
            append(str);
        } break;

        case FmtType::Double: {
            // Nothing in here needs shortest round-trip formatting
            char buf[128];
            int len = snprintf(buf, LD_SIZE(buf), "%g", arg.u.d);

            append(MakeSpan(buf, std::min(len, (int)LD_SIZE(buf) - 1)));
        } break;

        case FmtType::BigHex:
        case FmtType::SmallHex: {
            const char *literals = (arg.type == FmtType::BigHex) ? BigHexLiterals : SmallHexLiterals;

            char buf[32];
            Span<const char> str = FormatUnsignedToHex(arg.u.u, literals, buf);

            AppendPad((Size)arg.pad - str.len, arg.padding, append);
            append(str);
        } break;
    }
}

template <typename AppendFunc>
static inline Size ProcessAnsiSpecifier(const char *spec, bool vt100, AppendFunc append)
{
    Size idx = 0;

    LocalArray<char, 32> buf;
    bool valid = true;

    buf.Append("\x1B[");

    // Foreground color
    switch (spec[++idx]) {
        case 'd': { buf.Append("30"); } break;
        case 'r': { buf.Append("31"); } break;
        case 'g': { buf.Append("32"); } break;
        case 'y': { buf.Append("33"); } break;
        case 'b': { buf.Append("34"); } break;
        case 'm': { buf.Append("35"); } break;
        case 'c': { buf.Append("36"); } break;
        case 'w': { buf.Append("37"); } break;
        case 'D': { buf.Append("90"); } break;
        case 'R': { buf.Append("91"); } break;
        case 'G': { buf.Append("92"); } break;
        case 'Y': { buf.Append("93"); } break;
        case 'B': { buf.Append("94"); } break;
        case 'M': { buf.Append("95"); } break;
        case 'C': { buf.Append("96"); } break;
        case 'W': { buf.Append("97"); } break;
        case '.': { buf.Append("39"); } break;
        case '0': {
            buf.Append("0");
            goto end;
        } break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

    // Background color, only the default one is used around here
    switch (spec[++idx]) {
        case '.': { buf.Append(";49"); } break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

    // Bold/dim/underline/invert
    switch (spec[++idx]) {
        case '+': { buf.Append(";1"); } break;
        case '-': { buf.Append(";2"); } break;
        case '_': { buf.Append(";4"); } break;
        case '^': { buf.Append(";7"); } break;
        case '.': {} break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

end:
    if (!valid)
        return idx;

    if (vt100) {
        buf.Append("m");
        append(buf);
    }

    return idx;
}

template <typename AppendFunc>
static inline void DoFormat(const char *fmt, Span<const FmtArg> args, bool vt100, AppendFunc append)
{
#if defined(LD_DEBUG)
    bool invalid_marker = false;
    uint32_t unused_arguments = ((uint32_t)1 << args.len) - 1;
#endif

    const char *fmt_ptr = fmt;
    for (;;) {
        // Find the next marker (or the end of string) and write everything before it
        const char *marker_ptr = fmt_ptr;
        while (marker_ptr[0] && marker_ptr[0] != '%') {
            marker_ptr++;
        }
        append(MakeSpan(fmt_ptr, (Size)(marker_ptr - fmt_ptr)));
        if (!marker_ptr[0])
            break;

        // Try to interpret this marker as a number
        Size idx = 0;
        Size idx_end = 1;
        for (;;) {
            // Unsigned cast makes the test below quicker, don't remove it or it'll break
            unsigned int digit = (unsigned int)marker_ptr[idx_end] - '0';
            if (digit > 9)
                break;
            idx = (Size)(idx * 10) + (Size)digit;
            idx_end++;
        }

        // That was indeed a number
        if (idx_end > 1) {
            idx--;
            if (idx < args.len) {
                ProcessArg<AppendFunc>(args[idx], append);
#if defined(LD_DEBUG)
                unused_arguments &= ~((uint32_t)1 << idx);
            } else {
                invalid_marker = true;
#endif
            }
            fmt_ptr = marker_ptr + idx_end;
        } else if (marker_ptr[1] == '%') {
            append('%');
            fmt_ptr = marker_ptr + 2;
        } else if (marker_ptr[1] == '/') {
            append(*LD_PATH_SEPARATORS);
            fmt_ptr = marker_ptr + 2;
        } else if (marker_ptr[1] == '!') {
            fmt_ptr = marker_ptr + 2 + ProcessAnsiSpecifier(marker_ptr + 1, vt100, append);
        } else if (marker_ptr[1]) {
            append(marker_ptr[0]);
            fmt_ptr = marker_ptr + 1;
#if defined(LD_DEBUG)
            invalid_marker = true;
#endif
        } else {
#if defined(LD_DEBUG)
            invalid_marker = true;
#endif
            break;
        }
    }

#if defined(LD_DEBUG)
    if (invalid_marker && unused_arguments) {
        PrintLn(stderr, "\nLog format string '%1' has invalid markers and unused arguments", fmt);
    } else if (unused_arguments) {
        PrintLn(stderr, "\nLog format string '%1' has unused arguments", fmt);
    } else if (invalid_marker) {
        PrintLn(stderr, "\nLog format string '%1' has invalid markers", fmt);
    }
#endif
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf)
{
    LD_ASSERT(out_buf.len >= 0);

    if (!out_buf.len)
        return {};
    out_buf.len--;

    Size available_len = out_buf.len;

    DoFormat(fmt, args, vt100, [&](Span<const char> frag) {
        Size copy_len = std::min(frag.len, available_len);

        MemCpy(out_buf.end() - available_len, frag.ptr, copy_len);
        available_len -= copy_len;
    });

    out_buf.len -= available_len;
    out_buf.ptr[out_buf.len] = 0;

    return out_buf;
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf)
{
    Size start_len = out_buf->len;

    out_buf->Grow(LD_FMT_STRING_BASE_CAPACITY);
    DoFormat(fmt, args, vt100, [&](Span<const char> frag) {
        out_buf->Grow(frag.len + 1);
        MemCpy(out_buf->end(), frag.ptr, frag.len);
        out_buf->len += frag.len;
    });
    out_buf->ptr[out_buf->len] = 0;

    return out_buf->Take(start_len, out_buf->len - start_len);
}

void FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, FunctionRef<void(Span<const char>)> append)
{
    // This one dos not null terminate! Be careful!
    DoFormat(fmt, args, vt100, append);
}

void PrintFmt(const char *fmt, Span<const FmtArg> args, FILE *fp)
{
    LocalArray<char, LD_FMT_STRING_PRINT_BUFFER_SIZE> buf;
    DoFormat(fmt, args, FileIsVt100(fp), [&](Span<const char> frag) {
        if (frag.len > LD_LEN(buf.data) - buf.len) {
            fwrite(buf.data, 1, (size_t)buf.len, fp);
            buf.len = 0;
        }
        if (frag.len >= LD_LEN(buf.data)) {
            fwrite(frag.ptr, 1, (size_t)frag.len, fp);
        } else {
            MemCpy(buf.data + buf.len, frag.ptr, frag.len);
            buf.len += frag.len;
        }
    });
    fwrite(buf.data, 1, (size_t)buf.len, fp);
}

void PrintLnFmt(const char *fmt, Span<const FmtArg> args, FILE *fp)
{
    PrintFmt(fmt, args, fp);
    fputc('\n', fp);
}

// PrintLn variants without format strings
void PrintLn(FILE *fp)
{
    fputc('\n', fp);
}
void PrintLn()
{
    fputc('\n', stdout);
}

bool FileIsVt100(FILE *fp)
{
    static thread_local FILE *cache_fp = nullptr;
    static thread_local bool cache_vt100;

    if (fp != cache_fp) {
        const char *term = getenv("TERM");

        cache_fp = fp;
        cache_vt100 = !getenv("NO_COLOR") && isatty(fileno(fp)) && !(term && TestStr(term, "dumb"));
    }

    return cache_vt100;
}

// ------------------------------------------------------------------------
// Debug and errors
// ------------------------------------------------------------------------

static std::function<LogFunc> log_handler = DefaultLogHandler;
static bool log_vt100 = FileIsVt100(stderr);

// NOTE: LocalArray does not work with std::function because it is not trivially copyable
static std::function<LogFilterFunc> *log_filters[16];
static Size log_filters_len;

const char *GetEnv(const char *name)
{
    return getenv(name);
}

bool GetDebugFlag(const char *name)
{
    const char *debug = GetEnv(name);

    if (debug) {
        bool ret = false;
        if (!ParseBool(debug, &ret, LD_DEFAULT_PARSE_FLAGS & ~(int)ParseFlag::Log)) {
            LogError("Environment variable '%1' is not a boolean", name);
        }
        return ret;
    } else {
        return false;
    }
}

static void RunLogFilter(Size idx, LogLevel level, const char *ctx, const char *msg)
{
    const std::function<LogFilterFunc> &func = *log_filters[idx];

    func(level, ctx, msg, [&](LogLevel level, const char *ctx, const char *msg) {
        if (idx > 0) {
            RunLogFilter(idx - 1, level, ctx, msg);
        } else {
            log_handler(level, ctx, msg);
        }
    });
}

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args)
{
    static thread_local bool skip = false;

    static bool init = false;
    static bool log_debug;
    static bool log_times;

    // Avoid deadlock if a log filter or the handler tries to log something while handling a previous call
    if (skip)
        return;
    skip = true;
    LD_DEFER { skip = false; };

    if (!init) {
        // Do this first... GetDebugFlag() might log an error or something, in which
        // case we don't want to recurse forever and crash!
        init = true;

        log_debug = GetDebugFlag("LAMPD_DEBUG");
        log_times = GetDebugFlag("LOG_TIMES");
    }

    if (level == LogLevel::Debug && !log_debug)
        return;

    char ctx_buf[512];
    if (log_times) {
        double time = (double)(GetMonotonicTime() - start_clock) / 1000;
        Fmt(ctx_buf, "[%1] %2", time, ctx ? ctx : "");

        ctx = ctx_buf;
    }

    char msg_buf[2048];
    {
        Size len = FmtFmt(fmt, args, log_vt100, msg_buf).len;

        if (len == LD_SIZE(msg_buf) - 1) {
            strncpy(msg_buf + LD_SIZE(msg_buf) - 32, "... [truncated]", 32);
            msg_buf[LD_SIZE(msg_buf) - 1] = 0;
        }
    }

    if (log_filters_len) {
        RunLogFilter(log_filters_len - 1, level, ctx, msg_buf);
    } else {
        log_handler(level, ctx, msg_buf);
    }
}

void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg)
{
    switch (level)  {
        case LogLevel::Debug:
        case LogLevel::Info: { Print(stderr, "%!D..%1%!0%2\n", ctx ? ctx : "", msg); } break;
        case LogLevel::Warning: { Print(stderr, "%!M..%1%!0%2\n", ctx ? ctx : "", msg); } break;
        case LogLevel::Error: { Print(stderr, "%!R..%1%!0%2\n", ctx ? ctx : "", msg); } break;
    }

    fflush(stderr);
}

void PushLogFilter(const std::function<LogFilterFunc> &func)
{
    LD_ASSERT(log_filters_len < LD_LEN(log_filters));
    log_filters[log_filters_len++] = new std::function<LogFilterFunc>(func);
}

void PopLogFilter()
{
    LD_ASSERT(log_filters_len > 0);
    delete log_filters[--log_filters_len];
}

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

bool TestFile(const char *filename)
{
    struct stat sb;
    return !stat(filename, &sb);
}

bool TestFile(const char *filename, FileType type)
{
    struct stat sb;
    if (stat(filename, &sb) < 0)
        return false;

    FileType file_type;
    if (S_ISDIR(sb.st_mode)) {
        file_type = FileType::Directory;
    } else if (S_ISREG(sb.st_mode)) {
        file_type = FileType::File;
    } else if (S_ISLNK(sb.st_mode)) {
        file_type = FileType::Link;
    } else if (S_ISBLK(sb.st_mode) || S_ISCHR(sb.st_mode)) {
        file_type = FileType::Device;
    } else if (S_ISFIFO(sb.st_mode)) {
        file_type = FileType::Pipe;
    } else if (S_ISSOCK(sb.st_mode)) {
        file_type = FileType::Socket;
    } else {
        return false;
    }

    if (file_type != type) {
        LogError("Path '%1' is not a %2", filename, type == FileType::Directory ? "directory" : "file");
        return false;
    }

    return true;
}

Span<const char> GetPathDirectory(Span<const char> filename)
{
    Span<const char> directory;
    SplitStrReverseAny(filename, LD_PATH_SEPARATORS, &directory);

    return directory.len ? directory : ".";
}

Span<const char> GetPathBaseName(Span<const char> filename)
{
    Span<const char> name = SplitStrReverseAny(filename, LD_PATH_SEPARATORS);
    return name;
}

Size ReadFile(const char *filename, Size max_len, HeapArray<char> *out_buf)
{
    int fd = LD_RESTART_EINTR(open(filename, O_RDONLY | O_CLOEXEC), < 0);
    if (fd < 0) {
        LogError("Cannot open '%1': %2", filename, strerror(errno));
        return -1;
    }
    LD_DEFER { close(fd); };

    Size start_len = out_buf->len;
    LD_DEFER_N(buf_guard) { out_buf->RemoveFrom(start_len); };

    for (;;) {
        out_buf->Grow(4096);

        Size avail = std::min(out_buf->capacity - out_buf->len, max_len + 1 - (out_buf->len - start_len));
        ssize_t ret = LD_RESTART_EINTR(read(fd, out_buf->end(), (size_t)avail), < 0);

        if (ret < 0) {
            LogError("Error while reading file '%1': %2", filename, strerror(errno));
            return -1;
        }
        if (!ret)
            break;

        out_buf->len += (Size)ret;

        if (out_buf->len - start_len > max_len) {
            LogError("File '%1' is too big (limit = %2 bytes)", filename, max_len);
            return -1;
        }
    }

    buf_guard.Disable();
    return out_buf->len - start_len;
}

static const pthread_t main_thread = pthread_self();

static std::atomic_bool flag_signal { false };
static std::atomic_int explicit_signal { 0 };
static std::atomic_int interrupt_pfd[2] { -1, -1 };

static void SetSignalHandler(int signal, void (*func)(int))
{
    struct sigaction action = {};

    action.sa_handler = func;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(signal, &action, nullptr);
}

static void DefaultSignalHandler(int signal)
{
    if (pthread_self() != main_thread) {
        pthread_kill(main_thread, signal);
        return;
    }

    if (int fd = interrupt_pfd[1].load(); fd >= 0) {
        char dummy = 0;
        LD_IGNORE write(fd, &dummy, 1);
    }

    if (flag_signal) {
        // Termination requests must not be masked by a later reload
        if (signal == SIGHUP && explicit_signal.load())
            return;

        explicit_signal = signal;
    } else {
        int code = (signal == SIGINT) ? 130 : 1;
        exit(code);
    }
}

static void InitInterruptPipe()
{
    static bool success = ([]() {
        static int pfd[2];

        if (pipe2(pfd, O_CLOEXEC | O_NONBLOCK) < 0) {
            LogError("Failed to create pipe: %1", strerror(errno));
            return false;
        }

        atexit([]() {
            close(pfd[0]);
            close(pfd[1]);
        });

        interrupt_pfd[0] = pfd[0];
        interrupt_pfd[1] = pfd[1];

        return true;
    })();

    LD_CRITICAL(success, "Failed to initialize interrupt pipe");
}

static void DrainInterruptPipe()
{
    char buf[64];
    while (read(interrupt_pfd[0], buf, LD_SIZE(buf)) > 0);
}

void WaitDelay(int64_t delay)
{
    LD_ASSERT(delay >= 0);
    LD_ASSERT(delay < 1000ll * INT32_MAX);

    struct timespec ts;
    ts.tv_sec = (int)(delay / 1000);
    ts.tv_nsec = (int)((delay % 1000) * 1000000);

    struct timespec rem;
    while (nanosleep(&ts, &rem) < 0) {
        LD_ASSERT(errno == EINTR);
        ts = rem;
    }
}

WaitResult WaitEvents(Span<const WaitSource> sources, int64_t timeout, uint64_t *out_ready)
{
    LocalArray<struct pollfd, 64> pfds;
    LD_ASSERT(sources.len <= LD_LEN(pfds.data) - 1);

    // Don't exit after SIGINT/SIGTERM/SIGHUP, just signal us
    flag_signal = true;

    for (const WaitSource &src: sources) {
        short events = src.events ? (short)src.events : POLLIN;
        pfds.Append({ src.fd, events, 0 });

        timeout = (int64_t)std::min((uint64_t)timeout, (uint64_t)src.timeout);
    }

    InitInterruptPipe();
    pfds.Append({ interrupt_pfd[0], POLLIN, 0 });

    int64_t start = (timeout >= 0) ? GetMonotonicTime() : 0;
    int64_t until = start + timeout;
    int timeout32 = (timeout >= 0) ? (int)std::min(until - start, (int64_t)INT_MAX) : -1;

    for (;;) {
        int signal = explicit_signal.load();

        if (signal == SIGTERM) {
            return WaitResult::Exit;
        } else if (signal == SIGHUP) {
            // Reload requests are consumed once delivered
            explicit_signal = 0;
            DrainInterruptPipe();

            return WaitResult::Reload;
        } else if (signal) {
            return WaitResult::Interrupt;
        }

        int ready = poll(pfds.data, (nfds_t)pfds.len, timeout32);

        if (ready < 0) {
            if (errno == EINTR)
                continue;

            LogError("Failed to poll for events: %1", strerror(errno));
            abort();
        } else if (ready > 0) {
            uint64_t flags = 0;
            for (Size i = 0; i < pfds.len - 1; i++) {
                flags |= pfds[i].revents ? (1ull << i) : 0;
            }

            if (flags) {
                if (out_ready) {
                    *out_ready = flags;
                }
                return WaitResult::Ready;
            }

            // Spurious wake-up from the interrupt pipe
            if (!explicit_signal.load()) {
                DrainInterruptPipe();
            }
        }

        if (timeout >= 0) {
            int64_t clock = GetMonotonicTime();
            if (clock >= until)
                break;
            timeout32 = (int)std::min(until - clock, (int64_t)INT_MAX);
        }
    }

    return WaitResult::Timeout;
}

WaitResult WaitEvents(int64_t timeout)
{
    Span<const WaitSource> sources = {};
    return WaitEvents(sources, timeout);
}

void PostReload()
{
    pid_t pid = getpid();
    kill(pid, SIGHUP);
}

bool NotifySystemd(const char *state)
{
    const char *addr = GetEnv("NOTIFY_SOCKET");
    if (!addr)
        return true;

    struct sockaddr_un sa = {};
    if (addr[0] == '@') {
        addr++;

        if (strlen(addr) >= sizeof(sa.sun_path) - 1) {
            LogError("Abstract socket address in NOTIFY_SOCKET is too long");
            return false;
        }

        sa.sun_family = AF_UNIX;
        sa.sun_path[0] = 0;
        CopyString(addr, MakeSpan(sa.sun_path + 1, LD_SIZE(sa.sun_path) - 1));
    } else if (addr[0] == '/') {
        if (strlen(addr) >= sizeof(sa.sun_path)) {
            LogError("Socket pathname in NOTIFY_SOCKET is too long");
            return false;
        }

        sa.sun_family = AF_UNIX;
        CopyString(addr, sa.sun_path);
    } else {
        LogError("Invalid socket address in NOTIFY_SOCKET");
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LogError("Failed to create UNIX socket: %1", strerror(errno));
        return false;
    }
    LD_DEFER { close(fd); };

    // Abstract addresses start with a NUL byte that strlen() does not see
    socklen_t addr_len = (socklen_t)(offsetof(struct sockaddr_un, sun_path) + strlen(addr) + (sa.sun_path[0] ? 0 : 1));

    struct iovec iov = {};
    struct msghdr msg = {};
    iov.iov_base = (void *)state;
    iov.iov_len = strlen(state);
    msg.msg_name = &sa;
    msg.msg_namelen = addr_len;
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;

    if (sendmsg(fd, &msg, MSG_NOSIGNAL) < 0) {
        LogError("Failed to send message to systemd: %1", strerror(errno));
        return false;
    }

    return true;
}

void InitApp()
{
    // Setup default signal handlers
    SetSignalHandler(SIGINT, DefaultSignalHandler);
    SetSignalHandler(SIGTERM, DefaultSignalHandler);
    SetSignalHandler(SIGHUP, DefaultSignalHandler);
    SetSignalHandler(SIGPIPE, [](int) {});

    InitInterruptPipe();
}

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

bool ParseBool(Span<const char> str, bool *out_value, unsigned int flags, Span<const char> *out_remaining)
{
    static const struct {
        const char *str;
        bool value;
    } literals[] = {
        { "1", true },
        { "on", true },
        { "yes", true },
        { "y", true },
        { "true", true },
        { "0", false },
        { "off", false },
        { "no", false },
        { "n", false },
        { "false", false }
    };

    Size end = 0;
    bool value = false;

    // Longest match first, so that "no" is not parsed as "n" followed by garbage
    for (const auto &literal: literals) {
        Size len = (Size)strlen(literal.str);

        if (len > end && str.len >= len && TestStrI(str.Take(0, len), literal.str)) {
            end = len;
            value = literal.value;
        }
    }

    if (!end || ((flags & (int)ParseFlag::End) && end < str.len)) {
        if (flags & (int)ParseFlag::Log) {
            LogError("Invalid boolean value '%1'", str);
        }
        return false;
    }

    *out_value = value;
    if (out_remaining) {
        *out_remaining = str.Take(end, str.len - end);
    }
    return true;
}

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

static inline bool IsOption(const char *arg)
{
    return arg[0] == '-' && arg[1];
}

static inline bool IsLongOption(const char *arg)
{
    return arg[0] == '-' && arg[1] == '-' && arg[2];
}

static inline bool IsDashDash(const char *arg)
{
    return arg[0] == '-' && arg[1] == '-' && !arg[2];
}

const char *OptionParser::Next()
{
    current_option = nullptr;
    current_value = nullptr;
    test_failed = false;

    // Support aggregate short options, such as '-fbar'. Note that this can also be
    // parsed as the short option '-f' with value 'bar', if the user calls
    // ConsumeValue() after getting '-f'.
    if (smallopt_offset) {
        const char *opt = args[pos];

        buf[1] = opt[smallopt_offset];
        current_option = buf;

        if (!opt[++smallopt_offset]) {
            smallopt_offset = 0;
            pos++;
        }

        return current_option;
    }

    // Skip non-options, do the permutation once we reach an option or the last argument
    Size next_index = pos;
    while (next_index < limit && !IsOption(args[next_index])) {
        next_index++;
    }
    std::rotate(args.ptr + pos, args.ptr + next_index, args.end());
    limit -= (next_index - pos);
    if (pos >= limit)
        return nullptr;

    const char *opt = args[pos];

    if (IsLongOption(opt)) {
        const char *needle = strchr(opt, '=');
        if (needle) {
            // We can reorder args, but we don't want to change strings. So copy the
            // option up to '=' in our buffer. And store the part after '=' as the
            // current value.
            Size len = needle - opt;
            if (len > LD_SIZE(buf) - 1) {
                len = LD_SIZE(buf) - 1;
            }
            MemCpy(buf, opt, len);
            buf[len] = 0;
            current_option = buf;
            current_value = needle + 1;
        } else {
            current_option = opt;
        }
        pos++;
    } else if (IsDashDash(opt)) {
        // We may have previously moved non-options to the end of args. For example,
        // at this point 'a b c -- d e' is reordered to '-- d e a b c'. Fix it.
        std::rotate(args.ptr + pos + 1, args.ptr + limit, args.end());
        limit = pos;
        pos++;
    } else if (opt[2]) {
        // We either have aggregated short options or one short option with a value,
        // depending on whether or not the user calls ConsumeValue().
        buf[0] = '-';
        buf[1] = opt[1];
        buf[2] = 0;
        current_option = buf;
        smallopt_offset = opt[2] ? 2 : 0;
    } else {
        current_option = opt;
        pos++;
    }

    return current_option;
}

const char *OptionParser::ConsumeValue()
{
    if (current_value)
        return current_value;

    // Support '-fbar' where bar is the value, but only for the first short option
    // if it's an aggregate.
    if (smallopt_offset == 2 && args[pos][2]) {
        smallopt_offset = 0;
        current_value = args[pos] + 2;
        pos++;
    // Support '-f bar' and '--foo bar', see Next() for '--foo=bar'
    } else if (current_option != buf && pos < limit && !IsOption(args[pos])) {
        current_value = args[pos];
        pos++;
    }

    return current_value;
}

const char *OptionParser::ConsumeNonOption()
{
    if (pos == args.len)
        return nullptr;
    // Beyond limit there are only non-options, the limit is moved when we move non-options
    // to the end or upon encountering a double dash '--'.
    if (pos < limit && IsOption(args[pos]))
        return nullptr;

    return args[pos++];
}

bool OptionParser::Test(const char *test1, const char *test2, OptionType type)
{
    LD_ASSERT(test1 && IsOption(test1));
    LD_ASSERT(!test2 || IsOption(test2));

    if (TestStr(test1, current_option) || (test2 && TestStr(test2, current_option))) {
        switch (type) {
            case OptionType::NoValue: {
                if (current_value) {
                    LogError("Option '%1' does not support values", current_option);
                    test_failed = true;
                    return false;
                }
            } break;
            case OptionType::Value: {
                if (!ConsumeValue()) {
                    LogError("Option '%1' requires a value", current_option);
                    test_failed = true;
                    return false;
                }
            } break;
        }

        return true;
    } else {
        return false;
    }
}

void OptionParser::LogUnknownError() const
{
    if (!TestHasFailed()) {
        LogError("Unknown option '%1'", current_option);
    }
}

void OptionParser::LogUnusedArguments() const
{
    if (pos < args.len) {
       LogWarning("Unused command-line arguments");
    }
}

}
