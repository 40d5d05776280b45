// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "test.hh"

namespace LD {

TEST_FUNCTION("base/Format")
{
    char buf[512];

    TEST_STR(Fmt(buf, "%1", 0), "0");
    TEST_STR(Fmt(buf, "%1", -42), "-42");
    TEST_STR(Fmt(buf, "%1", (Size)1234567890123), "1234567890123");
    TEST_STR(Fmt(buf, "%1 %2", true, false), "true false");
    TEST_STR(Fmt(buf, "%2-%1", "a", "b"), "b-a");
    TEST_STR(Fmt(buf, "100%%"), "100%");

    TEST_STR(Fmt(buf, "%1", FmtHex(0xB05).Pad0(4)), "0B05");
    TEST_STR(Fmt(buf, "%1", FmtHex(0x5570)), "5570");
    TEST_STR(Fmt(buf, "[%1]", FmtArg(7).Pad(4)), "[   7]");
    TEST_STR(Fmt(buf, "[%1]", FmtArg("ab").Pad(4)), "[ab  ]");

    // Colors are dropped when not writing to a terminal
    TEST_STR(Fmt(buf, "%!R..%1%!0", "red"), "red");

    // Truncation keeps the buffer NUL-terminated
    char small[4];
    TEST_STR(Fmt(small, "%1", "abcdef"), "abc");
}

TEST_FUNCTION("base/ParseInt")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LD_DEFER { PopLogFilter(); };

    int value = 0;

    TEST(ParseInt("255", &value) && value == 255);
    TEST(ParseInt("-1", &value) && value == -1);
    TEST(ParseInt("+20", &value) && value == 20);
    TEST(!ParseInt("", &value));
    TEST(!ParseInt("12a", &value));
    TEST(!ParseInt("1.5", &value));
    TEST(!ParseInt("99999999999", &value));

    uint8_t byte = 0;
    TEST(ParseInt("255", &byte) && byte == 255);
    TEST(!ParseInt("256", &byte));
    TEST(!ParseInt("-1", &byte));

    Span<const char> remain = {};
    TEST(ParseInt("42ms", &value, 0, &remain) && value == 42);
    TEST_STR(remain, "ms");
}

TEST_FUNCTION("base/ParseBool")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LD_DEFER { PopLogFilter(); };

    bool value = false;

    TEST(ParseBool("1", &value) && value);
    TEST(ParseBool("On", &value) && value);
    TEST(ParseBool("yes", &value) && value);
    TEST(ParseBool("true", &value) && value);
    TEST(ParseBool("0", &value) && !value);
    TEST(ParseBool("off", &value) && !value);
    TEST(ParseBool("No", &value) && !value);
    TEST(ParseBool("FALSE", &value) && !value);
    TEST(!ParseBool("2", &value));
    TEST(!ParseBool("", &value));
}

TEST_FUNCTION("base/Strings")
{
    TEST_STR(TrimStr("  abc \t\n"), "abc");
    TEST_STR(TrimStr(""), "");
    TEST(StartsWith("test/lampd/Report", "test/lampd"));
    TEST(!StartsWith("test", "test/lampd"));
    TEST(CmpStr("abc", "abd") < 0);
    TEST(TestStrI("Breathe", "BREATHE"));

    TEST_STR(GetPathDirectory("/etc/lampd/config.json"), "/etc/lampd");
    TEST_STR(GetPathDirectory("config.json"), ".");
    TEST_STR(GetPathBaseName("/etc/lampd/config.json"), "config.json");

    char buf[8];
    TEST(CopyString("lampd", buf));
    TEST_STR(buf, "lampd");
    TEST(!CopyString("much too long", buf));
}

TEST_FUNCTION("base/OptionParser")
{
    const char *args[] = { "-C", "foo.json", "bar", "--device=/dev/hidraw3", "-v", "--", "-x" };
    OptionParser opt(args);

    const char *config = nullptr;
    const char *device = nullptr;
    bool verbose = false;

    while (opt.Next()) {
        if (opt.Test("-C", "--config_file", OptionType::Value)) {
            config = opt.current_value;
        } else if (opt.Test("-D", "--device", OptionType::Value)) {
            device = opt.current_value;
        } else if (opt.Test("-v", "--verbose")) {
            verbose = true;
        }
    }

    TEST_STR(config, "foo.json");
    TEST_STR(device, "/dev/hidraw3");
    TEST(verbose);
    TEST_STR(opt.ConsumeNonOption(), "bar");
    TEST_STR(opt.ConsumeNonOption(), "-x");
    TEST(!opt.ConsumeNonOption());

    {
        static const OptionDesc Modes[] = {
            { "static", nullptr },
            { "breathe", nullptr }
        };
        enum class Mode { Static, Breathe } mode = Mode::Static;

        TEST(OptionToEnumI(Modes, "Breathe", &mode));
        TEST_EQ((int)mode, (int)Mode::Breathe);
        TEST(!OptionToEnumI(Modes, "rainbow", &mode));
        TEST_EQ((int)mode, (int)Mode::Breathe);
    }
}

TEST_FUNCTION("base/WaitEvents")
{
    // Nothing to wait for
    int64_t start = GetMonotonicTime();
    TEST_EQ((int)WaitEvents(20), (int)WaitResult::Timeout);
    TEST(GetMonotonicTime() - start >= 20);

    // Reload requests are delivered once
    PostReload();
    TEST_EQ((int)WaitEvents(1000), (int)WaitResult::Reload);
    TEST_EQ((int)WaitEvents(0), (int)WaitResult::Timeout);

    // Readable file descriptor
    int pfd[2];
    TEST(!pipe(pfd));
    LD_DEFER {
        close(pfd[0]);
        close(pfd[1]);
    };

    TEST_EQ(write(pfd[1], "x", 1), 1);

    WaitSource sources[] = {
        { -1, -1 },
        { pfd[0], -1 }
    };
    uint64_t ready = 0;

    TEST_EQ((int)WaitEvents(sources, 1000, &ready), (int)WaitResult::Ready);
    TEST_EQ(ready, (uint64_t)2);
}

TEST_FUNCTION("base/LittleEndian")
{
    uint8_t bytes[] = { 0x34, 0x12, 0x78, 0x56 };

    uint16_t u16;
    uint32_t u32;
    MemCpy(&u16, bytes, 2);
    MemCpy(&u32, bytes, 4);

    TEST_EQ(LittleEndian(u16), 0x1234);
    TEST_EQ(LittleEndian(u32), 0x56781234u);
}

}
