// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "test.hh"

#include <fnmatch.h>

namespace LD {

// Constructors of TestInfo run during static initialization, so this
// must be ready before any of them
static HeapArray<const TestInfo *> &GetTests()
{
    static HeapArray<const TestInfo *> tests;
    return tests;
}

TestInfo::TestInfo(const char *path, void (*func)(Size *out_total, Size *out_failures))
    : path(path), func(func)
{
    GetTests().Append(this);
}

static bool MatchTestPath(const char *path, const char *pattern)
{
    // Plain prefixes such as "test/report" select a whole group
    if (StartsWith(path, pattern))
        return true;

    return !fnmatch(pattern, path, 0);
}

int Main(int argc, char **argv)
{
    // Options
    const char *pattern = nullptr;

    const auto print_usage = [=](FILE *fp) {
        PrintLn(fp, R"(Usage: %!..+%1 [pattern]%!0)", AppTarget);
    };

    // Parse arguments
    {
        OptionParser opt(argc, argv);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        pattern = opt.ConsumeNonOption();
        opt.LogUnusedArguments();
    }

    HeapArray<const TestInfo *> &tests = GetTests();

    // We want to group the output, make sure everything is sorted correctly
    std::sort(tests.begin(), tests.end(), [](const TestInfo *test1, const TestInfo *test2) {
        return CmpStr(test1->path, test2->path) < 0;
    });

    Size matches = 0;
    Size failed = 0;

    // Run tests
    for (Size i = 0; i < tests.len; i++) {
        const TestInfo &test = *tests[i];

        if (!pattern || MatchTestPath(test.path, pattern)) {
            Print("%!y..%1%!0", FmtArg(test.path).Pad(36));
            fflush(stdout);

            Size total = 0;
            Size failures = 0;
            test.func(&total, &failures);

            if (failures) {
                PrintLn("\n    %!R..Failed%!0 (%1/%2)\n", failures, total);
                failed++;
            } else {
                PrintLn(" %!G..Success%!0 (%1)", total);
            }

            matches++;
        }
    }
    if (matches) {
        PrintLn();
    }

    if (pattern && !matches) {
        LogError("Pattern '%1' does not match any test", pattern);
        return 1;
    }

    return failed ? 1 : 0;
}

}

extern "C" const char *AppTarget = "lampd_tests";
extern "C" const char *AppVersion = "test";

// C++ namespaces are stupid
int main(int argc, char **argv) { return LD::RunApp(argc, argv); }
