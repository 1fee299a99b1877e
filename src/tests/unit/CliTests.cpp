// File: src/tests/unit/CliTests.cpp
// Purpose: Verify command-line parsing of the shake driver.
// Key invariants: Parsing never touches the file system.
// Ownership/Lifetime: Argument storage lives in each test.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "tools/shake/cli.hpp"

#include <string>
#include <vector>

using namespace shake::tools;
using shake::support::TraceConfig;

namespace
{
struct Args
{
    explicit Args(std::vector<std::string> values) : storage(std::move(values))
    {
        for (auto &value : storage)
            argv.push_back(value.data());
    }

    int argc()
    {
        return static_cast<int>(argv.size());
    }

    std::vector<std::string> storage;
    std::vector<char *> argv;
};

CliParseResult parse(std::vector<std::string> values, CliOptions &opts, std::string &error)
{
    Args args(std::move(values));
    return parseCommandLine(args.argc(), args.argv.data(), opts, error);
}
} // namespace

TEST(CliTest, ParsesEntryOutputAndTrace)
{
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parse({"src/main.js", "-o", "out.js", "--trace=statements"}, opts, error),
              CliParseResult::Run);
    EXPECT_EQ(opts.entry, "src/main.js");
    EXPECT_EQ(opts.output, "out.js");
    EXPECT_EQ(opts.trace, TraceConfig::Statements);
    EXPECT_EQ(opts.exportsName, "exports");
}

TEST(CliTest, BareTraceSelectsModules)
{
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parse({"--trace", "main.js"}, opts, error), CliParseResult::Run);
    EXPECT_EQ(opts.trace, TraceConfig::Modules);

    CliOptions bad;
    EXPECT_EQ(parse({"--trace=everything", "main.js"}, bad, error), CliParseResult::Error);
    EXPECT_EQ(error, "unknown trace mode 'everything'");
}

TEST(CliTest, ExportsNameIsValidated)
{
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parse({"--exports-name", "module.exports", "main.js"}, opts, error), CliParseResult::Run);
    EXPECT_EQ(opts.exportsName, "module.exports");

    CliOptions bad;
    EXPECT_EQ(parse({"--exports-name", "my-lib", "main.js"}, bad, error), CliParseResult::Error);
    EXPECT_EQ(error, "invalid exports name 'my-lib'");

    CliOptions empty;
    EXPECT_EQ(parse({"--exports-name", "a..b", "main.js"}, empty, error), CliParseResult::Error);
}

TEST(CliTest, MissingOrExtraArgumentsAreErrors)
{
    std::string error;

    CliOptions none;
    EXPECT_EQ(parse({}, none, error), CliParseResult::Error);
    EXPECT_EQ(error, "no entry module given");

    CliOptions two;
    EXPECT_EQ(parse({"a.js", "b.js"}, two, error), CliParseResult::Error);
    EXPECT_EQ(error, "more than one entry module given");

    CliOptions dangling;
    EXPECT_EQ(parse({"main.js", "-o"}, dangling, error), CliParseResult::Error);
    EXPECT_EQ(error, "missing file name after '-o'");

    CliOptions unknown;
    EXPECT_EQ(parse({"--minify", "main.js"}, unknown, error), CliParseResult::Error);
    EXPECT_EQ(error, "unknown option '--minify'");
}

TEST(CliTest, HelpAndVersionShortCircuit)
{
    std::string error;
    CliOptions opts;
    EXPECT_EQ(parse({"--version"}, opts, error), CliParseResult::Version);
    EXPECT_EQ(parse({"main.js", "-h"}, opts, error), CliParseResult::Help);
}
