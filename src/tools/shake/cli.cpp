// File: src/tools/shake/cli.cpp
// Purpose: Command-line parsing and the bundle command of the shake driver.
// Key invariants: Diagnostics go to stderr; bundle text goes to stdout or -o.
// Ownership/Lifetime: Owns the loader, source manager and bundle for one run.
// Links: docs/codemap.md

#include "cli.hpp"

#include "bundle/Bundle.hpp"
#include "bundle/Identifiers.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <fstream>
#include <iostream>
#include <string_view>

namespace shake::tools
{
namespace
{

bool parseTraceMode(std::string_view value, support::TraceConfig::Mode &mode)
{
    if (value.empty() || value == "modules")
    {
        mode = support::TraceConfig::Modules;
        return true;
    }
    if (value == "statements" || value == "stmt")
    {
        mode = support::TraceConfig::Statements;
        return true;
    }
    return false;
}

/// @brief True when every dot-separated segment of @p name is a usable identifier.
bool isValidExportsName(const std::string &name)
{
    std::size_t begin = 0;
    while (true)
    {
        const std::size_t dot = name.find('.', begin);
        const std::string segment = name.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (segment.empty() || bundle::makeLegalIdentifier(segment) != segment)
            return false;
        if (dot == std::string::npos)
            return true;
        begin = dot + 1;
    }
}

} // namespace

CliParseResult parseCommandLine(int argc, char **argv, CliOptions &opts, std::string &error)
{
    for (int i = 0; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return CliParseResult::Help;
        if (arg == "--version")
            return CliParseResult::Version;

        if (arg == "-o")
        {
            if (i + 1 >= argc)
            {
                error = "missing file name after '-o'";
                return CliParseResult::Error;
            }
            opts.output = argv[++i];
            continue;
        }
        if (arg == "--exports-name")
        {
            if (i + 1 >= argc)
            {
                error = "missing identifier after '--exports-name'";
                return CliParseResult::Error;
            }
            opts.exportsName = argv[++i];
            if (!isValidExportsName(opts.exportsName))
            {
                error = "invalid exports name '" + opts.exportsName + "'";
                return CliParseResult::Error;
            }
            continue;
        }
        if (arg == "--trace" || arg.rfind("--trace=", 0) == 0)
        {
            const std::string_view value = arg.size() > 8 ? arg.substr(8) : std::string_view{};
            if (!parseTraceMode(value, opts.trace))
            {
                error = "unknown trace mode '" + std::string(value) + "'";
                return CliParseResult::Error;
            }
            continue;
        }
        if (!arg.empty() && arg.front() == '-')
        {
            error = "unknown option '" + std::string(arg) + "'";
            return CliParseResult::Error;
        }
        if (!opts.entry.empty())
        {
            error = "more than one entry module given";
            return CliParseResult::Error;
        }
        opts.entry = std::string(arg);
    }

    if (opts.entry.empty())
    {
        error = "no entry module given";
        return CliParseResult::Error;
    }
    return CliParseResult::Run;
}

int runBundle(const CliOptions &opts)
{
    support::SourceManager sm;
    bundle::FileSystemLoader loader;

    bundle::BundleOptions options;
    options.entry = opts.entry;
    options.exportsName = opts.exportsName;
    options.trace.mode = opts.trace;
    options.trace.sm = &sm;

    bundle::Bundle bundle(options, loader, sm);
    if (auto built = bundle.build(); !built)
    {
        support::printDiag(built.error(), std::cerr, &sm);
        return 1;
    }

    auto code = bundle.generate();
    if (!code)
    {
        support::printDiag(code.error(), std::cerr, &sm);
        return 1;
    }

    if (opts.output.empty())
    {
        std::cout << code.value();
        return 0;
    }

    std::ofstream out(opts.output, std::ios::binary);
    if (!out)
    {
        std::cerr << "error: cannot open " << opts.output << " for writing\n";
        return 1;
    }
    out << code.value();
    if (!out)
    {
        std::cerr << "error: failed writing " << opts.output << "\n";
        return 1;
    }
    return 0;
}

} // namespace shake::tools
