//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `shake` driver.  Argument parsing and the bundle
// command live in cli.cpp; this file wires them into `main` and prints the
// user-facing usage and version text.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point and usage utilities for the `shake` driver.

#include "cli.hpp"
#include "shake/version.hpp"

#include <iostream>
#include <string>

namespace
{

void printVersion()
{
    std::cout << "shake v" << SHAKE_VERSION_STR << "\n";
}

/// @brief Print synopsis and option hints for the `shake` CLI.
void usage(std::ostream &os)
{
    os << "shake v" << SHAKE_VERSION_STR << "\n"
       << "Usage: shake <entry.js> [-o <out.js>] [--exports-name <id>]"
          " [--trace[=modules|statements]]\n"
       << "       shake --version\n"
       << "       shake --help\n"
       << "\nOptions:\n"
       << "  -o <out.js>           Write the bundle to a file instead of stdout.\n"
       << "  --exports-name <id>   Object receiving the entry's exports (default: exports).\n"
       << "  --trace[=mode]        Log module fetches and definitions to stderr;\n"
       << "                        'statements' also logs every included statement.\n"
       << "\nNotes:\n"
       << "  Relative imports are bundled; bare specifiers stay external and are\n"
       << "  loaded with require().\n";
}

} // namespace

/// @brief Program entry for the `shake` command-line tool.
/// @return 0 on success, 1 on usage or bundling errors.
int main(int argc, char **argv)
{
    shake::tools::CliOptions opts;
    std::string error;
    switch (shake::tools::parseCommandLine(argc - 1, argv + 1, opts, error))
    {
        case shake::tools::CliParseResult::Help:
            usage(std::cout);
            return 0;
        case shake::tools::CliParseResult::Version:
            printVersion();
            return 0;
        case shake::tools::CliParseResult::Error:
            std::cerr << "error: " << error << "\n";
            usage(std::cerr);
            return 1;
        case shake::tools::CliParseResult::Run:
            break;
    }
    return shake::tools::runBundle(opts);
}
