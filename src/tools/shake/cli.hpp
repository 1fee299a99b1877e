// File: src/tools/shake/cli.hpp
// Purpose: Declarations for shake command-line parsing and the bundle command.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md

#pragma once

#include "support/trace.hpp"

#include <string>

namespace shake::tools
{

/// @brief Settings collected from the command line.
struct CliOptions
{
    /// @brief Entry module path (the single positional argument).
    std::string entry{};

    /// @brief Output file; standard output when empty.
    std::string output{};

    /// @brief Object receiving the entry's exports.
    std::string exportsName = "exports";

    /// @brief Trace settings requested via --trace.
    support::TraceConfig::Mode trace = support::TraceConfig::Off;
};

/// @brief Outcome of parsing the command line.
enum class CliParseResult
{
    Run,     ///< Options are complete; bundle the entry.
    Help,    ///< --help was given.
    Version, ///< --version was given.
    Error    ///< Malformed or missing arguments; @p error explains why.
};

/// @brief Parse @p argv (program name excluded) into @p opts.
/// @param error Receives a one-line description when the result is Error.
CliParseResult parseCommandLine(int argc, char **argv, CliOptions &opts, std::string &error);

/// @brief Bundle @p opts.entry and write the result.
/// @return Process exit status: 0 on success, 1 when bundling fails.
int runBundle(const CliOptions &opts);

} // namespace shake::tools
