// File: src/support/trace.cpp
// Purpose: Implement deterministic tracing for bundler events.
// Key invariants: Each event produces exactly one flushed line prefixed with "[shake]".
// Ownership/Lifetime: Uses external streams; no resource ownership.
// Links: docs/architecture.md
#include "support/trace.hpp"

#include "support/source_manager.hpp"
#include <cstdint>
#include <iostream>

namespace shake::support
{

/// @brief Determine whether tracing output should be emitted.
/// @return True when the trace mode is not TraceConfig::Off.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig c) : cfg(c) {}

std::ostream &TraceSink::out() const
{
    return cfg.os ? *cfg.os : std::cerr;
}

void TraceSink::onModuleFetched(std::string_view id, bool external)
{
    if (!cfg.enabled())
        return;
    out() << "[shake] fetch " << id << (external ? " (external)" : "") << std::endl;
}

void TraceSink::onDefine(std::string_view id, std::string_view name)
{
    if (!cfg.enabled())
        return;
    out() << "[shake] define " << id << " " << name << std::endl;
}

/// @brief Emit a line naming the included statement's source position.
/// @details Only active in Statements mode.  When a source manager is
///          configured the byte offset is rendered as `line:column`, otherwise
///          the raw offsets are printed.
void TraceSink::onStatementIncluded(std::string_view id,
                                    uint32_t fileId,
                                    std::size_t start,
                                    std::size_t end)
{
    if (cfg.mode != TraceConfig::Statements)
        return;
    std::ostream &os = out();
    os << "[shake] include " << id;
    if (cfg.sm && fileId != 0)
    {
        const SourceLoc loc = cfg.sm->locate(fileId, start);
        os << ':' << loc.line << ':' << loc.column;
    }
    else
    {
        os << " @" << start << ".." << end;
    }
    os << std::endl;
}

void TraceSink::onRename(std::string_view id, std::string_view name, std::string_view replacement)
{
    if (!cfg.enabled())
        return;
    out() << "[shake] rename " << id << " " << name << " -> " << replacement << std::endl;
}

} // namespace shake::support
