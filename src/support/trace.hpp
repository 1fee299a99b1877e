// File: src/support/trace.hpp
// Purpose: Declare tracing configuration and sink for bundler events.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value; the stream is borrowed.
// Links: docs/architecture.md
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace shake::support
{
class SourceManager;

/// @brief Configuration for bundler tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,       ///< Tracing disabled
        Modules,   ///< Trace module fetches and definition requests
        Statements ///< Additionally trace every statement pulled into the bundle
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *os = nullptr;

    /// @brief Optional source manager for resolving file paths.
    const SourceManager *sm = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record that module @p id was loaded (or recognised as external).
    void onModuleFetched(std::string_view id, bool external);

    /// @brief Record a request for binding @p name in module @p id.
    void onDefine(std::string_view id, std::string_view name);

    /// @brief Record inclusion of the statement spanning [@p start, @p end) of module @p id.
    void onStatementIncluded(std::string_view id, uint32_t fileId, std::size_t start, std::size_t end);

    /// @brief Record that @p name in module @p id was renamed to @p replacement.
    void onRename(std::string_view id, std::string_view name, std::string_view replacement);

    /// @brief Active configuration.
    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    std::ostream &out() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace shake::support
