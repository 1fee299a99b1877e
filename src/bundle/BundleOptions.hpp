//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bundle/BundleOptions.hpp
// Purpose: Declares the settings of one bundling session.
// Key invariants: exportsName is a property-access expression such as `exports`.
// Ownership/Lifetime: Value type; the trace stream and source manager are borrowed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/trace.hpp"

#include <string>

namespace shake::bundle
{

/// @brief Holds the settings that influence a bundling session.
/// @ownership Value type.
struct BundleOptions
{
    /// @brief Specifier of the entry module, resolved with an empty importer.
    std::string entry;

    /// @brief Object receiving the entry module's exports in the output.
    std::string exportsName = "exports";

    /// @brief Tracing of fetches, definition requests and inclusions.
    support::TraceConfig trace{};
};

} // namespace shake::bundle
