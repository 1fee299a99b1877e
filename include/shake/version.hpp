// File: include/shake/version.hpp
// Purpose: Version macros for the shake tools and library.
// Key invariants: SHAKE_VERSION_STR is "<major>.<minor>.<patch>".
// Ownership/Lifetime: Compile-time constants only.
// Links: docs/codemap.md
#pragma once

#define SHAKE_VERSION_MAJOR 0
#define SHAKE_VERSION_MINOR 3
#define SHAKE_VERSION_PATCH 0

#define SHAKE_VERSION_STR "0.3.0"
