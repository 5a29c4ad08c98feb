// src/support/feature_flags.hpp
#pragma once

/// @brief Compile-time switches for optional Glossa instrumentation.
/// @notes The build normally defines these; the fallbacks below keep headers
/// usable from translation units compiled without the build's definitions.
///
/// GLOSSA_ENABLE_STRING_TRACKING selects the reference tracker wired into the
/// default name table.  When 0 the no-op tracker is used and every tracking
/// call inlines to nothing.
#ifndef GLOSSA_ENABLE_STRING_TRACKING
#define GLOSSA_ENABLE_STRING_TRACKING 0
#endif
