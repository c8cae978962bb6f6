// =====================================================================
//  src/libdxfdim/dxfdim/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_CORE_H
#define DXFDIM_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libdxfdim as a shared library, DXFDIM_SHARED and
// DXFDIM_BUILDING are defined.  Consumers linking against the shared
// library only see DXFDIM_SHARED (set as a PUBLIC compile definition).

#if defined(DXFDIM_SHARED)
  #if defined(DXFDIM_BUILDING)
    #if defined(_WIN32)
      #define DXFDIM_EXPORT __declspec(dllexport)
    #else
      #define DXFDIM_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define DXFDIM_EXPORT __declspec(dllimport)
    #else
      #define DXFDIM_EXPORT
    #endif
  #endif
#else
  #define DXFDIM_EXPORT
#endif

#include <QLoggingCategory>

namespace dxfdim {

/// Library version string (e.g., "0.1.0").
DXFDIM_EXPORT const char* version();

/// Initialize library-wide state.
/// Call once at application startup before using other functions.
/// Returns true on success.
DXFDIM_EXPORT bool initialize();

/// Shut down the library and release resources.
DXFDIM_EXPORT void shutdown();

}  // namespace dxfdim

// ---- Logging categories ---------------------------------------------
//
// Enable with QT_LOGGING_RULES, e.g. "dxfdim.*.debug=true".

Q_DECLARE_LOGGING_CATEGORY(lcDxfDim)
Q_DECLARE_LOGGING_CATEGORY(lcDimStyle)
Q_DECLARE_LOGGING_CATEGORY(lcRender)

#endif  // DXFDIM_CORE_H
