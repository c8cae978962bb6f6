// =====================================================================
//  src/libdxfdim/dxfdim/render/options.h — Rendering options
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_RENDER_OPTIONS_H
#define DXFDIM_RENDER_OPTIONS_H

#include <QString>

namespace dxfdim {

/// Options for rendering DIMENSION geometry
struct RenderOptions {
    /// Text style used when the dimension style does not name one
    QString defaultTextStyle = QStringLiteral("Standard");
};

}  // namespace dxfdim

#endif  // DXFDIM_RENDER_OPTIONS_H
