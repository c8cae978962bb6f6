// =====================================================================
//  src/libdxfdim/dxfdim/geometry/ucs.h — User and object coordinate systems
// =====================================================================
//
//  UCS: a user coordinate system placed anywhere in world space.
//  OCS: the object coordinate system DXF derives from an extrusion
//       vector with the "arbitrary axis algorithm".
//
//  Dimension geometry is constructed in the UCS xy-plane and then
//  converted to WCS (lines, points) or to the OCS of the UCS z-axis
//  (text and block reference insertion points).
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_GEOMETRY_UCS_H
#define DXFDIM_GEOMETRY_UCS_H

#include "../core.h"

#include <gp_Ax3.hxx>
#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>
#include <gp_XYZ.hxx>

namespace dxfdim {
namespace geometry {

// =====================================================================
//  OCS
// =====================================================================

class DXFDIM_EXPORT OCS {
public:
    /// World OCS (extrusion = +Z), conversions are the identity
    OCS();

    /// OCS of an extrusion vector
    explicit OCS(const gp_Dir& extrusion);

    gp_Dir ux() const { return gp_Dir(m_ux); }
    gp_Dir uy() const { return gp_Dir(m_uy); }
    gp_Dir uz() const { return gp_Dir(m_uz); }

    /// True if the extrusion is +Z
    bool isWorld() const { return m_world; }

    gp_Pnt toWcs(const gp_Pnt& point) const;
    gp_Pnt fromWcs(const gp_Pnt& point) const;

private:
    gp_XYZ m_ux;
    gp_XYZ m_uy;
    gp_XYZ m_uz;
    bool m_world = true;
};

// =====================================================================
//  UCS
// =====================================================================

class DXFDIM_EXPORT UCS {
public:
    /// Pass-through UCS: coincides with WCS
    UCS();

    /// UCS from origin and x/y axes (z = x × y)
    UCS(const gp_Pnt& origin, const gp_Dir& ux, const gp_Dir& uy);

    /// UCS from an OCCT right-handed coordinate system
    explicit UCS(const gp_Ax3& axes);

    gp_Pnt origin() const { return m_axes.Location(); }
    gp_Dir ux() const { return m_axes.XDirection(); }
    gp_Dir uy() const { return m_axes.YDirection(); }
    gp_Dir uz() const { return m_axes.Direction(); }

    const gp_Ax3& axes() const { return m_axes; }

    /// True if uz is exactly the world z-axis
    bool isWorldZ() const;

    /// UCS point → WCS
    gp_Pnt toWcs(const gp_Pnt& point) const;

    /// WCS point → UCS
    gp_Pnt fromWcs(const gp_Pnt& point) const;

    /// UCS point → OCS of the extrusion uz
    gp_Pnt toOcs(const gp_Pnt& point) const;

private:
    gp_Ax3 m_axes;
};

}  // namespace geometry
}  // namespace dxfdim

#endif  // DXFDIM_GEOMETRY_UCS_H
