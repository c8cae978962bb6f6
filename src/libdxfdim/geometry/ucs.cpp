// =====================================================================
//  src/libdxfdim/geometry/ucs.cpp — User and object coordinate systems
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/geometry/ucs.h>

#include <gp.hxx>

namespace dxfdim {
namespace geometry {

// =====================================================================
//  OCS
// =====================================================================

OCS::OCS()
    : m_ux(1.0, 0.0, 0.0)
    , m_uy(0.0, 1.0, 0.0)
    , m_uz(0.0, 0.0, 1.0)
{
}

OCS::OCS(const gp_Dir& extrusion)
    : m_uz(extrusion.XYZ())
{
    m_world = extrusion.X() == 0.0 && extrusion.Y() == 0.0 && extrusion.Z() == 1.0;

    // Arbitrary axis algorithm
    constexpr double threshold = 1.0 / 64.0;
    if (qAbs(m_uz.X()) < threshold && qAbs(m_uz.Y()) < threshold) {
        m_ux = gp::DY().XYZ().Crossed(m_uz);
    } else {
        m_ux = gp::DZ().XYZ().Crossed(m_uz);
    }
    m_ux.Normalize();
    m_uy = m_uz.Crossed(m_ux);
    m_uy.Normalize();
}

gp_Pnt OCS::toWcs(const gp_Pnt& point) const
{
    if (m_world) return point;
    return gp_Pnt(m_ux * point.X() + m_uy * point.Y() + m_uz * point.Z());
}

gp_Pnt OCS::fromWcs(const gp_Pnt& point) const
{
    if (m_world) return point;
    const gp_XYZ& p = point.XYZ();
    return gp_Pnt(p.Dot(m_ux), p.Dot(m_uy), p.Dot(m_uz));
}

// =====================================================================
//  UCS
// =====================================================================

UCS::UCS()
    : m_axes(gp::XOY())
{
}

UCS::UCS(const gp_Pnt& origin, const gp_Dir& ux, const gp_Dir& uy)
    : m_axes(origin, ux.Crossed(uy), ux)
{
}

UCS::UCS(const gp_Ax3& axes)
    : m_axes(axes)
{
}

bool UCS::isWorldZ() const
{
    const gp_Dir z = uz();
    return z.X() == 0.0 && z.Y() == 0.0 && z.Z() == 1.0;
}

gp_Pnt UCS::toWcs(const gp_Pnt& point) const
{
    gp_XYZ wcs = origin().XYZ()
               + ux().XYZ() * point.X()
               + uy().XYZ() * point.Y()
               + uz().XYZ() * point.Z();
    return gp_Pnt(wcs);
}

gp_Pnt UCS::fromWcs(const gp_Pnt& point) const
{
    gp_XYZ d = point.XYZ() - origin().XYZ();
    return gp_Pnt(d.Dot(ux().XYZ()), d.Dot(uy().XYZ()), d.Dot(uz().XYZ()));
}

gp_Pnt UCS::toOcs(const gp_Pnt& point) const
{
    return OCS(uz()).fromWcs(toWcs(point));
}

}  // namespace geometry
}  // namespace dxfdim
