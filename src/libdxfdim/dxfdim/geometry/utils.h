// =====================================================================
//  src/libdxfdim/dxfdim/geometry/utils.h — Geometry utility functions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_GEOMETRY_UTILS_H
#define DXFDIM_GEOMETRY_UTILS_H

#include "types.h"

#include <gp_Pnt.hxx>

namespace dxfdim {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Compute the dot product of two vectors (as QPointF)
DXFDIM_EXPORT double dot(const QPointF& a, const QPointF& b);

/// Compute the length of a vector
DXFDIM_EXPORT double length(const QPointF& v);

/// Normalize a vector to unit length (zero vector stays zero)
DXFDIM_EXPORT QPointF normalize(const QPointF& v);

/// Scale a vector to the given length (zero vector stays zero)
DXFDIM_EXPORT QPointF normalize(const QPointF& v, double newLength);

/// Compute perpendicular vector (90° CCW rotation)
DXFDIM_EXPORT QPointF perpendicular(const QPointF& v);

/// Linear interpolation between two points
DXFDIM_EXPORT QPointF lerp(const QPointF& a, const QPointF& b, double t = 0.5);

/// Unit vector at angle (degrees), scaled by length
DXFDIM_EXPORT QPointF fromDegAngle(double angleDegrees, double length = 1.0);

/// Rotate a point around the origin by angle (degrees)
DXFDIM_EXPORT QPointF rotatePoint(const QPointF& point, double angleDegrees);

// =====================================================================
//  2D / 3D Conversion
// =====================================================================

/// Lift a 2D point into 3D at the given elevation
inline gp_Pnt toPnt(const QPointF& p, double z = 0.0)
{
    return gp_Pnt(p.x(), p.y(), z);
}

/// Drop the z-coordinate of a 3D point
inline QPointF toPointF(const gp_Pnt& p)
{
    return QPointF(p.X(), p.Y());
}

}  // namespace geometry
}  // namespace dxfdim

#endif  // DXFDIM_GEOMETRY_UTILS_H
