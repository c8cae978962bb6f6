// =====================================================================
//  src/libdxfdim/dxfdim/geometry/intersections.h — Intersection functions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_GEOMETRY_INTERSECTIONS_H
#define DXFDIM_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace dxfdim {
namespace geometry {

/// Compute intersection of two infinite lines (defined by two points each)
/// @param p1, p2 Points defining first line
/// @param p3, p4 Points defining second line
/// @return Intersection result; t1/t2 are parameters along p1→p2 and p3→p4
DXFDIM_EXPORT LineLineIntersection infiniteLineIntersection(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4);

/// Compute intersection of two construction rays
/// @return Intersection result; parallel rays have intersects == false
DXFDIM_EXPORT LineLineIntersection rayIntersection(const Ray2D& a, const Ray2D& b);

}  // namespace geometry
}  // namespace dxfdim

#endif  // DXFDIM_GEOMETRY_INTERSECTIONS_H
