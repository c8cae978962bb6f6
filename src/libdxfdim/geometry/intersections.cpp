// =====================================================================
//  src/libdxfdim/geometry/intersections.cpp — Intersection functions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/geometry/intersections.h>

namespace dxfdim {
namespace geometry {

LineLineIntersection infiniteLineIntersection(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4)
{
    LineLineIntersection result;

    // Direction vectors
    double d1x = p2.x() - p1.x();
    double d1y = p2.y() - p1.y();
    double d2x = p4.x() - p3.x();
    double d2y = p4.y() - p3.y();

    // Cross product of directions (determinant)
    double cross = d1x * d2y - d1y * d2x;

    // Vector from p1 to p3
    double dx = p3.x() - p1.x();
    double dy = p3.y() - p1.y();

    if (qAbs(cross) < DEFAULT_TOLERANCE) {
        result.parallel = true;

        // Coincident if p3 lies on line through p1, p2
        double crossCheck = dx * d1y - dy * d1x;
        result.coincident = (qAbs(crossCheck) < DEFAULT_TOLERANCE);

        return result;
    }

    result.t1 = (dx * d2y - dy * d2x) / cross;
    result.t2 = (dx * d1y - dy * d1x) / cross;
    result.point = QPointF(p1.x() + result.t1 * d1x, p1.y() + result.t1 * d1y);
    result.intersects = true;

    return result;
}

LineLineIntersection rayIntersection(const Ray2D& a, const Ray2D& b)
{
    return infiniteLineIntersection(a.location, a.location + a.direction,
                                    b.location, b.location + b.direction);
}

}  // namespace geometry
}  // namespace dxfdim
