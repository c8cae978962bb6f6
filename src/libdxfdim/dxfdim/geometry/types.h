// =====================================================================
//  src/libdxfdim/dxfdim/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Lightweight 2D value types used by the dimension renderers.  All
//  2D work happens in the xy-plane of the active UCS.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_GEOMETRY_TYPES_H
#define DXFDIM_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QtMath>

namespace dxfdim {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (drawing units)
constexpr double DEFAULT_TOLERANCE = 1e-9;

// =====================================================================
//  Intersection Results
// =====================================================================

/// Result of a line-line intersection
struct LineLineIntersection {
    bool intersects = false;      ///< Whether lines intersect
    bool parallel = false;        ///< Whether lines are parallel
    bool coincident = false;      ///< Whether lines are coincident (overlapping)
    QPointF point;                ///< Intersection point (if intersects)
    double t1 = 0.0;              ///< Parameter on first line
    double t2 = 0.0;              ///< Parameter on second line
};

// =====================================================================
//  Ray
// =====================================================================

/// Infinite 2D construction line through a location in a direction
struct Ray2D {
    QPointF location;
    QPointF direction = QPointF(1.0, 0.0);   ///< Unit direction

    /// Ray through location at angle (radians, CCW from +X)
    static Ray2D fromAngle(const QPointF& location, double angleRadians)
    {
        return Ray2D{location, QPointF(qCos(angleRadians), qSin(angleRadians))};
    }
};

}  // namespace geometry
}  // namespace dxfdim

#endif  // DXFDIM_GEOMETRY_TYPES_H
