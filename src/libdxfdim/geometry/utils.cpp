// =====================================================================
//  src/libdxfdim/geometry/utils.cpp — Geometry utility functions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/geometry/utils.h>

namespace dxfdim {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

double dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

double length(const QPointF& v)
{
    return qSqrt(v.x() * v.x() + v.y() * v.y());
}

QPointF normalize(const QPointF& v)
{
    return normalize(v, 1.0);
}

QPointF normalize(const QPointF& v, double newLength)
{
    double len = length(v);
    if (len < DEFAULT_TOLERANCE) {
        return QPointF(0, 0);
    }
    return QPointF(v.x() / len * newLength, v.y() / len * newLength);
}

QPointF perpendicular(const QPointF& v)
{
    return QPointF(-v.y(), v.x());
}

QPointF lerp(const QPointF& a, const QPointF& b, double t)
{
    return QPointF(
        a.x() + t * (b.x() - a.x()),
        a.y() + t * (b.y() - a.y())
    );
}

QPointF fromDegAngle(double angleDegrees, double length)
{
    double rad = qDegreesToRadians(angleDegrees);
    return QPointF(qCos(rad) * length, qSin(rad) * length);
}

QPointF rotatePoint(const QPointF& point, double angleDegrees)
{
    double rad = qDegreesToRadians(angleDegrees);
    double c = qCos(rad);
    double s = qSin(rad);
    return QPointF(
        point.x() * c - point.y() * s,
        point.x() * s + point.y() * c
    );
}

}  // namespace geometry
}  // namespace dxfdim
