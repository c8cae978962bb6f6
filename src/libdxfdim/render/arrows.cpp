// =====================================================================
//  src/libdxfdim/render/arrows.cpp — Built-in arrow heads
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/render/arrows.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/geometry/utils.h>

#include <QtMath>

namespace dxfdim {
namespace arrows {

namespace {

const QStringList& acadArrows()
{
    static const QStringList list{
        CLOSED_FILLED, DOT, DOT_SMALL, DOT_BLANK, ORIGIN_INDICATOR, ORIGIN_INDICATOR_2,
        OPEN, RIGHT_ANGLE, OPEN_30, CLOSED, DOT_SMALL_BLANK, NONE, OBLIQUE, BOX_FILLED,
        BOX, CLOSED_BLANK, DATUM_TRIANGLE_FILLED, DATUM_TRIANGLE, INTEGRAL,
        ARCHITECTURAL_TICK};
    return list;
}

const QStringList& ezArrows()
{
    static const QStringList list{EZ_ARROW, EZ_ARROW_BLANK, EZ_ARROW_FILLED};
    return list;
}

// Arrows whose connection point is the insert point itself
bool originIsConnection(const QString& name)
{
    static const QStringList list{ARCHITECTURAL_TICK, OBLIQUE, DOT_SMALL,
                                  DOT_SMALL_BLANK, INTEGRAL, NONE};
    return list.contains(name.toUpper());
}

constexpr int CIRCLE_SEGMENTS = 16;

QPolygonF circle(const QPointF& center, double radius)
{
    QPolygonF poly;
    for (int i = 0; i < CIRCLE_SEGMENTS; ++i) {
        double a = 2.0 * M_PI * i / CIRCLE_SEGMENTS;
        poly.append(center + QPointF(radius * qCos(a), radius * qSin(a)));
    }
    return poly;
}

QVector<QPointF> arc(const QPointF& center, double radius,
                     double startDeg, double endDeg, int segments = 8)
{
    QVector<QPointF> pts;
    for (int i = 0; i <= segments; ++i) {
        double a = qDegreesToRadians(startDeg + (endDeg - startDeg) * i / segments);
        pts.append(center + QPointF(radius * qCos(a), radius * qSin(a)));
    }
    return pts;
}

void addOutline(ArrowShape& shape, const QPolygonF& poly)
{
    for (int i = 0; i < poly.size(); ++i) {
        shape.lines.append(QLineF(poly[i], poly[(i + 1) % poly.size()]));
    }
}

void addPolyline(ArrowShape& shape, const QVector<QPointF>& pts)
{
    for (int i = 1; i < pts.size(); ++i) {
        shape.lines.append(QLineF(pts[i - 1], pts[i]));
    }
}

// Unit geometry, tip at the origin pointing along +X
ArrowShape unitShape(const QString& name)
{
    const QString n = name.toUpper();
    ArrowShape shape;

    const QPolygonF closedTriangle{QPointF(0, 0), QPointF(-1, -1.0 / 6.0), QPointF(-1, 1.0 / 6.0)};
    const QLineF centerLine(QPointF(0, 0), QPointF(-1, 0));

    if (n == CLOSED_FILLED) {
        shape.polygons.append(closedTriangle);
    } else if (n == CLOSED_BLANK) {
        addOutline(shape, closedTriangle);
    } else if (n == CLOSED) {
        addOutline(shape, closedTriangle);
        shape.lines.append(centerLine);
    } else if (n == OPEN || n == RIGHT_ANGLE || n == OPEN_30) {
        // Half opening angle of the two wings
        double half = 9.46;
        if (n == RIGHT_ANGLE) {
            half = 45.0;
        } else if (n == OPEN_30) {
            half = 15.0;
        }
        QPointF wing = geometry::fromDegAngle(180.0 - half);
        QPointF wing2(wing.x(), -wing.y());
        shape.lines.append(QLineF(QPointF(0, 0), wing));
        shape.lines.append(QLineF(QPointF(0, 0), wing2));
        shape.lines.append(centerLine);
    } else if (n == DOT) {
        shape.polygons.append(circle(QPointF(-0.5, 0), 0.5));
    } else if (n == DOT_BLANK) {
        addOutline(shape, circle(QPointF(-0.5, 0), 0.5));
    } else if (n == DOT_SMALL) {
        shape.polygons.append(circle(QPointF(0, 0), 1.0 / 8.0));
    } else if (n == DOT_SMALL_BLANK) {
        addOutline(shape, circle(QPointF(0, 0), 1.0 / 8.0));
    } else if (n == ORIGIN_INDICATOR) {
        addOutline(shape, circle(QPointF(0, 0), 0.5));
        shape.lines.append(centerLine);
    } else if (n == ORIGIN_INDICATOR_2) {
        addOutline(shape, circle(QPointF(0, 0), 0.5));
        addOutline(shape, circle(QPointF(0, 0), 0.25));
        shape.lines.append(QLineF(QPointF(-0.5, 0), QPointF(-1, 0)));
    } else if (n == NONE) {
        // nothing
    } else if (n == OBLIQUE) {
        shape.lines.append(QLineF(QPointF(-0.5, -0.5), QPointF(0.5, 0.5)));
    } else if (n == ARCHITECTURAL_TICK) {
        // Oblique stroke with a visible width
        const double w = 0.075;
        shape.polygons.append(QPolygonF{QPointF(-0.5 + w, -0.5 - w), QPointF(0.5 + w, 0.5 - w),
                                        QPointF(0.5 - w, 0.5 + w), QPointF(-0.5 - w, -0.5 + w)});
    } else if (n == BOX_FILLED || n == BOX) {
        const QPolygonF box{QPointF(-0.5, -0.5), QPointF(0.5, -0.5),
                            QPointF(0.5, 0.5), QPointF(-0.5, 0.5)};
        if (n == BOX_FILLED) {
            shape.polygons.append(box);
        } else {
            addOutline(shape, box);
        }
        shape.lines.append(QLineF(QPointF(-0.5, 0), QPointF(-1, 0)));
    } else if (n == DATUM_TRIANGLE_FILLED || n == DATUM_TRIANGLE) {
        const QPolygonF triangle{QPointF(0, 0.5), QPointF(0, -0.5), QPointF(-1, 0)};
        if (n == DATUM_TRIANGLE_FILLED) {
            shape.polygons.append(triangle);
        } else {
            addOutline(shape, triangle);
        }
    } else if (n == INTEGRAL) {
        addPolyline(shape, arc(QPointF(-0.5, 0), 0.5, 270.0, 360.0));
        addPolyline(shape, arc(QPointF(0.5, 0), 0.5, 90.0, 180.0));
    } else if (n == EZ_ARROW || n == EZ_ARROW_BLANK || n == EZ_ARROW_FILLED) {
        const QPolygonF triangle{QPointF(0, 0), QPointF(-1, -0.25), QPointF(-1, 0.25)};
        if (n == EZ_ARROW_FILLED) {
            shape.polygons.append(triangle);
        } else {
            addOutline(shape, triangle);
        }
        if (n == EZ_ARROW) {
            shape.lines.append(centerLine);
        }
    } else {
        throw ValidationError(QStringLiteral("\"%1\" is not a built-in arrow.").arg(name));
    }
    return shape;
}

}  // anonymous namespace

QStringList names()
{
    return acadArrows() + ezArrows();
}

bool isAcadArrow(const QString& name)
{
    return acadArrows().contains(name.toUpper());
}

bool isEzArrow(const QString& name)
{
    return ezArrows().contains(name.toUpper());
}

bool isArrow(const QString& name)
{
    return isAcadArrow(name) || isEzArrow(name);
}

bool hasExtensionLine(const QString& name)
{
    static const QStringList list{ARCHITECTURAL_TICK, OBLIQUE, NONE,
                                  DOT_SMALL_BLANK, INTEGRAL, DOT_SMALL};
    return list.contains(name.toUpper());
}

QString blockName(const QString& name)
{
    if (!isAcadArrow(name)) {
        return name.toUpper();
    }
    if (name.isEmpty()) {
        return QStringLiteral("_CLOSEDFILLED");
    }
    return QLatin1Char('_') + name.toUpper();
}

QString arrowName(const QString& blockName)
{
    if (blockName.startsWith(QLatin1Char('_'))) {
        QString name = blockName.mid(1).toUpper();
        if (name == QLatin1String("CLOSEDFILLED")) {
            return QString(CLOSED_FILLED);
        }
        if (isAcadArrow(name)) {
            return name;
        }
    }
    return blockName;
}

ArrowShape arrowShape(const QString& name, const QPointF& insert, double size, double rotation)
{
    ArrowShape shape = unitShape(name);

    auto place = [&](const QPointF& p) {
        return insert + geometry::rotatePoint(p * size, rotation);
    };
    for (QLineF& line : shape.lines) {
        line = QLineF(place(line.p1()), place(line.p2()));
    }
    for (QPolygonF& poly : shape.polygons) {
        for (QPointF& p : poly) {
            p = place(p);
        }
    }
    return shape;
}

QPointF connectionPoint(const QString& name, const QPointF& insert, double size, double rotation)
{
    if (originIsConnection(name)) {
        return insert;
    }
    return insert - geometry::fromDegAngle(rotation, size);
}

QString createBlock(Document& doc, const QString& name)
{
    const QString blkName = blockName(name);
    if (doc.hasBlock(blkName)) {
        return blkName;
    }

    ArrowShape shape = unitShape(name);
    BlockLayout* block = doc.newBlock(blkName);

    // Arrow blocks take the color of the referencing INSERT
    EntityAttribs attribs;
    attribs.color = COLOR_BYBLOCK;
    for (const QLineF& line : shape.lines) {
        block->addLine(geometry::toPnt(line.p1()), geometry::toPnt(line.p2()), attribs);
    }
    for (const QPolygonF& poly : shape.polygons) {
        QVector<gp_Pnt> vertices;
        for (const QPointF& p : poly) {
            vertices.append(geometry::toPnt(p));
        }
        block->addFilledPolygon(vertices, attribs);
    }
    return blkName;
}

}  // namespace arrows
}  // namespace dxfdim
