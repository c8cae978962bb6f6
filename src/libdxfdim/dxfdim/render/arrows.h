// =====================================================================
//  src/libdxfdim/dxfdim/render/arrows.h — Built-in arrow heads
// =====================================================================
//
//  Catalog of the arrow heads DIMSTYLE can name without a user block:
//  the AutoCAD standard arrows plus three arrows of our own (EZ_*).
//
//  Arrow geometry is defined for a unit arrow whose tip lies at the
//  origin pointing along +X; the body extends towards -X.  Blocks
//  created for an arrow hold exactly this unit geometry, and block
//  references scale it by the arrow size.
//
//  The "closed filled" arrow is the DXF default and has an empty
//  name; its block is called "_CLOSEDFILLED".
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_RENDER_ARROWS_H
#define DXFDIM_RENDER_ARROWS_H

#include "../core.h"

#include <QLineF>
#include <QPointF>
#include <QPolygonF>
#include <QString>
#include <QStringList>
#include <QVector>

namespace dxfdim {

class Document;

namespace arrows {

// ---- AutoCAD standard arrows ----------------------------------------

constexpr char CLOSED_FILLED[] = "";
constexpr char DOT[] = "DOT";
constexpr char DOT_SMALL[] = "DOTSMALL";
constexpr char DOT_BLANK[] = "DOTBLANK";
constexpr char ORIGIN_INDICATOR[] = "ORIGIN";
constexpr char ORIGIN_INDICATOR_2[] = "ORIGIN2";
constexpr char OPEN[] = "OPEN";
constexpr char RIGHT_ANGLE[] = "OPEN90";
constexpr char OPEN_30[] = "OPEN30";
constexpr char CLOSED[] = "CLOSED";
constexpr char DOT_SMALL_BLANK[] = "SMALL";
constexpr char NONE[] = "NONE";
constexpr char OBLIQUE[] = "OBLIQUE";
constexpr char BOX_FILLED[] = "BOXFILLED";
constexpr char BOX[] = "BOXBLANK";
constexpr char CLOSED_BLANK[] = "CLOSEDBLANK";
constexpr char DATUM_TRIANGLE_FILLED[] = "DATUMFILLED";
constexpr char DATUM_TRIANGLE[] = "DATUMBLANK";
constexpr char INTEGRAL[] = "INTEGRAL";
constexpr char ARCHITECTURAL_TICK[] = "ARCHTICK";

// ---- Additional arrows ----------------------------------------------

constexpr char EZ_ARROW[] = "EZ_ARROW";
constexpr char EZ_ARROW_BLANK[] = "EZ_ARROW_BLANK";
constexpr char EZ_ARROW_FILLED[] = "EZ_ARROW_FILLED";

/// Unit geometry of an arrow, transformed by insert, size and rotation
struct ArrowShape {
    QVector<QLineF> lines;
    QVector<QPolygonF> polygons;    ///< Filled areas

    bool isEmpty() const { return lines.isEmpty() && polygons.isEmpty(); }
};

/// All built-in arrow names
DXFDIM_EXPORT QStringList names();

/// True for the AutoCAD standard arrows (case-insensitive)
DXFDIM_EXPORT bool isAcadArrow(const QString& name);

/// True for the additional EZ_* arrows (case-insensitive)
DXFDIM_EXPORT bool isEzArrow(const QString& name);

/// True for any built-in arrow
DXFDIM_EXPORT bool isArrow(const QString& name);

/// True if the dimension line may extend past an arrow of this type
/// (ticks and markers that do not cover the line end)
DXFDIM_EXPORT bool hasExtensionLine(const QString& name);

/// Block name for an arrow: "_OPEN", "_CLOSEDFILLED", "EZ_ARROW", ...
DXFDIM_EXPORT QString blockName(const QString& name);

/// Arrow name for a block name; names of other blocks are returned unchanged
DXFDIM_EXPORT QString arrowName(const QString& blockName);

/// Geometry of an arrow placed at insert with the tip pointing in
/// direction rotation (degrees), scaled by size.
/// Throws ValidationError for names that are not built-in arrows.
DXFDIM_EXPORT ArrowShape arrowShape(const QString& name, const QPointF& insert = QPointF(),
                                    double size = 1.0, double rotation = 0.0);

/// Point where the dimension line meets an arrow placed at insert
DXFDIM_EXPORT QPointF connectionPoint(const QString& name, const QPointF& insert,
                                      double size, double rotation);

/// Create the block definition of an arrow unless it exists.
/// Returns the block name.
DXFDIM_EXPORT QString createBlock(Document& doc, const QString& name);

}  // namespace arrows
}  // namespace dxfdim

#endif  // DXFDIM_RENDER_ARROWS_H
