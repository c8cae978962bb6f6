// =====================================================================
//  src/libdxfdim/dxfdim/document/entity.h — Graphic entity types
// =====================================================================
//
//  Unified representation of the drawable primitives a dimension
//  renders into its anonymous block: LINE, filled polygon (SOLID),
//  TEXT, INSERT (block reference) and POINT.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DOCUMENT_ENTITY_H
#define DXFDIM_DOCUMENT_ENTITY_H

#include "../core.h"

#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>

#include <QString>
#include <QVector>

#include <optional>

namespace dxfdim {

// =====================================================================
//  Constants
// =====================================================================

constexpr int COLOR_BYBLOCK = 0;
constexpr int COLOR_BYLAYER = 256;

constexpr int LINEWEIGHT_BYLAYER = -1;
constexpr int LINEWEIGHT_BYBLOCK = -2;

// =====================================================================
//  Entity Types
// =====================================================================

/// Types of graphic entities
enum class EntityType {
    Line,           ///< LINE (2 points)
    FilledPolygon,  ///< SOLID-like filled area (3+ points)
    Text,           ///< TEXT (1 point)
    Insert,         ///< INSERT block reference (1 point)
    Point           ///< POINT (1 point)
};

/// Text alignment, subset of the DXF TEXT alignments
enum class TextAlign {
    Left,           ///< Insert point is the baseline start
    MiddleCenter    ///< Insert point is the middle of the text box
};

/// Common graphic attributes applied when an entity is created
struct EntityAttribs {
    QString layer = QStringLiteral("0");
    int color = COLOR_BYLAYER;
    std::optional<gp_Dir> extrusion;     ///< Set only when not +Z
};

// =====================================================================
//  Graphic Entity
// =====================================================================

/// A single graphic entity
struct DXFDIM_EXPORT GraphicEntity {
    EntityType type = EntityType::Line;
    QString handle;                       ///< Unique within the document

    QString layer = QStringLiteral("0");
    int color = COLOR_BYLAYER;
    double transparency = 0.0;            ///< 0 = opaque, 1 = fully transparent
    std::optional<gp_Dir> extrusion;      ///< OCS extrusion (unset = +Z)

    // Geometry data (interpretation depends on type)
    QVector<gp_Pnt> points;               ///< Definition points

    // Text
    QString text;
    QString style = QStringLiteral("Standard");
    double height = 1.0;
    TextAlign align = TextAlign::Left;

    // Text and Insert
    double rotation = 0.0;                ///< Degrees

    // Insert
    QString blockName;
    double xscale = 1.0;
    double yscale = 1.0;

    /// DXF type name ("LINE", "SOLID", "TEXT", "INSERT", "POINT")
    QString dxftype() const;

    /// Apply common attributes
    void applyAttribs(const EntityAttribs& attribs);
};

// =====================================================================
//  Entity Factory Functions
// =====================================================================

/// Create a line entity
DXFDIM_EXPORT GraphicEntity createLine(const gp_Pnt& start, const gp_Pnt& end,
                                       const EntityAttribs& attribs = {});

/// Create a filled polygon entity
DXFDIM_EXPORT GraphicEntity createFilledPolygon(const QVector<gp_Pnt>& vertices,
                                                const EntityAttribs& attribs = {});

/// Create a text entity
DXFDIM_EXPORT GraphicEntity createText(const QString& text, const gp_Pnt& position,
                                       double height, double rotation,
                                       const QString& style, TextAlign align,
                                       const EntityAttribs& attribs = {});

/// Create a block reference
DXFDIM_EXPORT GraphicEntity createBlockRef(const QString& blockName, const gp_Pnt& insert,
                                           double rotation, double xscale, double yscale,
                                           const EntityAttribs& attribs = {});

/// Create a point entity
DXFDIM_EXPORT GraphicEntity createPoint(const gp_Pnt& location,
                                        const EntityAttribs& attribs = {});

}  // namespace dxfdim

#endif  // DXFDIM_DOCUMENT_ENTITY_H
