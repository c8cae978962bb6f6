// =====================================================================
//  src/libdxfdim/dxfdim/document/dimension.h — DIMENSION entity
// =====================================================================
//
//  The DIMENSION entity carries the definition points, the dimension
//  type, the assigned dimension style and per-entity style overrides.
//  Its drawable geometry lives in an anonymous block ("*D<n>") that
//  render() creates.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DOCUMENT_DIMENSION_H
#define DXFDIM_DOCUMENT_DIMENSION_H

#include "entity.h"
#include "../core.h"
#include "../render/options.h"

#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>

#include <QString>
#include <QVariant>
#include <QVector>

#include <optional>

namespace dxfdim {

class Document;
class DimStyle;

namespace geometry {
class UCS;
}

// ---- Dimension type codes (group code 70) ---------------------------

constexpr int DIM_LINEAR = 0;
constexpr int DIM_ALIGNED = 1;
constexpr int DIM_ANGULAR = 2;
constexpr int DIM_DIAMETER = 3;
constexpr int DIM_RADIUS = 4;
constexpr int DIM_ANGULAR_3P = 5;
constexpr int DIM_ORDINATE = 6;

constexpr int DIM_BLOCK_EXCLUSIVE = 32;
constexpr int DIM_ORDINATE_TYPE = 64;
constexpr int DIM_USER_LOCATION_OVERRIDE = 128;

/// DXF attributes of a DIMENSION entity
struct DimensionData {
    QString layer = QStringLiteral("0");
    int color = COLOR_BYLAYER;

    int dimtype = DIM_LINEAR;                 ///< Type code plus flag bits
    gp_Pnt defpoint;                          ///< Location of the dimension line
    gp_Pnt defpoint2;                         ///< First measurement point
    gp_Pnt defpoint3;                         ///< Second measurement point
    double angle = 0.0;                       ///< Dimension line angle, degrees

    std::optional<gp_Pnt> textMidpoint;       ///< OCS, computed on first render
    double textRotation = 0.0;                ///< Degrees, added to angle
    QString text;                             ///< "" or "<>" = measurement, " " = none

    QString dimstyle = QStringLiteral("Standard");
    QString geometry;                         ///< Name of the rendered block
    std::optional<gp_Dir> extrusion;          ///< Set when rendered in a tilted UCS
};

class DXFDIM_EXPORT Dimension {
public:
    Dimension(Document* doc, const QString& handle);

    QString handle() const { return m_handle; }
    Document* document() const { return m_doc; }

    DimensionData& data() { return m_data; }
    const DimensionData& data() const { return m_data; }

    /// Dimension type without flag bits (0..6)
    int dimType() const { return m_data.dimtype & 7; }

    /// Assigned dimension style.  Throws NotFoundError.
    DimStyle* dimStyle() const;

    // ---- Style overrides --------------------------------------------

    const QVariantHash& overrides() const { return m_overrides; }

    /// Replace the override map.
    /// Throws SchemaError for names that are not DIMSTYLE attributes.
    void setOverrides(const QVariantHash& overrides);

    // ---- Geometry ---------------------------------------------------

    /// Render the geometry into a new anonymous block and store its
    /// name in data().geometry.  Without a UCS, WCS is used.
    void render(const geometry::UCS* ucs = nullptr,
                const RenderOptions& options = RenderOptions());

    /// Copies of the rendered entities, rendering first if needed.
    /// Copies are fully transparent, as DXF treats dimension geometry
    /// as part of a composite entity.
    QVector<GraphicEntity> virtualEntities();

private:
    Document* m_doc;
    QString m_handle;
    DimensionData m_data;
    QVariantHash m_overrides;
};

}  // namespace dxfdim

#endif  // DXFDIM_DOCUMENT_DIMENSION_H
