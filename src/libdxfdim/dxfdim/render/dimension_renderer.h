// =====================================================================
//  src/libdxfdim/dxfdim/render/dimension_renderer.h — DIMENSION geometry
// =====================================================================
//
//  Renderers turn the definition points of a DIMENSION entity and its
//  effective dimension style into lines, arrow block references and
//  measurement text inside the dimension's anonymous block.
//
//  Geometry is computed in the xy-plane of a UCS.  Lines and points
//  are written in WCS; text and block references in the OCS of the
//  UCS z-axis, with that axis as extrusion when it is not +Z.
//
//  Only linear (and aligned, which shares the geometry) dimensions are
//  rendered.  Angular, diameter, radius, 3-point angular and ordinate
//  dimensions raise UnsupportedDimensionTypeError.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_RENDER_DIMENSION_RENDERER_H
#define DXFDIM_RENDER_DIMENSION_RENDERER_H

#include "options.h"
#include "../core.h"
#include "../dimstyle/override.h"
#include "../document/entity.h"
#include "../geometry/ucs.h"

#include <gp_Pnt.hxx>

#include <QPointF>
#include <QString>
#include <QVariant>
#include <QVector>

#include <optional>
#include <utility>

namespace dxfdim {

class BlockLayout;
class DimStyle;
class Dimension;

namespace render {

// =====================================================================
//  DimensionBase
// =====================================================================

/// Shared state and drawing helpers of all dimension renderers
class DXFDIM_EXPORT DimensionBase {
public:
    /// @param dimension Entity to render; its definition points are
    ///        converted to WCS by render()
    /// @param dimStyle Base style of the entity
    /// @param block Target block for the geometry
    /// @param ucs Construction plane, WCS if null
    /// @param overrides Per-entity style overrides
    /// @param options Rendering options
    DimensionBase(Dimension& dimension, const DimStyle& dimStyle, BlockLayout& block,
                  const geometry::UCS* ucs = nullptr,
                  const QVariantHash& overrides = QVariantHash(),
                  const RenderOptions& options = RenderOptions());
    virtual ~DimensionBase() = default;

    DimensionBase(const DimensionBase&) = delete;
    DimensionBase& operator=(const DimensionBase&) = delete;

    /// Create the geometry
    virtual void render() = 0;

    /// Effective dimension style
    const DimStyleOverride& dimStyle() const { return m_dimStyle; }

    QString textStyle() const { return m_textStyle; }
    double textHeight() const;
    bool suppressExtensionLine1() const;
    bool suppressExtensionLine2() const;

    /// True if the UCS z-axis is not +Z
    bool requiresExtrusion() const { return m_requiresExtrusion; }

protected:
    /// Layer and color of the DIMENSION entity
    EntityAttribs defaultAttributes() const;

    /// UCS → WCS
    gp_Pnt wcs(const QPointF& point) const;
    gp_Pnt wcs(const gp_Pnt& point) const;

    /// UCS → OCS of the UCS z-axis
    gp_Pnt ocs(const QPointF& point) const;
    gp_Pnt ocs(const gp_Pnt& point) const;

    /// Dimension text for a measurement, empty if suppressed
    QString getText(double measurement) const;

    /// Formatted measurement using the dimrnd, dimdec, dimzin, dimdsep
    /// and dimpost attributes
    QString formatText(double value) const;

    /// Arrow names for both ends, unset if ticks are used
    std::pair<std::optional<QString>, std::optional<QString>> getArrowNames() const;

    /// Color attribute with the DIMENSION color as default
    int styleColor(const QString& name) const;

    void addLine(const QPointF& start, const QPointF& end, int color);

    /// Insert an arrow or user block; reverse turns an arrow by 180°.
    /// Returns the point where the dimension line has to end.
    /// Throws NotFoundError for undefined user blocks.
    QPointF addBlockRef(const QString& name, const QPointF& insert, double rotation,
                        double scale, bool reverse, int color);

    /// Middle-centered text
    void addText(const QString& text, const QPointF& pos, double rotation, int color);

    /// POINT entities on layer DEFPOINTS
    void addDefpoints(const QVector<gp_Pnt>& points);

    Dimension& m_dimension;
    BlockLayout& m_block;
    geometry::UCS m_ucs;
    DimStyleOverride m_dimStyle;
    QString m_textStyle;
    bool m_requiresExtrusion = false;
};

// =====================================================================
//  LinearDimension
// =====================================================================

/// Horizontal, vertical and rotated dimensions
class DXFDIM_EXPORT LinearDimension : public DimensionBase {
public:
    using DimensionBase::DimensionBase;

    void render() override;

private:
    void addMeasurementText(const QString& text, const QPointF& pos);
    void addDimensionLine(QPointF start, QPointF end,
                          const std::optional<QString>& blk1,
                          const std::optional<QString>& blk2);
    void addExtensionLine(const QPointF& start, const QPointF& end);
    std::pair<QPointF, QPointF> addArrows(const QPointF& start, const QPointF& end,
                                          const std::optional<QString>& blk1,
                                          const std::optional<QString>& blk2);
    QPointF textMidpoint(const QPointF& start, const QPointF& end) const;
    void defpointsToWcs();
};

// =====================================================================
//  DimensionRenderer
// =====================================================================

/// Selects the renderer by dimension type
class DXFDIM_EXPORT DimensionRenderer {
public:
    /// Render a DIMENSION into a new anonymous block "*D<n>" and store
    /// the block name in the entity.
    /// Throws UnsupportedDimensionTypeError for types without renderer,
    /// ValidationError for unknown type codes.  If rendering fails the
    /// block is removed and the entity data is left unchanged.
    void dispatch(Dimension& dimension, const geometry::UCS* ucs = nullptr,
                  const RenderOptions& options = RenderOptions());

    /// Render horizontal, vertical and rotated dimensions
    void linear(Dimension& dimension, const DimStyle& dimStyle, BlockLayout& block,
                const geometry::UCS* ucs, const RenderOptions& options);

    /// True if dimType (0..6) has a renderer
    static bool isSupported(int dimType);
};

}  // namespace render
}  // namespace dxfdim

#endif  // DXFDIM_RENDER_DIMENSION_RENDERER_H
