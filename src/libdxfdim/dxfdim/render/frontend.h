// =====================================================================
//  src/libdxfdim/dxfdim/render/frontend.h — Drawing frontend
// =====================================================================
//
//  Walks the entities of a document and hands flattened WCS geometry
//  to a DrawingBackend.  INSERT and DIMENSION are composite entities:
//  block references are expanded with their transformation, DIMENSION
//  entities through their rendered virtual entities.
//
//  A composite that fails to expand is reported to the backend through
//  ignoredEntity() and drawing continues with the next entity.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_RENDER_FRONTEND_H
#define DXFDIM_RENDER_FRONTEND_H

#include "options.h"
#include "../core.h"
#include "../document/entity.h"

#include <gp_GTrsf.hxx>
#include <gp_Pnt.hxx>

#include <QString>
#include <QVector>

namespace dxfdim {

class BlockLayout;
class Dimension;
class Document;

namespace render {

/// Resolved drawing properties of an entity
struct Properties {
    int color = COLOR_BYLAYER;
    QString layer = QStringLiteral("0");
    double transparency = 0.0;      ///< 0 = opaque, 1 = fully transparent
};

/// Receiver of flattened WCS geometry
class DXFDIM_EXPORT DrawingBackend {
public:
    virtual ~DrawingBackend() = default;

    /// Top level entity the following draw calls belong to
    virtual void setCurrentEntity(const QString& dxftype, const QString& handle)
    {
        Q_UNUSED(dxftype);
        Q_UNUSED(handle);
    }

    virtual void drawLine(const gp_Pnt& start, const gp_Pnt& end,
                          const Properties& properties) = 0;
    virtual void drawFilledPolygon(const QVector<gp_Pnt>& vertices,
                                   const Properties& properties) = 0;

    /// @param rotation Degrees in the WCS xy-plane
    virtual void drawText(const QString& text, const gp_Pnt& position, double height,
                          double rotation, const Properties& properties) = 0;
    virtual void drawPoint(const gp_Pnt& location, const Properties& properties) = 0;

    /// An entity that could not be drawn
    virtual void ignoredEntity(const QString& dxftype, const QString& reason)
    {
        Q_UNUSED(dxftype);
        Q_UNUSED(reason);
    }
};

class DXFDIM_EXPORT Frontend {
public:
    Frontend(Document& doc, DrawingBackend& backend,
             const RenderOptions& options = RenderOptions());

    /// Draw the modelspace and all DIMENSION entities
    void drawEntities();

    /// Draw the entities of a block with an identity transformation
    void drawLayout(const BlockLayout& layout);

    /// Draw a DIMENSION, rendering its geometry if needed
    void drawDimension(Dimension& dimension);

    /// Draw a single entity
    /// @param transform Block → WCS transformation
    /// @param parent Properties of the referencing INSERT, null at top level
    void drawEntity(const GraphicEntity& entity, const gp_GTrsf& transform,
                    const Properties* parent = nullptr);

    /// Nesting depth at which INSERT expansion stops
    static constexpr int MAX_BLOCK_DEPTH = 16;

private:
    Properties resolveProperties(const GraphicEntity& entity, const Properties* parent) const;
    void drawInsert(const GraphicEntity& insert, const gp_GTrsf& transform,
                    const Properties& properties);

    Document& m_doc;
    DrawingBackend& m_backend;
    RenderOptions m_options;
    int m_depth = 0;
};

}  // namespace render
}  // namespace dxfdim

#endif  // DXFDIM_RENDER_FRONTEND_H
