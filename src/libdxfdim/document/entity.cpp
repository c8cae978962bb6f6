// =====================================================================
//  src/libdxfdim/document/entity.cpp — Graphic entity implementation
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/document/entity.h>

namespace dxfdim {

QString GraphicEntity::dxftype() const
{
    switch (type) {
    case EntityType::Line:          return QStringLiteral("LINE");
    case EntityType::FilledPolygon: return QStringLiteral("SOLID");
    case EntityType::Text:          return QStringLiteral("TEXT");
    case EntityType::Insert:        return QStringLiteral("INSERT");
    case EntityType::Point:         return QStringLiteral("POINT");
    }
    return QString();
}

void GraphicEntity::applyAttribs(const EntityAttribs& attribs)
{
    layer = attribs.layer;
    color = attribs.color;
    extrusion = attribs.extrusion;
}

// =====================================================================
//  Entity Factory Functions
// =====================================================================

GraphicEntity createLine(const gp_Pnt& start, const gp_Pnt& end,
                         const EntityAttribs& attribs)
{
    GraphicEntity e;
    e.type = EntityType::Line;
    e.applyAttribs(attribs);
    e.points = {start, end};
    return e;
}

GraphicEntity createFilledPolygon(const QVector<gp_Pnt>& vertices,
                                  const EntityAttribs& attribs)
{
    GraphicEntity e;
    e.type = EntityType::FilledPolygon;
    e.applyAttribs(attribs);
    e.points = vertices;
    return e;
}

GraphicEntity createText(const QString& text, const gp_Pnt& position,
                         double height, double rotation,
                         const QString& style, TextAlign align,
                         const EntityAttribs& attribs)
{
    GraphicEntity e;
    e.type = EntityType::Text;
    e.applyAttribs(attribs);
    e.points = {position};
    e.text = text;
    e.height = height;
    e.rotation = rotation;
    e.style = style;
    e.align = align;
    return e;
}

GraphicEntity createBlockRef(const QString& blockName, const gp_Pnt& insert,
                             double rotation, double xscale, double yscale,
                             const EntityAttribs& attribs)
{
    GraphicEntity e;
    e.type = EntityType::Insert;
    e.applyAttribs(attribs);
    e.points = {insert};
    e.blockName = blockName;
    e.rotation = rotation;
    e.xscale = xscale;
    e.yscale = yscale;
    return e;
}

GraphicEntity createPoint(const gp_Pnt& location, const EntityAttribs& attribs)
{
    GraphicEntity e;
    e.type = EntityType::Point;
    e.applyAttribs(attribs);
    e.points = {location};
    return e;
}

}  // namespace dxfdim
