// =====================================================================
//  src/libdxfdim/document/block.cpp — Block definitions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/document/block.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>

namespace dxfdim {

BlockLayout::BlockLayout(Document* doc, const QString& name,
                         const QString& blockRecordHandle)
    : m_doc(doc)
    , m_name(name)
    , m_blockRecordHandle(blockRecordHandle)
{
}

void BlockLayout::append(GraphicEntity entity)
{
    if (m_doc) {
        entity.handle = m_doc->nextHandle();
    }
    m_entities.append(entity);
}

void BlockLayout::addLine(const gp_Pnt& start, const gp_Pnt& end,
                          const EntityAttribs& attribs)
{
    append(createLine(start, end, attribs));
}

void BlockLayout::addFilledPolygon(const QVector<gp_Pnt>& vertices,
                                   const EntityAttribs& attribs)
{
    append(createFilledPolygon(vertices, attribs));
}

void BlockLayout::addText(const QString& text, const gp_Pnt& position,
                          double height, double rotation, const QString& style,
                          TextAlign align, const EntityAttribs& attribs)
{
    append(createText(text, position, height, rotation, style, align, attribs));
}

void BlockLayout::addBlockRef(const QString& blockName, const gp_Pnt& insert,
                              double rotation, double xscale, double yscale,
                              const EntityAttribs& attribs)
{
    if (m_doc && !m_doc->hasBlock(blockName)) {
        throw NotFoundError(QStringLiteral("Undefined block: \"%1\"").arg(blockName));
    }
    append(createBlockRef(blockName, insert, rotation, xscale, yscale, attribs));
}

void BlockLayout::addPoint(const gp_Pnt& location, const EntityAttribs& attribs)
{
    append(createPoint(location, attribs));
}

}  // namespace dxfdim
