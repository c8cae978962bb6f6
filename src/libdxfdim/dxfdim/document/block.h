// =====================================================================
//  src/libdxfdim/dxfdim/document/block.h — Block definitions
// =====================================================================
//
//  A BlockLayout is a named container of graphic entities.  Dimension
//  geometry lives in anonymous blocks ("*D1", "*D2", ...), arrow
//  heads in blocks named after the arrow ("_OPEN", ...).
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DOCUMENT_BLOCK_H
#define DXFDIM_DOCUMENT_BLOCK_H

#include "entity.h"
#include "../core.h"

#include <QString>
#include <QVector>

namespace dxfdim {

class Document;

class DXFDIM_EXPORT BlockLayout {
public:
    BlockLayout(Document* doc, const QString& name, const QString& blockRecordHandle);

    /// Block name
    QString name() const { return m_name; }

    /// Handle of the BLOCK_RECORD table entry
    QString blockRecordHandle() const { return m_blockRecordHandle; }

    /// True for "*..." names
    bool isAnonymous() const { return m_name.startsWith('*'); }

    Document* document() const { return m_doc; }

    // ---- Content ----------------------------------------------------

    const QVector<GraphicEntity>& entities() const { return m_entities; }

    int size() const { return m_entities.size(); }

    void addLine(const gp_Pnt& start, const gp_Pnt& end,
                 const EntityAttribs& attribs = {});

    void addFilledPolygon(const QVector<gp_Pnt>& vertices,
                          const EntityAttribs& attribs = {});

    void addText(const QString& text, const gp_Pnt& position,
                 double height, double rotation, const QString& style,
                 TextAlign align = TextAlign::Left,
                 const EntityAttribs& attribs = {});

    /// Add a reference to an existing block.
    /// Throws NotFoundError if the block is not defined.
    void addBlockRef(const QString& blockName, const gp_Pnt& insert,
                     double rotation = 0.0, double xscale = 1.0, double yscale = 1.0,
                     const EntityAttribs& attribs = {});

    void addPoint(const gp_Pnt& location, const EntityAttribs& attribs = {});

    /// Remove all entities
    void clear() { m_entities.clear(); }

private:
    void append(GraphicEntity entity);

    Document* m_doc;
    QString m_name;
    QString m_blockRecordHandle;
    QVector<GraphicEntity> m_entities;
};

}  // namespace dxfdim

#endif  // DXFDIM_DOCUMENT_BLOCK_H
