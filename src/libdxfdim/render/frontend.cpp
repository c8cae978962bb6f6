// =====================================================================
//  src/libdxfdim/render/frontend.cpp — Drawing frontend
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/render/frontend.h>
#include <dxfdim/document/block.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/geometry/ucs.h>

#include <gp_Mat.hxx>
#include <gp_XYZ.hxx>

#include <QtMath>

namespace dxfdim {
namespace render {

namespace {

gp_Pnt transformed(const gp_GTrsf& transform, const gp_Pnt& point)
{
    gp_XYZ xyz = point.XYZ();
    transform.Transforms(xyz);
    return gp_Pnt(xyz);
}

gp_XYZ transformedVector(const gp_GTrsf& transform, const gp_XYZ& vector)
{
    gp_XYZ result = vector;
    result.Multiply(transform.VectorialPart());
    return result;
}

geometry::OCS entityOcs(const GraphicEntity& entity)
{
    return entity.extrusion ? geometry::OCS(*entity.extrusion) : geometry::OCS();
}

// Direction of an OCS angle in WCS
gp_XYZ ocsDirection(const geometry::OCS& ocs, double degrees)
{
    const double rad = qDegreesToRadians(degrees);
    return ocs.toWcs(gp_Pnt(qCos(rad), qSin(rad), 0.0)).XYZ();
}

}  // anonymous namespace

Frontend::Frontend(Document& doc, DrawingBackend& backend, const RenderOptions& options)
    : m_doc(doc)
    , m_backend(backend)
    , m_options(options)
{
}

void Frontend::drawEntities()
{
    drawLayout(m_doc.modelspace());
    for (const auto& dimension : m_doc.dimensions()) {
        drawDimension(*dimension);
    }
}

void Frontend::drawLayout(const BlockLayout& layout)
{
    const gp_GTrsf identity;
    for (const GraphicEntity& entity : layout.entities()) {
        m_backend.setCurrentEntity(entity.dxftype(), entity.handle);
        drawEntity(entity, identity);
    }
}

void Frontend::drawDimension(Dimension& dimension)
{
    m_backend.setCurrentEntity(QStringLiteral("DIMENSION"), dimension.handle());

    QVector<GraphicEntity> children;
    try {
        if (dimension.data().geometry.isEmpty()) {
            dimension.render(nullptr, m_options);
        }
        children = dimension.virtualEntities();
    } catch (const DxfError& e) {
        qCWarning(lcRender) << "skipping DIMENSION" << dimension.handle() << ":" << e.message();
        m_backend.ignoredEntity(QStringLiteral("DIMENSION"), e.message());
        return;
    }

    Properties parent;
    parent.color = dimension.data().color;
    parent.layer = dimension.data().layer;

    const gp_GTrsf identity;
    for (GraphicEntity& child : children) {
        // Virtual entities come fully transparent
        child.transparency = 0.0;
        drawEntity(child, identity, &parent);
    }
}

Properties Frontend::resolveProperties(const GraphicEntity& entity, const Properties* parent) const
{
    Properties properties;
    properties.color = entity.color;
    properties.layer = entity.layer;
    properties.transparency = entity.transparency;

    if (parent) {
        if (entity.color == COLOR_BYBLOCK) {
            properties.color = parent->color;
        }
        if (entity.layer == QLatin1String("0")) {
            properties.layer = parent->layer;
        }
    }
    return properties;
}

void Frontend::drawEntity(const GraphicEntity& entity, const gp_GTrsf& transform,
                          const Properties* parent)
{
    const Properties properties = resolveProperties(entity, parent);

    switch (entity.type) {
    case EntityType::Line:
        if (entity.points.size() >= 2) {
            m_backend.drawLine(transformed(transform, entity.points[0]),
                               transformed(transform, entity.points[1]), properties);
        }
        break;

    case EntityType::FilledPolygon: {
        QVector<gp_Pnt> vertices;
        vertices.reserve(entity.points.size());
        for (const gp_Pnt& p : entity.points) {
            vertices.append(transformed(transform, p));
        }
        m_backend.drawFilledPolygon(vertices, properties);
        break;
    }

    case EntityType::Text: {
        if (entity.points.isEmpty()) {
            break;
        }
        const geometry::OCS ocs = entityOcs(entity);
        const gp_Pnt position = transformed(transform, ocs.toWcs(entity.points[0]));
        const gp_XYZ xdir = transformedVector(transform, ocsDirection(ocs, entity.rotation));
        const gp_XYZ ydir = transformedVector(transform, ocsDirection(ocs, entity.rotation + 90.0));
        const double rotation = qRadiansToDegrees(qAtan2(xdir.Y(), xdir.X()));
        m_backend.drawText(entity.text, position, entity.height * ydir.Modulus(),
                           rotation, properties);
        break;
    }

    case EntityType::Point:
        if (!entity.points.isEmpty()) {
            m_backend.drawPoint(transformed(transform, entity.points[0]), properties);
        }
        break;

    case EntityType::Insert:
        drawInsert(entity, transform, properties);
        break;
    }
}

void Frontend::drawInsert(const GraphicEntity& insert, const gp_GTrsf& transform,
                          const Properties& properties)
{
    if (m_depth >= MAX_BLOCK_DEPTH) {
        m_backend.ignoredEntity(QStringLiteral("INSERT"),
                                QStringLiteral("Block nesting too deep: \"%1\"").arg(insert.blockName));
        return;
    }

    const BlockLayout* block = nullptr;
    try {
        block = m_doc.block(insert.blockName);
    } catch (const NotFoundError& e) {
        qCWarning(lcRender) << "skipping INSERT" << insert.handle << ":" << e.message();
        m_backend.ignoredEntity(QStringLiteral("INSERT"), e.message());
        return;
    }

    // Block coordinates → OCS of the INSERT → WCS
    const geometry::OCS ocs = entityOcs(insert);
    const gp_XYZ xaxis = ocsDirection(ocs, insert.rotation) * insert.xscale;
    const gp_XYZ yaxis = ocsDirection(ocs, insert.rotation + 90.0) * insert.yscale;
    const gp_Pnt origin = insert.points.isEmpty() ? gp_Pnt() : ocs.toWcs(insert.points[0]);

    const gp_GTrsf local(gp_Mat(xaxis, yaxis, ocs.uz().XYZ()), origin.XYZ());
    const gp_GTrsf combined = transform.Multiplied(local);

    ++m_depth;
    for (const GraphicEntity& entity : block->entities()) {
        drawEntity(entity, combined, &properties);
    }
    --m_depth;
}

}  // namespace render
}  // namespace dxfdim
