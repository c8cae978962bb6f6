// =====================================================================
//  src/libdxfdim/document/dimension.cpp — DIMENSION entity
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/document/dimension.h>
#include <dxfdim/document/document.h>
#include <dxfdim/dimstyle/schema.h>
#include <dxfdim/errors.h>
#include <dxfdim/render/dimension_renderer.h>

namespace dxfdim {

Dimension::Dimension(Document* doc, const QString& handle)
    : m_doc(doc)
    , m_handle(handle)
{
}

DimStyle* Dimension::dimStyle() const
{
    return m_doc->dimStyle(m_data.dimstyle);
}

void Dimension::setOverrides(const QVariantHash& overrides)
{
    const StyleSchema& schema = StyleSchema::instance();
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        if (!schema.contains(it.key())) {
            throw SchemaError(QStringLiteral("Invalid DXF attribute \"%1\" for DIMSTYLE.")
                                  .arg(it.key()));
        }
    }
    m_overrides = overrides;
}

void Dimension::render(const geometry::UCS* ucs, const RenderOptions& options)
{
    render::DimensionRenderer renderer;
    renderer.dispatch(*this, ucs, options);
}

QVector<GraphicEntity> Dimension::virtualEntities()
{
    if (m_data.geometry.isEmpty()) {
        render();
    }

    QVector<GraphicEntity> result;
    for (GraphicEntity entity : m_doc->block(m_data.geometry)->entities()) {
        entity.transparency = 1.0;
        result.append(entity);
    }
    return result;
}

}  // namespace dxfdim
