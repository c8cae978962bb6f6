// =====================================================================
//  src/libdxfdim/dimstyle/override.cpp — Dimension style overrides
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/dimstyle/override.h>
#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/errors.h>

namespace dxfdim {

DimStyleOverride::DimStyleOverride(const DimStyle& dimStyle, const QVariantHash& overrides,
                                   const StyleSchema& schema)
    : m_dimStyle(dimStyle)
    , m_overrides(overrides)
    , m_schema(schema)
{
}

QVariant DimStyleOverride::get(const QString& name, const QVariant& defaultValue) const
{
    auto cached = m_cache.constFind(name);
    if (cached != m_cache.constEnd()) {
        return cached.value();
    }

    // Checked against all DXF versions, so one algorithm serves every document
    if (!m_schema.contains(name)) {
        throw SchemaError(QStringLiteral("Invalid DXF attribute \"%1\" for DIMSTYLE.").arg(name));
    }

    QVariant result;
    auto it = m_overrides.constFind(name);
    if (it != m_overrides.constEnd()) {
        result = it.value();
    } else {
        try {
            result = m_dimStyle.get(name, defaultValue);
        } catch (const VersionGapError&) {
            // Attribute of a newer DXF version than the document
            result = defaultValue;
        }
    }
    m_cache.insert(name, result);
    return result;
}

void DimStyleOverride::commit(Dimension& dimension) const
{
    dimension.setOverrides(m_overrides);
}

}  // namespace dxfdim
