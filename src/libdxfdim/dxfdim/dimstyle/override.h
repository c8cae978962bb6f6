// =====================================================================
//  src/libdxfdim/dxfdim/dimstyle/override.h — Dimension style overrides
// =====================================================================
//
//  DimStyleOverride layers per-entity overrides on top of a DIMSTYLE
//  and resolves the effective value of any style attribute.
//
//  Resolved values are cached for the lifetime of the object; build a
//  new one whenever the style or the overrides change.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DIMSTYLE_OVERRIDE_H
#define DXFDIM_DIMSTYLE_OVERRIDE_H

#include "schema.h"
#include "../core.h"

#include <QHash>
#include <QString>
#include <QVariant>

namespace dxfdim {

class DimStyle;
class Dimension;

class DXFDIM_EXPORT DimStyleOverride {
public:
    /// @param dimStyle Base style, must outlive the resolver
    /// @param overrides Attribute name → value
    /// @param schema Attribute names accepted by get()
    DimStyleOverride(const DimStyle& dimStyle, const QVariantHash& overrides = QVariantHash(),
                     const StyleSchema& schema = StyleSchema::instance());

    /// Effective value of a style attribute: the override if present,
    /// else the base style value.  Attributes the document version of
    /// the base style does not store resolve to defaultValue.
    /// Throws SchemaError if name is not a DIMSTYLE attribute.
    QVariant get(const QString& name, const QVariant& defaultValue = QVariant()) const;

    const DimStyle& dimStyle() const { return m_dimStyle; }
    const QVariantHash& overrides() const { return m_overrides; }

    /// Store the overrides on the DIMENSION entity
    void commit(Dimension& dimension) const;

private:
    const DimStyle& m_dimStyle;
    QVariantHash m_overrides;
    const StyleSchema& m_schema;
    mutable QHash<QString, QVariant> m_cache;
};

}  // namespace dxfdim

#endif  // DXFDIM_DIMSTYLE_OVERRIDE_H
