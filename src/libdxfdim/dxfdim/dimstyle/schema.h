// =====================================================================
//  src/libdxfdim/dxfdim/dimstyle/schema.h — DIMSTYLE attribute schema
// =====================================================================
//
//  Definition of the DIMSTYLE table entry attributes: name, group
//  code, value type, default and the first DXF version that stores
//  the attribute.
//
//  Two kinds of fields exist.  Plain fields hold their value in the
//  record.  Callback fields (dimblk, dimtxsty, dimltype, ...) are
//  virtual: their getter and setter translate between a name and a
//  handle stored in a plain *_handle field.  Both kinds are accessed
//  through the same DimStyle::get()/set() interface.
//
//  The schema is immutable and shared; StyleSchema::instance() gives
//  the process-wide copy.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DIMSTYLE_SCHEMA_H
#define DXFDIM_DIMSTYLE_SCHEMA_H

#include "../core.h"
#include "../dxf/tags.h"
#include "../dxf/version.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>

#include <functional>

namespace dxfdim {

class DimStyle;

/// Storage type of a field value
enum class FieldType {
    Int,
    Double,
    String,
    Handle      ///< Hex string referencing another table entry
};

/// Zero suppression flags of dimzin / dimtzin
constexpr int DIMZIN_SUPPRESSES_LEADING_ZEROS = 4;
constexpr int DIMZIN_SUPPRESSES_TRAILING_ZEROS = 8;

struct DXFDIM_EXPORT StyleField {
    using Getter = std::function<QVariant(const DimStyle&)>;
    using Setter = std::function<void(DimStyle&, const QVariant&)>;

    QString name;
    int code = VIRTUAL_TAG;
    FieldType type = FieldType::Int;
    QVariant defaultValue;                  ///< Invalid if the field has none
    DxfVersion minVersion = DxfVersion::R12;

    Getter getter;                          ///< Callback fields only
    Setter setter;

    bool isCallback() const { return static_cast<bool>(getter); }

    /// True if a document of the given version stores this field
    bool isSupported(DxfVersion version) const { return !(version < minVersion); }

    /// Convert a value to the field's storage type
    QVariant coerce(const QVariant& value) const;
};

class DXFDIM_EXPORT StyleSchema {
public:
    /// Shared schema instance
    static const StyleSchema& instance();

    /// All fields in definition order
    const QVector<StyleField>& fields() const { return m_fields; }

    /// True if name is a DIMSTYLE attribute in any DXF version
    bool contains(const QString& name) const { return m_index.contains(name); }

    /// Field by name, nullptr if unknown
    const StyleField* find(const QString& name) const;

    /// Field by name.  Throws SchemaError if unknown.
    const StyleField& field(const QString& name) const;

    /// dim* field (or legacy arrow name field) by group code, nullptr if none
    const StyleField* findByCode(int code) const;

    /// True if name exists and is stored by documents of the given version
    bool supports(const QString& name, DxfVersion version) const;

    /// Ordered attribute names written by DIMSTYLE export for a version
    const QStringList& exportFields(DxfVersion version) const;

private:
    StyleSchema();

    void addPlain(const QString& name, int code, FieldType type,
                  const QVariant& defaultValue = QVariant(),
                  DxfVersion minVersion = DxfVersion::R12);
    void addCallback(const QString& name, int code,
                     StyleField::Getter getter, StyleField::Setter setter,
                     const QVariant& defaultValue = QVariant(),
                     DxfVersion minVersion = DxfVersion::R12);

    QVector<StyleField> m_fields;
    QHash<QString, int> m_index;
    QHash<int, int> m_codeIndex;

    QStringList m_exportR12;
    QStringList m_exportR2000;
    QStringList m_exportR2007;
};

}  // namespace dxfdim

#endif  // DXFDIM_DIMSTYLE_SCHEMA_H
