// =====================================================================
//  src/libdxfdim/dimstyle/schema.cpp — DIMSTYLE attribute schema
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/dimstyle/schema.h>
#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/entity.h>
#include <dxfdim/errors.h>

namespace dxfdim {

QVariant StyleField::coerce(const QVariant& value) const
{
    switch (type) {
    case FieldType::Int:
        if (value.typeId() == QMetaType::QString) {
            return value.toString().trimmed().toInt();
        }
        return value.toInt();
    case FieldType::Double:
        if (value.typeId() == QMetaType::QString) {
            return value.toString().trimmed().toDouble();
        }
        return value.toDouble();
    case FieldType::String:
        return value.toString();
    case FieldType::Handle:
        return value.toString().trimmed().toUpper();
    }
    return value;
}

const StyleSchema& StyleSchema::instance()
{
    static const StyleSchema schema;
    return schema;
}

void StyleSchema::addPlain(const QString& name, int code, FieldType type,
                           const QVariant& defaultValue, DxfVersion minVersion)
{
    StyleField f;
    f.name = name;
    f.code = code;
    f.type = type;
    f.defaultValue = defaultValue;
    f.minVersion = minVersion;
    m_index.insert(name, m_fields.size());
    m_fields.append(f);
}

void StyleSchema::addCallback(const QString& name, int code,
                              StyleField::Getter getter, StyleField::Setter setter,
                              const QVariant& defaultValue, DxfVersion minVersion)
{
    StyleField f;
    f.name = name;
    f.code = code;
    f.type = FieldType::String;
    f.defaultValue = defaultValue;
    f.minVersion = minVersion;
    f.getter = std::move(getter);
    f.setter = std::move(setter);
    m_index.insert(name, m_fields.size());
    m_fields.append(f);
}

StyleSchema::StyleSchema()
{
    const auto R2000 = DxfVersion::R2000;
    const auto R2007 = DxfVersion::R2007;
    const auto I = FieldType::Int;
    const auto D = FieldType::Double;
    const auto S = FieldType::String;
    const auto H = FieldType::Handle;

    auto arrowGetter = [](const QString& attr) {
        return [attr](const DimStyle& style) -> QVariant { return style.arrowName(attr); };
    };
    auto arrowSetter = [](const QString& attr) {
        return [attr](DimStyle& style, const QVariant& value) {
            style.setArrow(attr, value.toString());
        };
    };
    // Without a stored handle the caller's default applies
    auto linetypeGetter = [](const QString& handleAttr) {
        return [handleAttr](const DimStyle& style) -> QVariant {
            if (!style.supports(handleAttr) || !style.has(handleAttr)) {
                return QVariant();
            }
            return style.linetypeName(handleAttr);
        };
    };
    auto linetypeSetter = [](const QString& handleAttr) {
        return [handleAttr](DimStyle& style, const QVariant& value) {
            style.setLinetypeHandle(handleAttr, value.toString());
        };
    };

    addPlain("name", 2, S, QStringLiteral("Standard"));
    addPlain("flags", 70, I, 0);
    addPlain("dimpost", 3, S, QString());
    addPlain("dimapost", 4, S, QString());

    // R12 stores arrow names directly in 5/6/7, later versions use handles
    addCallback("dimblk", 5, arrowGetter("dimblk"), arrowSetter("dimblk"), QString());
    addCallback("dimblk1", 6, arrowGetter("dimblk1"), arrowSetter("dimblk1"), QString());
    addCallback("dimblk2", 7, arrowGetter("dimblk2"), arrowSetter("dimblk2"), QString());

    addPlain("dimscale", 40, D, 1.0);
    addPlain("dimasz", 41, D, 2.5);
    addPlain("dimexo", 42, D, 0.625);
    addPlain("dimdli", 43, D, 3.75);
    addPlain("dimexe", 44, D, 1.25);
    addPlain("dimrnd", 45, D, 0.0);
    addPlain("dimdle", 46, D, 0.0);
    addPlain("dimtp", 47, D, 0.0);
    addPlain("dimtm", 48, D, 0.0);
    addPlain("dimfxl", 49, D, 2.5, R2007);     // length of fixed extension lines
    addPlain("dimtxt", 140, D, 2.5);
    addPlain("dimcen", 141, D, 2.5);
    addPlain("dimtsz", 142, D, 0.0);
    addPlain("dimaltf", 143, D, 0.03937007874);
    addPlain("dimlfac", 144, D, 1.0);
    addPlain("dimtvp", 145, D, 0.0);
    addPlain("dimtfac", 146, D, 1.0, R2000);
    addPlain("dimgap", 147, D, 0.625);
    addPlain("dimaltrnd", 148, D, 0.0, R2000);
    addPlain("dimtfill", 69, I, 0, R2007);     // 0 = none, 1 = canvas, 2 = dimtfillclr
    addPlain("dimtfillclr", 70, I, 0, R2007);
    addPlain("dimtol", 71, I, 0);
    addPlain("dimlim", 72, I, 0);
    addPlain("dimtih", 73, I, 0);
    addPlain("dimtoh", 74, I, 0);
    addPlain("dimse1", 75, I, 0);
    addPlain("dimse2", 76, I, 0);
    addPlain("dimtad", 77, I, 1);
    addPlain("dimzin", 78, I, 8);
    addPlain("dimazin", 79, I, 8, R2000);
    addPlain("dimalt", 170, I, 0);
    addPlain("dimaltd", 171, I, 3);
    addPlain("dimtofl", 172, I, 1);
    addPlain("dimsah", 173, I, 0);
    addPlain("dimtix", 174, I, 0);
    addPlain("dimsoxd", 175, I, 0);
    addPlain("dimclrd", 176, I, 0);
    addPlain("dimclre", 177, I, 0);
    addPlain("dimclrt", 178, I, 0);
    addPlain("dimadec", 179, I, 0, R2000);
    addPlain("dimunit", 270, I);               // obsolete
    addPlain("dimdec", 271, I, 0, R2000);
    addPlain("dimtdec", 272, I, 2, R2000);
    addPlain("dimaltu", 273, I, 2, R2000);
    addPlain("dimalttd", 274, I, 3, R2000);
    addPlain("dimaunit", 275, I, 0, R2000);
    addPlain("dimfrac", 276, I, 0, R2000);
    addPlain("dimlunit", 277, I, 2, R2000);
    addPlain("dimdsep", 278, I, 44, R2000);    // character code
    addPlain("dimtmove", 279, I, 0, R2000);
    addPlain("dimjust", 280, I, 0, R2000);
    addPlain("dimsd1", 281, I, 0, R2000);
    addPlain("dimsd2", 282, I, 0, R2000);
    addPlain("dimtolj", 283, I, 0, R2000);
    addPlain("dimtzin", 284, I, 8, R2000);
    addPlain("dimaltz", 285, I, 0, R2000);
    addPlain("dimalttz", 286, I, 0, R2000);
    addPlain("dimfit", 287, I);                // obsolete, see dimatfit and dimtmove
    addPlain("dimupt", 288, I, 0, R2000);
    addPlain("dimatfit", 289, I, 3, R2000);
    addPlain("dimfxlon", 290, I, 0, R2007);    // 1 = fixed length extension lines

    addPlain("dimtxsty_handle", 340, H, QVariant(), R2000);
    // Without a stored handle (DXF R12) the caller's default applies
    addCallback("dimtxsty", VIRTUAL_TAG,
                [](const DimStyle& style) -> QVariant {
                    if (!style.supports(QStringLiteral("dimtxsty_handle"))) {
                        return QVariant();
                    }
                    return style.textStyle();
                },
                [](DimStyle& style, const QVariant& value) { style.setTextStyle(value.toString()); },
                QStringLiteral("Standard"));
    addCallback("dimldrblk", VIRTUAL_TAG, arrowGetter("dimldrblk"), arrowSetter("dimldrblk"));
    addPlain("dimldrblk_handle", 341, H, QVariant(), R2000);
    addPlain("dimblk_handle", 342, H, QVariant(), R2000);
    addPlain("dimblk1_handle", 343, H, QVariant(), R2000);
    addPlain("dimblk2_handle", 344, H, QVariant(), R2000);

    addPlain("dimltype_handle", 345, H, QVariant(), R2007);
    addCallback("dimltype", VIRTUAL_TAG, linetypeGetter("dimltype_handle"),
                linetypeSetter("dimltype_handle"), QStringLiteral("BYBLOCK"), R2007);
    addPlain("dimltex1_handle", 346, H, QVariant(), R2007);
    addCallback("dimltex1", VIRTUAL_TAG, linetypeGetter("dimltex1_handle"),
                linetypeSetter("dimltex1_handle"), QStringLiteral("BYBLOCK"), R2007);
    addPlain("dimltex2_handle", 347, H, QVariant(), R2007);
    addCallback("dimltex2", VIRTUAL_TAG, linetypeGetter("dimltex2_handle"),
                linetypeSetter("dimltex2_handle"), QStringLiteral("BYBLOCK"), R2007);

    addPlain("dimlwd", 371, I, LINEWEIGHT_BYBLOCK, R2000);
    addPlain("dimlwe", 372, I, LINEWEIGHT_BYBLOCK, R2000);

    // Group code lookup for loading: only dim* fields, which drops the
    // duplicate code 70 of "flags"
    for (int i = 0; i < m_fields.size(); ++i) {
        const StyleField& f = m_fields[i];
        if (f.code != VIRTUAL_TAG && f.name.startsWith(QLatin1String("dim"))) {
            m_codeIndex.insert(f.code, i);
        }
    }

    // Export order is the order DXF readers expect
    m_exportR2007 = QStringList{
        "name", "flags", "dimscale", "dimasz", "dimexo", "dimdli", "dimexe", "dimrnd",
        "dimdle", "dimtp", "dimtm", "dimfxl", "dimtxt", "dimcen", "dimtsz", "dimaltf",
        "dimlfac", "dimtvp", "dimtfac", "dimgap", "dimaltrnd", "dimtfill", "dimtfillclr",
        "dimtol", "dimlim", "dimtih", "dimtoh", "dimse1", "dimse2", "dimtad", "dimzin",
        "dimazin", "dimalt", "dimaltd", "dimtofl", "dimsah", "dimtix", "dimsoxd",
        "dimclrd", "dimclre", "dimclrt", "dimadec", "dimdec", "dimtdec", "dimaltu",
        "dimalttd", "dimaunit", "dimfrac", "dimlunit", "dimdsep", "dimtmove", "dimjust",
        "dimsd1", "dimsd2", "dimtolj", "dimtzin", "dimaltz", "dimalttz", "dimupt",
        "dimatfit", "dimfxlon", "dimtxsty_handle", "dimldrblk_handle", "dimblk_handle",
        "dimblk1_handle", "dimblk2_handle", "dimltype_handle", "dimltex1_handle",
        "dimltex2_handle", "dimlwd", "dimlwe"};

    m_exportR2000 = QStringList{
        "name", "flags", "dimpost", "dimapost", "dimscale", "dimasz", "dimexo", "dimdli",
        "dimexe", "dimrnd", "dimdle", "dimtp", "dimtm", "dimtxt", "dimcen", "dimtsz",
        "dimaltf", "dimlfac", "dimtvp", "dimtfac", "dimgap", "dimaltrnd", "dimtol",
        "dimlim", "dimtih", "dimtoh", "dimse1", "dimse2", "dimtad", "dimzin", "dimazin",
        "dimalt", "dimaltd", "dimtofl", "dimsah", "dimtix", "dimsoxd", "dimclrd",
        "dimclre", "dimclrt", "dimadec", "dimdec", "dimtdec", "dimaltu", "dimalttd",
        "dimaunit", "dimfrac", "dimlunit", "dimdsep", "dimtmove", "dimjust", "dimsd1",
        "dimsd2", "dimtolj", "dimtzin", "dimaltz", "dimalttz", "dimupt", "dimatfit",
        "dimtxsty_handle", "dimldrblk_handle", "dimblk_handle", "dimblk1_handle",
        "dimblk2_handle", "dimlwd", "dimlwe"};

    m_exportR12 = QStringList{
        "name", "flags", "dimpost", "dimapost", "dimblk", "dimblk1", "dimblk2",
        "dimscale", "dimasz", "dimexo", "dimdli", "dimexe", "dimrnd", "dimdle", "dimtp",
        "dimtm", "dimtxt", "dimcen", "dimtsz", "dimaltf", "dimlfac", "dimtvp", "dimtfac",
        "dimgap", "dimtol", "dimlim", "dimtih", "dimtoh", "dimse1", "dimse2", "dimtad",
        "dimzin", "dimalt", "dimaltd", "dimtofl", "dimsah", "dimtix", "dimsoxd",
        "dimclrd", "dimclre", "dimclrt"};
}

const StyleField* StyleSchema::find(const QString& name) const
{
    auto it = m_index.constFind(name);
    if (it == m_index.constEnd()) {
        return nullptr;
    }
    return &m_fields[it.value()];
}

const StyleField& StyleSchema::field(const QString& name) const
{
    const StyleField* f = find(name);
    if (!f) {
        throw SchemaError(QStringLiteral("Invalid DXF attribute \"%1\" for DIMSTYLE.").arg(name));
    }
    return *f;
}

const StyleField* StyleSchema::findByCode(int code) const
{
    auto it = m_codeIndex.constFind(code);
    if (it == m_codeIndex.constEnd()) {
        return nullptr;
    }
    return &m_fields[it.value()];
}

bool StyleSchema::supports(const QString& name, DxfVersion version) const
{
    const StyleField* f = find(name);
    return f && f->isSupported(version);
}

const QStringList& StyleSchema::exportFields(DxfVersion version) const
{
    if (version == DxfVersion::R12) {
        return m_exportR12;
    }
    if (version < DxfVersion::R2007) {
        return m_exportR2000;
    }
    return m_exportR2007;
}

}  // namespace dxfdim
