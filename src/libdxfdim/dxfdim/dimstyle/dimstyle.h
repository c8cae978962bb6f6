// =====================================================================
//  src/libdxfdim/dxfdim/dimstyle/dimstyle.h — DIMSTYLE table entry
// =====================================================================
//
//  A named dimension style.  Attribute values are kept by name and
//  checked against the StyleSchema: unknown names raise SchemaError,
//  names the document's DXF version does not store raise
//  VersionGapError.
//
//  Arrow, text style and linetype attributes are callback fields.  The
//  record stores the handle of the referenced table entry and
//  translates to and from names through the owning Document.
//
//  Usage:
//    DimStyle* style = doc.newDimStyle("ARCH");
//    style->setArrows(arrows::ARCHITECTURAL_TICK);
//    style->setTextFormat(QString(), " mm", std::nullopt, 2);
//    style->set("dimtxt", 0.35);
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DIMSTYLE_DIMSTYLE_H
#define DXFDIM_DIMSTYLE_DIMSTYLE_H

#include "schema.h"
#include "../core.h"
#include "../dxf/tags.h"
#include "../dxf/version.h"

#include <QChar>
#include <QHash>
#include <QString>
#include <QVariant>
#include <QVector>

#include <optional>

namespace dxfdim {

class Document;

// =====================================================================
//  Enumerations
// =====================================================================

/// Horizontal text placement (dimjust)
enum class HorizontalTextAlign {
    Center = 0,
    Left = 1,       ///< Next to extension line 1
    Right = 2,      ///< Next to extension line 2
    Above1 = 3,     ///< Above and aligned with extension line 1
    Above2 = 4      ///< Above and aligned with extension line 2
};

/// Vertical text placement (dimtad)
enum class VerticalTextAlign {
    Center = 0,
    Above = 1,
    Below = 4
};

/// Alignment of tolerance text (dimtolj)
enum class ToleranceAlign {
    Bottom = 0,
    Middle = 1,
    Top = 2
};

/// Tolerance display, stored as the dimtol/dimlim pair
enum class ToleranceMode {
    None,
    Tolerance,      ///< dimtol = 1, dimlim = 0
    Limits          ///< dimtol = 0, dimlim = 1
};

// =====================================================================
//  Setter parameter sets
// =====================================================================

/// Dimension line properties; unset members are left unchanged
struct DimlineFormat {
    std::optional<int> color;
    std::optional<QString> linetype;        ///< DXF R2007+
    std::optional<int> lineweight;          ///< 1/100 mm, DXF R2000+
    std::optional<double> extension;        ///< Extension past ticks
    std::optional<bool> disable1;           ///< Suppress first half, DXF R2000+
    std::optional<bool> disable2;           ///< Suppress second half, DXF R2000+
};

/// Extension line properties; unset members are left unchanged
struct ExtlineFormat {
    std::optional<int> color;
    std::optional<int> lineweight;          ///< 1/100 mm, DXF R2000+
    std::optional<double> extension;        ///< Length above the dimension line
    std::optional<double> offset;           ///< Gap to the measurement point
    std::optional<double> fixedLength;      ///< Fixed length below the dimension line
};

/// A stored dim* attribute
struct DimAttrib {
    QString name;
    int code = 0;
    QVariant value;
};

// =====================================================================
//  DimStyle
// =====================================================================

class DXFDIM_EXPORT DimStyle {
public:
    /// A style is always an entry of doc's DIMSTYLE table
    DimStyle(Document& doc, const QString& handle, const QString& name);

    QString handle() const { return m_handle; }
    QString name() const;
    Document* document() const { return m_doc; }
    DxfVersion dxfVersion() const;

    const StyleSchema& schema() const { return StyleSchema::instance(); }

    // ---- Attribute access -------------------------------------------

    /// Value of an attribute.  Unset attributes return defaultValue if
    /// valid, else the schema default.
    /// Throws SchemaError for unknown names, VersionGapError for plain
    /// attributes the document version does not store.
    QVariant get(const QString& name, const QVariant& defaultValue = QVariant()) const;

    /// Set an attribute, converting the value to the field type.
    /// Setting "name" renames the table entry.
    /// Throws SchemaError, VersionGapError, ValidationError for a name
    /// taken by another style, or the errors of the callback setter.
    void set(const QString& name, const QVariant& value);

    /// True if a value is stored for the attribute
    bool has(const QString& name) const;

    /// Remove a stored value
    void discard(const QString& name);

    /// True if the document version stores this attribute
    bool supports(const QString& name) const;

    // ---- Callback attributes ----------------------------------------

    /// Arrow name of dimblk, dimblk1, dimblk2 or dimldrblk.
    /// "" (closed filled) if unset.
    QString arrowName(const QString& attr) const;

    /// Set dimblk, dimblk1, dimblk2 or dimldrblk by arrow or block name.
    /// Built-in arrows get their block created on demand.
    /// Throws ValidationError if a block name does not exist.
    void setArrow(const QString& attr, const QString& arrowName);

    /// Name of the text style, "Standard" if unset or dangling
    QString textStyle() const;

    /// Throws NotFoundError if the text style does not exist
    void setTextStyle(const QString& name);

    /// Name of the linetype referenced by a dim*_handle attribute,
    /// "BYBLOCK" if unset or dangling.  Reading dimltype, dimltex1 or
    /// dimltex2 through get() yields the caller default for an unset
    /// handle instead.
    QString linetypeName(const QString& handleAttr) const;

    /// Throws NotFoundError if the linetype does not exist
    void setLinetypeHandle(const QString& handleAttr, const QString& linetype);

    // ---- High-level setters -----------------------------------------
    //
    // Attributes the document version does not store are skipped.

    /// Set arrows by block or arrow names and disable ticks.
    /// blk is used for both ends unless dimsah = 1, which selects
    /// blk1 and blk2.
    void setArrows(const QString& blk = QString(), const QString& blk1 = QString(),
                   const QString& blk2 = QString());

    /// Use oblique strokes of the given size instead of arrows
    void setTick(double size = 1.0);

    /// Text placement.  vshift applies to vertically centered text only.
    void setTextAlign(std::optional<HorizontalTextAlign> halign = std::nullopt,
                      std::optional<VerticalTextAlign> valign = std::nullopt,
                      std::optional<double> vshift = std::nullopt);

    /// Measurement text format
    /// @param prefix Text in front of the measurement
    /// @param postfix Text after the measurement
    /// @param rnd Rounding increment
    /// @param dec Decimal places, DXF R2000+
    /// @param sep Decimal separator, DXF R2000+
    /// @param leadingZeros false to suppress leading zeros
    /// @param trailingZeros false to suppress trailing zeros
    void setTextFormat(const QString& prefix = QString(), const QString& postfix = QString(),
                       std::optional<double> rnd = std::nullopt,
                       std::optional<int> dec = std::nullopt,
                       std::optional<QChar> sep = std::nullopt,
                       bool leadingZeros = true, bool trailingZeros = true);

    void setDimlineFormat(const DimlineFormat& format);
    void setExtlineFormat(const ExtlineFormat& format);

    /// Extension line 1: linetype (DXF R2007+) and suppression
    void setExtline1(const std::optional<QString>& linetype = std::nullopt, bool disable = false);

    /// Extension line 2: linetype (DXF R2007+) and suppression
    void setExtline2(const std::optional<QString>& linetype = std::nullopt, bool disable = false);

    /// Show tolerances; disables limits.
    /// @param lower Defaults to upper
    /// @param hfactor Tolerance text height relative to dimtxt
    void setTolerance(double upper, std::optional<double> lower = std::nullopt,
                      std::optional<double> hfactor = 1.0,
                      std::optional<ToleranceAlign> align = std::nullopt,
                      std::optional<int> dec = std::nullopt,
                      std::optional<bool> leadingZeros = std::nullopt,
                      std::optional<bool> trailingZeros = std::nullopt);

    /// Show limits; disables tolerances and aligns to the bottom
    void setLimits(double upper, double lower, double hfactor = 1.0,
                   std::optional<int> dec = std::nullopt,
                   std::optional<bool> leadingZeros = std::nullopt,
                   std::optional<bool> trailingZeros = std::nullopt);

    ToleranceMode toleranceMode() const;
    void setToleranceMode(ToleranceMode mode);

    /// Linetypes of dimension and extension lines, DXF R2007+ only
    void setLinetypes(const std::optional<QString>& dimline = std::nullopt,
                      const std::optional<QString>& ext1 = std::nullopt,
                      const std::optional<QString>& ext2 = std::nullopt);

    // ---- Persistence ------------------------------------------------

    /// Load attributes from the tags of a DIMSTYLE table entry.
    /// Attributes the document version does not store are skipped.
    void loadTags(const QVector<DxfTag>& tags);

    /// Write the DIMSTYLE table entry for the writer's DXF version
    void exportDxf(TagWriter& writer);

    /// Stored dim* attributes in schema order
    QVector<DimAttrib> dimAttribs() const;

    /// Write $DIMSTYLE and the stored dim* attributes as header variables
    void copyToHeader(Document& doc) const;

private:
    /// Set a plain attribute if the document version stores it
    void setIfSupported(const QString& name, const QVariant& value);

    void rename(const QString& newName);

    Document* m_doc;
    QString m_handle;
    QHash<QString, QVariant> m_values;
};

}  // namespace dxfdim

#endif  // DXFDIM_DIMSTYLE_DIMSTYLE_H
