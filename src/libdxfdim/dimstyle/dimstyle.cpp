// =====================================================================
//  src/libdxfdim/dimstyle/dimstyle.cpp — DIMSTYLE table entry
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/render/arrows.h>

namespace dxfdim {

namespace {

QString versionGapMessage(const QString& name, DxfVersion required)
{
    return QStringLiteral("DIMSTYLE attribute \"%1\" requires DXF version %2 or later.")
        .arg(name, acadVersionString(required));
}

int zeroSuppression(std::optional<bool> leadingZeros, std::optional<bool> trailingZeros)
{
    int flags = 0;
    if (leadingZeros == false) {
        flags = DIMZIN_SUPPRESSES_LEADING_ZEROS;
    }
    if (trailingZeros == false) {
        flags += DIMZIN_SUPPRESSES_TRAILING_ZEROS;
    }
    return flags;
}

}  // anonymous namespace

DimStyle::DimStyle(Document& doc, const QString& handle, const QString& name)
    : m_doc(&doc)
    , m_handle(handle)
{
    m_values.insert(QStringLiteral("name"), name);
    m_values.insert(QStringLiteral("flags"), 0);
}

QString DimStyle::name() const
{
    return m_values.value(QStringLiteral("name")).toString();
}

DxfVersion DimStyle::dxfVersion() const
{
    return m_doc->dxfVersion();
}

// ---- Attribute access -----------------------------------------------

QVariant DimStyle::get(const QString& name, const QVariant& defaultValue) const
{
    const StyleField& f = schema().field(name);
    if (f.isCallback()) {
        QVariant value = f.getter(*this);
        if (value.isValid()) {
            return value;
        }
    } else {
        if (!f.isSupported(dxfVersion())) {
            throw VersionGapError(versionGapMessage(name, f.minVersion));
        }
        auto it = m_values.constFind(name);
        if (it != m_values.constEnd()) {
            return it.value();
        }
    }
    return defaultValue.isValid() ? defaultValue : f.defaultValue;
}

void DimStyle::set(const QString& name, const QVariant& value)
{
    const StyleField& f = schema().field(name);
    if (f.isCallback()) {
        f.setter(*this, value);
        return;
    }
    if (!f.isSupported(dxfVersion())) {
        throw VersionGapError(versionGapMessage(name, f.minVersion));
    }
    const QVariant coerced = f.coerce(value);
    if (name == QLatin1String("name")) {
        rename(coerced.toString());
        return;
    }
    m_values.insert(name, coerced);
}

void DimStyle::rename(const QString& newName)
{
    m_doc->renameDimStyle(this->name(), newName);
    m_values.insert(QStringLiteral("name"), newName);
}

bool DimStyle::has(const QString& name) const
{
    return m_values.contains(name);
}

void DimStyle::discard(const QString& name)
{
    m_values.remove(name);
}

bool DimStyle::supports(const QString& name) const
{
    return schema().supports(name, dxfVersion());
}

void DimStyle::setIfSupported(const QString& name, const QVariant& value)
{
    if (supports(name)) {
        set(name, value);
    } else {
        qCDebug(lcDimStyle) << "DIMSTYLE" << this->name() << ": skipping" << name
                            << "for DXF" << acadVersionString(dxfVersion());
    }
}

// ---- Callback attributes --------------------------------------------

QString DimStyle::arrowName(const QString& attr) const
{
    const QString handleAttr = attr + QStringLiteral("_handle");
    if (!supports(handleAttr)) {
        // DXF R12 stores arrow names instead of block record handles
        return m_values.value(attr).toString();
    }

    const QString handle = m_values.value(handleAttr).toString();
    if (handle.isEmpty() || handle == QLatin1String("0")) {
        return QString(arrows::CLOSED_FILLED);
    }
    try {
        return arrows::arrowName(m_doc->reverse(handle));
    } catch (const NotFoundError& e) {
        qCWarning(lcDimStyle) << "DIMSTYLE" << name() << ":" << e.message();
        return QString(arrows::CLOSED_FILLED);
    }
}

void DimStyle::setArrow(const QString& attr, const QString& arrowName)
{
    const QString handleAttr = attr + QStringLiteral("_handle");
    const bool useHandles = supports(handleAttr);

    if (arrowName == QLatin1String(arrows::CLOSED_FILLED)) {
        // Default arrow, its block is created when first referenced
        discard(useHandles ? handleAttr : attr);
        return;
    }

    QString blockName = arrowName;
    if (arrows::isArrow(arrowName)) {
        blockName = arrows::createBlock(*m_doc, arrowName);
    }
    if (!m_doc->hasBlock(blockName)) {
        throw ValidationError(QStringLiteral("Block \"%1\" does not exist.").arg(arrowName));
    }

    if (useHandles) {
        m_values.insert(handleAttr, m_doc->block(blockName)->blockRecordHandle());
    } else {
        m_values.insert(attr, arrowName);
    }
}

QString DimStyle::textStyle() const
{
    const QString handle = m_values.value(QStringLiteral("dimtxsty_handle")).toString();
    if (handle.isEmpty()) {
        qCWarning(lcDimStyle) << "DIMSTYLE" << name() << ": text style handle not set.";
        return QStringLiteral("Standard");
    }
    try {
        return m_doc->reverse(handle);
    } catch (const NotFoundError&) {
        qCWarning(lcDimStyle) << "DIMSTYLE" << name()
                              << ": invalid text style handle" << handle;
        return QStringLiteral("Standard");
    }
}

void DimStyle::setTextStyle(const QString& name)
{
    set(QStringLiteral("dimtxsty_handle"), m_doc->resolve(TableType::TextStyle, name));
}

QString DimStyle::linetypeName(const QString& handleAttr) const
{
    if (!supports(handleAttr)) {
        qCDebug(lcDimStyle) << "Linetype support for DIMSTYLE requires DXF R2007 or later.";
        return QStringLiteral("BYBLOCK");
    }

    const QString handle = m_values.value(handleAttr).toString();
    if (handle.isEmpty()) {
        qCWarning(lcDimStyle) << "DIMSTYLE" << name() << ":" << handleAttr << "not set.";
        return QStringLiteral("BYBLOCK");
    }
    try {
        return m_doc->reverse(handle);
    } catch (const NotFoundError&) {
        qCWarning(lcDimStyle) << "DIMSTYLE" << name() << ": invalid linetype handle" << handle;
        return QStringLiteral("BYBLOCK");
    }
}

void DimStyle::setLinetypeHandle(const QString& handleAttr, const QString& linetype)
{
    set(handleAttr, m_doc->resolve(TableType::Linetype, linetype));
}

// ---- High-level setters ---------------------------------------------

void DimStyle::setArrows(const QString& blk, const QString& blk1, const QString& blk2)
{
    set(QStringLiteral("dimblk"), blk);
    set(QStringLiteral("dimblk1"), blk1);
    set(QStringLiteral("dimblk2"), blk2);
    set(QStringLiteral("dimtsz"), 0.0);
}

void DimStyle::setTick(double size)
{
    set(QStringLiteral("dimtsz"), size);
}

void DimStyle::setTextAlign(std::optional<HorizontalTextAlign> halign,
                            std::optional<VerticalTextAlign> valign,
                            std::optional<double> vshift)
{
    if (valign) {
        set(QStringLiteral("dimtad"), static_cast<int>(*valign));
        if (*valign == VerticalTextAlign::Center && vshift) {
            set(QStringLiteral("dimtvp"), *vshift);
        }
    }
    if (halign) {
        setIfSupported(QStringLiteral("dimjust"), static_cast<int>(*halign));
    }
}

void DimStyle::setTextFormat(const QString& prefix, const QString& postfix,
                             std::optional<double> rnd, std::optional<int> dec,
                             std::optional<QChar> sep, bool leadingZeros, bool trailingZeros)
{
    if (!prefix.isEmpty() || !postfix.isEmpty()) {
        set(QStringLiteral("dimpost"), prefix + QStringLiteral("<>") + postfix);
    }
    if (rnd) {
        set(QStringLiteral("dimrnd"), *rnd);
    }

    // Decimal units only; feet and inch formats need dimzin set directly
    set(QStringLiteral("dimzin"), zeroSuppression(leadingZeros, trailingZeros));

    if (dec) {
        setIfSupported(QStringLiteral("dimdec"), *dec);
    }
    if (sep) {
        setIfSupported(QStringLiteral("dimdsep"), static_cast<int>(sep->unicode()));
    }
}

void DimStyle::setDimlineFormat(const DimlineFormat& format)
{
    if (format.color) {
        set(QStringLiteral("dimclrd"), *format.color);
    }
    if (format.extension) {
        set(QStringLiteral("dimdle"), *format.extension);
    }
    if (format.lineweight) {
        setIfSupported(QStringLiteral("dimlwd"), *format.lineweight);
    }
    if (format.disable1) {
        setIfSupported(QStringLiteral("dimsd1"), *format.disable1 ? 1 : 0);
    }
    if (format.disable2) {
        setIfSupported(QStringLiteral("dimsd2"), *format.disable2 ? 1 : 0);
    }
    if (format.linetype) {
        setLinetypes(format.linetype);
    }
}

void DimStyle::setExtlineFormat(const ExtlineFormat& format)
{
    if (format.color) {
        set(QStringLiteral("dimclre"), *format.color);
    }
    if (format.extension) {
        set(QStringLiteral("dimexe"), *format.extension);
    }
    if (format.offset) {
        set(QStringLiteral("dimexo"), *format.offset);
    }
    if (format.lineweight) {
        setIfSupported(QStringLiteral("dimlwe"), *format.lineweight);
    }
    if (format.fixedLength) {
        setIfSupported(QStringLiteral("dimfxlon"), 1);
        setIfSupported(QStringLiteral("dimfxl"), *format.fixedLength);
    }
}

void DimStyle::setExtline1(const std::optional<QString>& linetype, bool disable)
{
    if (disable) {
        set(QStringLiteral("dimse1"), 1);
    }
    if (linetype) {
        setLinetypes(std::nullopt, linetype);
    }
}

void DimStyle::setExtline2(const std::optional<QString>& linetype, bool disable)
{
    if (disable) {
        set(QStringLiteral("dimse2"), 1);
    }
    if (linetype) {
        setLinetypes(std::nullopt, std::nullopt, linetype);
    }
}

void DimStyle::setTolerance(double upper, std::optional<double> lower,
                            std::optional<double> hfactor, std::optional<ToleranceAlign> align,
                            std::optional<int> dec, std::optional<bool> leadingZeros,
                            std::optional<bool> trailingZeros)
{
    setToleranceMode(ToleranceMode::Tolerance);
    set(QStringLiteral("dimtp"), upper);
    set(QStringLiteral("dimtm"), lower.value_or(upper));
    if (hfactor) {
        setIfSupported(QStringLiteral("dimtfac"), *hfactor);
    }
    if (leadingZeros || trailingZeros) {
        setIfSupported(QStringLiteral("dimtzin"), zeroSuppression(leadingZeros, trailingZeros));
    }
    if (align) {
        setIfSupported(QStringLiteral("dimtolj"), static_cast<int>(*align));
    }
    if (dec) {
        setIfSupported(QStringLiteral("dimtdec"), *dec);
    }
}

void DimStyle::setLimits(double upper, double lower, double hfactor, std::optional<int> dec,
                         std::optional<bool> leadingZeros, std::optional<bool> trailingZeros)
{
    setToleranceMode(ToleranceMode::Limits);
    set(QStringLiteral("dimtp"), upper);
    set(QStringLiteral("dimtm"), lower);
    setIfSupported(QStringLiteral("dimtfac"), hfactor);
    if (leadingZeros || trailingZeros) {
        setIfSupported(QStringLiteral("dimtzin"), zeroSuppression(leadingZeros, trailingZeros));
    }
    setIfSupported(QStringLiteral("dimtolj"), static_cast<int>(ToleranceAlign::Bottom));
    if (dec) {
        setIfSupported(QStringLiteral("dimtdec"), *dec);
    }
}

ToleranceMode DimStyle::toleranceMode() const
{
    if (get(QStringLiteral("dimtol")).toInt()) {
        return ToleranceMode::Tolerance;
    }
    if (get(QStringLiteral("dimlim")).toInt()) {
        return ToleranceMode::Limits;
    }
    return ToleranceMode::None;
}

void DimStyle::setToleranceMode(ToleranceMode mode)
{
    set(QStringLiteral("dimtol"), mode == ToleranceMode::Tolerance ? 1 : 0);
    set(QStringLiteral("dimlim"), mode == ToleranceMode::Limits ? 1 : 0);
}

void DimStyle::setLinetypes(const std::optional<QString>& dimline,
                            const std::optional<QString>& ext1,
                            const std::optional<QString>& ext2)
{
    if (dxfVersion() < DxfVersion::R2007) {
        qCDebug(lcDimStyle) << "Linetype support requires DXF R2007 or later.";
        return;
    }
    if (dimline) {
        setLinetypeHandle(QStringLiteral("dimltype_handle"), *dimline);
    }
    if (ext1) {
        setLinetypeHandle(QStringLiteral("dimltex1_handle"), *ext1);
    }
    if (ext2) {
        setLinetypeHandle(QStringLiteral("dimltex2_handle"), *ext2);
    }
}

// ---- Persistence ----------------------------------------------------

void DimStyle::loadTags(const QVector<DxfTag>& tags)
{
    const DxfVersion version = dxfVersion();
    bool flagsLoaded = false;

    for (const DxfTag& tag : tags) {
        switch (tag.code) {
        case 0:                     // structure tag "DIMSTYLE"
        case 105:                   // handle
        case SUBCLASS_MARKER:
        case 330:                   // owner
            continue;
        case 2:
            rename(tag.value);
            continue;
        case 70:
            // The first 70 is the table entry flags, a second one dimtfillclr
            if (!flagsLoaded) {
                m_values.insert(QStringLiteral("flags"), tag.value.trimmed().toInt());
                flagsLoaded = true;
                continue;
            }
            break;
        default:
            break;
        }

        const StyleField* f = schema().findByCode(tag.code);
        if (!f) {
            qCDebug(lcDimStyle) << "DIMSTYLE" << name() << ": ignoring group code" << tag.code;
            continue;
        }
        if (f->isCallback()) {
            // Arrow names in group codes 5, 6 and 7 exist in DXF R12 only
            if (!supports(f->name + QStringLiteral("_handle"))) {
                m_values.insert(f->name, tag.value);
            }
            continue;
        }
        if (!f->isSupported(version)) {
            qCDebug(lcDimStyle) << "DIMSTYLE" << name() << ":" << f->name
                                << "not supported by DXF" << acadVersionString(version);
            continue;
        }
        m_values.insert(f->name, f->coerce(tag.value));
    }
}

void DimStyle::exportDxf(TagWriter& writer)
{
    const DxfVersion version = writer.dxfVersion();

    writer.writeTag(0, QStringLiteral("DIMSTYLE"));
    writer.writeTag(105, m_handle);
    if (version > DxfVersion::R12) {
        writer.writeTag(SUBCLASS_MARKER, QStringLiteral("AcDbSymbolTableRecord"));
        writer.writeTag(SUBCLASS_MARKER, QStringLiteral("AcDbDimStyleTableRecord"));

        // Required by AutoCAD
        if (!has(QStringLiteral("dimtxsty_handle"))) {
            m_values.insert(QStringLiteral("dimtxsty_handle"),
                            m_doc->resolve(TableType::TextStyle, QStringLiteral("Standard")));
        }
    }

    for (const QString& name : schema().exportFields(version)) {
        const StyleField& f = schema().field(name);
        if (!f.isCallback() && !f.isSupported(version)) {
            continue;
        }
        QVariant value = f.isCallback() ? f.getter(*this)
                                        : m_values.value(name, f.defaultValue);
        if (!value.isValid()) {
            continue;
        }
        writer.writeTag(f.code, value);
    }
}

QVector<DimAttrib> DimStyle::dimAttribs() const
{
    QVector<DimAttrib> result;
    for (const StyleField& f : schema().fields()) {
        if (f.isCallback() || !f.name.startsWith(QLatin1String("dim"))) {
            continue;
        }
        auto it = m_values.constFind(f.name);
        if (it != m_values.constEnd()) {
            result.append(DimAttrib{f.name, f.code, it.value()});
        }
    }
    return result;
}

void DimStyle::copyToHeader(Document& doc) const
{
    QVariantHash& header = doc.header();
    header.insert(QStringLiteral("$DIMSTYLE"), name());
    for (const DimAttrib& attrib : dimAttribs()) {
        if (attrib.name.endsWith(QLatin1String("_handle"))) {
            qCDebug(lcDimStyle) << "Unsupported header variable: $" + attrib.name.toUpper();
            continue;
        }
        header.insert(QLatin1Char('$') + attrib.name.toUpper(), attrib.value);
    }
}

}  // namespace dxfdim
