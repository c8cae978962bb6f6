// =====================================================================
//  src/libdxfdim/render/dimension_renderer.cpp — DIMENSION geometry
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/render/dimension_renderer.h>
#include <dxfdim/render/arrows.h>
#include <dxfdim/render/textformat.h>
#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/block.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/geometry/intersections.h>
#include <dxfdim/geometry/utils.h>

#include <QtMath>

namespace dxfdim {
namespace render {

namespace {

// dimdsep is a character code in a DIMSTYLE but overrides may also
// give the separator as text
QChar decimalSeparator(const QVariant& value)
{
    const int typeId = value.typeId();
    if (typeId == QMetaType::QString || typeId == QMetaType::QChar) {
        const QString text = value.toString();
        return text.isEmpty() ? QLatin1Char('.') : text.at(0);
    }
    bool ok = false;
    const int code = value.toInt(&ok);
    if (!ok || code <= 0) {
        return QLatin1Char('.');
    }
    return QChar(code);
}

std::optional<QString> optionalName(const QVariant& value)
{
    if (!value.isValid()) {
        return QString(arrows::CLOSED_FILLED);
    }
    return value.toString();
}

QString typeName(int dimType)
{
    switch (dimType) {
    case DIM_ANGULAR:   return QStringLiteral("Angular");
    case DIM_DIAMETER:  return QStringLiteral("Diameter");
    case DIM_RADIUS:    return QStringLiteral("Radius");
    case DIM_ANGULAR_3P: return QStringLiteral("Angular 3P");
    case DIM_ORDINATE:  return QStringLiteral("Ordinate");
    default:            return QStringLiteral("Type %1").arg(dimType);
    }
}

}  // anonymous namespace

// =====================================================================
//  DimensionBase
// =====================================================================

DimensionBase::DimensionBase(Dimension& dimension, const DimStyle& dimStyle,
                             BlockLayout& block, const geometry::UCS* ucs,
                             const QVariantHash& overrides, const RenderOptions& options)
    : m_dimension(dimension)
    , m_block(block)
    , m_ucs(ucs ? *ucs : geometry::UCS())
    , m_dimStyle(dimStyle, overrides)
{
    m_requiresExtrusion = !m_ucs.isWorldZ();
    if (m_requiresExtrusion) {
        m_dimension.data().extrusion = m_ucs.uz();
    }

    m_textStyle = m_dimStyle.get(QStringLiteral("dimtxsty"), options.defaultTextStyle).toString();

    // Overrides become part of the entity
    m_dimStyle.commit(m_dimension);
}

double DimensionBase::textHeight() const
{
    return m_dimStyle.get(QStringLiteral("dimtxt"), 1.0).toDouble();
}

bool DimensionBase::suppressExtensionLine1() const
{
    return m_dimStyle.get(QStringLiteral("dimse1"), 0).toInt() != 0;
}

bool DimensionBase::suppressExtensionLine2() const
{
    return m_dimStyle.get(QStringLiteral("dimse2"), 0).toInt() != 0;
}

EntityAttribs DimensionBase::defaultAttributes() const
{
    EntityAttribs attribs;
    attribs.layer = m_dimension.data().layer;
    attribs.color = m_dimension.data().color;
    return attribs;
}

gp_Pnt DimensionBase::wcs(const QPointF& point) const
{
    return m_ucs.toWcs(geometry::toPnt(point));
}

gp_Pnt DimensionBase::wcs(const gp_Pnt& point) const
{
    return m_ucs.toWcs(point);
}

gp_Pnt DimensionBase::ocs(const QPointF& point) const
{
    return m_ucs.toOcs(geometry::toPnt(point));
}

gp_Pnt DimensionBase::ocs(const gp_Pnt& point) const
{
    return m_ucs.toOcs(point);
}

int DimensionBase::styleColor(const QString& name) const
{
    return m_dimStyle.get(name, m_dimension.data().color).toInt();
}

QString DimensionBase::getText(double measurement) const
{
    const QString text = m_dimension.data().text;
    if (text == QLatin1String(" ")) {
        return QString();
    }
    if (text.isEmpty() || text == QLatin1String("<>")) {
        return formatText(measurement);
    }
    return text;
}

QString DimensionBase::formatText(double value) const
{
    const QVariant rnd = m_dimStyle.get(QStringLiteral("dimrnd"));
    const QVariant dec = m_dimStyle.get(QStringLiteral("dimdec"));
    const int dimzin = m_dimStyle.get(QStringLiteral("dimzin"), 0).toInt();
    const QChar dimdsep = decimalSeparator(m_dimStyle.get(QStringLiteral("dimdsep"), QStringLiteral(".")));
    const QString dimpost = m_dimStyle.get(QStringLiteral("dimpost"), QStringLiteral("<>")).toString();

    std::optional<double> dimrnd;
    if (rnd.isValid()) {
        dimrnd = rnd.toDouble();
    }
    std::optional<int> dimdec;
    if (dec.isValid()) {
        dimdec = dec.toInt();
    }
    return render::formatText(value, dimrnd, dimdec, dimzin, dimdsep, dimpost);
}

std::pair<std::optional<QString>, std::optional<QString>> DimensionBase::getArrowNames() const
{
    if (m_dimStyle.get(QStringLiteral("dimtsz"), 0.0).toDouble() != 0.0) {
        return {std::nullopt, std::nullopt};
    }
    if (m_dimStyle.get(QStringLiteral("dimsah"), 0).toInt() != 0) {
        return {optionalName(m_dimStyle.get(QStringLiteral("dimblk1"))),
                optionalName(m_dimStyle.get(QStringLiteral("dimblk2")))};
    }
    const std::optional<QString> blk = optionalName(m_dimStyle.get(QStringLiteral("dimblk")));
    return {blk, blk};
}

void DimensionBase::addLine(const QPointF& start, const QPointF& end, int color)
{
    EntityAttribs attribs = defaultAttributes();
    attribs.color = color;
    m_block.addLine(wcs(start), wcs(end), attribs);
}

QPointF DimensionBase::addBlockRef(const QString& name, const QPointF& insert, double rotation,
                                   double scale, bool reverse, int color)
{
    EntityAttribs attribs = defaultAttributes();
    attribs.color = color;
    if (m_requiresExtrusion) {
        attribs.extrusion = m_ucs.uz();
    }

    if (arrows::isArrow(name)) {
        if (reverse) {
            rotation += 180.0;
        }
        const QString blockName = arrows::createBlock(*m_block.document(), name);
        m_block.addBlockRef(blockName, ocs(insert), rotation, scale, scale, attribs);
        return arrows::connectionPoint(name, insert, scale, rotation);
    }

    // User defined block, addBlockRef() rejects undefined names
    m_block.addBlockRef(name, ocs(insert), rotation, scale, scale, attribs);
    return insert;
}

void DimensionBase::addText(const QString& text, const QPointF& pos, double rotation, int color)
{
    EntityAttribs attribs = defaultAttributes();
    attribs.color = color;
    if (m_requiresExtrusion) {
        attribs.extrusion = m_ucs.uz();
    }
    m_block.addText(text, ocs(pos), textHeight(), rotation, m_textStyle,
                    TextAlign::MiddleCenter, attribs);
}

void DimensionBase::addDefpoints(const QVector<gp_Pnt>& points)
{
    EntityAttribs attribs;
    attribs.layer = QStringLiteral("DEFPOINTS");
    for (const gp_Pnt& point : points) {
        m_block.addPoint(wcs(point), attribs);
    }
}

// =====================================================================
//  LinearDimension
// =====================================================================

void LinearDimension::render()
{
    DimensionData& data = m_dimension.data();
    const QPointF defpoint = geometry::toPointF(data.defpoint);
    const QPointF defpoint2 = geometry::toPointF(data.defpoint2);
    const QPointF defpoint3 = geometry::toPointF(data.defpoint3);
    const double angleRad = qDegreesToRadians(data.angle);

    // Dimension line and extension lines as infinite rays
    const geometry::Ray2D dimlineRay = geometry::Ray2D::fromAngle(defpoint, angleRad);
    const geometry::Ray2D extRay1 = geometry::Ray2D::fromAngle(defpoint2, angleRad + M_PI_2);
    const geometry::Ray2D extRay2 = geometry::Ray2D::fromAngle(defpoint3, angleRad + M_PI_2);

    const geometry::LineLineIntersection hit1 = geometry::rayIntersection(dimlineRay, extRay1);
    const geometry::LineLineIntersection hit2 = geometry::rayIntersection(dimlineRay, extRay2);
    if (!hit1.intersects || !hit2.intersects) {
        throw ValidationError(QStringLiteral("Degenerated linear dimension %1.")
                                  .arg(m_dimension.handle()));
    }
    const QPointF start = hit1.point;
    const QPointF end = hit2.point;

    // Dimension line location
    data.defpoint = geometry::toPnt(start, data.defpoint.Z());

    const double dimlfac = m_dimStyle.get(QStringLiteral("dimlfac"), 1.0).toDouble();
    const double measurement = geometry::length(start - end) * dimlfac;
    const QString text = getText(measurement);

    if (!text.isEmpty()) {
        QPointF pos;
        if (data.textMidpoint) {
            pos = geometry::toPointF(*data.textMidpoint);
        } else {
            pos = textMidpoint(start, end);
            data.textMidpoint = geometry::toPnt(pos);
        }
        addMeasurementText(text, pos);
    }

    if (!suppressExtensionLine1()) {
        addExtensionLine(defpoint2, start);
    }
    if (!suppressExtensionLine2()) {
        addExtensionLine(defpoint3, end);
    }

    const auto names = getArrowNames();
    const auto connections = addArrows(start, end, names.first, names.second);
    addDimensionLine(connections.first, connections.second, names.first, names.second);

    addDefpoints({data.defpoint, data.defpoint2, data.defpoint3});
    defpointsToWcs();
    qCDebug(lcRender) << "rendered linear dimension" << m_dimension.handle()
                      << "into" << m_block.name();
}

QPointF LinearDimension::textMidpoint(const QPointF& start, const QPointF& end) const
{
    double dist = textHeight() / 2.0 + m_dimStyle.get(QStringLiteral("dimgap"), 0.625).toDouble();
    const int tad = m_dimStyle.get(QStringLiteral("dimtad"), 1).toInt();
    if (tad == static_cast<int>(VerticalTextAlign::Center)) {
        dist = 0.0;
    } else if (tad == static_cast<int>(VerticalTextAlign::Below)) {
        dist = -dist;
    }

    const QPointF direction = end - start;
    QPointF offset;
    if (dist != 0.0 && geometry::length(direction) > 0.0) {
        offset = geometry::normalize(geometry::perpendicular(direction), dist);
    }
    return geometry::lerp(start, end) + offset;
}

void LinearDimension::addMeasurementText(const QString& text, const QPointF& pos)
{
    const DimensionData& data = m_dimension.data();
    addText(text, pos, data.angle + data.textRotation, styleColor(QStringLiteral("dimclrt")));
}

void LinearDimension::addExtensionLine(const QPointF& start, const QPointF& end)
{
    const QPointF direction = end - start;
    if (geometry::length(direction) <= 0.0) {
        // Measurement point on the dimension line
        return;
    }
    const QPointF unit = geometry::normalize(direction);
    const double dimexo = m_dimStyle.get(QStringLiteral("dimexo"), 0.625).toDouble();
    const double dimexe = m_dimStyle.get(QStringLiteral("dimexe"), 1.25).toDouble();
    addLine(start + unit * dimexo, end + unit * dimexe, styleColor(QStringLiteral("dimclre")));
}

std::pair<QPointF, QPointF> LinearDimension::addArrows(const QPointF& start, const QPointF& end,
                                                       const std::optional<QString>& blk1,
                                                       const std::optional<QString>& blk2)
{
    const int color = styleColor(QStringLiteral("dimclrd"));
    const double rotation = m_dimension.data().angle;
    const double dimtsz = m_dimStyle.get(QStringLiteral("dimtsz"), 0.0).toDouble();

    if (dimtsz > 0.0) {
        for (const QPointF& location : {start, end}) {
            const arrows::ArrowShape tick =
                arrows::arrowShape(QString(arrows::OBLIQUE), location, dimtsz * 2.0, rotation);
            for (const QLineF& line : tick.lines) {
                addLine(line.p1(), line.p2(), color);
            }
        }
        return {start, end};
    }

    const double scale = m_dimStyle.get(QStringLiteral("dimasz"), 2.5).toDouble();
    QPointF first = start;
    QPointF second = end;
    if (blk1) {
        first = addBlockRef(*blk1, start, rotation, scale, true, color);
    }
    if (blk2) {
        second = addBlockRef(*blk2, end, rotation, scale, false, color);
    }
    return {first, second};
}

void LinearDimension::addDimensionLine(QPointF start, QPointF end,
                                       const std::optional<QString>& blk1,
                                       const std::optional<QString>& blk2)
{
    const double dimdle = m_dimStyle.get(QStringLiteral("dimdle"), 0.0).toDouble();
    const QPointF direction = end - start;
    if (dimdle != 0.0 && geometry::length(direction) > 0.0) {
        const QPointF extension = geometry::normalize(direction) * dimdle;
        if (!blk1 || arrows::hasExtensionLine(*blk1)) {
            start -= extension;
        }
        if (!blk2 || arrows::hasExtensionLine(*blk2)) {
            end += extension;
        }
    }
    addLine(start, end, styleColor(QStringLiteral("dimclrd")));
}

void LinearDimension::defpointsToWcs()
{
    DimensionData& data = m_dimension.data();
    data.defpoint = wcs(data.defpoint);
    data.defpoint2 = wcs(data.defpoint2);
    data.defpoint3 = wcs(data.defpoint3);
    if (data.textMidpoint) {
        data.textMidpoint = ocs(*data.textMidpoint);
    }
}

// =====================================================================
//  DimensionRenderer
// =====================================================================

bool DimensionRenderer::isSupported(int dimType)
{
    return dimType == DIM_LINEAR || dimType == DIM_ALIGNED;
}

void DimensionRenderer::dispatch(Dimension& dimension, const geometry::UCS* ucs,
                                 const RenderOptions& options)
{
    const int dimType = dimension.dimType();
    if (dimType > DIM_ORDINATE) {
        throw ValidationError(QStringLiteral("Unknown DIMENSION type: %1").arg(dimType));
    }
    if (!isSupported(dimType)) {
        throw UnsupportedDimensionTypeError(
            QStringLiteral("%1 dimension rendering is not implemented.").arg(typeName(dimType)));
    }

    const DimStyle* dimStyle = dimension.dimStyle();
    Document* doc = dimension.document();
    BlockLayout* block = doc->newAnonymousBlock(QLatin1Char('D'));
    const QString blockName = block->name();

    // A failed render leaves neither a partial block nor moved defpoints
    const DimensionData saved = dimension.data();
    try {
        linear(dimension, *dimStyle, *block, ucs, options);
    } catch (...) {
        dimension.data() = saved;
        doc->deleteBlock(blockName);
        throw;
    }
    dimension.data().geometry = blockName;
}

void DimensionRenderer::linear(Dimension& dimension, const DimStyle& dimStyle, BlockLayout& block,
                               const geometry::UCS* ucs, const RenderOptions& options)
{
    LinearDimension renderer(dimension, dimStyle, block, ucs, dimension.overrides(), options);
    renderer.render();
}

}  // namespace render
}  // namespace dxfdim
