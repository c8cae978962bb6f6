// =====================================================================
//  src/libdxfdim/document/document.cpp — Document model
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/document/document.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/errors.h>

namespace dxfdim {

namespace {

QString tableName(TableType table)
{
    switch (table) {
    case TableType::Block:     return QStringLiteral("BLOCK_RECORD");
    case TableType::Linetype:  return QStringLiteral("LTYPE");
    case TableType::TextStyle: return QStringLiteral("STYLE");
    case TableType::DimStyle:  return QStringLiteral("DIMSTYLE");
    }
    return QString();
}

// Table entry names are case-insensitive
QString key(const QString& name)
{
    return name.toUpper();
}

}  // anonymous namespace

Document::Document(DxfVersion version)
    : m_version(version)
{
    m_modelspace = std::make_unique<BlockLayout>(
        this, QStringLiteral("*Model_Space"),
        addEntry(TableType::Block, QStringLiteral("*Model_Space")));

    addTextStyle(QStringLiteral("Standard"));
    addLinetype(QStringLiteral("BYBLOCK"));
    addLinetype(QStringLiteral("BYLAYER"));
    addLinetype(QStringLiteral("CONTINUOUS"));
    DimStyle* standard = newDimStyle(QStringLiteral("Standard"));
    if (standard->supports(QStringLiteral("dimtxsty_handle"))) {
        standard->setTextStyle(QStringLiteral("Standard"));
    }

    m_header.insert(QStringLiteral("$ACADVER"), acadVersionString(version));
    m_header.insert(QStringLiteral("$DIMSTYLE"), QStringLiteral("Standard"));
}

Document::~Document() = default;

QString Document::nextHandle()
{
    return QString::number(m_handleSeed++, 16).toUpper();
}

// ---- Name resolution ------------------------------------------------

QHash<QString, QString>& Document::nameIndex(TableType table)
{
    switch (table) {
    case TableType::Block:     return m_blockNames;
    case TableType::Linetype:  return m_linetypeNames;
    case TableType::TextStyle: return m_textStyleNames;
    case TableType::DimStyle:  return m_dimStyleNames;
    }
    return m_blockNames;
}

const QHash<QString, QString>& Document::nameIndex(TableType table) const
{
    return const_cast<Document*>(this)->nameIndex(table);
}

QString Document::addEntry(TableType table, const QString& name)
{
    QString handle = nextHandle();
    m_entityDb.insert(handle, Entry{table, name});
    nameIndex(table).insert(key(name), handle);
    return handle;
}

QString Document::resolve(TableType table, const QString& name) const
{
    const auto& index = nameIndex(table);
    auto it = index.constFind(key(name));
    if (it == index.constEnd()) {
        throw NotFoundError(QStringLiteral("%1 entry \"%2\" does not exist.")
                                .arg(tableName(table), name));
    }
    return it.value();
}

QString Document::reverse(const QString& handle) const
{
    auto it = m_entityDb.constFind(handle.toUpper());
    if (it == m_entityDb.constEnd()) {
        throw NotFoundError(QStringLiteral("Invalid handle \"%1\".").arg(handle));
    }
    return it.value().name;
}

bool Document::hasEntry(TableType table, const QString& name) const
{
    return nameIndex(table).contains(key(name));
}

// ---- Linetypes and text styles --------------------------------------

QString Document::addLinetype(const QString& name)
{
    if (hasEntry(TableType::Linetype, name)) {
        return resolve(TableType::Linetype, name);
    }
    return addEntry(TableType::Linetype, name);
}

QString Document::addTextStyle(const QString& name)
{
    if (hasEntry(TableType::TextStyle, name)) {
        return resolve(TableType::TextStyle, name);
    }
    return addEntry(TableType::TextStyle, name);
}

// ---- Blocks ---------------------------------------------------------

bool Document::hasBlock(const QString& name) const
{
    return hasEntry(TableType::Block, name);
}

BlockLayout* Document::block(const QString& name) const
{
    if (m_modelspace && key(name) == key(m_modelspace->name())) {
        return m_modelspace.get();
    }
    for (const auto& blk : m_blocks) {
        if (key(blk->name()) == key(name)) {
            return blk.get();
        }
    }
    throw NotFoundError(QStringLiteral("Block \"%1\" does not exist.").arg(name));
}

BlockLayout* Document::newBlock(const QString& name)
{
    if (name.isEmpty()) {
        throw ValidationError(QStringLiteral("Block name must not be empty."));
    }
    if (hasBlock(name)) {
        throw ValidationError(QStringLiteral("Block \"%1\" already exists.").arg(name));
    }
    QString handle = addEntry(TableType::Block, name);
    m_blocks.push_back(std::make_unique<BlockLayout>(this, name, handle));
    return m_blocks.back().get();
}

BlockLayout* Document::newAnonymousBlock(QChar typeChar)
{
    QString name;
    do {
        name = QStringLiteral("*%1%2").arg(typeChar).arg(++m_anonymousBlockCount);
    } while (hasBlock(name));
    return newBlock(name);
}

void Document::deleteBlock(const QString& name)
{
    if (key(name) == key(m_modelspace->name())) {
        throw ValidationError(QStringLiteral("The model space cannot be deleted."));
    }
    for (auto it = m_blocks.begin(); it != m_blocks.end(); ++it) {
        if (key((*it)->name()) == key(name)) {
            m_entityDb.remove((*it)->blockRecordHandle());
            m_blockNames.remove(key(name));
            m_blocks.erase(it);
            return;
        }
    }
    throw NotFoundError(QStringLiteral("Block \"%1\" does not exist.").arg(name));
}

// ---- Dimension styles -----------------------------------------------

DimStyle* Document::newDimStyle(const QString& name)
{
    if (hasDimStyle(name)) {
        throw ValidationError(QStringLiteral("DIMSTYLE \"%1\" already exists.").arg(name));
    }
    QString handle = addEntry(TableType::DimStyle, name);
    m_dimStyles.push_back(std::make_unique<DimStyle>(*this, handle, name));
    return m_dimStyles.back().get();
}

DimStyle* Document::dimStyle(const QString& name) const
{
    for (const auto& style : m_dimStyles) {
        if (key(style->name()) == key(name)) {
            return style.get();
        }
    }
    throw NotFoundError(QStringLiteral("DIMSTYLE \"%1\" does not exist.").arg(name));
}

bool Document::hasDimStyle(const QString& name) const
{
    return hasEntry(TableType::DimStyle, name);
}

void Document::renameDimStyle(const QString& oldName, const QString& newName)
{
    if (newName.isEmpty()) {
        throw ValidationError(QStringLiteral("DIMSTYLE name must not be empty."));
    }
    const QString handle = resolve(TableType::DimStyle, oldName);
    if (key(oldName) != key(newName)) {
        if (hasDimStyle(newName)) {
            throw ValidationError(QStringLiteral("DIMSTYLE \"%1\" already exists.").arg(newName));
        }
        m_dimStyleNames.remove(key(oldName));
        m_dimStyleNames.insert(key(newName), handle);
    }
    m_entityDb[handle].name = newName;
}

// ---- Dimensions -----------------------------------------------------

Dimension* Document::newDimension()
{
    m_dimensions.push_back(std::make_unique<Dimension>(this, nextHandle()));
    return m_dimensions.back().get();
}

Dimension* Document::addLinearDimension(const gp_Pnt& base, const gp_Pnt& p1, const gp_Pnt& p2,
                                        double angle, const QString& dimstyle,
                                        const QVariantHash& overrides)
{
    // Fail before the entity is created
    dimStyle(dimstyle);

    auto dim = std::make_unique<Dimension>(this, nextHandle());
    DimensionData& data = dim->data();
    data.dimtype = DIM_LINEAR | DIM_BLOCK_EXCLUSIVE;
    data.defpoint = base;
    data.defpoint2 = p1;
    data.defpoint3 = p2;
    data.angle = angle;
    data.dimstyle = dimstyle;
    dim->setOverrides(overrides);

    m_dimensions.push_back(std::move(dim));
    return m_dimensions.back().get();
}

}  // namespace dxfdim
