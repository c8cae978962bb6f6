// =====================================================================
//  src/libdxfdim/dxfdim/document/document.h — Document model
// =====================================================================
//
//  A Document owns the tables the dimension subsystem resolves names
//  and handles against (blocks, linetypes, text styles, dimension
//  styles), the DIMENSION entities of the model space and the header
//  variables.  It hands out unique handles and anonymous block names.
//
//  Single-writer: nothing here is synchronized.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DOCUMENT_DOCUMENT_H
#define DXFDIM_DOCUMENT_DOCUMENT_H

#include "block.h"
#include "../core.h"
#include "../dxf/version.h"

#include <gp_Pnt.hxx>

#include <QHash>
#include <QString>
#include <QVariant>

#include <memory>
#include <vector>

namespace dxfdim {

class DimStyle;
class Dimension;

/// Tables that can be addressed by name
enum class TableType {
    Block,
    Linetype,
    TextStyle,
    DimStyle
};

// =====================================================================
//  Name Resolver
// =====================================================================

/// Translates between table entry names and persisted handles.
class DXFDIM_EXPORT NameResolver {
public:
    virtual ~NameResolver() = default;

    /// Handle of the entry called name in table.
    /// Throws NotFoundError if there is no such entry.
    virtual QString resolve(TableType table, const QString& name) const = 0;

    /// Name of the table entry with the given handle.
    /// Throws NotFoundError if the handle is unknown.
    virtual QString reverse(const QString& handle) const = 0;
};

// =====================================================================
//  Document
// =====================================================================

class DXFDIM_EXPORT Document : public NameResolver {
public:
    /// Create a document seeded with the standard table entries:
    /// text style "Standard", linetypes BYBLOCK/BYLAYER/CONTINUOUS
    /// and dimension style "Standard".
    explicit Document(DxfVersion version = DxfVersion::R2013);
    ~Document() override;

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    DxfVersion dxfVersion() const { return m_version; }

    /// Allocate a new unique handle
    QString nextHandle();

    // ---- Name resolution --------------------------------------------

    QString resolve(TableType table, const QString& name) const override;
    QString reverse(const QString& handle) const override;

    /// True if table has an entry called name (case-insensitive)
    bool hasEntry(TableType table, const QString& name) const;

    // ---- Linetypes and text styles ----------------------------------

    /// Add a linetype; returns its handle (existing handle if present)
    QString addLinetype(const QString& name);

    /// Add a text style; returns its handle (existing handle if present)
    QString addTextStyle(const QString& name);

    // ---- Blocks -----------------------------------------------------

    bool hasBlock(const QString& name) const;

    /// Block by name.  Throws NotFoundError.
    BlockLayout* block(const QString& name) const;

    /// Create a named block.  Throws ValidationError if it exists.
    BlockLayout* newBlock(const QString& name);

    /// Create an anonymous block "*<typeChar><n>" with a unique name
    BlockLayout* newAnonymousBlock(QChar typeChar = QLatin1Char('U'));

    /// Remove a block and its BLOCK_RECORD entry.
    /// Throws NotFoundError, ValidationError for the model space.
    void deleteBlock(const QString& name);

    /// Model space entities
    BlockLayout& modelspace() { return *m_modelspace; }
    const BlockLayout& modelspace() const { return *m_modelspace; }

    // ---- Dimension styles -------------------------------------------

    /// Create a dimension style with schema defaults.
    /// Throws ValidationError if the name is taken.
    DimStyle* newDimStyle(const QString& name);

    /// Dimension style by name.  Throws NotFoundError.
    DimStyle* dimStyle(const QString& name) const;

    bool hasDimStyle(const QString& name) const;

    /// Re-key the DIMSTYLE table after a style changed its name.
    /// Throws ValidationError if newName is empty or taken by another
    /// style, NotFoundError if oldName does not exist.
    void renameDimStyle(const QString& oldName, const QString& newName);

    // ---- Dimensions -------------------------------------------------

    /// Create an empty DIMENSION entity in model space
    Dimension* newDimension();

    /// Create a linear (rotated) DIMENSION; the geometry is not rendered yet
    /// @param base Location of the dimension line
    /// @param p1 First measurement point
    /// @param p2 Second measurement point
    /// @param angle Dimension line angle in degrees
    /// @param dimstyle Name of the dimension style
    /// @param overrides Per-entity dimension style overrides
    Dimension* addLinearDimension(const gp_Pnt& base, const gp_Pnt& p1, const gp_Pnt& p2,
                                  double angle = 0.0,
                                  const QString& dimstyle = QStringLiteral("Standard"),
                                  const QVariantHash& overrides = {});

    const std::vector<std::unique_ptr<Dimension>>& dimensions() const { return m_dimensions; }

    // ---- Header -----------------------------------------------------

    QVariantHash& header() { return m_header; }
    const QVariantHash& header() const { return m_header; }

private:
    struct Entry {
        TableType type;
        QString name;
    };

    QHash<QString, QString>& nameIndex(TableType table);
    const QHash<QString, QString>& nameIndex(TableType table) const;
    QString addEntry(TableType table, const QString& name);

    DxfVersion m_version;
    quint64 m_handleSeed = 0x20;
    int m_anonymousBlockCount = 0;

    QHash<QString, Entry> m_entityDb;           // handle → entry
    QHash<QString, QString> m_blockNames;       // NAME → handle
    QHash<QString, QString> m_linetypeNames;
    QHash<QString, QString> m_textStyleNames;
    QHash<QString, QString> m_dimStyleNames;

    std::vector<std::unique_ptr<BlockLayout>> m_blocks;
    std::unique_ptr<BlockLayout> m_modelspace;
    std::vector<std::unique_ptr<DimStyle>> m_dimStyles;
    std::vector<std::unique_ptr<Dimension>> m_dimensions;

    QVariantHash m_header;
};

}  // namespace dxfdim

#endif  // DXFDIM_DOCUMENT_DOCUMENT_H
