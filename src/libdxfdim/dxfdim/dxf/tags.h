// =====================================================================
//  src/libdxfdim/dxfdim/dxf/tags.h — DXF group code tags
// =====================================================================
//
//  Minimal tag layer: reading group code / value pairs from DXF text
//  and writing them back, version aware.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DXF_TAGS_H
#define DXFDIM_DXF_TAGS_H

#include "version.h"
#include "../core.h"

#include <QString>
#include <QTextStream>
#include <QVariant>
#include <QVector>

namespace dxfdim {

/// Group code used by attributes that are never written to a file
constexpr int VIRTUAL_TAG = -666;

/// Subclass marker group code
constexpr int SUBCLASS_MARKER = 100;

/// DXF group code and value pair
struct DxfTag {
    int code = 0;
    QString value;

    bool operator==(const DxfTag& other) const
    {
        return code == other.code && value == other.value;
    }
};

/// Parse DXF text content into tags.
/// Parsing stops at the first malformed group code.
DXFDIM_EXPORT QVector<DxfTag> readTags(const QString& content);

/// Read tags from a DXF file
/// @param filePath Path to the file
/// @param tags Receives the parsed tags
/// @param errorMsg Receives an error description on failure (optional)
/// @return True on success
DXFDIM_EXPORT bool readTagsFromFile(const QString& filePath,
                                    QVector<DxfTag>* tags,
                                    QString* errorMsg = nullptr);

/// Writes tags as DXF text for one target version.
class DXFDIM_EXPORT TagWriter {
public:
    TagWriter(QTextStream& out, DxfVersion version);

    DxfVersion dxfVersion() const { return m_version; }

    /// Write one tag; doubles are written with full precision.
    void writeTag(int code, const QVariant& value);

    /// Number of tags written so far
    int tagCount() const { return m_count; }

private:
    QTextStream& m_out;
    DxfVersion m_version;
    int m_count = 0;
};

}  // namespace dxfdim

#endif  // DXFDIM_DXF_TAGS_H
