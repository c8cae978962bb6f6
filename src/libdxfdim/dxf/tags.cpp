// =====================================================================
//  src/libdxfdim/dxf/tags.cpp — DXF group code tags
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/dxf/tags.h>

#include <QFile>
#include <QStringList>

namespace dxfdim {

// =====================================================================
//  Versions
// =====================================================================

QString acadVersionString(DxfVersion version)
{
    return QStringLiteral("AC%1").arg(static_cast<int>(version));
}

std::optional<DxfVersion> parseAcadVersion(const QString& acadver)
{
    static const DxfVersion known[] = {
        DxfVersion::R12, DxfVersion::R2000, DxfVersion::R2004,
        DxfVersion::R2007, DxfVersion::R2010, DxfVersion::R2013,
        DxfVersion::R2018
    };

    const QString upper = acadver.trimmed().toUpper();
    for (DxfVersion v : known) {
        if (acadVersionString(v) == upper) {
            return v;
        }
    }
    return std::nullopt;
}

// =====================================================================
//  Reading
// =====================================================================

namespace {

/// Read next group code/value pair from DXF lines
bool readPair(const QStringList& lines, int& lineIndex, DxfTag& tag)
{
    if (lineIndex + 1 >= lines.size()) return false;

    bool ok;
    tag.code = lines[lineIndex].trimmed().toInt(&ok);
    if (!ok) return false;

    tag.value = lines[lineIndex + 1].trimmed();
    lineIndex += 2;
    return true;
}

}  // anonymous namespace

QVector<DxfTag> readTags(const QString& content)
{
    QVector<DxfTag> tags;
    QString normalized = content;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    const QStringList lines = normalized.split('\n');

    int lineIndex = 0;
    DxfTag tag;
    while (readPair(lines, lineIndex, tag)) {
        tags.append(tag);
    }
    return tags;
}

bool readTagsFromFile(const QString& filePath, QVector<DxfTag>* tags,
                      QString* errorMsg)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Cannot open DXF file: ") + filePath;
        return false;
    }

    QTextStream in(&file);
    QVector<DxfTag> result = readTags(in.readAll());
    if (result.isEmpty()) {
        if (errorMsg) *errorMsg = QStringLiteral("No DXF tags found in: ") + filePath;
        return false;
    }

    if (tags) *tags = result;
    return true;
}

// =====================================================================
//  Writing
// =====================================================================

TagWriter::TagWriter(QTextStream& out, DxfVersion version)
    : m_out(out)
    , m_version(version)
{
}

void TagWriter::writeTag(int code, const QVariant& value)
{
    QString text;
    if (value.typeId() == QMetaType::Double) {
        text = QString::number(value.toDouble(), 'g', 16);
    } else {
        text = value.toString();
    }

    m_out << code << "\n" << text << "\n";
    ++m_count;
}

}  // namespace dxfdim
