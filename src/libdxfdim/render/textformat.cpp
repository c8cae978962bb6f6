// =====================================================================
//  src/libdxfdim/render/textformat.cpp — Measurement text formatting
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <dxfdim/render/textformat.h>
#include <dxfdim/dimstyle/schema.h>
#include <dxfdim/errors.h>

#include <QRegularExpression>

#include <cmath>

namespace dxfdim {
namespace render {

QString suppressZeros(const QString& text, bool leading, bool trailing)
{
    if (!leading && !trailing) {
        return text;
    }
    if (text.toDouble() == 0.0) {
        return QStringLiteral("0");
    }

    QString s = text;
    QString sign;
    if (s.startsWith(QLatin1Char('-')) || s.startsWith(QLatin1Char('+'))) {
        sign = s.left(1);
        s = s.mid(1);
    }

    if (leading) {
        int i = 0;
        while (i < s.size() && s[i] == QLatin1Char('0')) {
            ++i;
        }
        s = s.mid(i);
    }
    if (trailing && s.contains(QLatin1Char('.'))) {
        int end = s.size();
        while (end > 0 && s[end - 1] == QLatin1Char('0')) {
            --end;
        }
        s.truncate(end);
    }
    if (s.endsWith(QLatin1Char('.')) || s.endsWith(QLatin1Char(','))) {
        s.chop(1);
    }
    return sign + s;
}

QString raiseDecimals(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("\\.(\\d+)"));

    QString result;
    int last = 0;
    auto it = re.globalMatch(text);
    while (it.hasNext()) {
        QRegularExpressionMatch m = it.next();
        result += text.mid(last, m.capturedStart() - last);
        result += QStringLiteral("\\S%1^ ;").arg(m.captured(1));
        last = m.capturedEnd();
    }
    result += text.mid(last);
    return result;
}

QString formatText(double value, std::optional<double> dimrnd, std::optional<int> dimdec,
                   int dimzin, QChar dimdsep, const QString& dimpost, bool raiseDec)
{
    if (dimrnd && *dimrnd != 0.0) {
        value = std::round(value / *dimrnd) * *dimrnd;
    }

    QString text;
    if (!dimdec) {
        // "%f" precision, the padding zeros are always removed
        text = QString::number(value, 'f', 6);
        dimzin |= DIMZIN_SUPPRESSES_TRAILING_ZEROS;
    } else {
        text = QString::number(value, 'f', *dimdec);
    }

    text = suppressZeros(text,
                         dimzin & DIMZIN_SUPPRESSES_LEADING_ZEROS,
                         dimzin & DIMZIN_SUPPRESSES_TRAILING_ZEROS);
    if (raiseDec) {
        text = raiseDecimals(text);
    }
    if (dimdsep != QLatin1Char('.')) {
        text.replace(QLatin1Char('.'), dimdsep);
    }
    if (!dimpost.isEmpty()) {
        int pos = dimpost.indexOf(QLatin1String("<>"));
        if (pos < 0) {
            throw ValidationError(QStringLiteral("Invalid dimpost string: \"%1\"").arg(dimpost));
        }
        text = QString(dimpost).replace(pos, 2, text);
    }
    return text;
}

}  // namespace render
}  // namespace dxfdim
