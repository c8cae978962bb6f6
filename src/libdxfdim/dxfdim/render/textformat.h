// =====================================================================
//  src/libdxfdim/dxfdim/render/textformat.h — Measurement text formatting
// =====================================================================
//
//  Converts a measured distance to dimension text following the
//  DIMSTYLE variables dimrnd, dimdec, dimzin, dimdsep and dimpost.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_RENDER_TEXTFORMAT_H
#define DXFDIM_RENDER_TEXTFORMAT_H

#include "../core.h"

#include <QChar>
#include <QString>

#include <optional>

namespace dxfdim {
namespace render {

/// Remove leading and/or trailing zeros from a decimal number string.
/// A value of zero always becomes "0".
DXFDIM_EXPORT QString suppressZeros(const QString& text, bool leading, bool trailing);

/// Turn the decimal places into MTEXT superscript: "1.25" → "1\S25^ ;"
DXFDIM_EXPORT QString raiseDecimals(const QString& text);

/// Format a measurement as dimension text.
/// @param value Measured value, already scaled by dimlfac
/// @param dimrnd Round to the nearest multiple of this value (0 = off);
///        ties round away from zero
/// @param dimdec Decimal places; unset means up to 6 with trailing
///        zeros removed
/// @param dimzin Zero suppression flags (DIMZIN_SUPPRESSES_*)
/// @param dimdsep Decimal separator
/// @param dimpost Text template, "<>" is replaced by the number
/// @param raiseDec Render decimal places as superscript
/// @throws ValidationError if dimpost is not empty and has no "<>"
DXFDIM_EXPORT QString formatText(double value,
                                 std::optional<double> dimrnd = std::nullopt,
                                 std::optional<int> dimdec = std::nullopt,
                                 int dimzin = 0,
                                 QChar dimdsep = QLatin1Char('.'),
                                 const QString& dimpost = QStringLiteral("<>"),
                                 bool raiseDec = false);

}  // namespace render
}  // namespace dxfdim

#endif  // DXFDIM_RENDER_TEXTFORMAT_H
