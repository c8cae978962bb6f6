// =====================================================================
//  src/libdxfdim/dxfdim/dxf/version.h — DXF format versions
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_DXF_VERSION_H
#define DXFDIM_DXF_VERSION_H

#include "../core.h"

#include <QString>

#include <optional>

namespace dxfdim {

/// DXF file format versions, valued by their $ACADVER number so that
/// the natural ordering is the release ordering.
enum class DxfVersion {
    R12   = 1009,  ///< AC1009
    R2000 = 1015,  ///< AC1015
    R2004 = 1018,  ///< AC1018
    R2007 = 1021,  ///< AC1021
    R2010 = 1024,  ///< AC1024
    R2013 = 1027,  ///< AC1027
    R2018 = 1032   ///< AC1032
};

/// Newest version known to this library
constexpr DxfVersion LATEST_DXF_VERSION = DxfVersion::R2018;

inline bool operator<(DxfVersion a, DxfVersion b)
{
    return static_cast<int>(a) < static_cast<int>(b);
}

inline bool operator>(DxfVersion a, DxfVersion b) { return b < a; }
inline bool operator<=(DxfVersion a, DxfVersion b) { return !(b < a); }
inline bool operator>=(DxfVersion a, DxfVersion b) { return !(a < b); }

/// $ACADVER string of a version (e.g. "AC1015")
DXFDIM_EXPORT QString acadVersionString(DxfVersion version);

/// Parse a $ACADVER string; returns nullopt for unknown versions
DXFDIM_EXPORT std::optional<DxfVersion> parseAcadVersion(const QString& acadver);

}  // namespace dxfdim

#endif  // DXFDIM_DXF_VERSION_H
