// =====================================================================
//  src/libdxfdim/core.cpp — Library initialization
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "dxfdim/core.h"

#include <Standard_Version.hxx>

Q_LOGGING_CATEGORY(lcDxfDim, "dxfdim")
Q_LOGGING_CATEGORY(lcDimStyle, "dxfdim.dimstyle")
Q_LOGGING_CATEGORY(lcRender, "dxfdim.render")

namespace dxfdim {

const char* version()
{
    return "0.1.0";
}

bool initialize()
{
    qCDebug(lcDxfDim) << "libdxfdim" << version()
                      << "using OCCT" << OCC_VERSION_COMPLETE;
    return true;
}

void shutdown()
{
    // Nothing to tear down: documents own all of their state.
}

}  // namespace dxfdim
