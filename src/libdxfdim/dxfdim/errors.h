// =====================================================================
//  src/libdxfdim/dxfdim/errors.h — Exception types
// =====================================================================
//
//  All errors raised by libdxfdim derive from DxfError.  Callers that
//  need to keep going (a drawing frontend, a batch exporter) catch the
//  specific subclass they can recover from and let the rest propagate.
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_ERRORS_H
#define DXFDIM_ERRORS_H

#include "core.h"

#include <QString>

#include <stdexcept>

namespace dxfdim {

/// Base class of all libdxfdim exceptions.
class DXFDIM_EXPORT DxfError : public std::runtime_error {
public:
    explicit DxfError(const QString& message)
        : std::runtime_error(message.toStdString())
        , m_message(message)
    {
    }

    /// The message as a QString (what() returns the UTF-8 form).
    QString message() const { return m_message; }

private:
    QString m_message;
};

/// Unknown attribute name for a DIMSTYLE record or resolver.
class DXFDIM_EXPORT SchemaError : public DxfError {
public:
    using DxfError::DxfError;
};

/// Attribute exists but requires a newer DXF version than the document.
class DXFDIM_EXPORT VersionGapError : public SchemaError {
public:
    using SchemaError::SchemaError;
};

/// A handle or table entry name could not be resolved.
class DXFDIM_EXPORT NotFoundError : public DxfError {
public:
    using DxfError::DxfError;
};

/// Invalid argument: missing arrow block, malformed template, ...
class DXFDIM_EXPORT ValidationError : public DxfError {
public:
    using DxfError::DxfError;
};

/// No renderer exists for the requested DIMENSION type.
class DXFDIM_EXPORT UnsupportedDimensionTypeError : public DxfError {
public:
    using DxfError::DxfError;
};

}  // namespace dxfdim

#endif  // DXFDIM_ERRORS_H
