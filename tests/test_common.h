// =====================================================================
//  tests/test_common.h — Shared test helpers
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DXFDIM_TESTS_TEST_COMMON_H
#define DXFDIM_TESTS_TEST_COMMON_H

#include <gtest/gtest.h>

#include <dxfdim/document/entity.h>

#include <gp_Pnt.hxx>

#include <QPointF>
#include <QString>
#include <QVector>

#include <ostream>

// Readable failure messages for Qt strings
inline void PrintTo(const QString& s, std::ostream* os)
{
    *os << '"' << s.toStdString() << '"';
}

namespace dxfdim_test {

constexpr double kTol = 1e-9;

inline void expectPoint(const gp_Pnt& actual, double x, double y, double z = 0.0,
                        double tol = kTol)
{
    EXPECT_NEAR(actual.X(), x, tol);
    EXPECT_NEAR(actual.Y(), y, tol);
    EXPECT_NEAR(actual.Z(), z, tol);
}

inline void expectPoint(const QPointF& actual, double x, double y, double tol = kTol)
{
    EXPECT_NEAR(actual.x(), x, tol);
    EXPECT_NEAR(actual.y(), y, tol);
}

/// Entities of one type
inline QVector<dxfdim::GraphicEntity> ofType(const QVector<dxfdim::GraphicEntity>& entities,
                                             dxfdim::EntityType type)
{
    QVector<dxfdim::GraphicEntity> result;
    for (const auto& e : entities) {
        if (e.type == type) {
            result.append(e);
        }
    }
    return result;
}

}  // namespace dxfdim_test

#endif  // DXFDIM_TESTS_TEST_COMMON_H
