// =====================================================================
//  tests/arrows_test.cpp — Built-in arrow heads
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <dxfdim/document/block.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/render/arrows.h>

using namespace dxfdim;
using namespace dxfdim_test;

TEST(Arrows, Names) {
    EXPECT_TRUE(arrows::isAcadArrow(""));
    EXPECT_TRUE(arrows::isAcadArrow("archtick"));
    EXPECT_FALSE(arrows::isAcadArrow(arrows::EZ_ARROW));
    EXPECT_TRUE(arrows::isEzArrow("ez_arrow_filled"));
    EXPECT_TRUE(arrows::isArrow(arrows::EZ_ARROW_BLANK));
    EXPECT_FALSE(arrows::isArrow("MYBLOCK"));
    EXPECT_EQ(arrows::names().size(), 23);
}

TEST(Arrows, BlockNames) {
    EXPECT_EQ(arrows::blockName(arrows::CLOSED_FILLED), QString("_CLOSEDFILLED"));
    EXPECT_EQ(arrows::blockName("dot"), QString("_DOT"));
    EXPECT_EQ(arrows::blockName(arrows::EZ_ARROW), QString("EZ_ARROW"));

    EXPECT_EQ(arrows::arrowName("_CLOSEDFILLED"), QString(arrows::CLOSED_FILLED));
    EXPECT_EQ(arrows::arrowName("_DOT"), QString("DOT"));
    EXPECT_EQ(arrows::arrowName("EZ_ARROW"), QString("EZ_ARROW"));
    EXPECT_EQ(arrows::arrowName("_MYBLOCK"), QString("_MYBLOCK"));
}

TEST(Arrows, ExtensionLine) {
    EXPECT_TRUE(arrows::hasExtensionLine(arrows::ARCHITECTURAL_TICK));
    EXPECT_TRUE(arrows::hasExtensionLine(arrows::OBLIQUE));
    EXPECT_TRUE(arrows::hasExtensionLine(arrows::NONE));
    EXPECT_FALSE(arrows::hasExtensionLine(arrows::CLOSED_FILLED));
    EXPECT_FALSE(arrows::hasExtensionLine(arrows::DOT));
}

TEST(Arrows, ConnectionPoint) {
    // Closed filled arrow: dimension line ends at the arrow base
    expectPoint(arrows::connectionPoint(arrows::CLOSED_FILLED, QPointF(10, 0), 2.5, 180.0),
                12.5, 0.0);
    expectPoint(arrows::connectionPoint(arrows::CLOSED_FILLED, QPointF(0, 0), 1.0, 90.0),
                0.0, -1.0);
    // Ticks connect at the insert point
    expectPoint(arrows::connectionPoint(arrows::OBLIQUE, QPointF(3, 4), 2.5, 0.0), 3.0, 4.0);
}

TEST(Arrows, ShapeIsScaledAndRotated) {
    arrows::ArrowShape shape = arrows::arrowShape(arrows::CLOSED_FILLED, QPointF(1, 1), 2.0, 90.0);
    ASSERT_EQ(shape.polygons.size(), 1);
    ASSERT_EQ(shape.polygons[0].size(), 3);
    expectPoint(shape.polygons[0][0], 1.0, 1.0);
    // Base center one arrow length behind the tip
    const QPointF base = (shape.polygons[0][1] + shape.polygons[0][2]) / 2.0;
    expectPoint(base, 1.0, -1.0);

    arrows::ArrowShape tick = arrows::arrowShape(arrows::OBLIQUE, QPointF(0, 0), 2.0, 0.0);
    ASSERT_EQ(tick.lines.size(), 1);
    expectPoint(tick.lines[0].p1(), -1.0, -1.0);
    expectPoint(tick.lines[0].p2(), 1.0, 1.0);

    EXPECT_TRUE(arrows::arrowShape(arrows::NONE).isEmpty());
}

TEST(Arrows, ShapeOfUnknownNameThrows) {
    EXPECT_THROW(arrows::arrowShape("MYBLOCK"), ValidationError);
}

TEST(Arrows, CreateBlock) {
    Document doc;
    const QString name = arrows::createBlock(doc, arrows::DOT);
    EXPECT_EQ(name, QString("_DOT"));
    ASSERT_TRUE(doc.hasBlock("_DOT"));

    BlockLayout* block = doc.block(name);
    EXPECT_GT(block->size(), 0);
    for (const GraphicEntity& e : block->entities()) {
        EXPECT_EQ(e.color, COLOR_BYBLOCK);
    }

    // Second call reuses the block
    const int count = block->size();
    EXPECT_EQ(arrows::createBlock(doc, "dot"), QString("_DOT"));
    EXPECT_EQ(doc.block(name)->size(), count);
}

TEST(Arrows, EveryBuiltinArrowHasABlock) {
    Document doc;
    for (const QString& name : arrows::names()) {
        const QString blockName = arrows::createBlock(doc, name);
        EXPECT_TRUE(doc.hasBlock(blockName)) << name.toStdString();
        EXPECT_EQ(arrows::arrowName(blockName), name) << name.toStdString();
    }
}
