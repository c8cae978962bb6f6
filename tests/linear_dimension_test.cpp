// =====================================================================
//  tests/linear_dimension_test.cpp — Linear dimension rendering
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/block.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>
#include <dxfdim/geometry/ucs.h>
#include <dxfdim/render/arrows.h>
#include <dxfdim/render/dimension_renderer.h>

using namespace dxfdim;
using namespace dxfdim_test;

namespace {

class LinearDimensionTest : public ::testing::Test {
protected:
    // Horizontal dimension of length 10, dimension line at y = 3
    Dimension* addHorizontal(const QVariantHash& overrides = QVariantHash())
    {
        return doc.addLinearDimension(gp_Pnt(5, 3, 0), gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0),
                                      0.0, "Standard", overrides);
    }

    const QVector<GraphicEntity>& rendered(Dimension* dim)
    {
        return doc.block(dim->data().geometry)->entities();
    }

    Document doc{DxfVersion::R2013};
};

}  // anonymous namespace

TEST_F(LinearDimensionTest, HorizontalGeometry) {
    Dimension* dim = addHorizontal();
    dim->render();

    ASSERT_TRUE(dim->data().geometry.startsWith("*D"));
    const QVector<GraphicEntity>& entities = rendered(dim);

    // Two extension lines and the dimension line
    const QVector<GraphicEntity> lines = ofType(entities, EntityType::Line);
    ASSERT_EQ(lines.size(), 3);
    expectPoint(lines[0].points[0], 0, 0.625);
    expectPoint(lines[0].points[1], 0, 4.25);
    expectPoint(lines[1].points[0], 10, 0.625);
    expectPoint(lines[1].points[1], 10, 4.25);

    // Dimension line ends at the base of the closed filled arrows
    expectPoint(lines[2].points[0], 2.5, 3);
    expectPoint(lines[2].points[1], 7.5, 3);

    const QVector<GraphicEntity> inserts = ofType(entities, EntityType::Insert);
    ASSERT_EQ(inserts.size(), 2);
    EXPECT_EQ(inserts[0].blockName, QString("_CLOSEDFILLED"));
    expectPoint(inserts[0].points[0], 0, 3);
    EXPECT_DOUBLE_EQ(inserts[0].rotation, 180.0);
    EXPECT_DOUBLE_EQ(inserts[0].xscale, 2.5);
    expectPoint(inserts[1].points[0], 10, 3);
    EXPECT_DOUBLE_EQ(inserts[1].rotation, 0.0);
    EXPECT_TRUE(doc.hasBlock("_CLOSEDFILLED"));

    const QVector<GraphicEntity> texts = ofType(entities, EntityType::Text);
    ASSERT_EQ(texts.size(), 1);
    EXPECT_EQ(texts[0].text, QString("10"));
    EXPECT_EQ(texts[0].align, TextAlign::MiddleCenter);
    EXPECT_EQ(texts[0].style, QString("Standard"));
    EXPECT_DOUBLE_EQ(texts[0].height, 1.0);
    // dimtxt / 2 + dimgap above the line
    expectPoint(texts[0].points[0], 5, 3 + 0.5 + 0.625);

    const QVector<GraphicEntity> points = ofType(entities, EntityType::Point);
    ASSERT_EQ(points.size(), 3);
    for (const GraphicEntity& p : points) {
        EXPECT_EQ(p.layer, QString("DEFPOINTS"));
    }
    expectPoint(points[0].points[0], 0, 3);
    expectPoint(points[1].points[0], 0, 0);
    expectPoint(points[2].points[0], 10, 0);
}

TEST_F(LinearDimensionTest, ResolvedDefinitionPointsAreStored) {
    Dimension* dim = addHorizontal();
    dim->render();
    expectPoint(dim->data().defpoint, 0, 3);
    ASSERT_TRUE(dim->data().textMidpoint.has_value());
    expectPoint(*dim->data().textMidpoint, 5, 4.125);
    EXPECT_FALSE(dim->data().extrusion.has_value());
}

TEST_F(LinearDimensionTest, RenderTwiceKeepsTextPosition) {
    Dimension* dim = addHorizontal();
    dim->render();
    const gp_Pnt first = ofType(rendered(dim), EntityType::Text)[0].points[0];
    const QString firstBlock = dim->data().geometry;

    dim->render();
    EXPECT_NE(dim->data().geometry, firstBlock);
    const gp_Pnt second = ofType(rendered(dim), EntityType::Text)[0].points[0];
    expectPoint(second, first.X(), first.Y(), first.Z());
}

TEST_F(LinearDimensionTest, StoredTextMidpointIsUsed) {
    Dimension* dim = addHorizontal();
    dim->data().textMidpoint = gp_Pnt(1, 1, 0);
    dim->render();
    expectPoint(ofType(rendered(dim), EntityType::Text)[0].points[0], 1, 1);
}

TEST_F(LinearDimensionTest, VerticalTextPlacement) {
    Dimension* centered = addHorizontal({{"dimtad", 0}});
    centered->render();
    expectPoint(ofType(rendered(centered), EntityType::Text)[0].points[0], 5, 3);

    Dimension* below = addHorizontal({{"dimtad", 4}});
    below->render();
    expectPoint(ofType(rendered(below), EntityType::Text)[0].points[0], 5, 3 - 1.125);
}

TEST_F(LinearDimensionTest, RotatedDimension) {
    Dimension* dim = doc.addLinearDimension(gp_Pnt(-2, 4, 0), gp_Pnt(0, 0, 0), gp_Pnt(0, 10, 0),
                                            90.0);
    dim->render();

    expectPoint(dim->data().defpoint, -2, 0);
    const QVector<GraphicEntity> texts = ofType(rendered(dim), EntityType::Text);
    ASSERT_EQ(texts.size(), 1);
    EXPECT_EQ(texts[0].text, QString("10"));
    EXPECT_DOUBLE_EQ(texts[0].rotation, 90.0);
    expectPoint(texts[0].points[0], -3.125, 5);
}

TEST_F(LinearDimensionTest, TicksReplaceArrows) {
    Dimension* dim = addHorizontal({{"dimtsz", 0.5}});
    dim->render();

    const QVector<GraphicEntity>& entities = rendered(dim);
    EXPECT_TRUE(ofType(entities, EntityType::Insert).isEmpty());

    // Extension lines, two ticks, dimension line
    const QVector<GraphicEntity> lines = ofType(entities, EntityType::Line);
    ASSERT_EQ(lines.size(), 5);
    expectPoint(lines[2].points[0], -0.5, 2.5);
    expectPoint(lines[2].points[1], 0.5, 3.5);
    expectPoint(lines[4].points[0], 0, 3);
    expectPoint(lines[4].points[1], 10, 3);
}

TEST_F(LinearDimensionTest, DimensionLineExtension) {
    Dimension* ticks = addHorizontal({{"dimtsz", 0.5}, {"dimdle", 1.0}});
    ticks->render();
    const QVector<GraphicEntity> lines = ofType(rendered(ticks), EntityType::Line);
    expectPoint(lines.last().points[0], -1, 3);
    expectPoint(lines.last().points[1], 11, 3);

    // Arrows without extension visual keep the line at the arrow base
    Dimension* filled = addHorizontal({{"dimdle", 1.0}});
    filled->render();
    const QVector<GraphicEntity> arrowLines = ofType(rendered(filled), EntityType::Line);
    expectPoint(arrowLines.last().points[0], 2.5, 3);
    expectPoint(arrowLines.last().points[1], 7.5, 3);

    // Architectural ticks extend on both ends
    Dimension* archtick = addHorizontal({{"dimblk", arrows::ARCHITECTURAL_TICK}, {"dimdle", 1.0}});
    archtick->render();
    const QVector<GraphicEntity> tickLines = ofType(rendered(archtick), EntityType::Line);
    expectPoint(tickLines.last().points[0], -1, 3);
    expectPoint(tickLines.last().points[1], 11, 3);
}

TEST_F(LinearDimensionTest, SeparateArrows) {
    Dimension* dim = addHorizontal({{"dimsah", 1}, {"dimblk1", arrows::DOT},
                                    {"dimblk2", arrows::OPEN}});
    dim->render();
    const QVector<GraphicEntity> inserts = ofType(rendered(dim), EntityType::Insert);
    ASSERT_EQ(inserts.size(), 2);
    EXPECT_EQ(inserts[0].blockName, QString("_DOT"));
    EXPECT_EQ(inserts[1].blockName, QString("_OPEN"));
}

TEST_F(LinearDimensionTest, UndefinedArrowBlockThrows) {
    Dimension* dim = addHorizontal({{"dimblk", "NOSUCHBLOCK"}});
    EXPECT_THROW(dim->render(), NotFoundError);

    // Nothing of the failed render remains
    EXPECT_TRUE(dim->data().geometry.isEmpty());
    EXPECT_FALSE(doc.hasBlock("*D1"));
    expectPoint(dim->data().defpoint, 5, 3, 0);
    EXPECT_FALSE(dim->data().textMidpoint.has_value());

    // Every later attempt fails the same way
    EXPECT_THROW(dim->virtualEntities(), NotFoundError);
    EXPECT_TRUE(dim->data().geometry.isEmpty());
    EXPECT_FALSE(doc.hasBlock("*D2"));
}

TEST_F(LinearDimensionTest, FailedRenderKeepsPreviousGeometry) {
    Dimension* dim = addHorizontal();
    dim->render();
    const QString first = dim->data().geometry;

    dim->setOverrides({{"dimblk", "NOSUCHBLOCK"}});
    EXPECT_THROW(dim->render(), NotFoundError);
    EXPECT_EQ(dim->data().geometry, first);
    EXPECT_TRUE(doc.hasBlock(first));
    EXPECT_EQ(ofType(rendered(dim), EntityType::Line).size(), 3);
}

TEST_F(LinearDimensionTest, UserBlockArrow) {
    doc.newBlock("MYARROW")->addLine(gp_Pnt(0, 0, 0), gp_Pnt(-1, 0, 0));
    Dimension* dim = addHorizontal({{"dimblk", "MYARROW"}});
    dim->render();
    const QVector<GraphicEntity> inserts = ofType(rendered(dim), EntityType::Insert);
    ASSERT_EQ(inserts.size(), 2);
    EXPECT_EQ(inserts[0].blockName, QString("MYARROW"));
    // User blocks connect at the insert point and are not reversed
    EXPECT_DOUBLE_EQ(inserts[0].rotation, 0.0);
    const QVector<GraphicEntity> lines = ofType(rendered(dim), EntityType::Line);
    expectPoint(lines.last().points[0], 0, 3);
}

TEST_F(LinearDimensionTest, SuppressedExtensionLines) {
    Dimension* dim = addHorizontal({{"dimse1", 1}});
    dim->render();
    const QVector<GraphicEntity> lines = ofType(rendered(dim), EntityType::Line);
    ASSERT_EQ(lines.size(), 2);
    expectPoint(lines[0].points[0], 10, 0.625);
}

TEST_F(LinearDimensionTest, TextOverrides) {
    Dimension* none = addHorizontal();
    none->data().text = " ";
    none->render();
    EXPECT_TRUE(ofType(rendered(none), EntityType::Text).isEmpty());
    EXPECT_FALSE(none->data().textMidpoint.has_value());

    Dimension* literal = addHorizontal();
    literal->data().text = "approx.";
    literal->render();
    EXPECT_EQ(ofType(rendered(literal), EntityType::Text)[0].text, QString("approx."));
}

TEST_F(LinearDimensionTest, MeasurementFormat) {
    Dimension* dim = doc.addLinearDimension(gp_Pnt(5, 3, 0), gp_Pnt(0, 0, 0), gp_Pnt(10.5, 0, 0),
                                            0.0, "Standard",
                                            {{"dimdec", 2}, {"dimdsep", ","}, {"dimpost", "<> mm"}});
    dim->render();
    EXPECT_EQ(ofType(rendered(dim), EntityType::Text)[0].text, QString("10,50 mm"));

    Dimension* scaled = addHorizontal({{"dimlfac", 2.0}});
    scaled->render();
    EXPECT_EQ(ofType(rendered(scaled), EntityType::Text)[0].text, QString("20"));
}

TEST_F(LinearDimensionTest, DecimalSeparatorFromStyle) {
    DimStyle* style = doc.newDimStyle("COMMA");
    style->setTextFormat(QString(), QString(), std::nullopt, 1, QChar(','));
    Dimension* dim = doc.addLinearDimension(gp_Pnt(5, 3, 0), gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0),
                                            0.0, "COMMA");
    dim->render();
    EXPECT_EQ(ofType(rendered(dim), EntityType::Text)[0].text, QString("10,0"));
}

TEST_F(LinearDimensionTest, StyleColors) {
    Dimension* dim = addHorizontal({{"dimclrt", 2}, {"dimclrd", 3}, {"dimclre", 4}});
    dim->data().layer = "DIMENSIONS";
    dim->render();
    const QVector<GraphicEntity>& entities = rendered(dim);
    EXPECT_EQ(ofType(entities, EntityType::Text)[0].color, 2);
    EXPECT_EQ(ofType(entities, EntityType::Insert)[0].color, 3);
    const QVector<GraphicEntity> lines = ofType(entities, EntityType::Line);
    EXPECT_EQ(lines[0].color, 4);
    EXPECT_EQ(lines[2].color, 3);
    EXPECT_EQ(lines[2].layer, QString("DIMENSIONS"));
}

TEST_F(LinearDimensionTest, DimensionColorIsDefault) {
    Dimension* dim = addHorizontal();
    dim->data().color = 5;
    dim->render();
    for (const GraphicEntity& e : rendered(dim)) {
        if (e.type != EntityType::Point) {
            EXPECT_EQ(e.color, 5) << e.dxftype().toStdString();
        }
    }
}

TEST_F(LinearDimensionTest, OverridesAreCommitted) {
    Dimension* dim = addHorizontal({{"dimtxt", 0.5}});
    dim->render();
    EXPECT_DOUBLE_EQ(ofType(rendered(dim), EntityType::Text)[0].height, 0.5);
    EXPECT_DOUBLE_EQ(dim->overrides().value("dimtxt").toDouble(), 0.5);
}

TEST_F(LinearDimensionTest, TranslatedUcs) {
    Dimension* dim = addHorizontal();
    const geometry::UCS ucs(gp_Pnt(0, 0, 5), gp_Dir(1, 0, 0), gp_Dir(0, 1, 0));
    dim->render(&ucs);

    EXPECT_FALSE(dim->data().extrusion.has_value());
    expectPoint(dim->data().defpoint, 0, 3, 5);
    expectPoint(dim->data().defpoint2, 0, 0, 5);
    const QVector<GraphicEntity> lines = ofType(rendered(dim), EntityType::Line);
    expectPoint(lines[0].points[0], 0, 0.625, 5);
    const QVector<GraphicEntity> inserts = ofType(rendered(dim), EntityType::Insert);
    EXPECT_FALSE(inserts[0].extrusion.has_value());
    expectPoint(inserts[0].points[0], 0, 3, 5);
}

TEST_F(LinearDimensionTest, TiltedUcsSetsExtrusion) {
    Dimension* dim = addHorizontal();
    // UCS z-axis along -Y
    const geometry::UCS ucs(gp_Pnt(0, 0, 0), gp_Dir(1, 0, 0), gp_Dir(0, 0, 1));
    dim->render(&ucs);

    ASSERT_TRUE(dim->data().extrusion.has_value());
    EXPECT_NEAR(dim->data().extrusion->Y(), -1.0, kTol);

    // Lines in WCS
    const QVector<GraphicEntity> lines = ofType(rendered(dim), EntityType::Line);
    expectPoint(lines[0].points[0], 0, 0, 0.625);

    // Block references in OCS with extrusion
    const geometry::OCS ocs(*dim->data().extrusion);
    for (const GraphicEntity& insert : ofType(rendered(dim), EntityType::Insert)) {
        ASSERT_TRUE(insert.extrusion.has_value());
        EXPECT_NEAR(insert.extrusion->Y(), -1.0, kTol);
    }
    const GraphicEntity first = ofType(rendered(dim), EntityType::Insert)[0];
    expectPoint(ocs.toWcs(first.points[0]), 0, 0, 3);

    // Definition points in WCS
    expectPoint(dim->data().defpoint, 0, 0, 3);
}

TEST_F(LinearDimensionTest, DefaultTextStyleOption) {
    Document r12(DxfVersion::R12);
    Dimension* dim = r12.addLinearDimension(gp_Pnt(5, 3, 0), gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0));
    RenderOptions options;
    options.defaultTextStyle = "ROMANS";
    dim->render(nullptr, options);

    const QVector<GraphicEntity> texts =
        ofType(r12.block(dim->data().geometry)->entities(), EntityType::Text);
    ASSERT_EQ(texts.size(), 1);
    EXPECT_EQ(texts[0].style, QString("ROMANS"));
    EXPECT_EQ(texts[0].text, QString("10"));
}

TEST_F(LinearDimensionTest, VirtualEntities) {
    Dimension* dim = addHorizontal();
    const QVector<GraphicEntity> entities = dim->virtualEntities();
    EXPECT_FALSE(dim->data().geometry.isEmpty());
    EXPECT_EQ(entities.size(), rendered(dim).size());
    for (const GraphicEntity& e : entities) {
        EXPECT_DOUBLE_EQ(e.transparency, 1.0);
    }
}

// ---- Dispatcher -----------------------------------------------------

TEST_F(LinearDimensionTest, AlignedTypeUsesLinearRenderer) {
    Dimension* dim = addHorizontal();
    dim->data().dimtype = DIM_ALIGNED | DIM_BLOCK_EXCLUSIVE;
    dim->render();
    EXPECT_EQ(ofType(rendered(dim), EntityType::Text)[0].text, QString("10"));
}

TEST_F(LinearDimensionTest, UnsupportedTypes) {
    for (int type : {DIM_ANGULAR, DIM_DIAMETER, DIM_RADIUS, DIM_ANGULAR_3P, DIM_ORDINATE}) {
        Dimension* dim = addHorizontal();
        dim->data().dimtype = type | DIM_BLOCK_EXCLUSIVE;
        EXPECT_THROW(dim->render(), UnsupportedDimensionTypeError) << type;
        EXPECT_TRUE(dim->data().geometry.isEmpty());
        EXPECT_FALSE(render::DimensionRenderer::isSupported(type));
    }
    EXPECT_FALSE(doc.hasBlock("*D1"));
}

TEST_F(LinearDimensionTest, UnknownTypeCode) {
    Dimension* dim = addHorizontal();
    dim->data().dimtype = 7;
    EXPECT_THROW(dim->render(), ValidationError);
}

TEST_F(LinearDimensionTest, MissingDimStyle) {
    Dimension* dim = addHorizontal();
    dim->data().dimstyle = "MISSING";
    EXPECT_THROW(dim->render(), NotFoundError);
}
