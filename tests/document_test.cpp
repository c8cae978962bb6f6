// =====================================================================
//  tests/document_test.cpp — Tables, blocks and handles
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <dxfdim/core.h>
#include <dxfdim/dimstyle/dimstyle.h>
#include <dxfdim/document/block.h>
#include <dxfdim/document/dimension.h>
#include <dxfdim/document/document.h>
#include <dxfdim/errors.h>

using namespace dxfdim;
using namespace dxfdim_test;

TEST(Core, Initialize) {
    EXPECT_TRUE(initialize());
    EXPECT_STRNE(version(), "");
    shutdown();
}

TEST(Document, DefaultTables) {
    Document doc;
    EXPECT_EQ(doc.dxfVersion(), DxfVersion::R2013);
    EXPECT_TRUE(doc.hasEntry(TableType::TextStyle, "Standard"));
    EXPECT_TRUE(doc.hasEntry(TableType::Linetype, "ByBlock"));
    EXPECT_TRUE(doc.hasDimStyle("STANDARD"));
    EXPECT_EQ(doc.header().value("$ACADVER").toString(), QString("AC1027"));
    EXPECT_EQ(doc.modelspace().name(), QString("*Model_Space"));
}

TEST(Document, HandlesResolveBothWays) {
    Document doc;
    const QString handle = doc.addLinetype("DASHED");
    EXPECT_EQ(doc.resolve(TableType::Linetype, "dashed"), handle);
    EXPECT_EQ(doc.reverse(handle), QString("DASHED"));
    EXPECT_EQ(doc.addLinetype("DASHED"), handle);

    EXPECT_THROW(doc.resolve(TableType::Linetype, "DOTTED"), NotFoundError);
    EXPECT_THROW(doc.reverse("FFFFFF"), NotFoundError);
}

TEST(Document, HandlesAreUnique) {
    Document doc;
    const QString a = doc.nextHandle();
    const QString b = doc.nextHandle();
    EXPECT_NE(a, b);
}

TEST(Document, Blocks) {
    Document doc;
    BlockLayout* block = doc.newBlock("PART");
    EXPECT_TRUE(doc.hasBlock("part"));
    EXPECT_EQ(doc.block("PART"), block);
    EXPECT_EQ(doc.reverse(block->blockRecordHandle()), QString("PART"));
    EXPECT_FALSE(block->isAnonymous());

    EXPECT_THROW(doc.newBlock("PART"), ValidationError);
    EXPECT_THROW(doc.newBlock(QString()), ValidationError);
    EXPECT_THROW(doc.block("MISSING"), NotFoundError);
}

TEST(Document, AnonymousBlocksHaveUniqueNames) {
    Document doc;
    BlockLayout* first = doc.newAnonymousBlock('D');
    BlockLayout* second = doc.newAnonymousBlock('D');
    EXPECT_TRUE(first->name().startsWith("*D"));
    EXPECT_TRUE(first->isAnonymous());
    EXPECT_NE(first->name(), second->name());
    EXPECT_TRUE(doc.newAnonymousBlock()->name().startsWith("*U"));
}

TEST(Document, BlockContent) {
    Document doc;
    BlockLayout* block = doc.newBlock("CONTENT");
    EntityAttribs attribs;
    attribs.layer = "DIM";
    attribs.color = 3;
    block->addLine(gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0), attribs);
    block->addText("12", gp_Pnt(0.5, 1, 0), 0.25, 0.0, "Standard", TextAlign::MiddleCenter);
    block->addPoint(gp_Pnt(2, 2, 0));

    ASSERT_EQ(block->size(), 3);
    const GraphicEntity& line = block->entities()[0];
    EXPECT_EQ(line.dxftype(), QString("LINE"));
    EXPECT_EQ(line.layer, QString("DIM"));
    EXPECT_EQ(line.color, 3);
    EXPECT_FALSE(line.handle.isEmpty());
    EXPECT_EQ(block->entities()[1].dxftype(), QString("TEXT"));
    EXPECT_EQ(block->entities()[1].align, TextAlign::MiddleCenter);
    EXPECT_EQ(block->entities()[2].dxftype(), QString("POINT"));

    EXPECT_THROW(block->addBlockRef("MISSING", gp_Pnt()), NotFoundError);
    block->clear();
    EXPECT_EQ(block->size(), 0);
}

TEST(Document, DimStyles) {
    Document doc;
    DimStyle* style = doc.newDimStyle("ARCH");
    EXPECT_EQ(doc.dimStyle("arch"), style);
    EXPECT_THROW(doc.newDimStyle("ARCH"), ValidationError);
    EXPECT_THROW(doc.dimStyle("MISSING"), NotFoundError);
}

TEST(Document, RenamedDimStyleKeepsNamesUnique) {
    Document doc;
    DimStyle* style = doc.newDimStyle("A");
    style->set("name", "B");

    EXPECT_TRUE(doc.hasDimStyle("B"));
    EXPECT_FALSE(doc.hasDimStyle("A"));
    EXPECT_EQ(doc.dimStyle("b"), style);
    EXPECT_EQ(doc.reverse(style->handle()), QString("B"));
    EXPECT_THROW(doc.newDimStyle("B"), ValidationError);

    // The old name is free again
    DimStyle* other = doc.newDimStyle("A");
    EXPECT_EQ(doc.dimStyle("A"), other);

    EXPECT_THROW(other->set("name", "B"), ValidationError);
    EXPECT_EQ(other->name(), QString("A"));
    EXPECT_THROW(other->set("name", ""), ValidationError);

    // Changing only the case is no collision
    other->set("name", "a");
    EXPECT_EQ(doc.dimStyle("A")->name(), QString("a"));
}

TEST(Document, DeleteBlock) {
    Document doc;
    BlockLayout* block = doc.newAnonymousBlock('D');
    const QString name = block->name();
    const QString handle = block->blockRecordHandle();

    doc.deleteBlock(name);
    EXPECT_FALSE(doc.hasBlock(name));
    EXPECT_THROW(doc.block(name), NotFoundError);
    EXPECT_THROW(doc.reverse(handle), NotFoundError);
    EXPECT_THROW(doc.deleteBlock(name), NotFoundError);
    EXPECT_THROW(doc.deleteBlock("*Model_Space"), ValidationError);
    // Anonymous names are not reused
    EXPECT_NE(doc.newAnonymousBlock('D')->name(), name);
}

TEST(Document, AddLinearDimension) {
    Document doc;
    Dimension* dim = doc.addLinearDimension(gp_Pnt(3, 2, 0), gp_Pnt(0, 0, 0), gp_Pnt(3, 0, 0),
                                            0.0, "Standard", {{"dimtxt", 0.5}});
    EXPECT_EQ(dim->dimType(), DIM_LINEAR);
    EXPECT_EQ(dim->data().dimtype & DIM_BLOCK_EXCLUSIVE, DIM_BLOCK_EXCLUSIVE);
    EXPECT_EQ(dim->data().dimstyle, QString("Standard"));
    expectPoint(dim->data().defpoint3, 3, 0, 0);
    EXPECT_TRUE(dim->data().geometry.isEmpty());
    EXPECT_EQ(dim->overrides().size(), 1);
    EXPECT_EQ(doc.dimensions().size(), 1u);
}

TEST(Document, AddLinearDimensionValidatesFirst) {
    Document doc;
    EXPECT_THROW(doc.addLinearDimension(gp_Pnt(), gp_Pnt(), gp_Pnt(1, 0, 0), 0.0, "MISSING"),
                 NotFoundError);
    EXPECT_THROW(doc.addLinearDimension(gp_Pnt(), gp_Pnt(), gp_Pnt(1, 0, 0), 0.0, "Standard",
                                        {{"dimfoo", 1}}),
                 SchemaError);
    EXPECT_TRUE(doc.dimensions().empty());
}
