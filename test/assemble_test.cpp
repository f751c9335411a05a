// assemble_test.cpp - overlap filter, reading-order sequencing and assembly

#include "docrecon_types.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// ========================================================================
// OverlapFilter
// ========================================================================

TEST(OverlapFilter, DropsParagraphInsideTable) {
    std::vector<Paragraph> paras = {make_para("para-0", "Cell text", 12, false, 1, {0, 0, 100, 20})};
    std::vector<Table> tables = {make_table("table-0", 1, {40, 10, 300, 200})};

    EXPECT_TRUE(filter_table_overlaps(paras, tables).empty());
}

TEST(OverlapFilter, KeepsParagraphWhenTableOnOtherPage) {
    std::vector<Paragraph> paras = {make_para("para-0", "Cell text", 12, false, 1, {0, 0, 100, 20})};
    std::vector<Table> tables = {make_table("table-0", 2, {40, 10, 300, 200})};

    auto kept = filter_table_overlaps(paras, tables);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].id, "para-0");
}

TEST(OverlapFilter, TouchingEdgesAreNotOverlap) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Above", 12, false, 1, {0, 0, 100, 10}),
        make_para("para-1", "Beside", 12, false, 1, {300, 50, 400, 60}),
    };
    std::vector<Table> tables = {make_table("table-0", 1, {0, 10, 300, 200})};

    EXPECT_EQ(filter_table_overlaps(paras, tables).size(), 2u);
}

TEST(OverlapFilter, PositiveOverlapOnBothAxesRequired) {
    Paragraph p = make_para("para-0", "x", 12, false, 1, {0, 0, 50, 50});
    std::vector<Table> tables = {make_table("table-0", 1, {49, 49, 60, 60})};
    EXPECT_TRUE(overlaps_any_table(p, tables));

    std::vector<Table> zero_area = {make_table("table-1", 1, {10, 10, 10, 40})};
    EXPECT_FALSE(overlaps_any_table(p, zero_area));
}

TEST(OverlapFilter, NoTablesKeepsEverything) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "a"),
        make_para("para-1", "b"),
    };
    EXPECT_EQ(filter_table_overlaps(paras, {}).size(), 2u);
}

// ========================================================================
// ContentSequencer
// ========================================================================

TEST(ContentSequencer, OrdersByPageThenY) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "page two", 12, false, 2, {0, 10, 10, 20}),
        make_para("para-1", "lower", 12, false, 1, {0, 300, 10, 310}),
        make_para("para-2", "upper", 12, false, 1, {0, 50, 10, 60}),
    };
    auto blocks = sequence_content(paras, {}, {});

    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].content_id, "para-2");
    EXPECT_EQ(blocks[1].content_id, "para-1");
    EXPECT_EQ(blocks[2].content_id, "para-0");

    for (size_t i = 1; i < blocks.size(); ++i) {
        bool ordered = blocks[i - 1].page_number < blocks[i].page_number ||
                       (blocks[i - 1].page_number == blocks[i].page_number &&
                        blocks[i - 1].y_position <= blocks[i].y_position);
        EXPECT_TRUE(ordered) << "block " << i;
    }
}

TEST(ContentSequencer, TiesKeepParagraphTableImageOrder) {
    std::vector<Image> images = {make_image("img-0", 1, {0, 100, 10, 110})};
    std::vector<Table> tables = {make_table("table-0", 1, {0, 100, 10, 110})};
    std::vector<Paragraph> paras = {
        make_para("para-0", "a", 12, false, 1, {0, 100, 10, 110}),
        make_para("para-1", "b", 12, false, 1, {0, 100, 10, 110}),
    };
    auto blocks = sequence_content(paras, tables, images);

    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks[0].content_id, "para-0");
    EXPECT_EQ(blocks[1].content_id, "para-1");
    EXPECT_EQ(blocks[2].content_id, "table-0");
    EXPECT_EQ(blocks[3].content_id, "img-0");
    EXPECT_EQ(blocks[2].type, BlockType::table);
    EXPECT_EQ(blocks[3].type, BlockType::image);
}

TEST(ContentSequencer, UsesTopEdgeAsPosition) {
    std::vector<Table> tables = {make_table("table-0", 3, {5, 42.5, 50, 90})};
    auto blocks = sequence_content({}, tables, {});

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].page_number, 3);
    EXPECT_DOUBLE_EQ(blocks[0].y_position, 42.5);
}

// ========================================================================
// DocumentModelAssembler
// ========================================================================

TEST(Assembler, BasicAssembly) {
    std::vector<Paragraph> paras = {make_para("para-0", "Hello world", 12, false, 1, {0, 0, 100, 20})};
    DocumentModel model = assemble_document(paras, {}, {}, 1);

    EXPECT_EQ(model.pages, 1);
    ASSERT_EQ(model.paragraphs.size(), 1u);
    EXPECT_EQ(model.full_text, "Hello world");
    ASSERT_EQ(model.content_blocks.size(), 1u);
    EXPECT_EQ(model.content_blocks[0].type, BlockType::paragraph);
}

TEST(Assembler, FullTextKeepsExtractionOrder) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "first extracted", 12, false, 1, {0, 500, 10, 510}),
        make_para("para-1", "second extracted", 12, false, 1, {0, 100, 10, 110}),
        make_para("para-2", "third extracted", 12, false, 1, {0, 300, 10, 310}),
    };
    DocumentModel model = assemble_document(paras, {}, {}, 1);

    EXPECT_EQ(model.full_text, "first extracted\nsecond extracted\nthird extracted");

    ASSERT_EQ(model.content_blocks.size(), 3u);
    EXPECT_EQ(model.content_blocks[0].content_id, "para-1");
    EXPECT_EQ(model.content_blocks[1].content_id, "para-2");
    EXPECT_EQ(model.content_blocks[2].content_id, "para-0");
}

TEST(Assembler, FilteredParagraphsLeaveTextAndBlocks) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Outside", 12, false, 1, {0, 0, 100, 20}),
        make_para("para-1", "Inside", 12, false, 1, {60, 120, 90, 130}),
    };
    std::vector<Table> tables = {make_table("table-0", 1, {50, 100, 300, 200}, 1, 1)};
    std::vector<Image> images = {make_image("img-0", 1, {0, 250, 10, 260})};

    DocumentModel model = assemble_document(paras, tables, images, 4);

    ASSERT_EQ(model.paragraphs.size(), 1u);
    EXPECT_EQ(model.paragraphs[0].id, "para-0");
    EXPECT_EQ(model.full_text, "Outside");
    ASSERT_EQ(model.tables.size(), 1u);
    ASSERT_EQ(model.images.size(), 1u);
    EXPECT_EQ(model.pages, 4);

    // one block per survivor, nothing for the dropped paragraph
    ASSERT_EQ(model.content_blocks.size(), 3u);
    for (const auto& b : model.content_blocks)
        EXPECT_NE(b.content_id, "para-1");
}

TEST(Assembler, PagesIsNotRecomputed) {
    std::vector<Paragraph> paras = {make_para("para-0", "only page 3", 12, false, 3)};
    DocumentModel model = assemble_document(paras, {}, {}, 10);
    EXPECT_EQ(model.pages, 10);
}

TEST(Assembler, EmptyInput) {
    DocumentModel model = assemble_document({}, {}, {}, 0);
    EXPECT_TRUE(model.paragraphs.empty());
    EXPECT_TRUE(model.tables.empty());
    EXPECT_TRUE(model.images.empty());
    EXPECT_TRUE(model.content_blocks.empty());
    EXPECT_EQ(model.full_text, "");
}
