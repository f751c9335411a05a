// roles_test.cpp - font-statistics role classification

#include "docrecon_types.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <vector>

TEST(RoleClassifier, TitleBySize) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Title", 24.0, true),
        make_para("para-1", repeat("Body ", 50), 12.0),
    };
    classify_roles(paras, 18.0, 14.0);

    ASSERT_TRUE(paras[0].role.has_value());
    EXPECT_EQ(*paras[0].role, Role::title);
    ASSERT_TRUE(paras[1].role.has_value());
    EXPECT_EQ(*paras[1].role, Role::none);
}

TEST(RoleClassifier, HeadingBySize) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Section", 15.0),
        make_para("para-1", repeat("Body text here. ", 20), 12.0),
    };
    classify_roles(paras, 18.0, 14.0);

    EXPECT_EQ(*paras[0].role, Role::section_heading);
    EXPECT_EQ(*paras[1].role, Role::none);
}

TEST(RoleClassifier, HeadingByBoldAndSlightlyLarger) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Bold heading", 13.5, true),
        make_para("para-1", repeat("Body text here. ", 20), 12.0),
    };
    classify_roles(paras, 18.0, 14.0);

    EXPECT_EQ(*paras[0].role, Role::section_heading);
}

TEST(RoleClassifier, BoldAtBodySizeStaysBody) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Emphasised", 12.0, true),
        make_para("para-1", repeat("Body text here. ", 20), 12.0),
    };
    classify_roles(paras, 18.0, 14.0);

    EXPECT_EQ(*paras[0].role, Role::none);
    EXPECT_EQ(*paras[1].role, Role::none);
}

TEST(RoleClassifier, TitleByRelativeSizeAndBold) {
    // 16 >= 10 * 1.5 and bold, but below both absolute thresholds
    std::vector<Paragraph> paras = {
        make_para("para-0", "Big bold", 16.0, true),
        make_para("para-1", repeat("Small body text. ", 20), 10.0),
    };
    classify_roles(paras, 18.0, 17.0);

    EXPECT_EQ(*paras[0].role, Role::title);
}

TEST(RoleClassifier, CustomThresholds) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Medium", 14.0),
        make_para("para-1", repeat("Body text here. ", 20), 12.0),
    };
    classify_roles(paras, 14.0, 13.0);

    EXPECT_EQ(*paras[0].role, Role::title);
}

TEST(RoleClassifier, EmptyInputIsNoOp) {
    std::vector<Paragraph> paras;
    classify_roles(paras, 18.0, 14.0);
    EXPECT_TRUE(paras.empty());
}

TEST(RoleClassifier, Idempotent) {
    std::vector<Paragraph> paras = {
        make_para("para-0", "Title", 24.0, true),
        make_para("para-1", "Heading", 15.0),
        make_para("para-2", "Bold", 13.5, true),
        make_para("para-3", repeat("Body ", 40), 12.0),
    };
    classify_roles(paras, 18.0, 14.0);
    std::vector<Paragraph> again = paras;
    classify_roles(again, 18.0, 14.0);

    for (size_t i = 0; i < paras.size(); ++i)
        EXPECT_EQ(*paras[i].role, *again[i].role) << "paragraph " << i;
}

TEST(BodyFontSize, WeightedByLength) {
    // many short 14pt lines lose to one long 11pt paragraph
    std::vector<Paragraph> paras = {
        make_para("para-0", "a", 14.0),
        make_para("para-1", "b", 14.0),
        make_para("para-2", "c", 14.0),
        make_para("para-3", repeat("x", 150), 11.0),
    };
    EXPECT_DOUBLE_EQ(detect_body_font_size(paras), 11.0);
}

TEST(BodyFontSize, WeightCappedAt200) {
    std::vector<Paragraph> paras = {
        make_para("para-0", repeat("x", 1000), 9.0),
        make_para("para-1", repeat("y", 150), 11.0),
        make_para("para-2", repeat("z", 150), 11.0),
    };
    EXPECT_DOUBLE_EQ(detect_body_font_size(paras), 11.0);
}

TEST(BodyFontSize, DefaultsWithoutText) {
    std::vector<Paragraph> paras = {make_para("para-0", "", 30.0)};
    EXPECT_DOUBLE_EQ(detect_body_font_size(paras), 12.0);
    EXPECT_DOUBLE_EQ(detect_body_font_size({}), 12.0);
}

TEST(BodyFontSize, TieGoesToSmallestSize) {
    std::vector<Paragraph> paras = {
        make_para("para-0", repeat("x", 50), 14.0),
        make_para("para-1", repeat("y", 50), 10.0),
    };
    EXPECT_DOUBLE_EQ(detect_body_font_size(paras), 10.0);
}

TEST(BodyFontSize, CountsCodePointsNotBytes) {
    // 60 two-byte characters weigh 60, not 120
    std::vector<Paragraph> paras = {
        make_para("para-0", repeat("\xc3\xa9", 60), 14.0),
        make_para("para-1", repeat("e", 100), 10.0),
    };
    EXPECT_DOUBLE_EQ(detect_body_font_size(paras), 10.0);
}
