// cursor_test.cpp - C API over the primitives input

#include "docrecon.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <string>
#include <vector>

using json = nlohmann::json;

class CursorTest : public ::testing::Test {
protected:
    std::string primitives;
    docrecon_options opts;

    void SetUp() override {
        docrecon_default_options(&opts);

        json span_title = {{"text", "Hi"}, {"size", 24}, {"font", "Serif"}, {"flags", 16}};
        json span_body  = {{"text", std::string(120, 'x')}, {"size", 11}, {"font", "Serif"}, {"flags", 0}};
        json doc = {
            {"page_count", 1},
            {"pages", json::array({
                {{"page_number", 1},
                 {"blocks", json::array({
                     {{"bbox", {0, 10, 100, 30}}, {"lines", json::array({{{"spans", json::array({span_title})}}})}},
                     {{"bbox", {0, 300, 100, 330}}, {"lines", json::array({{{"spans", json::array({span_body})}}})}},
                 })},
                 {"tables", json::array({
                     {{"bbox", {0, 100, 100, 200}},
                      {"cells", json::array({json::array({"A", "B"}), json::array({"1", "2"})})}},
                 })}},
            })},
        };
        primitives = doc.dump();
    }

    docrecon_cursor* open() {
        return docrecon_open_primitives(primitives.data(), primitives.size(), &opts);
    }
};

TEST_F(CursorTest, DefaultOptions) {
    EXPECT_DOUBLE_EQ(opts.title_threshold, 18.0);
    EXPECT_DOUBLE_EQ(opts.heading_threshold, 14.0);
    EXPECT_EQ(opts.include_images, 0);
    EXPECT_EQ(opts.pages, nullptr);
}

TEST_F(CursorTest, DocView) {
    docrecon_cursor* cur = open();
    ASSERT_NE(cur, nullptr);
    ASSERT_EQ(docrecon_get_status(cur), DOCRECON_OK);
    EXPECT_EQ(docrecon_get_error(cur), nullptr);

    const docrecon_doc* doc = docrecon_get_doc(cur);
    ASSERT_NE(doc, nullptr);
    EXPECT_STREQ(doc->model_used, "primitives");
    EXPECT_EQ(doc->pages, 1);
    EXPECT_EQ(doc->pages_processed, 1);
    EXPECT_EQ(doc->paragraph_count, 2u);
    EXPECT_EQ(doc->table_count, 1u);
    EXPECT_EQ(doc->image_count, 0u);
    EXPECT_EQ(doc->block_count, 3u);
    EXPECT_EQ(std::string(doc->full_text), "Hi\n" + std::string(120, 'x'));

    docrecon_close(cur);
}

TEST_F(CursorTest, BlocksInReadingOrder) {
    docrecon_cursor* cur = open();
    ASSERT_EQ(docrecon_get_status(cur), DOCRECON_OK);

    std::vector<std::string> ids;
    while (const docrecon_block* b = docrecon_next_block(cur))
        ids.push_back(b->content_id);
    EXPECT_EQ(ids, (std::vector<std::string>{"para-0", "table-0", "para-1"}));
    EXPECT_EQ(docrecon_next_block_json(cur), nullptr);

    docrecon_close(cur);
}

TEST_F(CursorTest, RowIterators) {
    docrecon_cursor* cur = open();
    ASSERT_EQ(docrecon_get_status(cur), DOCRECON_OK);

    int paragraphs = 0;
    while (const char* s = docrecon_next_paragraph_json(cur)) {
        json p = json::parse(s);
        EXPECT_TRUE(p.contains("role"));
        ++paragraphs;
    }
    EXPECT_EQ(paragraphs, 2);

    const char* t = docrecon_next_table_json(cur);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(json::parse(t)["id"], "table-0");
    EXPECT_EQ(docrecon_next_table_json(cur), nullptr);
    EXPECT_EQ(docrecon_next_image_json(cur), nullptr);

    docrecon_close(cur);
}

TEST_F(CursorTest, HtmlAndJson) {
    docrecon_cursor* cur = open();
    ASSERT_EQ(docrecon_get_status(cur), DOCRECON_OK);

    std::string html = docrecon_get_html(cur);
    EXPECT_EQ(html.rfind("<html><head><meta charset=\"utf-8\"></head><body><h1>Hi</h1>"
                         "<table border=\"1\" id=\"table-0\">", 0), 0u);

    json j = json::parse(docrecon_get_json(cur));
    EXPECT_EQ(j["model_used"], "primitives");
    EXPECT_EQ(j["content_blocks"].size(), 3u);

    json meta = json::parse(docrecon_get_metadata_json(cur));
    EXPECT_EQ(meta["total_paragraphs"], 2);

    docrecon_close(cur);
}

TEST_F(CursorTest, ValidationErrorCursor) {
    opts.pages = "9-2";
    docrecon_cursor* cur = open();
    ASSERT_NE(cur, nullptr);

    EXPECT_EQ(docrecon_get_status(cur), DOCRECON_ERR_VALIDATION);
    ASSERT_NE(docrecon_get_error(cur), nullptr);
    EXPECT_NE(std::strstr(docrecon_get_error(cur), "start > end"), nullptr);
    EXPECT_EQ(docrecon_get_doc(cur), nullptr);
    EXPECT_EQ(docrecon_get_json(cur), nullptr);
    EXPECT_EQ(docrecon_get_html(cur), nullptr);
    EXPECT_EQ(docrecon_next_block(cur), nullptr);

    docrecon_close(cur);
}

TEST_F(CursorTest, DocumentErrorCursor) {
    const char bad[] = "%PDF-not-really";
    docrecon_cursor* cur = docrecon_open_primitives(bad, sizeof(bad) - 1, &opts);
    ASSERT_NE(cur, nullptr);
    EXPECT_EQ(docrecon_get_status(cur), DOCRECON_ERR_DOCUMENT);
    EXPECT_EQ(docrecon_next_paragraph_json(cur), nullptr);
    docrecon_close(cur);
}

TEST(CursorNull, NullSafe) {
    EXPECT_EQ(docrecon_get_status(nullptr), DOCRECON_ERR_INTERNAL);
    EXPECT_EQ(docrecon_get_doc(nullptr), nullptr);
    EXPECT_EQ(docrecon_next_block(nullptr), nullptr);
    docrecon_close(nullptr);
}
