#include "docrecon_types.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static double overlap_1d(double a_min, double a_max, double b_min, double b_max) {
    return std::max(0.0, std::min(a_max, b_max) - std::max(a_min, b_min));
}

static ContentBlock make_block(BlockType type, int page_number,
                               const BoundingBox& bbox, const std::string& id) {
    ContentBlock block;
    block.type        = type;
    block.page_number = page_number;
    block.y_position  = bbox.y_min;
    block.content_id  = id;
    return block;
}

/* ── overlap filter ─────────────────────────────────────────────────── */

const char* block_type_name(BlockType type) {
    switch (type) {
    case BlockType::paragraph: return "paragraph";
    case BlockType::table:     return "table";
    case BlockType::image:     return "image";
    }
    return "paragraph";
}

bool overlaps_any_table(const Paragraph& para, const std::vector<Table>& tables) {
    const BoundingBox& p = para.bounding_box;
    for (const auto& table : tables) {
        if (table.page_number != para.page_number) continue;
        const BoundingBox& t = table.bounding_box;
        double overlap_x = overlap_1d(p.x_min, p.x_max, t.x_min, t.x_max);
        double overlap_y = overlap_1d(p.y_min, p.y_max, t.y_min, t.y_max);
        if (overlap_x > 0 && overlap_y > 0)
            return true;
    }
    return false;
}

std::vector<Paragraph> filter_table_overlaps(const std::vector<Paragraph>& paragraphs,
                                             const std::vector<Table>& tables) {
    if (tables.empty()) return paragraphs;

    std::vector<Paragraph> kept;
    kept.reserve(paragraphs.size());
    for (const auto& para : paragraphs) {
        if (!overlaps_any_table(para, tables))
            kept.push_back(para);
    }
    return kept;
}

/* ── sequencer ──────────────────────────────────────────────────────── */

/*
 * Paragraphs, then tables, then images, each in discovery order; the
 * stable sort keeps that order among equal (page, y) keys.
 */
std::vector<ContentBlock> sequence_content(const std::vector<Paragraph>& paragraphs,
                                           const std::vector<Table>& tables,
                                           const std::vector<Image>& images) {
    std::vector<ContentBlock> blocks;
    blocks.reserve(paragraphs.size() + tables.size() + images.size());

    for (const auto& para : paragraphs)
        blocks.push_back(make_block(BlockType::paragraph, para.page_number,
                                    para.bounding_box, para.id));
    for (const auto& table : tables)
        blocks.push_back(make_block(BlockType::table, table.page_number,
                                    table.bounding_box, table.id));
    for (const auto& img : images)
        blocks.push_back(make_block(BlockType::image, img.page_number,
                                    img.bounding_box, img.id));

    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const ContentBlock& a, const ContentBlock& b) {
                         if (a.page_number != b.page_number)
                             return a.page_number < b.page_number;
                         return a.y_position < b.y_position;
                     });
    return blocks;
}

/* ── assembler ──────────────────────────────────────────────────────── */

DocumentModel assemble_document(const std::vector<Paragraph>& paragraphs,
                                std::vector<Table> tables,
                                std::vector<Image> images,
                                int total_pages) {
    DocumentModel model;
    model.pages      = total_pages;
    model.paragraphs = filter_table_overlaps(paragraphs, tables);
    model.tables     = std::move(tables);
    model.images     = std::move(images);

    /* extraction order, not reading order */
    for (size_t i = 0; i < model.paragraphs.size(); ++i) {
        if (i) model.full_text += '\n';
        model.full_text += model.paragraphs[i].content;
    }

    model.content_blocks = sequence_content(model.paragraphs, model.tables, model.images);
    return model;
}
