#include "docrecon_types.h"
#include "docrecon_base64.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using json = nlohmann::json;

/* ── helpers ────────────────────────────────────────────────────────── */

/* byte length of the whitespace code point that starts at s[i], 0 if none */
static size_t space_at(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == ' ' || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F)) return 1;

    auto byte = [&](size_t k) -> unsigned char {
        return i + k < s.size() ? static_cast<unsigned char>(s[i + k]) : 0;
    };
    if (c == 0xC2 && (byte(1) == 0x85 || byte(1) == 0xA0)) return 2;   /* NEL, NBSP */
    if (c == 0xE1 && byte(1) == 0x9A && byte(2) == 0x80) return 3;     /* U+1680 */
    if (c == 0xE2 && byte(1) == 0x80) {
        unsigned char b = byte(2);
        if ((b >= 0x80 && b <= 0x8A) || b == 0xA8 || b == 0xA9 || b == 0xAF) return 3;
    }
    if (c == 0xE2 && byte(1) == 0x81 && byte(2) == 0x9F) return 3;     /* U+205F */
    if (c == 0xE3 && byte(1) == 0x80 && byte(2) == 0x80) return 3;     /* U+3000 */
    return 0;
}

/* trims ASCII and Unicode whitespace from both ends */
static std::string strip(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e) {
        size_t n = space_at(s, b);
        if (n == 0 || b + n > e) break;
        b += n;
    }
    while (e > b) {
        size_t n = 0;
        for (size_t k = 1; k <= 3 && k <= e - b; ++k) {
            if (space_at(s, e - k) == k) {
                n = k;
                break;
            }
        }
        if (n == 0) break;
        e -= n;
    }
    return s.substr(b, e - b);
}

/* most frequent name, first encountered wins a tie */
static std::string primary_font(const std::vector<std::string>& names) {
    std::unordered_map<std::string, size_t> counts;
    for (const auto& n : names) ++counts[n];

    std::string best;
    size_t best_count = 0;
    for (const auto& n : names) {
        size_t c = counts[n];
        if (c > best_count) {
            best_count = c;
            best = n;
        }
    }
    return best;
}

static BoundingBox bbox_from_json(const json& j) {
    BoundingBox bb;
    if (j.is_array() && j.size() == 4) {
        bb.x_min = j[0].get<double>();
        bb.y_min = j[1].get<double>();
        bb.x_max = j[2].get<double>();
        bb.y_max = j[3].get<double>();
    } else if (j.is_object()) {
        bb.x_min = j.value("x_min", 0.0);
        bb.y_min = j.value("y_min", 0.0);
        bb.x_max = j.value("x_max", 0.0);
        bb.y_max = j.value("y_max", 0.0);
    }
    return bb;
}

/* ── record builders ────────────────────────────────────────────────── */

void build_paragraphs(const PagePrimitives& page, IdCounters& ids,
                      std::vector<Paragraph>& out) {
    for (const auto& block : page.blocks) {
        std::vector<std::string> lines;
        std::vector<double> sizes;
        std::vector<std::string> fonts;
        bool bold = false;

        for (const auto& line : block.lines) {
            std::string text;
            bool any = false;
            for (const auto& span : line.spans) {
                if (strip(span.text).empty()) continue;
                if (any) text += ' ';
                text += span.text;
                any = true;
                sizes.push_back(span.size);
                fonts.push_back(span.font);
                if (span.flags & 16) bold = true;
            }
            if (any) lines.push_back(std::move(text));
        }

        std::string content;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i) content += '\n';
            content += lines[i];
        }
        content = strip(content);
        if (content.empty()) continue;

        double avg = 12.0;
        if (!sizes.empty()) {
            double sum = 0;
            for (double s : sizes) sum += s;
            avg = sum / static_cast<double>(sizes.size());
        }

        Paragraph para;
        para.id           = "para-" + std::to_string(ids.paragraph++);
        para.content      = std::move(content);
        para.page_number  = page.page_number;
        para.bounding_box = block.bbox;
        para.font.name    = primary_font(fonts);
        para.font.size    = std::round(avg * 10.0) / 10.0;
        para.font.bold    = bold;
        out.push_back(std::move(para));
    }
}

void build_tables(const PagePrimitives& page, IdCounters& ids,
                  std::vector<Table>& out) {
    if (!page.table_error.empty()) {
        spdlog::warn("table detection failed on page {}: {}",
                     page.page_number, page.table_error);
        return;
    }

    for (const auto& cand : page.tables) {
        /* an empty grid still uses up its id */
        std::string id = "table-" + std::to_string(ids.table++);
        if (cand.grid.empty()) continue;

        Table table;
        table.id           = std::move(id);
        table.page_number  = page.page_number;
        table.bounding_box = cand.bbox;
        table.rows         = static_cast<int>(cand.grid.size());
        table.columns      = 0;

        for (size_t r = 0; r < cand.grid.size(); ++r) {
            const auto& row = cand.grid[r];
            table.columns = std::max(table.columns, static_cast<int>(row.size()));
            for (size_t c = 0; c < row.size(); ++c) {
                TableCell cell;
                cell.row_index    = static_cast<int>(r);
                cell.column_index = static_cast<int>(c);
                cell.content      = row[c] ? *row[c] : std::string();
                cell.kind         = r == 0 ? CellKind::column_header : CellKind::content;
                table.cells.push_back(std::move(cell));
            }
        }
        out.push_back(std::move(table));
    }
}

void build_images(const PagePrimitives& page, IdCounters& ids,
                  std::vector<Image>& out) {
    for (const auto& cand : page.images) {
        if (cand.data.empty()) continue;

        Image img;
        img.id          = "img-" + std::to_string(ids.image++);
        img.page_number = page.page_number;
        img.mime_type   = "image/" + cand.ext;
        img.data        = cand.data;
        if (!cand.rects.empty())
            img.bounding_box = cand.rects.front();
        out.push_back(std::move(img));
    }
}

/* ── primitives JSON document ───────────────────────────────────────── */

static TextBlock parse_block(const json& jb) {
    TextBlock block;
    if (jb.contains("bbox")) block.bbox = bbox_from_json(jb["bbox"]);
    if (!jb.contains("lines")) return block;

    for (const auto& jl : jb["lines"]) {
        TextLine line;
        if (jl.contains("spans")) {
            for (const auto& js : jl["spans"]) {
                TextSpan span;
                span.text  = js.value("text", "");
                span.size  = js.value("size", 12.0);
                span.font  = js.value("font", "");
                span.flags = js.value("flags", 0);
                line.spans.push_back(std::move(span));
            }
        }
        block.lines.push_back(std::move(line));
    }
    return block;
}

/* false when the entry has no row-major "cells" grid */
static bool parse_table(const json& jt, TableCandidate& cand) {
    if (!jt.is_object() || !jt.contains("cells") || !jt["cells"].is_array())
        return false;
    if (jt.contains("bbox")) cand.bbox = bbox_from_json(jt["bbox"]);

    for (const auto& jr : jt["cells"]) {
        if (!jr.is_array()) return false;
        std::vector<std::optional<std::string>> row;
        for (const auto& jc : jr) {
            if (jc.is_null())
                row.emplace_back(std::nullopt);
            else if (jc.is_string())
                row.emplace_back(jc.get<std::string>());
            else
                row.emplace_back(jc.dump());
        }
        cand.grid.push_back(std::move(row));
    }
    return true;
}

/* Tables and images fail per page / per item; everything else fails the document. */
static PagePrimitives parse_page(const json& jp, bool include_images) {
    PagePrimitives page;
    page.page_number = jp.at("page_number").get<int>();
    page.table_error = jp.value("table_error", "");

    if (jp.contains("blocks")) {
        for (const auto& jb : jp["blocks"])
            page.blocks.push_back(parse_block(jb));
    }

    if (jp.contains("tables") && page.table_error.empty()) {
        const json& jt = jp["tables"];
        if (!jt.is_array()) {
            page.table_error = "malformed table list";
        } else {
            for (size_t i = 0; i < jt.size(); ++i) {
                TableCandidate cand;
                bool ok = false;
                try {
                    ok = parse_table(jt[i], cand);
                } catch (const json::exception&) {
                    ok = false;
                }
                if (!ok) {
                    page.tables.clear();
                    page.table_error = "malformed table entry " + std::to_string(i);
                    break;
                }
                page.tables.push_back(std::move(cand));
            }
        }
    }

    if (include_images && jp.contains("images")) {
        size_t index = 0;
        for (const auto& ji : jp["images"]) {
            ImageCandidate cand;
            bool ok = false;
            try {
                ok = docrecon_base64::decode(ji.at("data").get<std::string>(), cand.data);
                cand.ext = ji.value("ext", "png");
                if (ji.contains("rects")) {
                    for (const auto& jr : ji["rects"])
                        cand.rects.push_back(bbox_from_json(jr));
                }
            } catch (const json::exception& e) {
                spdlog::warn("failed to read image {} on page {}: {}",
                             index, page.page_number, e.what());
                ++index;
                continue;
            }
            if (!ok) {
                spdlog::warn("failed to decode image {} on page {}: bad base64 payload",
                             index, page.page_number);
            } else {
                page.images.push_back(std::move(cand));
            }
            ++index;
        }
    }

    return page;
}

ExtractResult extract_primitives(const char* json_text, size_t len,
                                 const ExtractionConfig& cfg) {
    ExtractResult result;

    /* validate before touching the document */
    if (!cfg.pages.empty()) {
        std::vector<PageSpan> requested;
        if (!parse_page_range(cfg.pages, requested, result.error)) {
            result.status = EXTRACT_ERR_VALIDATION;
            return result;
        }
    }

    if (!json_text) len = 0;
    std::string text(json_text ? json_text : "", len);
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("pages") ||
        !doc["pages"].is_array()) {
        result.status = EXTRACT_ERR_DOCUMENT;
        result.error  = "Invalid or corrupted primitives document";
        return result;
    }

    std::vector<PagePrimitives> all;
    int page_count = 0;
    try {
        for (const auto& jp : doc["pages"]) {
            all.push_back(parse_page(jp, cfg.include_images));
            page_count = std::max(page_count, all.back().page_number);
        }
        page_count = doc.value("page_count", page_count);
    } catch (const json::exception& e) {
        result.status = EXTRACT_ERR_DOCUMENT;
        result.error  = std::string("Invalid primitives document: ") + e.what();
        return result;
    }

    std::vector<int> selected;
    int pages_for_model = 0;
    if (!select_pages(cfg.pages, page_count, selected, pages_for_model, result.error)) {
        result.status = EXTRACT_ERR_VALIDATION;
        return result;
    }

    /* selected is ascending; keep document order within a page number */
    std::vector<PagePrimitives> chosen;
    for (int p : selected) {
        for (auto& page : all) {
            if (page.page_number == p)
                chosen.push_back(std::move(page));
        }
    }

    return reconstruct(chosen, cfg, "primitives", pages_for_model);
}
