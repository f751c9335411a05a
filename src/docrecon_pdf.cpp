#include "docrecon.h"
#include "docrecon_types.h"

#include <fpdfview.h>
#include <fpdf_edit.h>
#include <fpdf_text.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <climits>
#include <cmath>
#include <cstring>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using json = nlohmann::json;

/* ── helpers ────────────────────────────────────────────────────────── */

static void append_codepoint(std::string& s, unsigned int cp) {
    if (cp < 0x80) {
        s += static_cast<char>(cp);
    } else if (cp < 0x800) {
        s += static_cast<char>(0xC0 | (cp >> 6));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        s += static_cast<char>(0xE0 | (cp >> 12));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        s += static_cast<char>(0xF0 | (cp >> 18));
        s += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static bool is_blank(unsigned int cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == '\n' || cp == 0xA0;
}

/* intern by name only */
struct FontTable {
    std::unordered_map<std::string, uint32_t> map;
    std::vector<std::string> names;

    uint32_t intern(const char* name) {
        std::string key = name ? name : "";
        auto it = map.find(key);
        if (it != map.end()) return it->second;
        uint32_t id = static_cast<uint32_t>(names.size());
        map[key] = id;
        names.push_back(key);
        return id;
    }
};

struct CharInfo {
    uint32_t font_id;
    double font_size;
    bool bold;
    unsigned int color_r, color_g, color_b, color_a;
    double left, top, right, bottom;
    unsigned int codepoint;
};

/* one style-consistent run; becomes a span */
struct Run {
    TextSpan span;
    BoundingBox bbox;
};

static bool same_style(const CharInfo& a, const CharInfo& b) {
    return a.font_id == b.font_id &&
           a.font_size == b.font_size &&
           a.bold == b.bold &&
           a.color_r == b.color_r && a.color_g == b.color_g &&
           a.color_b == b.color_b && a.color_a == b.color_a;
}

static bool same_line(const CharInfo& a, const CharInfo& b) {
    double line_height = a.bottom - a.top;
    if (line_height <= 0) line_height = a.font_size;
    return std::fabs(a.top - b.top) < line_height * 0.5;
}

static bool gap_ok(const CharInfo& prev, const CharInfo& cur) {
    return (cur.left - prev.right) < prev.font_size * 0.35;
}

static bool runs_share_line(const BoundingBox& a, const BoundingBox& b) {
    double line_height = a.y_max - a.y_min;
    return std::fabs(a.y_min - b.y_min) < line_height * 0.5;
}

static void grow(BoundingBox& into, const BoundingBox& bb) {
    if (bb.x_min < into.x_min) into.x_min = bb.x_min;
    if (bb.y_min < into.y_min) into.y_min = bb.y_min;
    if (bb.x_max > into.x_max) into.x_max = bb.x_max;
    if (bb.y_max > into.y_max) into.y_max = bb.y_max;
}

/* ── text: chars → runs → lines → blocks ────────────────────────────── */

static std::vector<Run> collect_runs(FPDF_TEXTPAGE text_page, double page_height,
                                     FontTable& fonts) {
    int char_count = FPDFText_CountChars(text_page);
    std::vector<CharInfo> chars;
    chars.reserve(char_count > 0 ? char_count : 0);

    for (int ci = 0; ci < char_count; ++ci) {
        unsigned int cp = FPDFText_GetUnicode(text_page, ci);
        if (cp == 0 || cp == 0xFFFE || cp == 0xFFFF) continue;
        if (cp == '\r' || cp == '\n') continue;   /* generated line breaks */

        double left, right, bottom, top;
        if (!FPDFText_GetCharBox(text_page, ci, &left, &right, &bottom, &top)) continue;

        /* PDFium gives bottom-up coordinates; convert to top-down */
        double tl_y = page_height - top;
        double br_y = page_height - bottom;

        char font_name_buf[256] = {};
        int font_flags = 0;
        FPDFText_GetFontInfo(text_page, ci, font_name_buf, sizeof(font_name_buf), &font_flags);
        double font_size = FPDFText_GetFontSize(text_page, ci);
        bool bold = ((font_flags >> 18) & 1) || FPDFText_GetFontWeight(text_page, ci) >= 700;

        unsigned int r = 0, g = 0, b = 0, a = 255;
        FPDFText_GetFillColor(text_page, ci, &r, &g, &b, &a);

        uint32_t fid = fonts.intern(font_name_buf);
        chars.push_back({fid, font_size, bold, r, g, b, a, left, tl_y, right, br_y, cp});
    }

    std::vector<Run> runs;
    for (size_t i = 0; i < chars.size(); ) {
        const CharInfo& first = chars[i];

        if (is_blank(first.codepoint)) {
            ++i;
            continue;
        }

        Run run;
        run.bbox = {first.left, first.top, first.right, first.bottom};
        append_codepoint(run.span.text, first.codepoint);

        size_t j = i + 1;
        while (j < chars.size()) {
            const CharInfo& cur = chars[j];
            if (!same_style(first, cur) || !same_line(first, cur)) break;
            if (!gap_ok(chars[j - 1], cur)) break;
            append_codepoint(run.span.text, cur.codepoint);
            grow(run.bbox, {cur.left, cur.top, cur.right, cur.bottom});
            ++j;
        }

        while (!run.span.text.empty() &&
               (run.span.text.back() == ' ' || run.span.text.back() == '\t'))
            run.span.text.pop_back();

        if (!run.span.text.empty()) {
            run.span.size  = first.font_size;
            run.span.font  = fonts.names[first.font_id];
            run.span.flags = first.bold ? 16 : 0;
            runs.push_back(std::move(run));
        }

        i = j;
    }
    return runs;
}

/*
 * Runs on one baseline form a line. A line joins the open block when the
 * vertical gap to the previous line is under one line height and its
 * font size is within 20% of the block's first line.
 */
static void group_blocks(const std::vector<Run>& runs, std::vector<TextBlock>& out) {
    struct Line { TextLine line; BoundingBox bbox; double size; };
    std::vector<Line> lines;

    for (const auto& run : runs) {
        if (!lines.empty() && runs_share_line(lines.back().bbox, run.bbox)) {
            lines.back().line.spans.push_back(run.span);
            grow(lines.back().bbox, run.bbox);
            continue;
        }
        Line l;
        l.line.spans.push_back(run.span);
        l.bbox = run.bbox;
        l.size = run.span.size;
        lines.push_back(std::move(l));
    }

    double block_size = 0;
    BoundingBox prev;
    for (auto& l : lines) {
        bool join = false;
        if (!out.empty()) {
            double line_height = prev.y_max - prev.y_min;
            double gap = l.bbox.y_min - prev.y_max;
            bool close = gap >= -line_height * 0.5 && gap < line_height;
            bool similar = block_size > 0 && std::fabs(l.size - block_size) <= block_size * 0.2;
            join = close && similar;
        }

        if (join) {
            out.back().lines.push_back(std::move(l.line));
            grow(out.back().bbox, l.bbox);
        } else {
            TextBlock block;
            block.bbox = l.bbox;
            block.lines.push_back(std::move(l.line));
            out.push_back(std::move(block));
            block_size = l.size;
        }
        prev = l.bbox;
    }
}

/* ── images ─────────────────────────────────────────────────────────── */

/* extension for the outermost stream filter, "" when not a file format */
static std::string image_ext(FPDF_PAGEOBJECT obj) {
    int count = FPDFImageObj_GetImageFilterCount(obj);
    if (count <= 0) return "";

    unsigned long len = FPDFImageObj_GetImageFilter(obj, count - 1, nullptr, 0);
    if (len == 0) return "";
    std::vector<char> buf(len);
    FPDFImageObj_GetImageFilter(obj, count - 1, buf.data(), len);
    std::string filter(buf.data());

    if (filter == "DCTDecode") return "jpeg";
    if (filter == "JPXDecode") return "jpx";
    return "";
}

static void extract_images(FPDF_PAGE page, double page_height, PagePrimitives& out) {
    int count = FPDFPage_CountObjects(page);
    for (int oi = 0; oi < count; ++oi) {
        FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page, oi);
        if (!obj || FPDFPageObj_GetType(obj) != FPDF_PAGEOBJ_IMAGE) continue;

        std::string ext = image_ext(obj);
        if (ext.empty()) {
            spdlog::warn("skipping image object {} on page {}: unsupported encoding",
                         oi, out.page_number);
            continue;
        }

        unsigned long size = FPDFImageObj_GetImageDataRaw(obj, nullptr, 0);
        if (size == 0) {
            spdlog::warn("skipping image object {} on page {}: no data", oi, out.page_number);
            continue;
        }

        ImageCandidate cand;
        cand.ext = ext;
        cand.data.resize(size);
        if (FPDFImageObj_GetImageDataRaw(obj, cand.data.data(), size) != size) {
            spdlog::warn("skipping image object {} on page {}: short read", oi, out.page_number);
            continue;
        }

        float left, bottom, right, top;
        if (FPDFPageObj_GetBounds(obj, &left, &bottom, &right, &top))
            cand.rects.push_back({left, page_height - top, right, page_height - bottom});

        out.images.push_back(std::move(cand));
    }
}

/* ── extract one page ───────────────────────────────────────────────── */

static void extract_page(FPDF_DOCUMENT doc, int pi, bool include_images,
                         FontTable& fonts, PagePrimitives& out) {
    FPDF_PAGE page = FPDF_LoadPage(doc, pi);
    if (!page) {
        spdlog::warn("failed to load page {}", pi + 1);
        return;
    }

    double page_height = FPDF_GetPageHeight(page);

    FPDF_TEXTPAGE text_page = FPDFText_LoadPage(page);
    if (text_page) {
        std::vector<Run> runs = collect_runs(text_page, page_height, fonts);
        group_blocks(runs, out.blocks);
        FPDFText_ClosePage(text_page);
    } else {
        spdlog::warn("no text page for page {}", pi + 1);
    }

    if (include_images)
        extract_images(page, page_height, out);

    FPDF_ClosePage(page);
}

/* trimmed character count of a page's text */
static int page_char_count(FPDF_TEXTPAGE text_page) {
    int n = FPDFText_CountChars(text_page);
    int first = -1, last = -1;
    for (int ci = 0; ci < n; ++ci) {
        unsigned int cp = FPDFText_GetUnicode(text_page, ci);
        if (cp == 0 || is_blank(cp)) continue;
        if (first < 0) first = ci;
        last = ci;
    }
    return first < 0 ? 0 : last - first + 1;
}

/* ── public backend API ─────────────────────────────────────────────── */

void docrecon_init(void)    { FPDF_InitLibrary(); }
void docrecon_destroy(void) { FPDF_DestroyLibrary(); }

ExtractResult extract_pdf(const void* buf, size_t len, const char* password,
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

    if (!buf || len == 0 || len > static_cast<size_t>(INT_MAX)) {
        result.status = EXTRACT_ERR_DOCUMENT;
        result.error  = "Invalid or corrupted PDF file";
        return result;
    }

    FPDF_DOCUMENT doc = FPDF_LoadMemDocument(buf, static_cast<int>(len), password);
    if (!doc) {
        result.status = EXTRACT_ERR_DOCUMENT;
        result.error  = "Invalid or corrupted PDF file (pdfium error " +
                        std::to_string(FPDF_GetLastError()) + ")";
        return result;
    }

    int total = FPDF_GetPageCount(doc);

    std::vector<int> selected;
    int pages_for_model = 0;
    if (!select_pages(cfg.pages, total, selected, pages_for_model, result.error)) {
        FPDF_CloseDocument(doc);
        result.status = EXTRACT_ERR_VALIDATION;
        return result;
    }

    FontTable fonts;
    std::vector<PagePrimitives> pages;
    pages.reserve(selected.size());
    for (int p : selected) {
        PagePrimitives prim;
        prim.page_number = p;
        extract_page(doc, p - 1, cfg.include_images, fonts, prim);
        pages.push_back(std::move(prim));
    }

    FPDF_CloseDocument(doc);
    return reconstruct(pages, cfg, "pdfium", pages_for_model);
}

int docrecon_detect_text_layer(const void* buf, size_t len, const char* password,
                               int char_threshold,
                               docrecon_page_callback cb, void* user_data) {
    if (!cb || !buf || len == 0 || len > static_cast<size_t>(INT_MAX)) return -1;

    FPDF_DOCUMENT doc = FPDF_LoadMemDocument(buf, static_cast<int>(len), password);
    if (!doc) return -1;

    int page_count = FPDF_GetPageCount(doc);
    for (int pi = 0; pi < page_count; ++pi) {
        int char_count = 0;
        FPDF_PAGE page = FPDF_LoadPage(doc, pi);
        if (page) {
            FPDF_TEXTPAGE text_page = FPDFText_LoadPage(page);
            if (text_page) {
                char_count = page_char_count(text_page);
                FPDFText_ClosePage(text_page);
            }
            FPDF_ClosePage(page);
        } else {
            spdlog::warn("failed to load page {}", pi + 1);
        }

        json obj;
        obj["page"]           = pi + 1;
        obj["has_text_layer"] = char_count >= char_threshold;
        obj["char_count"]     = char_count;

        std::string s = obj.dump();
        int rc = cb(s.c_str(), user_data);
        if (rc != 0) {
            FPDF_CloseDocument(doc);
            return rc;
        }
    }

    FPDF_CloseDocument(doc);
    return 0;
}
