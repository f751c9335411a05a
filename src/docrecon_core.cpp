#include "docrecon.h"
#include "docrecon_types.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <new>
#include <string>
#include <utility>

/* ── cursor implementation ──────────────────────────────────────────── */

struct docrecon_cursor {
    ExtractResult result;

    /* whole-document views, built on first request */
    docrecon_doc doc_view;
    std::string  doc_json;
    std::string  html;
    std::string  metadata_json;

    /* paragraph iterator */
    size_t      paragraph_index;
    std::string paragraph_json;

    /* table iterator */
    size_t      table_index;
    std::string table_json;

    /* image iterator */
    size_t      image_index;
    std::string image_json;

    /* content-block iterator */
    size_t         block_index;
    docrecon_block block_view;
    std::string    block_json;
};

/* ── helpers ────────────────────────────────────────────────────────── */

static ExtractionConfig to_config(const docrecon_options* opts) {
    ExtractionConfig cfg;
    if (!opts) return cfg;
    cfg.title_threshold   = opts->title_threshold;
    cfg.heading_threshold = opts->heading_threshold;
    cfg.include_images    = opts->include_images != 0;
    cfg.pages             = opts->pages ? opts->pages : "";
    return cfg;
}

static docrecon_cursor* wrap_result(ExtractResult r) {
    auto* c = new (std::nothrow) docrecon_cursor{};
    if (!c) return nullptr;
    c->result          = std::move(r);
    c->paragraph_index = 0;
    c->table_index     = 0;
    c->image_index     = 0;
    c->block_index     = 0;

    if (c->result.status != EXTRACT_OK)
        spdlog::warn("extraction failed ({}): {}", c->result.status, c->result.error);
    return c;
}

static ExtractResult internal_error(const std::exception& e) {
    ExtractResult r;
    r.status = EXTRACT_ERR_INTERNAL;
    r.error  = e.what();
    return r;
}

static bool usable(docrecon_cursor* c) {
    return c && c->result.status == EXTRACT_OK;
}

/* ── options ────────────────────────────────────────────────────────── */

void docrecon_default_options(docrecon_options* opts) {
    if (!opts) return;
    ExtractionConfig cfg;
    opts->title_threshold   = cfg.title_threshold;
    opts->heading_threshold = cfg.heading_threshold;
    opts->include_images    = cfg.include_images ? 1 : 0;
    opts->pages             = nullptr;
}

/* ── open ───────────────────────────────────────────────────────────── */

docrecon_cursor* docrecon_open_pdf(const void* buf, size_t len,
                                   const char* password,
                                   const docrecon_options* opts) {
    try {
        return wrap_result(extract_pdf(buf, len, password, to_config(opts)));
    } catch (const std::exception& e) {
        return wrap_result(internal_error(e));
    }
}

docrecon_cursor* docrecon_open_primitives(const char* json, size_t len,
                                          const docrecon_options* opts) {
    try {
        return wrap_result(extract_primitives(json, len, to_config(opts)));
    } catch (const std::exception& e) {
        return wrap_result(internal_error(e));
    }
}

int docrecon_get_status(docrecon_cursor* c) {
    return c ? c->result.status : DOCRECON_ERR_INTERNAL;
}

const char* docrecon_get_error(docrecon_cursor* c) {
    if (!c || c->result.status == EXTRACT_OK) return nullptr;
    return c->result.error.c_str();
}

/* ── whole document ─────────────────────────────────────────────────── */

const docrecon_doc* docrecon_get_doc(docrecon_cursor* c) {
    if (!usable(c)) return nullptr;
    const DocumentModel& m = c->result.model;
    c->doc_view.model_used      = m.model_used.c_str();
    c->doc_view.pages           = m.pages;
    c->doc_view.pages_processed = c->result.metadata.pages_processed;
    c->doc_view.paragraph_count = m.paragraphs.size();
    c->doc_view.table_count     = m.tables.size();
    c->doc_view.image_count     = m.images.size();
    c->doc_view.block_count     = m.content_blocks.size();
    c->doc_view.full_text       = m.full_text.c_str();
    return &c->doc_view;
}

const char* docrecon_get_json(docrecon_cursor* c) {
    if (!usable(c)) return nullptr;
    if (c->doc_json.empty())
        c->doc_json = document_to_json(c->result.model);
    return c->doc_json.c_str();
}

const char* docrecon_get_html(docrecon_cursor* c) {
    if (!usable(c)) return nullptr;
    if (c->html.empty())
        c->html = render_html(c->result.model);
    return c->html.c_str();
}

const char* docrecon_get_metadata_json(docrecon_cursor* c) {
    if (!usable(c)) return nullptr;
    if (c->metadata_json.empty())
        c->metadata_json = metadata_to_json(c->result.metadata, c->result.model.model_used);
    return c->metadata_json.c_str();
}

/* ── row iterators ──────────────────────────────────────────────────── */

const char* docrecon_next_paragraph_json(docrecon_cursor* c) {
    if (!usable(c) || c->paragraph_index >= c->result.model.paragraphs.size()) return nullptr;
    c->paragraph_json = paragraph_to_json(c->result.model.paragraphs[c->paragraph_index++]);
    return c->paragraph_json.c_str();
}

const char* docrecon_next_table_json(docrecon_cursor* c) {
    if (!usable(c) || c->table_index >= c->result.model.tables.size()) return nullptr;
    c->table_json = table_to_json(c->result.model.tables[c->table_index++]);
    return c->table_json.c_str();
}

const char* docrecon_next_image_json(docrecon_cursor* c) {
    if (!usable(c) || c->image_index >= c->result.model.images.size()) return nullptr;
    c->image_json = image_to_json(c->result.model.images[c->image_index++]);
    return c->image_json.c_str();
}

const docrecon_block* docrecon_next_block(docrecon_cursor* c) {
    if (!usable(c) || c->block_index >= c->result.model.content_blocks.size()) return nullptr;
    const ContentBlock& b = c->result.model.content_blocks[c->block_index++];
    c->block_view.type        = block_type_name(b.type);
    c->block_view.page_number = b.page_number;
    c->block_view.y_position  = b.y_position;
    c->block_view.content_id  = b.content_id.c_str();
    return &c->block_view;
}

const char* docrecon_next_block_json(docrecon_cursor* c) {
    if (!usable(c) || c->block_index >= c->result.model.content_blocks.size()) return nullptr;
    c->block_json = block_to_json(c->result.model.content_blocks[c->block_index++]);
    return c->block_json.c_str();
}

/* ── close ──────────────────────────────────────────────────────────── */

void docrecon_close(docrecon_cursor* c) {
    delete c;
}
