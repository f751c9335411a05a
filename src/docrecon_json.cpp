#include "docrecon_types.h"
#include "docrecon_base64.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

/* ── record → json ──────────────────────────────────────────────────── */

static json bbox_json(const BoundingBox& bb) {
    json obj;
    obj["x_min"] = bb.x_min;
    obj["y_min"] = bb.y_min;
    obj["x_max"] = bb.x_max;
    obj["y_max"] = bb.y_max;
    return obj;
}

/* body text is null, as in the target schema */
static json role_json(const std::optional<Role>& role) {
    if (!role || *role == Role::none) return nullptr;
    return role_name(*role);
}

static json paragraph_json(const Paragraph& p) {
    json obj;
    obj["id"]           = p.id;
    obj["content"]      = p.content;
    obj["role"]         = role_json(p.role);
    obj["page_number"]  = p.page_number;
    obj["bounding_box"] = bbox_json(p.bounding_box);
    obj["font"]         = {{"name", p.font.name}, {"size", p.font.size}, {"bold", p.font.bold}};
    return obj;
}

static json table_json(const Table& t) {
    json cells = json::array();
    for (const auto& c : t.cells) {
        json cell;
        cell["row_index"]    = c.row_index;
        cell["column_index"] = c.column_index;
        cell["row_span"]     = c.row_span;
        cell["column_span"]  = c.column_span;
        cell["content"]      = c.content;
        cell["kind"]         = c.kind == CellKind::column_header ? "columnHeader" : "content";
        cells.push_back(std::move(cell));
    }

    json obj;
    obj["id"]           = t.id;
    obj["page_number"]  = t.page_number;
    obj["rows"]         = t.rows;
    obj["columns"]      = t.columns;
    obj["cells"]        = std::move(cells);
    obj["bounding_box"] = bbox_json(t.bounding_box);
    return obj;
}

static json image_json(const Image& i) {
    json obj;
    obj["id"]           = i.id;
    obj["page_number"]  = i.page_number;
    obj["mime_type"]    = i.mime_type;
    obj["data"]         = docrecon_base64::encode(i.data);
    obj["bounding_box"] = bbox_json(i.bounding_box);
    return obj;
}

static json block_json(const ContentBlock& b) {
    json obj;
    obj["type"]        = block_type_name(b.type);
    obj["page_number"] = b.page_number;
    obj["y_position"]  = b.y_position;
    obj["content_id"]  = b.content_id;
    return obj;
}

/* ── public API ─────────────────────────────────────────────────────── */

std::string document_to_json(const DocumentModel& model, int indent) {
    json paragraphs = json::array();
    json tables     = json::array();
    json images     = json::array();
    json blocks     = json::array();
    for (const auto& p : model.paragraphs)     paragraphs.push_back(paragraph_json(p));
    for (const auto& t : model.tables)         tables.push_back(table_json(t));
    for (const auto& i : model.images)         images.push_back(image_json(i));
    for (const auto& b : model.content_blocks) blocks.push_back(block_json(b));

    json obj;
    obj["model_used"]     = model.model_used;
    obj["pages"]          = model.pages;
    obj["paragraphs"]     = std::move(paragraphs);
    obj["tables"]         = std::move(tables);
    obj["images"]         = std::move(images);
    obj["full_text"]      = model.full_text;
    obj["content_blocks"] = std::move(blocks);

    /* invalid UTF-8 from the engine is replaced, not thrown */
    return obj.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string paragraph_to_json(const Paragraph& para) {
    return paragraph_json(para).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string table_to_json(const Table& table) {
    return table_json(table).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string image_to_json(const Image& image) {
    return image_json(image).dump();
}

std::string block_to_json(const ContentBlock& block) {
    return block_json(block).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string metadata_to_json(const ExtractMetadata& meta, const std::string& model_used) {
    json obj;
    obj["pages_processed"]  = meta.pages_processed;
    obj["total_paragraphs"] = meta.total_paragraphs;
    obj["total_tables"]     = meta.total_tables;
    obj["model_used"]       = model_used;
    return obj.dump();
}
