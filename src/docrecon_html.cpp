#include "docrecon_types.h"
#include "docrecon_base64.h"

#include <string>
#include <unordered_map>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static const char* paragraph_tag(const Paragraph& para) {
    if (!para.role) return "p";
    switch (*para.role) {
    case Role::title:           return "h1";
    case Role::section_heading: return "h2";
    case Role::none:            break;
    }
    return "p";
}

static void append_table(std::string& html, const Table& table) {
    html += "<table border=\"1\" id=\"";
    html += table.id;
    html += "\"><tbody>";

    /* grid[row][col] -> cell, NULL for an empty position */
    int rows = table.rows > 0 ? table.rows : 0;
    int cols = table.columns > 0 ? table.columns : 0;
    std::vector<std::vector<const TableCell*>> grid(
        rows, std::vector<const TableCell*>(cols, nullptr));
    for (const auto& cell : table.cells) {
        if (cell.row_index < 0 || cell.row_index >= rows) continue;
        if (cell.column_index < 0 || cell.column_index >= cols) continue;
        grid[cell.row_index][cell.column_index] = &cell;
    }

    for (const auto& row : grid) {
        html += "<tr>";
        for (const TableCell* cell : row) {
            if (!cell) {
                html += "<td></td>";
                continue;
            }
            const char* tag = cell->kind == CellKind::column_header ? "th" : "td";
            html += '<';
            html += tag;
            if (cell->column_span > 1)
                html += " colspan=\"" + std::to_string(cell->column_span) + "\"";
            if (cell->row_span > 1)
                html += " rowspan=\"" + std::to_string(cell->row_span) + "\"";
            html += '>';
            html += escape_html(cell->content);
            html += "</";
            html += tag;
            html += '>';
        }
        html += "</tr>";
    }

    html += "</tbody></table>";
}

/* ── public API ─────────────────────────────────────────────────────── */

/* & first, so later entities are not escaped twice */
std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':  out += "&amp;";  break;
        case '<':  out += "&lt;";   break;
        case '>':  out += "&gt;";   break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&#039;"; break;
        default:   out += c;        break;
        }
    }
    return out;
}

std::string render_html(const DocumentModel& model) {
    std::unordered_map<std::string, const Paragraph*> paragraphs;
    std::unordered_map<std::string, const Table*>     tables;
    std::unordered_map<std::string, const Image*>     images;
    for (const auto& p : model.paragraphs) paragraphs.emplace(p.id, &p);
    for (const auto& t : model.tables)     tables.emplace(t.id, &t);
    for (const auto& i : model.images)     images.emplace(i.id, &i);

    std::string html = "<html><head><meta charset=\"utf-8\"></head><body>";

    for (const auto& block : model.content_blocks) {
        switch (block.type) {
        case BlockType::paragraph: {
            auto it = paragraphs.find(block.content_id);
            if (it == paragraphs.end()) break;
            const char* tag = paragraph_tag(*it->second);
            html += '<';
            html += tag;
            html += '>';
            html += escape_html(it->second->content);
            html += "</";
            html += tag;
            html += '>';
            break;
        }
        case BlockType::table: {
            auto it = tables.find(block.content_id);
            if (it == tables.end()) break;
            append_table(html, *it->second);
            break;
        }
        case BlockType::image: {
            auto it = images.find(block.content_id);
            if (it == images.end() || it->second->data.empty()) break;
            html += "<img src=\"data:";
            html += escape_html(it->second->mime_type);
            html += ";base64,";
            html += docrecon_base64::encode(it->second->data);
            html += "\" />";
            break;
        }
        }
    }

    html += "</body></html>";
    return html;
}
