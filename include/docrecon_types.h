#ifndef DOCRECON_TYPES_H
#define DOCRECON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/* ── configuration ─────────────────────────────────────────────── */

struct ExtractionConfig {
    double      title_threshold           = 18.0;
    double      heading_threshold         = 14.0;
    int         text_layer_char_threshold = 50;
    bool        include_images            = false;
    std::string output_format             = "json";   /* "json" or "html" */
    std::string pages;                                 /* "" = all pages   */
    int         max_file_size_mb          = 100;
};

/* Overlay TITLE_FONT_SIZE_THRESHOLD, HEADING_FONT_SIZE_THRESHOLD,
   TEXT_LAYER_CHAR_THRESHOLD and MAX_FILE_SIZE_MB when they are set. */
void load_config_from_env(ExtractionConfig& cfg);

/* Whole-string decimal number; false (out untouched) on anything else. */
bool parse_threshold(const char* text, double& out);

/* ── document model records ────────────────────────────────────── */

struct BoundingBox {
    double x_min = 0, y_min = 0, x_max = 0, y_max = 0;
};

struct FontInfo {
    std::string name;
    double      size = 12.0;   /* rounded to one decimal */
    bool        bold = false;
};

enum class Role { none, title, section_heading };

struct Paragraph {
    std::string         id;
    std::string         content;
    int                 page_number = 1;
    BoundingBox         bounding_box;
    FontInfo            font;
    std::optional<Role> role;   /* unset until classify_roles() */
};

enum class CellKind { column_header, content };

struct TableCell {
    int         row_index    = 0;
    int         column_index = 0;
    int         row_span     = 1;
    int         column_span  = 1;
    std::string content;
    CellKind    kind = CellKind::content;
};

struct Table {
    std::string            id;
    int                    page_number = 1;
    BoundingBox            bounding_box;
    int                    rows    = 0;
    int                    columns = 0;
    std::vector<TableCell> cells;
};

struct Image {
    std::string          id;
    int                  page_number = 1;
    std::string          mime_type;
    std::vector<uint8_t> data;
    BoundingBox          bounding_box;
};

enum class BlockType { paragraph, table, image };

/* Positional pointer into one of the collections; owns nothing. */
struct ContentBlock {
    BlockType   type = BlockType::paragraph;
    int         page_number = 1;
    double      y_position  = 0;
    std::string content_id;
};

struct DocumentModel {
    std::string               model_used;
    int                       pages = 0;
    std::vector<Paragraph>    paragraphs;
    std::vector<Table>        tables;
    std::vector<Image>        images;
    std::string               full_text;
    std::vector<ContentBlock> content_blocks;
};

const char* role_name(Role role);            /* "title", "sectionHeading", "none" */
const char* block_type_name(BlockType type); /* "paragraph", "table", "image" */

/* ── page primitives (what a PDF engine hands over per page) ───── */

struct TextSpan {
    std::string text;
    double      size = 12.0;
    std::string font;
    int         flags = 0;   /* bit 4 (16) = bold */
};

struct TextLine {
    std::vector<TextSpan> spans;
};

struct TextBlock {
    BoundingBox           bbox;
    std::vector<TextLine> lines;
};

struct TableCandidate {
    BoundingBox                                         bbox;
    std::vector<std::vector<std::optional<std::string>>> grid;   /* row-major */
};

struct ImageCandidate {
    std::vector<uint8_t>     data;
    std::string              ext;     /* "png", "jpeg", ... */
    std::vector<BoundingBox> rects;   /* placements, first one wins */
};

struct PagePrimitives {
    int                         page_number = 1;
    std::vector<TextBlock>      blocks;
    std::vector<TableCandidate> tables;
    std::vector<ImageCandidate> images;
    std::string                 table_error;   /* non-empty: detection failed */
};

/* Running id counters across the pages of one request. */
struct IdCounters {
    uint32_t paragraph = 0;
    uint32_t table     = 0;
    uint32_t image     = 0;
};

void build_paragraphs(const PagePrimitives& page, IdCounters& ids,
                      std::vector<Paragraph>& out);
void build_tables(const PagePrimitives& page, IdCounters& ids,
                  std::vector<Table>& out);
void build_images(const PagePrimitives& page, IdCounters& ids,
                  std::vector<Image>& out);

/* ── pipeline stages ───────────────────────────────────────────── */

double detect_body_font_size(const std::vector<Paragraph>& paragraphs);

void classify_roles(std::vector<Paragraph>& paragraphs,
                    double title_threshold, double heading_threshold);

bool overlaps_any_table(const Paragraph& para, const std::vector<Table>& tables);

std::vector<Paragraph> filter_table_overlaps(const std::vector<Paragraph>& paragraphs,
                                             const std::vector<Table>& tables);

std::vector<ContentBlock> sequence_content(const std::vector<Paragraph>& paragraphs,
                                           const std::vector<Table>& tables,
                                           const std::vector<Image>& images);

DocumentModel assemble_document(const std::vector<Paragraph>& paragraphs,
                                std::vector<Table> tables,
                                std::vector<Image> images,
                                int total_pages);

std::string escape_html(const std::string& text);
std::string render_html(const DocumentModel& model);

/* ── page selection ────────────────────────────────────────────── */

/* Inclusive run of page numbers. */
struct PageSpan {
    int first = 0;
    int last  = 0;
};

/* Parses "1,3,5-10" into sorted, merged, non-overlapping spans.
   Returns false and fills `error` on malformed input or start > end. */
bool parse_page_range(const std::string& spec, std::vector<PageSpan>& spans,
                      std::string& error);

/* ── extraction result (produced by backends) ──────────────────── */

enum ExtractStatus {
    EXTRACT_OK               =  0,
    EXTRACT_ERR_DOCUMENT     = -1,
    EXTRACT_ERR_VALIDATION   = -2,
    EXTRACT_ERR_INTERNAL     = -3,
};

struct ExtractMetadata {
    int    pages_processed  = 0;
    size_t total_paragraphs = 0;   /* before overlap filtering */
    size_t total_tables     = 0;
};

struct ExtractResult {
    int             status = EXTRACT_OK;
    std::string     error;
    DocumentModel   model;
    ExtractMetadata metadata;
};

/* Selected pages, in ascending order, with out-of-range numbers removed.
   `pages_for_model` receives the page total the model should report. */
bool select_pages(const std::string& range, int page_count,
                  std::vector<int>& selected, int& pages_for_model,
                  std::string& error);

/* Runs build → classify → assemble over already selected pages. */
ExtractResult reconstruct(const std::vector<PagePrimitives>& pages,
                          const ExtractionConfig& cfg,
                          const std::string& model_used,
                          int pages_for_model);

ExtractResult extract_primitives(const char* json_text, size_t len,
                                 const ExtractionConfig& cfg);

ExtractResult extract_pdf(const void* buf, size_t len, const char* password,
                          const ExtractionConfig& cfg);

/* ── serialization ─────────────────────────────────────────────── */

std::string document_to_json(const DocumentModel& model, int indent = 2);
std::string paragraph_to_json(const Paragraph& para);
std::string table_to_json(const Table& table);
std::string image_to_json(const Image& image);
std::string block_to_json(const ContentBlock& block);
std::string metadata_to_json(const ExtractMetadata& meta, const std::string& model_used);

#endif
