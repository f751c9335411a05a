#ifndef DOCRECON_H
#define DOCRECON_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── library lifecycle ───────────────────────────────────────────── */

/* Initialize / destroy the underlying PDF library. Call once per process. */
void docrecon_init(void);
void docrecon_destroy(void);

/* ── status codes ────────────────────────────────────────────────── */

typedef enum {
    DOCRECON_OK             =  0,
    DOCRECON_ERR_DOCUMENT   = -1,   /* malformed or undecodable input document */
    DOCRECON_ERR_VALIDATION = -2,   /* bad page-range syntax, start > end       */
    DOCRECON_ERR_INTERNAL   = -3
} docrecon_status;

/* ── options ─────────────────────────────────────────────────────── */

typedef struct {
    double      title_threshold;     /* default 18 */
    double      heading_threshold;   /* default 14 */
    int         include_images;      /* 0 or 1 */
    const char* pages;               /* "1,3,5-10", NULL or "" for all */
} docrecon_options;

void docrecon_default_options(docrecon_options* opts);

/* ── struct types ────────────────────────────────────────────────── */

typedef struct {
    const char* model_used;        /* "pdfium" or "primitives" */
    int         pages;
    int         pages_processed;
    size_t      paragraph_count;   /* after table-overlap filtering */
    size_t      table_count;
    size_t      image_count;
    size_t      block_count;
    const char* full_text;
} docrecon_doc;

typedef struct {
    const char* type;              /* "paragraph", "table", "image" */
    int         page_number;       /* 1-based */
    double      y_position;
    const char* content_id;
} docrecon_block;

/* ── cursor ──────────────────────────────────────────────────────── */
/*
 * A cursor holds one reconstructed document. It is always returned
 * (NULL only when out of memory); check docrecon_get_status() first.
 * A failed cursor answers NULL from every data accessor.
 *
 * Row iterators are independent of each other; the block iterator is
 * shared between docrecon_next_block and docrecon_next_block_json.
 */

typedef struct docrecon_cursor docrecon_cursor;

docrecon_cursor* docrecon_open_pdf(const void* buf, size_t len,
                                   const char* password,
                                   const docrecon_options* opts);

/* Page primitives as JSON, for engines other than the built-in one. */
docrecon_cursor* docrecon_open_primitives(const char* json, size_t len,
                                          const docrecon_options* opts);

int          docrecon_get_status(docrecon_cursor* cursor);
const char*  docrecon_get_error(docrecon_cursor* cursor);

/* whole document */
const docrecon_doc* docrecon_get_doc(docrecon_cursor* cursor);
const char*         docrecon_get_json(docrecon_cursor* cursor);
const char*         docrecon_get_html(docrecon_cursor* cursor);
const char*         docrecon_get_metadata_json(docrecon_cursor* cursor);

/* row iterators */
const char*           docrecon_next_paragraph_json(docrecon_cursor* cursor);
const char*           docrecon_next_table_json(docrecon_cursor* cursor);
const char*           docrecon_next_image_json(docrecon_cursor* cursor);
const docrecon_block* docrecon_next_block(docrecon_cursor* cursor);
const char*           docrecon_next_block_json(docrecon_cursor* cursor);

void docrecon_close(docrecon_cursor* cursor);

/* ── text-layer detection ────────────────────────────────────────── */

/* Callback receives a JSON string per page. Return 0 to continue, non-zero to abort. */
typedef int (*docrecon_page_callback)(const char* json, void* user_data);

/*
 * Report, per page, whether the PDF carries an extractable text layer:
 *   {"page": 1, "has_text_layer": true, "char_count": 1234}
 * A page has a text layer when its trimmed character count reaches
 * char_threshold.
 *
 * Returns 0 on success, -1 on a bad PDF.
 * If the callback returns non-zero, detection stops and that value is returned.
 */
int docrecon_detect_text_layer(const void* buf, size_t len, const char* password,
                               int char_threshold,
                               docrecon_page_callback cb, void* user_data);

#ifdef __cplusplus
}
#endif

#endif
