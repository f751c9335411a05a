#include "docrecon_types.h"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

ExtractResult reconstruct(const std::vector<PagePrimitives>& pages,
                          const ExtractionConfig& cfg,
                          const std::string& model_used,
                          int pages_for_model) {
    ExtractResult result;

    std::vector<Paragraph> paragraphs;
    std::vector<Table>     tables;
    std::vector<Image>     images;
    IdCounters ids;

    for (const auto& page : pages) {
        build_paragraphs(page, ids, paragraphs);
        build_tables(page, ids, tables);
        if (cfg.include_images)
            build_images(page, ids, images);
        result.metadata.pages_processed++;
    }

    /* roles are relative to the body size of the whole request */
    classify_roles(paragraphs, cfg.title_threshold, cfg.heading_threshold);

    result.metadata.total_paragraphs = paragraphs.size();
    result.metadata.total_tables     = tables.size();

    result.model = assemble_document(paragraphs, std::move(tables), std::move(images),
                                     pages_for_model);
    result.model.model_used = model_used;

    spdlog::info("reconstructed {} page(s): {} paragraphs ({} kept), {} tables, {} images",
                 result.metadata.pages_processed, result.metadata.total_paragraphs,
                 result.model.paragraphs.size(), result.model.tables.size(),
                 result.model.images.size());
    return result;
}
