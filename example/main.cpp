#include "docrecon.h"
#include "docrecon_types.h"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

enum {
    EXIT_USAGE      = 1,
    EXIT_VALIDATION = 2,
    EXIT_DOCUMENT   = 3,
    EXIT_INTERNAL   = 4,
};

static void usage(const char* prog) {
    fprintf(stderr,
            "usage: %s [--html] [--pages SPEC] [--images] [--primitives]\n"
            "          [--detect-text-layer] [--title N] [--heading N] <file>\n",
            prog);
}

static bool read_file(const char* path, std::vector<char>& buf) {
    FILE* f = fopen(path, "rb");
    if (!f) { perror(path); return false; }
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    rewind(f);
    if (sz < 0) { fclose(f); return false; }
    buf.resize(static_cast<size_t>(sz));
    if (fread(buf.data(), 1, buf.size(), f) != buf.size()) {
        fclose(f);
        fprintf(stderr, "read error\n");
        return false;
    }
    fclose(f);
    return true;
}

static int exit_code(int status) {
    switch (status) {
    case DOCRECON_ERR_VALIDATION: return EXIT_VALIDATION;
    case DOCRECON_ERR_DOCUMENT:   return EXIT_DOCUMENT;
    default:                      return EXIT_INTERNAL;
    }
}

/* collects per-page reports into {"total_pages", "pages"} */
struct TextLayerReport {
    std::string pages;
    int total = 0;
    int with_text = 0;
};

static int on_text_layer_page(const char* json, void* user_data) {
    auto* report = static_cast<TextLayerReport*>(user_data);
    if (report->total) report->pages += ",";
    report->pages += json;
    report->total++;
    if (std::strstr(json, "\"has_text_layer\":true")) report->with_text++;
    return 0;
}

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("docrecon"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    ExtractionConfig cfg;
    load_config_from_env(cfg);

    bool primitives = false;
    bool text_layer = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--html") {
            cfg.output_format = "html";
        } else if (arg == "--images") {
            cfg.include_images = true;
        } else if (arg == "--primitives") {
            primitives = true;
        } else if (arg == "--detect-text-layer") {
            text_layer = true;
        } else if (arg == "--pages" && i + 1 < argc) {
            cfg.pages = argv[++i];
        } else if (arg == "--title" && i + 1 < argc) {
            if (!parse_threshold(argv[++i], cfg.title_threshold)) {
                fprintf(stderr, "--title: not a number: %s\n", argv[i]);
                return EXIT_USAGE;
            }
        } else if (arg == "--heading" && i + 1 < argc) {
            if (!parse_threshold(argv[++i], cfg.heading_threshold)) {
                fprintf(stderr, "--heading: not a number: %s\n", argv[i]);
                return EXIT_USAGE;
            }
        } else if (!arg.empty() && arg[0] != '-' && !path) {
            path = argv[i];
        } else {
            usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (!path) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    std::vector<char> buf;
    if (!read_file(path, buf)) return EXIT_USAGE;

    if (buf.size() > static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024) {
        fprintf(stderr, "%s: file exceeds %d MB limit\n", path, cfg.max_file_size_mb);
        return EXIT_USAGE;
    }

    docrecon_init();

    if (text_layer) {
        TextLayerReport report;
        int rc = docrecon_detect_text_layer(buf.data(), buf.size(), nullptr,
                                            cfg.text_layer_char_threshold,
                                            on_text_layer_page, &report);
        docrecon_destroy();
        if (rc != 0) {
            fprintf(stderr, "failed to parse PDF\n");
            return EXIT_DOCUMENT;
        }
        printf("{\"total_pages\":%d,\"pages\":[%s]}\n", report.total, report.pages.c_str());
        spdlog::info("{} of {} page(s) have a text layer", report.with_text, report.total);
        return 0;
    }

    docrecon_options opts;
    docrecon_default_options(&opts);
    opts.title_threshold   = cfg.title_threshold;
    opts.heading_threshold = cfg.heading_threshold;
    opts.include_images    = cfg.include_images ? 1 : 0;
    opts.pages             = cfg.pages.empty() ? nullptr : cfg.pages.c_str();

    auto* cur = primitives
        ? docrecon_open_primitives(buf.data(), buf.size(), &opts)
        : docrecon_open_pdf(buf.data(), buf.size(), nullptr, &opts);
    if (!cur) {
        docrecon_destroy();
        fprintf(stderr, "out of memory\n");
        return EXIT_INTERNAL;
    }

    int status = docrecon_get_status(cur);
    if (status != DOCRECON_OK) {
        fprintf(stderr, "%s\n", docrecon_get_error(cur));
        docrecon_close(cur);
        docrecon_destroy();
        return exit_code(status);
    }

    if (cfg.output_format == "html")
        printf("%s\n", docrecon_get_html(cur));
    else
        printf("%s\n", docrecon_get_json(cur));

    spdlog::info("metadata: {}", docrecon_get_metadata_json(cur));

    docrecon_close(cur);
    docrecon_destroy();
    return 0;
}
