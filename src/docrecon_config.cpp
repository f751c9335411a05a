#include "docrecon_types.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <climits>
#include <cstdlib>

/* ── helpers ────────────────────────────────────────────────────────── */

static void env_double(const char* name, double& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    if (!parse_threshold(v, out))
        spdlog::warn("ignoring {}={}: not a number", name, v);
}

static void env_int(const char* name, int& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (errno != 0 || *end != '\0' || n < INT_MIN || n > INT_MAX) {
        spdlog::warn("ignoring {}={}: not an integer", name, v);
        return;
    }
    out = static_cast<int>(n);
}

/* ── public API ─────────────────────────────────────────────────────── */

bool parse_threshold(const char* text, double& out) {
    if (!text || !*text) return false;
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(text, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(d)) return false;
    out = d;
    return true;
}

void load_config_from_env(ExtractionConfig& cfg) {
    env_double("TITLE_FONT_SIZE_THRESHOLD",   cfg.title_threshold);
    env_double("HEADING_FONT_SIZE_THRESHOLD", cfg.heading_threshold);
    env_int("TEXT_LAYER_CHAR_THRESHOLD",      cfg.text_layer_char_threshold);
    env_int("MAX_FILE_SIZE_MB",               cfg.max_file_size_mb);
}
