#include "docrecon_types.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

/* code points, not bytes */
static size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

static Role classify_single(double size, bool bold, double body_size,
                            double title_threshold, double heading_threshold) {
    if (size >= title_threshold)
        return Role::title;
    if (size >= body_size * 1.5 && bold)
        return Role::title;
    if (size >= heading_threshold)
        return Role::section_heading;
    if (bold && size > body_size * 1.1)
        return Role::section_heading;
    return Role::none;
}

/* ── public API ─────────────────────────────────────────────────────── */

const char* role_name(Role role) {
    switch (role) {
    case Role::title:           return "title";
    case Role::section_heading: return "sectionHeading";
    case Role::none:            break;
    }
    return "none";
}

/*
 * Most frequent font size, where each paragraph counts
 * min(length, 200) times. Ties go to the smallest size.
 */
double detect_body_font_size(const std::vector<Paragraph>& paragraphs) {
    std::map<double, size_t> weights;
    size_t total = 0;

    for (const auto& para : paragraphs) {
        size_t weight = std::min<size_t>(utf8_length(para.content), 200);
        if (weight == 0) continue;
        weights[round1(para.font.size)] += weight;
        total += weight;
    }

    if (total == 0)
        return 12.0;

    double body_size = 12.0;
    size_t best = 0;
    for (const auto& entry : weights) {
        if (entry.second > best) {
            best = entry.second;
            body_size = entry.first;
        }
    }
    return body_size;
}

void classify_roles(std::vector<Paragraph>& paragraphs,
                    double title_threshold, double heading_threshold) {
    if (paragraphs.empty()) return;

    double body_size = detect_body_font_size(paragraphs);
    spdlog::debug("detected body font size: {}", body_size);

    for (auto& para : paragraphs) {
        para.role = classify_single(para.font.size, para.font.bold, body_size,
                                    title_threshold, heading_threshold);
    }
}
