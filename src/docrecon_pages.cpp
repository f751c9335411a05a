#include "docrecon_types.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static bool parse_int(const std::string& raw, int& out) {
    std::string s = trim(raw);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

/* sorts and merges overlapping or adjacent spans */
static void merge_spans(std::vector<PageSpan>& spans) {
    std::sort(spans.begin(), spans.end(),
              [](const PageSpan& a, const PageSpan& b) { return a.first < b.first; });

    std::vector<PageSpan> merged;
    for (const auto& span : spans) {
        if (!merged.empty() &&
            static_cast<long long>(span.first) <= static_cast<long long>(merged.back().last) + 1) {
            merged.back().last = std::max(merged.back().last, span.last);
            continue;
        }
        merged.push_back(span);
    }
    spans.swap(merged);
}

/* ── public API ─────────────────────────────────────────────────────── */

bool parse_page_range(const std::string& spec, std::vector<PageSpan>& spans,
                      std::string& error) {
    std::vector<PageSpan> parsed;

    size_t pos = 0;
    while (true) {
        size_t comma = spec.find(',', pos);
        std::string part = trim(spec.substr(pos, comma == std::string::npos
                                                     ? std::string::npos
                                                     : comma - pos));
        size_t dash = part.find('-');
        if (dash != std::string::npos) {
            int start = 0, end = 0;
            if (!parse_int(part.substr(0, dash), start) ||
                !parse_int(part.substr(dash + 1), end)) {
                error = "Invalid page range: " + part;
                return false;
            }
            if (start > end) {
                error = "Invalid page range: " + part + " (start > end)";
                return false;
            }
            parsed.push_back({start, end});
        } else {
            int page = 0;
            if (!parse_int(part, page)) {
                error = "Invalid page number: '" + part + "'";
                return false;
            }
            parsed.push_back({page, page});
        }

        if (comma == std::string::npos) break;
        pos = comma + 1;
    }

    merge_spans(parsed);
    spans.swap(parsed);
    return true;
}

bool select_pages(const std::string& range, int page_count,
                  std::vector<int>& selected, int& pages_for_model,
                  std::string& error) {
    selected.clear();

    if (range.empty()) {
        for (int p = 1; p <= page_count; ++p)
            selected.push_back(p);
        pages_for_model = page_count;
        return true;
    }

    std::vector<PageSpan> requested;
    if (!parse_page_range(range, requested, error))
        return false;

    /* every named page counts; only in-range ones are visited */
    long long named = 0;
    for (const auto& span : requested) {
        named += static_cast<long long>(span.last) - span.first + 1;

        int first = std::max(span.first, 1);
        int last  = std::min(span.last, page_count);
        for (int p = first; p <= last; ++p)
            selected.push_back(p);
    }
    pages_for_model = static_cast<int>(std::min<long long>(named, INT_MAX));
    return true;
}
