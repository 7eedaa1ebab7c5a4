#include "cvextract/LineBuilder.hpp"

#include "cvextract/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace cvextract {

static double center_y(const WordToken& w) {
    return (w.box.top + w.box.bottom) * 0.5;
}

static Line words_to_line(const std::vector<const WordToken*>& words, int page_index) {
    Line line;
    line.page = page_index;
    line.top = words.front()->box.top;
    line.bottom = words.front()->box.bottom;
    line.left = words.front()->box.left;
    line.right = words.front()->box.right;

    std::vector<std::string> parts;
    parts.reserve(words.size());
    for (const WordToken* w : words) {
        parts.push_back(w->text);
        line.top = std::min(line.top, w->box.top);
        line.bottom = std::max(line.bottom, w->box.bottom);
        line.left = std::min(line.left, w->box.left);
        line.right = std::max(line.right, w->box.right);
    }
    line.text = textutil::trim(textutil::join(parts, " "));
    return line;
}

// cut one band (already sorted left to right) at large horizontal gaps
static void split_band(const std::vector<const WordToken*>& band, int page_index, double gap_threshold,
                       std::vector<Line>& out) {
    std::vector<const WordToken*> segment;
    double last_right = 0.0;

    for (const WordToken* w : band) {
        if (!segment.empty() && w->box.left - last_right > gap_threshold) {
            out.push_back(words_to_line(segment, page_index));
            segment.clear();
        }
        segment.push_back(w);
        last_right = w->box.right;
    }
    if (!segment.empty()) out.push_back(words_to_line(segment, page_index));
}

double column_gap_threshold(double page_width, const ExtractConfig& cfg) {
    return std::max(cfg.min_column_gap, page_width * cfg.column_gap_ratio);
}

std::vector<Line> build_page_lines(const Page& page, int page_index, const ExtractConfig& cfg) {
    std::vector<Line> lines;

    std::vector<const WordToken*> words;
    words.reserve(page.words.size());
    for (const auto& w : page.words) {
        if (!textutil::trim(w.text).empty()) words.push_back(&w);
    }
    if (words.empty()) return lines;

    std::stable_sort(words.begin(), words.end(), [](const WordToken* a, const WordToken* b) {
        const double ya = center_y(*a);
        const double yb = center_y(*b);
        if (ya != yb) return ya < yb;
        return a->box.left < b->box.left;
    });

    const double gap_threshold = column_gap_threshold(page.width, cfg);

    std::vector<const WordToken*> band;
    double band_center = 0.0;

    auto flush = [&]() {
        if (band.empty()) return;
        std::stable_sort(band.begin(), band.end(), [](const WordToken* a, const WordToken* b) {
            return a->box.left < b->box.left;
        });
        split_band(band, page_index, gap_threshold, lines);
        band.clear();
    };

    for (const WordToken* w : words) {
        const double yc = center_y(*w);
        if (!band.empty() && std::abs(yc - band_center) > cfg.band_tolerance) flush();
        if (band.empty()) band_center = yc;
        band.push_back(w);
    }
    flush();

    return lines;
}

std::vector<Line> build_lines(const std::vector<Page>& pages, const ExtractConfig& cfg) {
    std::vector<Line> lines;
    for (size_t i = 0; i < pages.size(); ++i) {
        auto page_lines = build_page_lines(pages[i], static_cast<int>(i), cfg);
        lines.insert(lines.end(), std::make_move_iterator(page_lines.begin()),
                     std::make_move_iterator(page_lines.end()));
    }
    return lines;
}

}  // namespace cvextract
