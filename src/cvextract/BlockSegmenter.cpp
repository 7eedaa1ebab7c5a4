#include "cvextract/BlockSegmenter.hpp"

#include "cvextract/TextUtil.hpp"

#include <algorithm>

namespace cvextract {

static std::vector<LineShape> shapes_of(const std::vector<Line>& lines) {
    std::vector<LineShape> shapes;
    shapes.reserve(lines.size());
    for (const auto& l : lines) shapes.push_back(shape_of(l.text));
    return shapes;
}

static std::vector<Line> without_footers(const std::vector<Line>& lines) {
    std::vector<Line> out;
    out.reserve(lines.size());
    for (const auto& l : lines) {
        if (!is_page_footer(l.text)) out.push_back(l);
    }
    return out;
}

double median_line_height(const std::vector<Line>& lines, double fallback) {
    std::vector<double> heights;
    heights.reserve(lines.size());
    for (const auto& l : lines) {
        if (l.bottom > l.top) heights.push_back(l.height());
    }
    if (heights.empty()) return fallback;

    std::sort(heights.begin(), heights.end());
    const size_t mid = heights.size() / 2;
    if (heights.size() % 2 == 1) return heights[mid];
    return (heights[mid - 1] + heights[mid]) / 2.0;
}

bool is_continuation_block(const Block& block) {
    std::vector<LineShape> shapes;
    for (const auto& l : block) {
        LineShape s = shape_of(l.text);
        if (!s.text.empty()) shapes.push_back(std::move(s));
    }
    if (shapes.empty()) return false;

    const LineShape& first = shapes.front();
    if (starts_with_achievements(first.text)) return true;
    if (first.bullet) return true;
    if (first.footer) return true;

    const bool has_range = std::any_of(shapes.begin(), shapes.end(), [](const LineShape& s) { return s.date_range; });
    const bool has_duration = std::any_of(shapes.begin(), shapes.end(), [](const LineShape& s) { return s.duration; });
    return !has_range && has_duration;
}

std::vector<Block> split_blocks(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    std::vector<Block> blocks;
    if (lines.empty()) return blocks;

    const double gap_threshold = median_line_height(lines, cfg.default_line_height) * cfg.block_gap_factor;

    Block current{lines.front()};
    double last_bottom = lines.front().bottom;
    for (size_t i = 1; i < lines.size(); ++i) {
        const Line& line = lines[i];
        if (line.top - last_bottom > gap_threshold) {
            blocks.push_back(std::move(current));
            current = Block{line};
        } else {
            current.push_back(line);
        }
        last_bottom = line.bottom;
    }
    blocks.push_back(std::move(current));

    std::vector<Block> merged;
    for (auto& block : blocks) {
        if (!merged.empty() && is_continuation_block(block)) {
            merged.back().insert(merged.back().end(), block.begin(), block.end());
        } else {
            merged.push_back(std::move(block));
        }
    }
    return merged;
}

bool is_entry_start(const std::vector<LineShape>& shapes, size_t idx) {
    const LineShape& cur = shapes[idx];
    if (cur.text.empty() || cur.achievements) return false;
    if (cur.bullet || cur.date_range || cur.duration) return false;
    if (textutil::char_count(cur.text) > 60) return false;

    const LineShape* next = idx + 1 < shapes.size() ? &shapes[idx + 1] : nullptr;
    const LineShape* prev = idx > 0 ? &shapes[idx - 1] : nullptr;

    if (next && next->duration) return true;
    if (next && next->date_range && !(prev && prev->duration)) return true;

    if (idx + 2 < shapes.size() && shapes[idx + 2].date_range) {
        if (!next->duration && !next->date_range) return true;
    }
    return false;
}

static bool is_position_only_start(const std::vector<LineShape>& shapes, size_t idx) {
    if (shapes[idx].date_range) return false;
    const bool next_range = idx + 1 < shapes.size() && shapes[idx + 1].date_range;
    const bool prev_duration = idx > 0 && shapes[idx - 1].duration;
    return next_range && !prev_duration;
}

static bool is_company_line(const std::vector<LineShape>& shapes, size_t idx) {
    return idx + 1 < shapes.size() && shapes[idx + 1].duration;
}

std::vector<Block> split_experience_blocks(const std::vector<Line>& lines) {
    const std::vector<Line> cleaned = without_footers(lines);
    const std::vector<LineShape> shapes = shapes_of(cleaned);

    std::vector<Block> blocks;
    Block current;
    const Line* last_company = nullptr;

    for (size_t idx = 0; idx < cleaned.size(); ++idx) {
        if (is_entry_start(shapes, idx)) {
            if (!current.empty()) {
                blocks.push_back(std::move(current));
                current.clear();
            }
            if (is_position_only_start(shapes, idx) && last_company) current.push_back(*last_company);
        }
        current.push_back(cleaned[idx]);
        if (is_company_line(shapes, idx)) last_company = &cleaned[idx];
    }
    if (!current.empty()) blocks.push_back(std::move(current));
    return blocks;
}

std::vector<Block> split_education_blocks(const std::vector<Line>& lines) {
    const std::vector<Line> cleaned = without_footers(lines);

    std::vector<Block> blocks;
    size_t i = 0;
    while (i < cleaned.size()) {
        if (textutil::trim(cleaned[i].text).empty()) {
            ++i;
            continue;
        }

        Block block{cleaned[i]};
        if (i + 1 < cleaned.size() && looks_like_degree_line(textutil::trim(cleaned[i + 1].text))) {
            const Line& degree = cleaned[i + 1];
            if (i + 2 < cleaned.size() && is_trailing_year_line(cleaned[i + 2].text)) {
                block.push_back(degree.with_text(textutil::trim(degree.text + " " + cleaned[i + 2].text)));
                i += 2;
            } else {
                block.push_back(degree);
                i += 1;
            }
        }
        blocks.push_back(std::move(block));
        ++i;
    }
    return blocks;
}

}  // namespace cvextract
