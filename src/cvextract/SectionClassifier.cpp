#include "cvextract/SectionClassifier.hpp"

#include "cvextract/LineShape.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <algorithm>

namespace cvextract {

std::optional<double> detect_column_split(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    if (lines.size() < static_cast<size_t>(std::max(cfg.min_lines_for_columns, 2))) return std::nullopt;

    std::vector<double> lefts;
    lefts.reserve(lines.size());
    for (const auto& l : lines) lefts.push_back(l.left);
    std::sort(lefts.begin(), lefts.end());

    double best_gap = 0.0;
    size_t best_idx = 0;
    for (size_t i = 0; i + 1 < lefts.size(); ++i) {
        const double gap = lefts[i + 1] - lefts[i];
        if (gap > best_gap) {
            best_gap = gap;
            best_idx = i;
        }
    }

    if (best_gap <= cfg.min_column_split_gap) return std::nullopt;
    return (lefts[best_idx] + lefts[best_idx + 1]) / 2.0;
}

bool looks_like_heading(const std::string& text, const ExtractConfig& cfg) {
    const std::string t = textutil::trim(text);
    if (textutil::char_count(t) > static_cast<size_t>(cfg.max_heading_chars)) return false;
    if (textutil::has_digit(t)) return false;
    const size_t words = textutil::split_words(t).size();
    return words >= 1 && words <= static_cast<size_t>(cfg.max_heading_words);
}

std::optional<SectionKind> classify_heading(const std::string& text, const ExtractConfig& cfg) {
    const auto& lookup = vocab::heading_lookup();
    auto it = lookup.find(textutil::normalize_heading(text));
    if (it == lookup.end()) return std::nullopt;
    if (!looks_like_heading(text, cfg)) return std::nullopt;
    return it->second;
}

void ColumnState::on_line(const Line& line, SectionLines& out, const ExtractConfig& cfg) {
    if (auto heading = classify_heading(line.text, cfg)) {
        m_active = heading;
        return;
    }
    if (m_active) out[*m_active].push_back(line);
}

SectionLines split_sections(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    SectionLines sections;
    const std::optional<double> split = cfg.detect_columns ? detect_column_split(lines, cfg) : std::nullopt;

    ColumnState left;
    ColumnState right;

    for (const auto& line : lines) {
        if (is_page_footer(line.text)) continue;
        const bool is_right = split && line.left > *split;
        (is_right ? right : left).on_line(line, sections, cfg);
    }
    return sections;
}

}  // namespace cvextract
