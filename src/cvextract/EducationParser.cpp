#include "cvextract/EducationParser.hpp"

#include "cvextract/DateNormalizer.hpp"
#include "cvextract/LineShape.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"

#include <algorithm>
#include <regex>

namespace cvextract {

// short keywords ("ba", "ma") only count as whole words
static bool has_degree_keyword(const std::string& text) {
    const std::string lowered = textutil::to_lower(text);
    const auto words = textutil::split_words(textutil::normalize_heading(text));
    for (const auto& k : vocab::degree_keywords()) {
        if (textutil::char_count(k) <= 3) {
            if (std::find(words.begin(), words.end(), k) != words.end()) return true;
        } else if (textutil::contains(lowered, k)) {
            return true;
        }
    }
    return false;
}

std::pair<std::string, std::string> parse_degree(const std::string& raw) {
    if (textutil::trim(raw).empty()) return {"", ""};

    static const std::regex paren_year("\\s*\\(.*?\\d{4}.*?\\)");
    std::string line = std::regex_replace(raw, paren_year, "");
    line = textutil::join(textutil::split_any(line, {"·"}), " ");
    line = textutil::trim(line);

    const size_t comma = line.find(',');
    if (comma != std::string::npos) {
        const std::string left = textutil::trim(line.substr(0, comma));
        const std::string right = textutil::trim(line.substr(comma + 1));
        const bool left_has = has_degree_keyword(left);
        const bool right_has = has_degree_keyword(right);
        if (left_has) return {left.empty() ? line : left, right};
        if (right_has) return {right, left};
    }

    std::string study_type;
    std::string area;
    if (has_degree_keyword(line)) study_type = line;

    static const std::regex in_re("\\s+in\\s+", std::regex::icase);
    if (textutil::contains(textutil::to_lower(line), " in ")) {
        std::sregex_token_iterator it(line.begin(), line.end(), in_re, -1);
        std::vector<std::string> parts(it, std::sregex_token_iterator());
        if (parts.size() >= 2) {
            study_type = textutil::trim(parts[0]);
            area = textutil::trim(parts[1]);
        }
    }
    return {study_type.empty() ? line : study_type, area};
}

std::optional<EducationEntry> parse_education_block(const Block& block) {
    std::vector<std::string> raw;
    for (const auto& l : block) raw.push_back(l.text);
    const auto texts = filter_block_texts(raw);
    if (texts.empty()) return std::nullopt;

    auto date_it = std::find_if(texts.begin(), texts.end(), [](const std::string& t) {
        return contains_single_date(t);
    });

    EducationEntry entry;
    std::vector<std::string> cleaned = texts;
    if (date_it != texts.end()) {
        const DateRange dates = parse_date_range(*date_it);
        entry.start_date = dates.start;
        entry.end_date = dates.end;
        if (!looks_like_degree_line(*date_it)) {
            const std::string date_line = *date_it;
            cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), date_line), cleaned.end());
        }
    }

    if (!cleaned.empty()) entry.institution = cleaned[0];
    if (cleaned.size() > 1) {
        auto degree = parse_degree(cleaned[1]);
        entry.study_type = degree.first;
        entry.area = degree.second;
    }

    if (entry.empty()) return std::nullopt;
    return entry;
}

std::vector<EducationEntry> parse_education(const std::vector<Line>& lines) {
    std::vector<EducationEntry> entries;
    for (const auto& block : split_education_blocks(lines)) {
        if (auto e = parse_education_block(block)) entries.push_back(std::move(*e));
    }
    return entries;
}

}  // namespace cvextract
