#include "cvextract/EntryParsers.hpp"

#include "cvextract/DateNormalizer.hpp"
#include "cvextract/LineShape.hpp"
#include "cvextract/TextUtil.hpp"
#include "cvextract/Vocabulary.hpp"
#include "cvextract/WorkParser.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace cvextract {

static std::vector<std::string> block_texts(const Block& block) {
    std::vector<std::string> raw;
    raw.reserve(block.size());
    for (const auto& l : block) raw.push_back(l.text);
    return raw;
}

// text before an inline "Hobbies:" aside from the other column
static std::string cut_hobbies_aside(const std::string& text) {
    const size_t pos = text.find("Hobbies:");
    return textutil::trim(pos == std::string::npos ? text : text.substr(0, pos));
}

static bool is_cert_continuation(const std::string& text, const std::string& current_name) {
    if (textutil::starts_with(text, "(") || textutil::starts_with(text, "-")) return true;
    return !current_name.empty() && textutil::contains(textutil::to_lower(text), "specialization");
}

std::vector<CertificateEntry> parse_certifications(const std::vector<Line>& lines) {
    std::vector<CertificateEntry> entries;
    std::string current;

    for (const auto& text : filter_block_texts(block_texts(lines))) {
        const std::string cleaned = cut_hobbies_aside(text);
        if (cleaned.empty()) continue;

        if (!current.empty() && is_cert_continuation(cleaned, current)) {
            current = textutil::trim(current + " " + cleaned);
            continue;
        }
        if (!current.empty()) entries.push_back(CertificateEntry{current, "", "", ""});
        current = cleaned;
    }
    if (!current.empty()) entries.push_back(CertificateEntry{current, "", "", ""});
    return entries;
}

std::optional<ProjectEntry> parse_project_block(const Block& block) {
    const auto texts = filter_block_texts(block_texts(block));
    if (texts.empty()) return std::nullopt;

    ProjectEntry entry;
    entry.name = texts[0];

    std::vector<std::string> description;
    bool dated = false;
    for (size_t i = 1; i < texts.size(); ++i) {
        if (!dated && textutil::char_count(texts[i]) <= 40 && contains_single_date(texts[i])) {
            const DateRange dates = parse_date_range(texts[i]);
            entry.start_date = dates.start;
            entry.end_date = dates.end;
            dated = true;
            continue;
        }
        description.push_back(texts[i]);
    }
    entry.description = textutil::trim(textutil::join(description, " "));

    if (entry.empty()) return std::nullopt;
    return entry;
}

std::vector<ProjectEntry> parse_projects(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    std::vector<ProjectEntry> entries;
    for (const auto& block : split_blocks(lines, cfg)) {
        if (auto e = parse_project_block(block)) entries.push_back(std::move(*e));
    }
    return entries;
}

std::optional<VolunteerEntry> parse_volunteer_block(const Block& block) {
    const auto texts = filter_block_texts(block_texts(block), true, true);
    if (texts.empty()) return std::nullopt;

    VolunteerEntry entry;
    std::vector<std::string> cleaned;
    bool dated = false;
    for (const auto& t : texts) {
        if (!dated && contains_single_date(t)) {
            const DateRange dates = parse_date_range(t);
            entry.start_date = dates.start;
            entry.end_date = dates.end;
            dated = true;
            continue;
        }
        cleaned.push_back(t);
    }

    if (!cleaned.empty()) {
        const bool inline_org = textutil::contains(textutil::to_lower(cleaned[0]), " at ");
        auto pc = split_title_company(cleaned);
        entry.position = pc.first;
        entry.organization = pc.second;

        const size_t body_from = (inline_org && !pc.second.empty()) ? 1 : 2;
        if (cleaned.size() > body_from) {
            std::vector<std::string> body(cleaned.begin() + static_cast<std::ptrdiff_t>(body_from), cleaned.end());
            entry.summary = textutil::trim(textutil::join(body, " "));
        }
    }

    if (entry.empty()) return std::nullopt;
    return entry;
}

std::vector<VolunteerEntry> parse_volunteer(const std::vector<Line>& lines, const ExtractConfig& cfg) {
    std::vector<VolunteerEntry> entries;
    for (const auto& block : split_blocks(lines, cfg)) {
        if (auto e = parse_volunteer_block(block)) entries.push_back(std::move(*e));
    }
    return entries;
}

std::vector<SkillEntry> normalize_skill_parts(const std::vector<std::string>& parts) {
    std::vector<SkillEntry> skills;
    std::unordered_set<std::string> seen;
    for (const auto& p : parts) {
        const std::string name = textutil::trim(p);
        if (name.empty()) continue;
        if (!seen.insert(textutil::to_lower(name)).second) continue;
        skills.push_back(SkillEntry{name});
    }
    return skills;
}

// ".NET", "AWS", "Python"
static bool is_title_token(const std::string& token) {
    if (textutil::starts_with(token, ".") && token.size() > 1) return true;
    if (textutil::is_all_upper(token)) return true;
    return textutil::starts_upper(token);
}

static bool has_list_delimiter(const std::string& text) {
    for (const auto& d : vocab::list_delimiters()) {
        if (textutil::contains(text, d)) return true;
    }
    return false;
}

std::vector<SkillEntry> parse_skills(const std::vector<Line>& lines) {
    const auto texts = filter_block_texts(block_texts(lines));
    const std::string joined = textutil::join(texts, " ");
    if (joined.empty()) return {};

    if (has_list_delimiter(joined)) return normalize_skill_parts(textutil::split_any(joined, vocab::list_delimiters()));

    std::vector<std::string> parts;
    for (const auto& t : texts) {
        const auto tokens = textutil::split_words(t);
        if (tokens.size() >= 3 && std::all_of(tokens.begin(), tokens.end(), is_title_token)) {
            parts.insert(parts.end(), tokens.begin(), tokens.end());
        } else {
            parts.push_back(t);
        }
    }
    return normalize_skill_parts(parts);
}

std::vector<LanguageEntry> parse_languages(const std::vector<Line>& lines) {
    static const std::regex re("^(.+?)\\s*\\(([^)]+)\\)$");

    std::vector<LanguageEntry> items;
    for (const auto& l : lines) {
        const std::string t = textutil::trim(l.text);
        if (t.empty() || is_noise_line(t)) continue;

        std::smatch m;
        if (std::regex_match(t, m, re)) {
            items.push_back(LanguageEntry{textutil::trim(m.str(1)), textutil::trim(m.str(2))});
        } else {
            items.push_back(LanguageEntry{t, ""});
        }
    }
    return items;
}

std::vector<InterestEntry> parse_interests(const std::vector<Line>& lines) {
    std::vector<std::string> texts;
    for (const auto& l : lines) {
        if (!is_noise_line(l.text)) texts.push_back(l.text);
    }

    std::vector<InterestEntry> items;
    for (const auto& part : textutil::split_any(textutil::join(texts, " "), vocab::list_delimiters())) {
        const std::string name = textutil::trim(part);
        if (!name.empty()) items.push_back(InterestEntry{name});
    }
    return items;
}

}  // namespace cvextract
